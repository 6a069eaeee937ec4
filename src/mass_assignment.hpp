// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef MASS_ASSIGNMENT_HPP
#define MASS_ASSIGNMENT_HPP

// Standard includes
#include <array>
#include <cmath>
#include <vector>

// Local includes
#include "grid.hpp"
#include "particle.hpp"

/**
 * @brief The Cloud-in-Cell weights of a position along one axis.
 *
 * Mesh nodes sit at the cell centres (i + 0.5) * width, so a particle at x
 * shares its mass between the two nodes bracketing it, with weights equal to
 * the overlap of a cell-wide cloud centred on the particle with each node's
 * cell. The weights sum to one and the indices are already wrapped.
 */
struct CICWeights {
  int lo;
  int hi;
  double w_lo;
  double w_hi;
};

/**
 * @brief Compute the CIC weights of x on an axis of n cells.
 *
 * @param x The coordinate (any value, it is used periodically)
 * @param inv_width The inverse width of a cell along the axis
 * @param n The number of cells along the axis
 */
inline CICWeights cicWeights(const double x, const double inv_width,
                             const int n) {
  const double u = x * inv_width - 0.5;
  const double base = std::floor(u);
  const double d = u - base;
  const int i = static_cast<int>(base);
  return {wrapIndex(i, n), wrapIndex(i + 1, n), 1.0 - d, d};
}

// Prototypes (defined in mass_assignment.cpp)
void depositMass(const ParticleEnsemble &particles, Grid &grid);
double interpolateField(const std::vector<double> &field, const Grid &grid,
                        const double pos[3]);
std::array<double, 3> interpolateForce(const Grid &grid, const double pos[3]);
void interpolateForces(ParticleEnsemble &particles, const Grid &grid);

#endif // MASS_ASSIGNMENT_HPP
