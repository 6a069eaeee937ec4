#ifndef DEBUGGING_UTILS_HPP
#define DEBUGGING_UTILS_HPP

// Consistency checks on the state of a run. The integration loop only calls
// these when DEBUGGING_CHECKS is defined (they cost a pass over the data).

// Local includes
#include "grid.hpp"
#include "particle.hpp"

/**
 * @brief Validate that the deposited grid mass matches the particle mass
 *
 * @param particles The particles
 * @param grid The grid holding the deposited density
 * @param tolerance Allowed relative difference
 */
void validateMassConservation(const ParticleEnsemble &particles,
                              const Grid &grid, double tolerance);

/**
 * @brief Validate that every particle lies in [0, box_size) on every axis
 *
 * @param particles The particles
 * @param box_size The width of the periodic box
 */
void validateParticlesInBox(const ParticleEnsemble &particles,
                            double box_size);

/**
 * @brief Validate that the force field has no net (k = 0) component
 *
 * @param grid The grid holding the force field
 * @param tolerance Allowed mean relative to the largest force magnitude
 */
void validateZeroMeanForce(const Grid &grid, double tolerance);

#endif // DEBUGGING_UTILS_HPP
