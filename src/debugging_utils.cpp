// Standard includes
#include <algorithm>
#include <cmath>
#include <vector>

// Local includes
#include "debugging_utils.hpp"
#include "grid.hpp"
#include "logger.hpp"
#include "particle.hpp"

/**
 * @brief Validate that the deposited grid mass matches the particle mass
 *
 * Cloud-in-cell weights sum to one so the density integrated over the box
 * must reproduce the particle mass to rounding.
 */
void validateMassConservation(const ParticleEnsemble &particles,
                              const Grid &grid, const double tolerance) {

  double part_mass = 0.0;
  for (const Particle &part : particles) {
    part_mass += part.mass;
  }

  const double grid_mass = grid.totalMass();
  const double scale = std::max(std::fabs(part_mass), 1e-300);

  if (std::fabs(grid_mass - part_mass) / scale > tolerance) {
    error("[DEBUG] Grid mass %.16e doesn't match particle mass %.16e",
          grid_mass, part_mass);
  }

  v_message("[DEBUG] Mass conserved (%.16e)", grid_mass);
}

/**
 * @brief Validate that every particle lies in [0, box_size) on every axis
 */
void validateParticlesInBox(const ParticleEnsemble &particles,
                            const double box_size) {

  int errors = 0;
  for (size_t pid = 0; pid < particles.size(); pid++) {
    const Particle &part = particles[pid];
    for (int i = 0; i < 3; i++) {
      if (!(part.pos[i] >= 0.0 && part.pos[i] < box_size)) {
        if (errors < 10) {
          message("[DEBUG] ERROR: Particle %zu at (%.6f, %.6f, %.6f) is "
                  "outside the box",
                  pid, part.pos[0], part.pos[1], part.pos[2]);
        }
        errors++;
        break;
      }
    }
  }

  if (errors > 0) {
    error("[DEBUG] Found %d particles outside [0, %f)", errors, box_size);
  }

  v_message("[DEBUG] All %zu particles inside the box", particles.size());
}

/**
 * @brief Validate that the force field has no net (k = 0) component
 *
 * The Green's function zeroes the k = 0 mode so the mean of each force
 * component must vanish up to rounding.
 */
void validateZeroMeanForce(const Grid &grid, const double tolerance) {

  for (int axis = 0; axis < 3; axis++) {
    const std::vector<double> &force = grid.force[axis];

    double sum = 0.0;
    double max_abs = 0.0;
    for (const double f : force) {
      sum += f;
      max_abs = std::max(max_abs, std::fabs(f));
    }

    const double mean = sum / static_cast<double>(force.size());
    if (std::fabs(mean) > tolerance * std::max(max_abs, 1e-300)) {
      error("[DEBUG] Mean force along axis %d is %.6e (max |F| = %.6e)", axis,
            mean, max_abs);
    }
  }

  v_message("[DEBUG] Force field has zero mean");
}
