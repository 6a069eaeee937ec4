// Standard includes
#include <cmath>
#include <vector>

// Local includes
#include "grid.hpp"
#include "integrator.hpp"
#include "logger.hpp"
#include "mass_assignment.hpp"
#include "particle.hpp"
#include "poisson.hpp"

/**
 * @brief Rebuild the density, solve for the forces and read them back.
 *
 * After this call every particle's acc holds the (growth amplified) force
 * per unit mass at its position.
 *
 * @param particles The particles
 * @param grid The grid
 * @param solver The Poisson solver for the grid
 */
void computeForces(ParticleEnsemble &particles, Grid &grid,
                   PoissonSolver &solver) {
  depositMass(particles, grid);
  solver.solve(grid);
  interpolateForces(particles, grid);
}

/**
 * @brief Update the velocities with the stored accelerations, v += dt * a.
 *
 * @param particles The particles
 * @param dt The length of the kick (half a step for KDK)
 */
void kick(ParticleEnsemble &particles, const double dt) {

  const size_t npart = particles.size();

#pragma omp parallel for schedule(static)
  for (size_t pid = 0; pid < npart; pid++) {
    Particle &part = particles[pid];
    part.vel[0] += dt * part.acc[0];
    part.vel[1] += dt * part.acc[1];
    part.vel[2] += dt * part.acc[2];
  }
}

/**
 * @brief Move the particles, x = wrap(x + dt * v).
 *
 * @param particles The particles
 * @param dt The length of the drift
 * @param box_size The width of the periodic box
 */
void drift(ParticleEnsemble &particles, const double dt,
           const double box_size) {

  const size_t npart = particles.size();

#pragma omp parallel for schedule(static)
  for (size_t pid = 0; pid < npart; pid++) {
    Particle &part = particles[pid];
    part.pos[0] = wrap(part.pos[0] + dt * part.vel[0], box_size);
    part.pos[1] = wrap(part.pos[1] + dt * part.vel[1], box_size);
    part.pos[2] = wrap(part.pos[2] + dt * part.vel[2], box_size);
  }
}

/**
 * @brief Advance the particles by one Kick-Drift-Kick step.
 *
 * The accelerations must already hold the forces at the current positions
 * (computeForces). On return they hold the forces at the new positions, ready
 * for the next step. The drifted particles are checked before they are
 * deposited, a non-finite position has no host cell.
 *
 * @param particles The particles
 * @param grid The grid
 * @param solver The Poisson solver for the grid
 * @param dt The step size
 * @param step The number of the step being taken (from 1)
 *
 * @throw NumericalInstabilityError If the drift left a non-finite particle.
 */
void stepKDK(ParticleEnsemble &particles, Grid &grid, PoissonSolver &solver,
             const double dt, const int step) {
  kick(particles, 0.5 * dt);
  drift(particles, dt, grid.box_size);
  checkParticleState(particles, step);
  computeForces(particles, grid, solver);
  kick(particles, 0.5 * dt);
}

/**
 * @brief Make sure no NaN or Inf has crept into the state of the run.
 *
 * @param particles The particles
 * @param grid The grid
 * @param step The step being checked (0 is the initial state)
 *
 * @throw NumericalInstabilityError Naming the offending field and the step.
 */
void checkNumericalState(const ParticleEnsemble &particles, const Grid &grid,
                         const int step) {

  // Grid fields
  bool bad_density = false;
  bool bad_force = false;
#pragma omp parallel for reduction(|| : bad_density, bad_force)
  for (size_t cid = 0; cid < grid.ncells; cid++) {
    bad_density = bad_density || !std::isfinite(grid.density[cid]);
    bad_force = bad_force || !std::isfinite(grid.force[0][cid]) ||
                !std::isfinite(grid.force[1][cid]) ||
                !std::isfinite(grid.force[2][cid]);
  }
  if (bad_density) {
    instability_error(step, "Non-finite density at step %d", step);
  }
  if (bad_force) {
    instability_error(step, "Non-finite force at step %d", step);
  }

  checkParticleState(particles, step);
}

/**
 * @brief Make sure every particle has a finite position, velocity and
 * acceleration.
 *
 * @param particles The particles
 * @param step The step being checked
 *
 * @throw NumericalInstabilityError Naming the offending quantity and the step.
 */
void checkParticleState(const ParticleEnsemble &particles, const int step) {

  const size_t npart = particles.size();
  bool bad_pos = false;
  bool bad_vel = false;
#pragma omp parallel for reduction(|| : bad_pos, bad_vel)
  for (size_t pid = 0; pid < npart; pid++) {
    const Particle &part = particles[pid];
    for (int i = 0; i < 3; i++) {
      bad_pos = bad_pos || !std::isfinite(part.pos[i]);
      bad_vel = bad_vel || !std::isfinite(part.vel[i]) ||
                !std::isfinite(part.acc[i]);
    }
  }
  if (bad_pos) {
    instability_error(step, "Non-finite particle position at step %d", step);
  }
  if (bad_vel) {
    instability_error(step, "Non-finite particle velocity at step %d", step);
  }
}

/**
 * @brief The total kinetic energy, sum of m v^2 / 2.
 */
double kineticEnergy(const ParticleEnsemble &particles) {
  double energy = 0.0;
  for (const Particle &part : particles) {
    const double v2 = part.vel[0] * part.vel[0] + part.vel[1] * part.vel[1] +
                      part.vel[2] * part.vel[2];
    energy += 0.5 * part.mass * v2;
  }
  return energy;
}

/**
 * @brief The total potential energy, sum of m phi(x) / 2.
 *
 * phi is the grid potential interpolated with the CIC stencil. The potential
 * must be up to date with the particle positions (computeForces). Note the
 * growth factor only scales the forces, not this energy.
 */
double potentialEnergy(const ParticleEnsemble &particles, const Grid &grid) {
  double energy = 0.0;
  for (const Particle &part : particles) {
    energy += 0.5 * part.mass * interpolateField(grid.potential, grid, part.pos);
  }
  return energy;
}
