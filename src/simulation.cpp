// Standard includes
#include <cstring>
#include <random>
#include <utility>
#include <vector>

// Local includes
#include "debugging_utils.hpp"
#include "initial_conditions.hpp"
#include "integrator.hpp"
#include "logger.hpp"
#include "projector.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"

/**
 * @brief Construct a new Simulation object
 *
 * Validates the configuration and allocates the grid and solver. No particles
 * exist until initialise is called.
 *
 * @param config The configuration of the run
 */
Simulation::Simulation(const SimulationConfig &config)
    : config(config), grid(config.grid_size, config.box_length),
      rng(config.seed), solver(grid, config.G, config.growth_factor) {
  validateConfig(this->config);
}

/**
 * @brief Draw the initial conditions and compute the first force field.
 */
void Simulation::initialise() {

  if (this->initialised) {
    error("The initial conditions of this run have already been drawn");
  }

  this->particles = sampleInitialConditions(this->config, this->rng);

  // The forces the first half kick needs
  computeForces(this->particles, this->grid, this->solver);
  checkNumericalState(this->particles, this->grid, 0);

#ifdef DEBUGGING_CHECKS
  validateMassConservation(this->particles, this->grid, 1e-10);
  validateParticlesInBox(this->particles, this->grid.box_size);
  validateZeroMeanForce(this->grid, 1e-8);
#endif

  this->initialised = true;
  this->step = 0;

  if (this->config.energy_diagnostics) {
    reportEnergies();
  }
}

/**
 * @brief Take all the configured Kick-Drift-Kick steps.
 *
 * The loop always runs exactly config.nsteps steps. The state is checked for
 * non-finite values after every step.
 */
void Simulation::evolve() {

  if (!this->initialised) {
    error("Cannot evolve a run before its initial conditions are drawn");
  }

  tic();

  while (this->step < this->config.nsteps) {

    this->step++;
    stepKDK(this->particles, this->grid, this->solver, this->config.time_step,
            this->step);

    checkNumericalState(this->particles, this->grid, this->step);

#ifdef DEBUGGING_CHECKS
    validateMassConservation(this->particles, this->grid, 1e-10);
    validateParticlesInBox(this->particles, this->grid.box_size);
    validateZeroMeanForce(this->grid, 1e-8);
#endif

    v_message("Completed step %d/%d", this->step, this->config.nsteps);

    if (this->config.energy_diagnostics) {
      reportEnergies();
    }
  }

  toc("Evolving particles");
}

/**
 * @brief Run the whole simulation: initial conditions, evolution, projection.
 *
 * @return The map, its statistics and the final energies
 */
SimulationResult Simulation::run() {

  initialise();
  evolve();

  SurfaceDensityMap map = projectToMap(this->particles, this->config);
  const MapStatistics stats = computeMapStatistics(map.values);

  message("Map statistics: mean=%f std=%f min=%f max=%f", stats.mean,
          stats.std, stats.min, stats.max);

  SimulationResult result{std::move(map), stats, this->config.seed,
                          kineticEnergy(this->particles),
                          potentialEnergy(this->particles, this->grid),
                          {}};

  if (this->config.save_particles) {
    result.coordinates.reserve(3 * this->particles.size());
    for (const Particle &part : this->particles) {
      result.coordinates.push_back(part.pos[0]);
      result.coordinates.push_back(part.pos[1]);
      result.coordinates.push_back(part.pos[2]);
    }
  }

  return result;
}

/**
 * @brief Log the energy budget of the current state.
 */
void Simulation::reportEnergies() const {
  const double kin = kineticEnergy(this->particles);
  const double pot = potentialEnergy(this->particles, this->grid);
  message("Step %d: K=%.8e W=%.8e E=%.8e", this->step, kin, pot, kin + pot);
}

/**
 * @brief Generate one map from a configuration.
 *
 * @param config The configuration of the run
 * @return The result of the run
 *
 * @throw ConfigurationError If the configuration is invalid.
 * @throw NumericalInstabilityError If the run diverged.
 */
SimulationResult run(const SimulationConfig &config) {
  Simulation sim(config);
  return sim.run();
}

/**
 * @brief Run a configuration twice and demand bit-identical maps.
 *
 * @param config The configuration of the run
 * @return The result of the first run
 *
 * @throw ReproducibilityViolation If the two maps differ.
 */
SimulationResult verifyReproducibility(const SimulationConfig &config) {

  SimulationResult first = run(config);
  SimulationResult second = run(config);

  const std::vector<double> &a = first.map.values;
  const std::vector<double> &b = second.map.values;
  if (a.size() != b.size() ||
      std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) != 0) {
    reproducibility_error("Two runs with seed %llu produced different maps",
                          static_cast<unsigned long long>(config.seed));
  }

  message("Seed %llu reproduced bit for bit",
          static_cast<unsigned long long>(config.seed));

  return first;
}
