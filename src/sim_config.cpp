// Standard includes
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

// Local includes
#include "logger.hpp"
#include "params.hpp"
#include "sim_config.hpp"

/**
 * @brief Is n a (positive) power of two?
 */
bool isPowerOfTwo(const int n) { return n > 0 && (n & (n - 1)) == 0; }

/**
 * @brief Build the simulation configuration from the parameter file.
 *
 * Missing keys fall back to the defaults of SimulationConfig. The particle
 * count defaults to Simulation/particles_per_cell times the number of grid
 * cells.
 *
 * @param params The parameters object
 * @return The (validated) configuration
 */
SimulationConfig readSimulationConfig(Parameters *params) {

  SimulationConfig config;

  // The box and its discretisation
  config.grid_size =
      params->getParameter<int>("Simulation/grid_size", config.grid_size);
  config.box_length =
      params->getParameter<double>("Simulation/box_length", config.box_length);

  // How many particles? Either directly or from the mean occupancy
  if (params->exists("Simulation/nparticles")) {
    const int nparticles =
        params->getParameterNoDefault<int>("Simulation/nparticles");
    if (nparticles < 0) {
      config_error("Simulation/nparticles must not be negative (got %d)",
                   nparticles);
    }
    config.nparticles = static_cast<size_t>(nparticles);
  } else {
    const double per_cell =
        params->getParameter<double>("Simulation/particles_per_cell", 1.0);
    if (per_cell < 0.0) {
      config_error("Simulation/particles_per_cell must not be negative "
                   "(got %f)",
                   per_cell);
    }
    const double ncells = std::pow(static_cast<double>(config.grid_size), 3);
    config.nparticles = static_cast<size_t>(std::llround(per_cell * ncells));
  }

  // Time stepping
  config.nsteps = params->getParameter<int>("Simulation/nsteps", config.nsteps);
  config.time_step =
      params->getParameter<double>("Simulation/time_step", config.time_step);
  config.growth_factor = params->getParameter<double>(
      "Simulation/growth_factor", config.growth_factor);

  // The seed (any unsigned 64 bit value)
  try {
    config.seed = params->getParameterUnsigned("Simulation/seed", config.seed);
  } catch (const std::runtime_error &e) {
    config_error("Invalid Simulation/seed: %s", e.what());
  }

  // Gravity
  config.particle_mass = params->getParameter<double>(
      "Simulation/particle_mass", config.particle_mass);
  config.G = params->getParameter<double>("Gravity/G", config.G);

  // Initial conditions
  config.spectral_index = params->getParameter<double>(
      "InitialConditions/spectral_index", config.spectral_index);
  config.density_contrast = params->getParameter<double>(
      "InitialConditions/density_contrast", config.density_contrast);
  config.velocity_dispersion = params->getParameter<double>(
      "InitialConditions/velocity_dispersion", config.velocity_dispersion);

  // Projection
  config.projection_axis =
      params->getParameter<int>("Projection/axis", config.projection_axis);
  config.map_height =
      params->getParameter<int>("Projection/map_height", config.map_height);
  config.map_width =
      params->getParameter<int>("Projection/map_width", config.map_width);
  config.rescale =
      static_cast<bool>(params->getParameter<int>("Projection/rescale", 0));
  config.target_mean = params->getParameter<double>("Projection/target_mean",
                                                    config.target_mean);
  config.target_std =
      params->getParameter<double>("Projection/target_std", config.target_std);

  // Diagnostics
  config.energy_diagnostics = static_cast<bool>(
      params->getParameter<int>("Run/energy_diagnostics", 0));

  // Output
  config.save_particles = static_cast<bool>(
      params->getParameter<int>("Output/save_particles", 0));

  validateConfig(config);

  return config;
}

/**
 * @brief Reject configurations that can never produce a valid run.
 *
 * @param config The configuration to check
 *
 * @throw ConfigurationError Describing the first problem found.
 */
void validateConfig(const SimulationConfig &config) {

  // The transform needs a cubic power of two grid
  if (config.grid_size < 2 || !isPowerOfTwo(config.grid_size)) {
    config_error("Grid size must be a power of two >= 2 (got %d)",
                 config.grid_size);
  }
  if (!(config.box_length > 0.0) || !std::isfinite(config.box_length)) {
    config_error("Box length must be positive (got %f)", config.box_length);
  }
  if (config.nparticles == 0) {
    config_error("The particle count must be positive");
  }
  if (config.nsteps < 0) {
    config_error("The number of steps must not be negative (got %d)",
                 config.nsteps);
  }
  if (!(config.time_step > 0.0) || !std::isfinite(config.time_step)) {
    config_error("Time step must be positive (got %f)", config.time_step);
  }
  if (!(config.growth_factor >= 0.0) || !std::isfinite(config.growth_factor)) {
    config_error("Growth factor must be finite and non-negative (got %f)",
                 config.growth_factor);
  }
  if (!(config.particle_mass > 0.0) || !std::isfinite(config.particle_mass)) {
    config_error("Particle mass must be positive (got %f)",
                 config.particle_mass);
  }
  if (!(config.G > 0.0) || !std::isfinite(config.G)) {
    config_error("G must be positive (got %f)", config.G);
  }
  if (!std::isfinite(config.spectral_index)) {
    config_error("The spectral index must be finite");
  }
  if (!(config.density_contrast >= 0.0) ||
      !std::isfinite(config.density_contrast)) {
    config_error("Density contrast must be non-negative (got %f)",
                 config.density_contrast);
  }
  if (!(config.velocity_dispersion >= 0.0) ||
      !std::isfinite(config.velocity_dispersion)) {
    config_error("Velocity dispersion must be non-negative (got %f)",
                 config.velocity_dispersion);
  }
  if (config.projection_axis < 0 || config.projection_axis > 2) {
    config_error("Projection axis must be 0, 1 or 2 (got %d)",
                 config.projection_axis);
  }
  if (config.map_height < 1 || config.map_width < 1) {
    config_error("Map dimensions must be positive (got %d x %d)",
                 config.map_height, config.map_width);
  }
  if (config.rescale &&
      (!(config.target_std > 0.0) || !std::isfinite(config.target_mean))) {
    config_error("Rescaling needs a finite target mean and a positive "
                 "target std (got %f, %f)",
                 config.target_mean, config.target_std);
  }
}

/**
 * @brief Print the configuration of a run.
 */
void reportConfig(const SimulationConfig &config) {
  message("Grid: %d^3 cells, box length %f", config.grid_size,
          config.box_length);
  message("Particles: %zu of mass %f", config.nparticles,
          config.particle_mass);
  message("Steps: %d of dt=%f (growth factor %f, G=%f)", config.nsteps,
          config.time_step, config.growth_factor, config.G);
  message("Initial conditions: A(k) ~ k^%.2f, rms contrast %f, sigma_v %f",
          config.spectral_index, config.density_contrast,
          config.velocity_dispersion);
  message("Projection: axis %d onto a %d x %d map (rescale=%d)",
          config.projection_axis, config.map_height, config.map_width,
          static_cast<int>(config.rescale));
}
