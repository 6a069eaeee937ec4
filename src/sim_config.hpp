// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef SIM_CONFIG_HPP
#define SIM_CONFIG_HPP

// Standard includes
#include <cstdint>
#include <string>

// Local includes
#include "params.hpp"

/**
 * @brief Everything a single simulation run needs.
 *
 * A SimulationConfig is a plain value: runs never share one by reference so
 * independent runs can be generated concurrently.
 */
struct SimulationConfig {
  //! The number of grid cells along each axis (power of two)
  int grid_size = 64;

  //! The comoving side length of the periodic box
  double box_length = 100.0;

  //! The number of particles
  size_t nparticles = 64 * 64 * 64;

  //! The number of Kick-Drift-Kick steps
  int nsteps = 10;

  //! The step size
  double time_step = 0.01;

  //! Uniform multiplier applied to the force field (a tuning knob mimicking
  // late time nonlinear growth, not a physical quantity)
  double growth_factor = 1.0;

  //! The random seed for the initial conditions
  uint64_t seed = 42;

  //! The mass of every particle
  double particle_mass = 1.0;

  //! The gravitational constant in code units
  double G = 1.0;

  //! Exponent of the initial amplitude spectrum, A(k) ~ k^spectral_index
  double spectral_index = -0.5;

  //! The rms of the synthesized initial overdensity field
  double density_contrast = 0.5;

  //! The standard deviation of each initial velocity component
  double velocity_dispersion = 0.01;

  //! The line of sight axis for the projection (0, 1 or 2)
  int projection_axis = 2;

  //! The shape of the output map
  int map_height = 256;
  int map_width = 256;

  //! Should the log1p map be affinely rescaled to the target statistics?
  bool rescale = false;

  //! Target statistics of the rescaled log1p map
  double target_mean = 0.0;
  double target_std = 1.0;

  //! Log the energy budget after every step
  bool energy_diagnostics = false;

  //! Keep the final particle positions for the output file
  bool save_particles = false;
};

// Prototypes (defined in sim_config.cpp)
SimulationConfig readSimulationConfig(Parameters *params);
void validateConfig(const SimulationConfig &config);
bool isPowerOfTwo(const int n);
void reportConfig(const SimulationConfig &config);

#endif // SIM_CONFIG_HPP
