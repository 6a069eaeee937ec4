/**
 * @file simulation.hpp
 * @brief The defintion of the Simulation class driving a single
 * particle-mesh run.
 *
 * A Simulation owns everything a run touches: the grid, the particles, the
 * Poisson solver and the random generator. Nothing is shared between
 * Simulation objects so independent runs can be executed concurrently.
 */
#ifndef SIMULATION_HPP
#define SIMULATION_HPP

// Standard includes
#include <cstdint>
#include <random>
#include <vector>

// Local includes
#include "grid.hpp"
#include "particle.hpp"
#include "poisson.hpp"
#include "projector.hpp"
#include "sim_config.hpp"

/**
 * @brief Everything a run hands back to its caller.
 */
struct SimulationResult {
  //! The log1p surface density map
  SurfaceDensityMap map;

  //! Statistics of the map (as written, i.e. after any rescaling)
  MapStatistics stats;

  //! The seed the run was generated from
  uint64_t seed;

  //! The energy budget of the final state
  double kinetic_energy;
  double potential_energy;

  //! Final positions as (x, y, z) triples, empty unless save_particles is set
  std::vector<double> coordinates;
};

class Simulation {

public:
  //! The configuration of this run
  const SimulationConfig config;

  //! The mesh
  Grid grid;

  //! The particles
  ParticleEnsemble particles;

  //! The number of steps taken so far
  int step = 0;

  // Constructor prototype
  explicit Simulation(const SimulationConfig &config);

  // Prototypes for member functions (defined in simulation.cpp)
  void initialise();
  void evolve();
  SimulationResult run();

private:
  //! The run's random generator (seeded from config.seed)
  std::mt19937_64 rng;

  //! The Poisson solver for the grid
  PoissonSolver solver;

  //! Have the initial conditions been drawn?
  bool initialised = false;

  void reportEnergies() const;
};

// Prototypes for the entry points (defined in simulation.cpp)
SimulationResult run(const SimulationConfig &config);
SimulationResult verifyReproducibility(const SimulationConfig &config);

#endif // SIMULATION_HPP
