// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef PROJECTOR_HPP
#define PROJECTOR_HPP

// Standard includes
#include <vector>

// Local includes
#include "particle.hpp"
#include "sim_config.hpp"

/**
 * @brief Summary statistics of a map (population std).
 */
struct MapStatistics {
  double mean = 0.0;
  double std = 0.0;
  double min = 0.0;
  double max = 0.0;
};

/**
 * @brief A 2D map stored row-major, height rows of width values.
 *
 * Depending on the stage of the projection the values are the surface
 * density (mass per unit area) or log(1 + surface density).
 */
class SurfaceDensityMap {
public:
  int height;
  int width;
  std::vector<double> values;

  SurfaceDensityMap(const int height, const int width)
      : height(height), width(width),
        values(static_cast<size_t>(height) * width, 0.0) {}

  double at(const int row, const int col) const {
    return values[static_cast<size_t>(row) * width + col];
  }
};

// Prototypes (defined in projector.cpp)
SurfaceDensityMap projectParticles(const ParticleEnsemble &particles,
                                   const double box_size, const int axis,
                                   const int height, const int width);
void applyLogStabilization(SurfaceDensityMap &map);
MapStatistics computeMapStatistics(const std::vector<double> &values);
void rescaleToTarget(SurfaceDensityMap &map, const double target_mean,
                     const double target_std);
SurfaceDensityMap projectToMap(const ParticleEnsemble &particles,
                               const SimulationConfig &config);

#endif // PROJECTOR_HPP
