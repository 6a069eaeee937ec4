// Standard includes
#include <algorithm>
#include <cmath>
#include <vector>

// Local includes
#include "logger.hpp"
#include "mass_assignment.hpp"
#include "particle.hpp"
#include "projector.hpp"
#include "sim_config.hpp"

/**
 * @brief Bin the particles onto a 2D map along a line of sight (CIC).
 *
 * The two axes other than the line of sight become the rows (the lower
 * numbered one) and the columns of the map. Each particle shares its mass
 * between the four surrounding pixel centres with bilinear weights, wrapping
 * periodically. Values are mass per unit projected area, so the map sums to
 * the total mass divided by the pixel area.
 *
 * @param particles The particles
 * @param box_size The width of the periodic box
 * @param axis The line of sight (0, 1 or 2)
 * @param height The number of rows
 * @param width The number of columns
 * @return The surface density map
 */
SurfaceDensityMap projectParticles(const ParticleEnsemble &particles,
                                   const double box_size, const int axis,
                                   const int height, const int width) {

  if (axis < 0 || axis > 2) {
    config_error("Projection axis must be 0, 1 or 2 (got %d)", axis);
  }
  if (height < 1 || width < 1) {
    config_error("Map dimensions must be positive (got %d x %d)", height,
                 width);
  }

  // Which particle axes map to rows and columns?
  const int row_axis = (axis == 0) ? 1 : 0;
  const int col_axis = (axis == 2) ? 1 : 2;

  const double inv_row_width = height / box_size;
  const double inv_col_width = width / box_size;
  const double inv_pixel_area = inv_row_width * inv_col_width;

  SurfaceDensityMap map(height, width);

  for (const Particle &part : particles) {
    const CICWeights wr =
        cicWeights(part.pos[row_axis], inv_row_width, height);
    const CICWeights wc =
        cicWeights(part.pos[col_axis], inv_col_width, width);

    const double sigma = part.mass * inv_pixel_area;
    const size_t lo = static_cast<size_t>(wr.lo) * width;
    const size_t hi = static_cast<size_t>(wr.hi) * width;

    map.values[lo + wc.lo] += sigma * wr.w_lo * wc.w_lo;
    map.values[lo + wc.hi] += sigma * wr.w_lo * wc.w_hi;
    map.values[hi + wc.lo] += sigma * wr.w_hi * wc.w_lo;
    map.values[hi + wc.hi] += sigma * wr.w_hi * wc.w_hi;
  }

  return map;
}

/**
 * @brief Compress the dynamic range of a surface density map, v = log(1 + v).
 */
void applyLogStabilization(SurfaceDensityMap &map) {
  for (double &v : map.values) {
    v = std::log1p(v);
  }
}

/**
 * @brief Mean, (population) standard deviation, minimum and maximum.
 *
 * @param values The values (an empty vector gives all zeros)
 */
MapStatistics computeMapStatistics(const std::vector<double> &values) {

  MapStatistics stats;
  if (values.empty()) {
    return stats;
  }

  double sum = 0.0;
  stats.min = values[0];
  stats.max = values[0];
  for (const double v : values) {
    sum += v;
    stats.min = std::min(stats.min, v);
    stats.max = std::max(stats.max, v);
  }
  stats.mean = sum / static_cast<double>(values.size());

  double sum2 = 0.0;
  for (const double v : values) {
    sum2 += (v - stats.mean) * (v - stats.mean);
  }
  stats.std = std::sqrt(sum2 / static_cast<double>(values.size()));

  return stats;
}

/**
 * @brief Affinely map the values so their mean and std match a target.
 *
 * v' = target_mean + (v - mean) * target_std / std, then clamped at zero
 * (log1p maps are never negative). A flat map only gets shifted.
 *
 * @param map The map to rescale in place
 * @param target_mean The target mean
 * @param target_std The target standard deviation
 */
void rescaleToTarget(SurfaceDensityMap &map, const double target_mean,
                     const double target_std) {

  const MapStatistics stats = computeMapStatistics(map.values);
  const double scale = (stats.std > 0.0) ? target_std / stats.std : 1.0;

  for (double &v : map.values) {
    v = std::max(0.0, target_mean + (v - stats.mean) * scale);
  }

  v_message("Rescaled map from mean=%f std=%f to mean=%f std=%f", stats.mean,
            stats.std, target_mean, target_std);
}

/**
 * @brief Produce the final log1p map of a run.
 *
 * @param particles The final particles
 * @param config The run configuration
 * @return The log-stabilised (and optionally rescaled) map
 */
SurfaceDensityMap projectToMap(const ParticleEnsemble &particles,
                               const SimulationConfig &config) {

  tic();

  SurfaceDensityMap map =
      projectParticles(particles, config.box_length, config.projection_axis,
                       config.map_height, config.map_width);
  applyLogStabilization(map);

  if (config.rescale) {
    rescaleToTarget(map, config.target_mean, config.target_std);
  }

  toc("Projecting particles");

  return map;
}
