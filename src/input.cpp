/**
 * @file input.cpp
 * @brief Reading reference maps (e.g. from a hydrodynamical suite) to match
 * the statistics of generated maps against.
 */

// Standard includes
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

// Local includes
#include "hdf_io.hpp"
#include "logger.hpp"
#include "projector.hpp"

/**
 * @brief Read a stack of 2D maps from an HDF5 dataset.
 *
 * The dataset may be 2D (a single map) or 3D (nmaps, height, width). Any
 * numeric storage type is converted to double on read.
 *
 * @param filename The HDF5 file
 * @param dataset The dataset holding the maps
 * @return The maps in file order
 */
std::vector<SurfaceDensityMap> readReferenceMaps(const std::string &filename,
                                                 const std::string &dataset) {

  tic();

  HDF5Helper hdf5(filename, H5F_ACC_RDONLY);

  if (!hdf5.exists(dataset)) {
    error("No dataset '%s' in %s", dataset.c_str(), filename.c_str());
  }

  std::vector<double> data;
  std::vector<hsize_t> dims;
  hdf5.readDataset<double>(dataset, data, dims);

  hsize_t nmaps = 1;
  hsize_t height = 0;
  hsize_t width = 0;
  if (dims.size() == 2) {
    height = dims[0];
    width = dims[1];
  } else if (dims.size() == 3) {
    nmaps = dims[0];
    height = dims[1];
    width = dims[2];
  } else {
    error("Dataset '%s' has rank %zu, expected 2 or 3", dataset.c_str(),
          dims.size());
  }

  if (nmaps == 0 || height == 0 || width == 0) {
    error("Dataset '%s' in %s is empty", dataset.c_str(), filename.c_str());
  }

  std::vector<SurfaceDensityMap> maps;
  maps.reserve(nmaps);
  const size_t map_size = height * width;
  for (hsize_t i = 0; i < nmaps; i++) {
    SurfaceDensityMap map(static_cast<int>(height), static_cast<int>(width));
    const auto first = data.begin() + i * map_size;
    std::copy(first, first + map_size, map.values.begin());
    maps.push_back(std::move(map));
  }

  message("Read %llu reference maps of %llux%llu from %s",
          static_cast<unsigned long long>(nmaps),
          static_cast<unsigned long long>(height),
          static_cast<unsigned long long>(width), filename.c_str());

  toc("Reading reference maps");

  return maps;
}

/**
 * @brief The pooled statistics of log1p of a set of reference maps.
 *
 * Reference maps are raw surface densities, so they go through the same
 * log1p stabilisation as the generated maps before the statistics are taken.
 *
 * @param maps The reference maps
 * @return Mean, std, min and max over every pixel of every map
 *
 * @throw std::runtime_error If there are no maps or a value is below -1.
 */
MapStatistics referenceStatistics(const std::vector<SurfaceDensityMap> &maps) {

  if (maps.empty()) {
    error("Cannot compute statistics of an empty set of reference maps");
  }

  std::vector<double> pooled;
  for (const SurfaceDensityMap &map : maps) {
    for (const double v : map.values) {
      if (!(v > -1.0)) {
        error("Reference map value %g has no finite log1p", v);
      }
      pooled.push_back(std::log1p(v));
    }
  }

  const MapStatistics stats = computeMapStatistics(pooled);

  message("Reference statistics: mean=%f std=%f", stats.mean, stats.std);

  return stats;
}
