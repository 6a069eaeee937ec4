/**
 * @file output.cpp
 * @brief Writing generated maps to HDF5
 */

// Standard includes
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Local includes
#include "hdf_io.hpp"
#include "logger.hpp"
#include "projector.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"

/**
 * @brief Write a batch of maps and their provenance to an HDF5 file
 *
 * The file layout is:
 *   Header (group)       run parameters as scalar attributes
 *   Maps_Nbody           float32 (nmaps, height, width), one map per sample
 *   Seeds                uint64 (nmaps), the seed each map came from
 *   Statistics/Mean|Std|Min|Max  float64 (nmaps), per map statistics
 *   Particles/Coordinates  float64 (nmaps, nparticles, 3), final positions,
 *                          only when config.save_particles is set
 *
 * An existing file is overwritten.
 *
 * @param filename The file to write
 * @param config The configuration shared by the batch (the seed is ignored)
 * @param results The maps to write (all the same shape)
 */
void writeMapFile(const std::string &filename, const SimulationConfig &config,
                  const std::vector<SimulationResult> &results) {

  tic();

  message("Writing %zu maps to %s", results.size(), filename.c_str());

  const hsize_t nmaps = results.size();
  const hsize_t height = config.map_height;
  const hsize_t width = config.map_width;

  for (const SimulationResult &res : results) {
    if (res.map.height != config.map_height ||
        res.map.width != config.map_width) {
      error("Map for seed %llu has shape %dx%d, expected %dx%d",
            static_cast<unsigned long long>(res.seed), res.map.height,
            res.map.width, config.map_height, config.map_width);
    }
    if (config.save_particles &&
        res.coordinates.size() != 3 * config.nparticles) {
      error("Run with seed %llu kept %zu coordinates, expected %zu",
            static_cast<unsigned long long>(res.seed), res.coordinates.size(),
            3 * config.nparticles);
    }
  }

  HDF5Helper hdf5(filename, H5F_ACC_TRUNC);

  // Create the Header group and write out the metadata
  hdf5.createGroup("Header");
  hdf5.writeAttribute<double>("Header", "BoxSize", config.box_length);
  hdf5.writeAttribute<int>("Header", "GridSize", config.grid_size);
  hdf5.writeAttribute<uint64_t>("Header", "NParticles",
                                static_cast<uint64_t>(config.nparticles));
  hdf5.writeAttribute<int>("Header", "NSteps", config.nsteps);
  hdf5.writeAttribute<double>("Header", "TimeStep", config.time_step);
  hdf5.writeAttribute<double>("Header", "GrowthFactor", config.growth_factor);
  hdf5.writeAttribute<int>("Header", "ProjectionAxis", config.projection_axis);
  hdf5.writeAttribute<int>("Header", "NMaps", static_cast<int>(nmaps));

  // The maps themselves, written one slice at a time
  const std::array<hsize_t, 3> map_dims = {nmaps, height, width};
  hdf5.createDataset<float, 3>("Maps_Nbody", map_dims);

  std::vector<float> slice(height * width);
  for (hsize_t i = 0; i < nmaps; i++) {
    const std::vector<double> &values = results[i].map.values;
    for (size_t j = 0; j < values.size(); j++) {
      slice[j] = static_cast<float>(values[j]);
    }
    hdf5.writeDatasetSlice<float, 3>("Maps_Nbody", slice, {i, 0, 0},
                                     {1, height, width});
  }

  // Per map provenance and statistics
  std::vector<uint64_t> seeds(nmaps);
  std::vector<double> mean(nmaps), stdev(nmaps), min(nmaps), max(nmaps);
  for (hsize_t i = 0; i < nmaps; i++) {
    seeds[i] = results[i].seed;
    mean[i] = results[i].stats.mean;
    stdev[i] = results[i].stats.std;
    min[i] = results[i].stats.min;
    max[i] = results[i].stats.max;
  }

  const std::array<hsize_t, 1> stat_dims = {nmaps};
  hdf5.writeDataset<uint64_t, 1>("Seeds", seeds, stat_dims);

  hdf5.createGroup("Statistics");
  hdf5.writeDataset<double, 1>("Statistics/Mean", mean, stat_dims);
  hdf5.writeDataset<double, 1>("Statistics/Std", stdev, stat_dims);
  hdf5.writeDataset<double, 1>("Statistics/Min", min, stat_dims);
  hdf5.writeDataset<double, 1>("Statistics/Max", max, stat_dims);

  // The final particle distributions
  if (config.save_particles) {
    const hsize_t npart = config.nparticles;
    hdf5.createGroup("Particles");
    const std::array<hsize_t, 3> coord_dims = {nmaps, npart, 3};
    hdf5.createDataset<double, 3>("Particles/Coordinates", coord_dims);
    for (hsize_t i = 0; i < nmaps; i++) {
      hdf5.writeDatasetSlice<double, 3>("Particles/Coordinates",
                                        results[i].coordinates, {i, 0, 0},
                                        {1, npart, 3});
    }
  }

  hdf5.close();

  toc("Writing map file");
}
