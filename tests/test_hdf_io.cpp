// Third party includes
#include <gtest/gtest.h>
#include <hdf5.h>

// Standard includes
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Local includes
#include "hdf_io.hpp"
#include "projector.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"

namespace {

std::string tempFile(const std::string &name) {
  return (std::filesystem::temp_directory_path() / ("bayronik_test_" + name))
      .string();
}

SimulationResult makeResult(const int height, const int width,
                            const uint64_t seed) {
  SurfaceDensityMap map(height, width);
  for (size_t i = 0; i < map.values.size(); i++) {
    map.values[i] = 0.25 * static_cast<double>(i + seed);
  }
  const MapStatistics stats = computeMapStatistics(map.values);
  return SimulationResult{map, stats, seed, 1.0, -2.0};
}

} // namespace

TEST(MapFile, WritesHeaderMapsAndStatistics) {
  SimulationConfig config;
  config.map_height = 4;
  config.map_width = 3;
  config.grid_size = 16;

  std::vector<SimulationResult> results;
  results.push_back(makeResult(4, 3, 10));
  results.push_back(makeResult(4, 3, 11));

  const std::string filename = tempFile("write.hdf5");
  writeMapFile(filename, config, results);

  HDF5Helper hdf5(filename, H5F_ACC_RDONLY);

  int nmaps = 0;
  int grid_size = 0;
  double box = 0.0;
  uint64_t npart = 0;
  hdf5.readAttribute<int>("Header", "NMaps", nmaps);
  hdf5.readAttribute<int>("Header", "GridSize", grid_size);
  hdf5.readAttribute<double>("Header", "BoxSize", box);
  hdf5.readAttribute<uint64_t>("Header", "NParticles", npart);
  EXPECT_EQ(nmaps, 2);
  EXPECT_EQ(grid_size, 16);
  EXPECT_DOUBLE_EQ(box, config.box_length);
  EXPECT_EQ(npart, static_cast<uint64_t>(config.nparticles));

  std::vector<float> maps;
  std::vector<hsize_t> dims;
  hdf5.readDataset<float>("Maps_Nbody", maps, dims);
  ASSERT_EQ(dims.size(), 3u);
  EXPECT_EQ(dims[0], 2u);
  EXPECT_EQ(dims[1], 4u);
  EXPECT_EQ(dims[2], 3u);
  for (size_t m = 0; m < 2; m++) {
    for (size_t i = 0; i < 12; i++) {
      EXPECT_FLOAT_EQ(maps[m * 12 + i],
                      static_cast<float>(results[m].map.values[i]));
    }
  }

  std::vector<uint64_t> seeds;
  hdf5.readDataset<uint64_t>("Seeds", seeds, dims);
  ASSERT_EQ(seeds.size(), 2u);
  EXPECT_EQ(seeds[0], 10u);
  EXPECT_EQ(seeds[1], 11u);

  std::vector<double> means;
  hdf5.readDataset<double>("Statistics/Mean", means, dims);
  ASSERT_EQ(means.size(), 2u);
  EXPECT_DOUBLE_EQ(means[1], results[1].stats.mean);

  hdf5.close();
  std::filesystem::remove(filename);
}

TEST(MapFile, WritesParticleCoordinatesOnRequest) {
  SimulationConfig config;
  config.map_height = 2;
  config.map_width = 2;
  config.nparticles = 2;
  config.save_particles = true;

  std::vector<SimulationResult> results;
  results.push_back(makeResult(2, 2, 5));
  results.push_back(makeResult(2, 2, 6));
  results[0].coordinates = {0.5, 1.5, 2.5, 3.5, 4.5, 5.5};
  results[1].coordinates = {6.0, 7.0, 8.0, 9.0, 10.0, 11.0};

  const std::string filename = tempFile("particles.hdf5");
  writeMapFile(filename, config, results);

  HDF5Helper hdf5(filename, H5F_ACC_RDONLY);
  std::vector<double> coords;
  std::vector<hsize_t> dims;
  hdf5.readDataset<double>("Particles/Coordinates", coords, dims);
  ASSERT_EQ(dims.size(), 3u);
  EXPECT_EQ(dims[0], 2u);
  EXPECT_EQ(dims[1], 2u);
  EXPECT_EQ(dims[2], 3u);
  ASSERT_EQ(coords.size(), 12u);
  EXPECT_DOUBLE_EQ(coords[1], 1.5);
  EXPECT_DOUBLE_EQ(coords[11], 11.0);
  hdf5.close();
  std::filesystem::remove(filename);

  // Without the flag there is nothing to find
  config.save_particles = false;
  writeMapFile(filename, config, results);
  HDF5Helper plain(filename, H5F_ACC_RDONLY);
  EXPECT_FALSE(plain.exists("Particles"));
  plain.close();
  std::filesystem::remove(filename);

  // Every run must have kept its particles
  config.save_particles = true;
  results[1].coordinates.clear();
  EXPECT_THROW(writeMapFile(filename, config, results), std::runtime_error);
}

TEST(MapFile, RejectsMismatchedMaps) {
  SimulationConfig config;
  config.map_height = 4;
  config.map_width = 4;

  std::vector<SimulationResult> results;
  results.push_back(makeResult(4, 3, 1));

  EXPECT_THROW(writeMapFile(tempFile("bad.hdf5"), config, results),
               std::runtime_error);
}

TEST(ReferenceMaps, ReadBackAndSummarise) {
  SimulationConfig config;
  config.map_height = 4;
  config.map_width = 3;

  std::vector<SimulationResult> results;
  results.push_back(makeResult(4, 3, 0));
  results.push_back(makeResult(4, 3, 5));

  const std::string filename = tempFile("reference.hdf5");
  writeMapFile(filename, config, results);

  const std::vector<SurfaceDensityMap> maps =
      readReferenceMaps(filename, "Maps_Nbody");
  ASSERT_EQ(maps.size(), 2u);
  EXPECT_EQ(maps[0].height, 4);
  EXPECT_EQ(maps[0].width, 3);
  EXPECT_DOUBLE_EQ(maps[1].values[7],
                   static_cast<float>(results[1].map.values[7]));

  // Reference statistics are those of log1p of every pixel pooled
  std::vector<double> pooled;
  for (const SurfaceDensityMap &map : maps) {
    for (const double v : map.values) {
      pooled.push_back(std::log1p(v));
    }
  }
  const MapStatistics expected = computeMapStatistics(pooled);
  const MapStatistics stats = referenceStatistics(maps);
  EXPECT_DOUBLE_EQ(stats.mean, expected.mean);
  EXPECT_DOUBLE_EQ(stats.std, expected.std);

  EXPECT_THROW(readReferenceMaps(filename, "Maps_Mcdm"), std::runtime_error);

  std::filesystem::remove(filename);
}

TEST(ReferenceMaps, MissingFileThrows) {
  EXPECT_THROW(readReferenceMaps(tempFile("does_not_exist.hdf5"), "Maps_Mcdm"),
               std::runtime_error);
}

TEST(ReferenceMaps, EmptySetThrows) {
  EXPECT_THROW(referenceStatistics({}), std::runtime_error);
}
