// Third party includes
#include <gtest/gtest.h>

// Standard includes
#include <memory>
#include <sstream>
#include <string>

// Local includes
#include "errors.hpp"
#include "params.hpp"
#include "sim_config.hpp"

namespace {

SimulationConfig configFrom(const std::string &text) {
  std::istringstream stream(text);
  std::unique_ptr<Parameters> params(parseParamsStream(stream));
  return readSimulationConfig(params.get());
}

} // namespace

TEST(SimulationConfig, Defaults) {
  const SimulationConfig config = configFrom("");
  EXPECT_EQ(config.grid_size, 64);
  EXPECT_DOUBLE_EQ(config.box_length, 100.0);
  EXPECT_EQ(config.nparticles, static_cast<size_t>(64 * 64 * 64));
  EXPECT_EQ(config.nsteps, 10);
  EXPECT_DOUBLE_EQ(config.time_step, 0.01);
  EXPECT_DOUBLE_EQ(config.growth_factor, 1.0);
  EXPECT_EQ(config.seed, 42u);
  EXPECT_EQ(config.projection_axis, 2);
  EXPECT_EQ(config.map_height, 256);
  EXPECT_EQ(config.map_width, 256);
  EXPECT_FALSE(config.rescale);
  EXPECT_FALSE(config.save_particles);
}

TEST(SimulationConfig, ReadsEveryGroup) {
  const SimulationConfig config = configFrom("Simulation:\n"
                                             "  grid_size: 32\n"
                                             "  box_length: 25\n"
                                             "  nparticles: 4096\n"
                                             "  nsteps: 5\n"
                                             "  time_step: 0.02\n"
                                             "  growth_factor: 1.5\n"
                                             "  seed: 7\n"
                                             "Gravity:\n"
                                             "  G: 4.3e-6\n"
                                             "InitialConditions:\n"
                                             "  spectral_index: -1\n"
                                             "  velocity_dispersion: 0\n"
                                             "Projection:\n"
                                             "  axis: 0\n"
                                             "  map_height: 64\n"
                                             "  map_width: 128\n"
                                             "Output:\n"
                                             "  save_particles: 1\n");
  EXPECT_EQ(config.grid_size, 32);
  EXPECT_DOUBLE_EQ(config.box_length, 25.0);
  EXPECT_EQ(config.nparticles, 4096u);
  EXPECT_EQ(config.nsteps, 5);
  EXPECT_DOUBLE_EQ(config.time_step, 0.02);
  EXPECT_DOUBLE_EQ(config.growth_factor, 1.5);
  EXPECT_EQ(config.seed, 7u);
  EXPECT_DOUBLE_EQ(config.G, 4.3e-6);
  EXPECT_DOUBLE_EQ(config.spectral_index, -1.0);
  EXPECT_DOUBLE_EQ(config.velocity_dispersion, 0.0);
  EXPECT_EQ(config.projection_axis, 0);
  EXPECT_EQ(config.map_height, 64);
  EXPECT_EQ(config.map_width, 128);
  EXPECT_TRUE(config.save_particles);
}

TEST(SimulationConfig, ParticlesPerCell) {
  const SimulationConfig config = configFrom("Simulation:\n"
                                             "  grid_size: 16\n"
                                             "  particles_per_cell: 0.5\n");
  EXPECT_EQ(config.nparticles, 2048u);
}

TEST(SimulationConfig, RejectsInvalidValues) {
  EXPECT_THROW(configFrom("Simulation:\n  grid_size: 48\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  grid_size: 1\n"), ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  box_length: 0\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  box_length: -5.0\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  nparticles: 0\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  time_step: 0\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  seed: -1\n"), ConfigurationError);
  EXPECT_THROW(configFrom("Projection:\n  axis: 3\n"), ConfigurationError);
  EXPECT_THROW(configFrom("Projection:\n  map_height: 0\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Projection:\n  rescale: 1\n  target_std: 0\n"),
               ConfigurationError);
}

TEST(SimulationConfig, SeedsUseAllSixtyFourBits) {
  EXPECT_EQ(configFrom("Simulation:\n  seed: 3000000000\n").seed,
            3000000000ull);
  EXPECT_EQ(configFrom("Simulation:\n  seed: 18446744073709551615\n").seed,
            18446744073709551615ull);
  EXPECT_THROW(configFrom("Simulation:\n  seed: 18446744073709551616\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  seed: lucky\n"),
               ConfigurationError);
  EXPECT_THROW(configFrom("Simulation:\n  seed: 4.5\n"), ConfigurationError);
}

TEST(SimulationConfig, ValidateDirectly) {
  SimulationConfig config;
  EXPECT_NO_THROW(validateConfig(config));

  config.nsteps = 0;
  EXPECT_NO_THROW(validateConfig(config));

  config.nsteps = -1;
  EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(SimulationConfig, PowerOfTwo) {
  EXPECT_TRUE(isPowerOfTwo(1));
  EXPECT_TRUE(isPowerOfTwo(2));
  EXPECT_TRUE(isPowerOfTwo(64));
  EXPECT_FALSE(isPowerOfTwo(0));
  EXPECT_FALSE(isPowerOfTwo(-4));
  EXPECT_FALSE(isPowerOfTwo(48));
}
