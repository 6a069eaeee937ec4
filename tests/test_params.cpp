// Third party includes (before any local header, the logging macros would
// otherwise clash with gtest's)
#include <gtest/gtest.h>

// Standard includes
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

// Local includes
#include "metadata.hpp"
#include "params.hpp"

namespace {

std::unique_ptr<Parameters> parse(const std::string &text) {
  std::istringstream stream(text);
  return std::unique_ptr<Parameters>(parseParamsStream(stream));
}

} // namespace

TEST(StringToVariant, ClassifiesNumbersAndStrings) {
  EXPECT_EQ(std::get<int>(stringToVariant("42")), 42);
  EXPECT_EQ(std::get<int>(stringToVariant("-3")), -3);
  EXPECT_DOUBLE_EQ(std::get<double>(stringToVariant("2.5")), 2.5);
  EXPECT_DOUBLE_EQ(std::get<double>(stringToVariant("2.5e-3")), 2.5e-3);
  EXPECT_DOUBLE_EQ(std::get<double>(stringToVariant("1E10")), 1e10);
  EXPECT_EQ(std::get<std::string>(stringToVariant("\"123\"")), "123");
  EXPECT_EQ(std::get<std::string>(stringToVariant("1.2.3")), "1.2.3");
  EXPECT_EQ(std::get<std::string>(stringToVariant("maps")), "maps");
  EXPECT_EQ(std::get<std::string>(stringToVariant("e5")), "e5");
}

TEST(ParseParams, ReadsSectionsAndComments) {
  auto params = parse("# A comment line\n"
                      "Simulation:\n"
                      "  grid_size: 32   # trailing comment\n"
                      "  box_length: 25.0\n"
                      "\n"
                      "Output:\n"
                      "  basename: \"maps\"\n");

  EXPECT_EQ(params->getParameter<int>("Simulation/grid_size", 0), 32);
  EXPECT_DOUBLE_EQ(params->getParameter<double>("Simulation/box_length", 0.0),
                   25.0);
  EXPECT_EQ(params->getParameterString("Output/basename", ""), "maps");
  EXPECT_FALSE(params->exists("grid_size"));
}

TEST(ParseParams, PromotesIntegersToDoubles) {
  auto params = parse("Simulation:\n  box_length: 100\n");
  EXPECT_DOUBLE_EQ(params->getParameter<double>("Simulation/box_length", 0.0),
                   100.0);
}

TEST(ParseParams, DefaultsAreStored) {
  auto params = parse("Simulation:\n  grid_size: 16\n");
  EXPECT_FALSE(params->exists("Simulation/nsteps"));
  EXPECT_EQ(params->getParameter<int>("Simulation/nsteps", 10), 10);
  EXPECT_TRUE(params->exists("Simulation/nsteps"));
}

TEST(ParseParams, MissingAndMistypedParametersThrow) {
  auto params = parse("Output:\n  basename: maps\n");
  EXPECT_THROW(params->getParameterNoDefault<std::string>("Output/filepath"),
               std::runtime_error);
  EXPECT_THROW(params->getParameter<int>("Output/basename", 0),
               std::runtime_error);
}

TEST(ParseParams, MissingFileThrows) {
  EXPECT_THROW(parseParams("/nonexistent/bayronik/params.yml"),
               std::runtime_error);
}

TEST(OutputPath, CombinesDirectoryAndBasename) {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "bayronik_test_output_path";
  std::filesystem::remove_all(dir);

  auto params = parse("Output:\n  filepath: " + dir.string() +
                      "\n  basename: maps\n");

  const std::string path = getOutputFilePath(params.get(), 3);

#ifdef WITH_MPI
  EXPECT_EQ(path, dir.string() + "/maps_0003.hdf5");
#else
  EXPECT_EQ(path, dir.string() + "/maps.hdf5");
#endif
  EXPECT_TRUE(std::filesystem::is_directory(dir));

  std::filesystem::remove_all(dir);
}

TEST(ReadMetadata, SampleCountAndReference) {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "bayronik_test_metadata";

  auto params = parse("Run:\n"
                      "  nsamples: 3\n"
                      "  check_reproducibility: 1\n"
                      "Input:\n"
                      "  reference_file: camels.hdf5\n"
                      "Output:\n"
                      "  filepath: " +
                      dir.string() +
                      "\n"
                      "  basename: maps\n");

  Metadata &metadata = Metadata::getInstance();
  metadata.nsamples = 0;
  readMetadata(params.get());

  EXPECT_EQ(metadata.nsamples, 3);
  EXPECT_TRUE(metadata.check_reproducibility);
  EXPECT_EQ(metadata.reference_file, "camels.hdf5");
  EXPECT_EQ(metadata.reference_dataset, "Maps_Mcdm");

  // The command line wins over the parameter file
  metadata.nsamples = 5;
  readMetadata(params.get());
  EXPECT_EQ(metadata.nsamples, 5);

  // Reset the singleton for other tests
  metadata.nsamples = 0;
  metadata.check_reproducibility = false;
  metadata.reference_file.clear();
  std::filesystem::remove_all(dir);
}
