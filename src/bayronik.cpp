// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.

// Standard includes
#include <iostream>
#include <memory>
#include <omp.h>
#include <string>
#include <vector>

// MPI includes
#ifdef WITH_MPI
#include <mpi.h>
#endif

// Local includes
#include "cmd_parser.hpp"
#include "errors.hpp"
#include "hdf_io.hpp"
#include "logger.hpp"
#include "metadata.hpp"
#include "params.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"
#include "talking.hpp"

/**
 * @brief Function to handle the command line arguments
 *
 * @param argc The number of command line arguments
 * @param argv The command line arguments
 * @param rank MPI rank for error reporting
 * @param size MPI size
 * @return CommandLineArgs structure with parsed arguments
 * @throws std::runtime_error if parsing fails
 */
CommandLineArgs parseCmdArgs(int argc, char *argv[], int rank = 0,
                             int size = 1) {

  CommandLineArgs args = CommandLineParser::parse(argc, argv);

  // Handle help request
  if (args.help_requested) {
    if (rank == 0) {
      CommandLineParser::printUsage(argv[0]);
    }
    return args;
  }

  // Get a metadata instance and configure it
  Metadata *metadata = &Metadata::getInstance();
  metadata->param_file = args.parameter_file;
  metadata->nsamples = args.nsamples;
  metadata->verbosity = args.verbosity;
  metadata->nthreads = args.nthreads;
  metadata->rank = rank;
  metadata->size = size;

  // Set the number of threads (this is a global setting)
  omp_set_num_threads(args.nthreads);

  Logging::getInstance()->setRank(rank);

  return args;
}

/**
 * @brief Generate this rank's share of the samples.
 *
 * Sample i is generated from seed + i by rank i % size so every map depends
 * only on the base configuration and its index, whatever the rank count.
 *
 * @param base The configuration shared by every sample
 * @return The results in sample order
 */
std::vector<SimulationResult> generateSamples(const SimulationConfig &base) {

  Metadata *metadata = &Metadata::getInstance();

  std::vector<SimulationResult> results;
  bool checked = false;

  for (int isample = 0; isample < metadata->nsamples; isample++) {

    if (isample % metadata->size != metadata->rank) {
      continue;
    }

    SimulationConfig config = base;
    config.seed = base.seed + static_cast<uint64_t>(isample);

    Logging::getInstance()->setSample(isample);
    message("Generating sample %d (seed %llu)", isample,
            static_cast<unsigned long long>(config.seed));

    // Optionally demand the first sample is bit reproducible
    if (metadata->check_reproducibility && !checked) {
      results.push_back(verifyReproducibility(config));
      checked = true;
    } else {
      results.push_back(run(config));
    }
  }

  Logging::getInstance()->clearSample();

  return results;
}

/**
 * @brief Main function
 *
 * @param argc The number of command line arguments
 * @param argv The command line arguments
 * @return int The exit status
 */
int main(int argc, char *argv[]) {

  // Handle MPI setup if we need it
  int rank, size;
#ifdef WITH_MPI
  int mpi_initialized = 0;
  MPI_Initialized(&mpi_initialized);
  if (!mpi_initialized) {
    int ierr = MPI_Init(&argc, &argv);
    if (ierr != MPI_SUCCESS) {
      std::cerr << "MPI_Init failed!" << std::endl;
      MPI_Abort(MPI_COMM_WORLD, ierr);
    }
  }

  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);
#else
  rank = 0;
  size = 1;
#endif

  // Parse the command line arguments
  CommandLineArgs args;
  try {
    args = parseCmdArgs(argc, argv, rank, size);
    if (args.help_requested) {
#ifdef WITH_MPI
      MPI_Finalize();
#endif
      return 0;
    }
  } catch (const std::exception &e) {
    if (rank == 0) {
      CommandLineParser::printError(e.what(), argv[0]);
    }
#ifdef WITH_MPI
    MPI_Finalize();
#endif
    return 1;
  }

  // Howdy
  if (rank == 0) {
    say_hello();
  }

  // Start the timer for the whole shebang
  start();

  Metadata *metadata = &Metadata::getInstance();

  try {

#ifdef WITH_MPI
    message("Running on %d MPI ranks", metadata->size);
#endif

    // Read the parameters from the parameter file
    std::unique_ptr<Parameters> params(parseParams(metadata->param_file));

#ifdef DEBUGGING_CHECKS
    params->printAllParameters();
#endif

    // Setup the metadata we need to carry around (some has already been set
    // during command line argument parsing)
    readMetadata(params.get());

    // The configuration every sample shares
    SimulationConfig config = readSimulationConfig(params.get());

    // Match the statistics of a set of reference maps if we have them
    if (!metadata->reference_file.empty()) {
      const std::vector<SurfaceDensityMap> reference = readReferenceMaps(
          metadata->reference_file, metadata->reference_dataset);
      const MapStatistics stats = referenceStatistics(reference);
      config.rescale = true;
      config.target_mean = stats.mean;
      config.target_std = stats.std;
      validateConfig(config);
    }

    reportConfig(config);
    message("Generating %d samples", metadata->nsamples);

    const std::vector<SimulationResult> results = generateSamples(config);

    writeMapFile(metadata->output_file, config, results);

  } catch (const std::exception &e) {
    report_error(e.what());
#ifdef WITH_MPI
    if (size > 1) {
      MPI_Abort(MPI_COMM_WORLD, 1);
    }
    MPI_Finalize();
#endif
    return 1;
  }

  // Stop the timer for the whole shebang
  finish();

#ifdef WITH_MPI
  MPI_Finalize();
#endif

  return 0;
}
