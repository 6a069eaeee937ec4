// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef METADATA_HPP
#define METADATA_HPP

// Standard includes
#include <string>

// Local includes
#include "params.hpp"

// This is a Singleton class to store the run-wide metadata (how the program
// was invoked and where things go). The physics itself never reads it, so
// independent simulations can run side by side.
class Metadata {
public:
  // Method to get the instance of the Metadata class
  static Metadata &getInstance() {
    static Metadata instance; // Create static instance of Metadata
    return instance;
  }

  // MPI information (set in main.parseCmdArgs)
  int rank = 0;
  int size = 1;

  // Parameter file path (set in main.parseCmdArgs)
  std::string param_file;

  // HDF5 output file path (rank suffixed in MPI builds)
  std::string output_file;

  // Optional HDF5 file of reference maps to match statistics against
  std::string reference_file;

  // The dataset holding the reference maps
  std::string reference_dataset;

  // Verbosity level (0=minimal, 1=rank 0 only, 2=all ranks)
  int verbosity = 1;

  // Number of OpenMP threads (set in main.parseCmdArgs)
  int nthreads = 1;

  // How many independent samples do we generate? (0 until set from the
  // command line or the parameter file)
  int nsamples = 0;

  // Should we rerun the first sample and demand an identical map?
  bool check_reproducibility = false;

  // Deleted copy constructor and copy assignment to prevent duplication
  Metadata(const Metadata &) = delete;            // Copy constructor
  Metadata &operator=(const Metadata &) = delete; // Copy assignment operator

private:
  // Private constructor and destructor to ensure that only one instance of the
  // class is created
  Metadata() {}
  ~Metadata() {}

  // Deleted move constructor and move assignment to ensure singleton
  Metadata(Metadata &&) = delete;            // Move constructor
  Metadata &operator=(Metadata &&) = delete; // Move assignment operator
};

// Prototype for reading metadata (defined in metadata.cpp)
void readMetadata(Parameters *params);

#endif // METADATA_HPP
