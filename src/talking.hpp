// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
//
// This header file contains functions related to "talking" to the user.

#ifndef TALKING_H_
#define TALKING_H_

// Standard includes
#include <iostream>
#include <string>

#ifdef WITH_MPI
#include <mpi.h>
#endif

// Local includes
#include "fourier.hpp"
#include "version.h"

inline std::string padString(const std::string &input, std::size_t length) {

  /* Set up the result. */
  std::string result = input;

  /* Loop until the desired length is reached. */
  while (result.length() < length) {
    result += " ";
  }
  return result;
}

/**
 * @brief Prints a greeting message to the standard output containing code
 * version, revision number and the versions of the libraries we lean on.
 */
inline void say_hello() {

  const std::string string1 = R"( ____ ____ ____ ____ ____ ____ ____ ____ )";
  const std::string string2 = R"(||B |||A |||Y |||R |||O |||N |||I |||K ||)";
  const std::string string3 = R"(||__|||__|||__|||__|||__|||__|||__|||__||)";
  const std::string string4 = R"(|/__\|/__\|/__\|/__\|/__\|/__\|/__\|/__\|)";

  std::cout << std::endl;
  std::cout << string1 << std::endl;
  std::cout << string2 << std::endl;
  std::cout << string3 << std::endl;
  std::cout << string4 << std::endl;
  std::cout << std::endl;

  /* Report some information about the version being run. */
  const int nPad = 30;
  std::cout << padString(" Version : ", nPad) << PROJECT_VERSION_MAJOR << "."
            << PROJECT_VERSION_MINOR << "." << PROJECT_VERSION_PATCH
            << std::endl;

  std::cout << std::endl;

  std::cout << " Git:" << std::endl
            << padString(" On branch: ", nPad) << GIT_BRANCH << std::endl
            << padString(" Using revision: ", nPad) << GIT_REVISION
            << std::endl
            << padString(" Last updated: ", nPad) << GIT_DATE << std::endl;

  std::cout << std::endl;

  std::cout << padString(" Compiler: ", nPad) << COMPILER_INFO << std::endl;
  std::cout << padString(" CFLAGS: ", nPad) << CFLAGS_INFO << std::endl;

  std::cout << std::endl;

  std::cout << padString(" HDF5 library version: ", nPad) << HDF5_VERSION
            << std::endl;
  std::cout << padString(" FFTW library version: ", nPad) << fftwVersion()
            << std::endl;
#ifdef WITH_MPI
  char mpi_version[MPI_MAX_LIBRARY_VERSION_STRING];
  int len = 0;
  MPI_Get_library_version(mpi_version, &len);
  std::cout << padString(" MPI library version: ", nPad)
            << std::string(mpi_version, len) << std::endl;
#endif
  std::cout << std::endl;
}

#endif // TALKING_H_
