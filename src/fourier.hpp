// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef FOURIER_HPP
#define FOURIER_HPP

// Standard includes
#include <complex>
#include <cstddef>
#include <vector>

// FFTW includes
#include <fftw3.h>

/**
 * @brief Forward and inverse 3D real transforms on a periodic cdim^3 lattice.
 *
 * Real fields are stored row-major (x slowest, z fastest). Their spectra use
 * the half-complex layout of a real-to-complex transform: cdim x cdim x
 * (cdim / 2 + 1) modes, the missing half being the complex conjugate of the
 * stored one.
 *
 * The forward transform is unnormalised and the inverse divides by cdim^3,
 * so inverse(forward(f)) == f up to rounding.
 *
 * Plans are built once per object. Planning and destroying plans goes through
 * a global lock (the FFTW planner is not re-entrant), executing them does not,
 * so different FourierTransform objects can be used from different threads.
 */
class FourierTransform {
public:
  //! The number of cells along an axis
  const int cdim;

  //! The number of real values (cdim^3)
  const size_t nreal;

  //! The number of stored modes (cdim * cdim * (cdim / 2 + 1))
  const size_t nmodes;

  //! The length of the last axis in the half-complex layout
  const int nzmodes;

  // Prototypes for member functions (defined in fourier.cpp)
  explicit FourierTransform(const int cdim);
  ~FourierTransform();

  FourierTransform(const FourierTransform &) = delete;
  FourierTransform &operator=(const FourierTransform &) = delete;

  void forward(const std::vector<double> &field,
               std::vector<std::complex<double>> &modes);
  void inverse(const std::vector<std::complex<double>> &modes,
               std::vector<double> &field);

  /**
   * @brief The flat index of mode (i, j, k) in the half-complex layout.
   */
  size_t modeIndex(const int i, const int j, const int k) const {
    return (static_cast<size_t>(i) * cdim + j) * nzmodes + k;
  }

private:
  //! Working buffers the plans were made for (FFTW aligned)
  double *real_buffer;
  fftw_complex *complex_buffer;

  //! The plans
  fftw_plan forward_plan;
  fftw_plan inverse_plan;
};

const char *fftwVersion();

#endif // FOURIER_HPP
