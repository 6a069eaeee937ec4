// Standard includes
#include <algorithm>
#include <complex>
#include <cstring>
#include <mutex>
#include <vector>

// FFTW includes
#include <fftw3.h>

// Local includes
#include "fourier.hpp"
#include "logger.hpp"
#include "sim_config.hpp"

namespace {
// Only fftw_execute is thread safe, everything touching the planner is not
std::mutex planner_mutex;
} // namespace

/**
 * @brief Construct the plans for a cdim^3 lattice.
 *
 * @param cdim The number of cells along an axis (a power of two)
 *
 * @throw ConfigurationError If cdim is not a power of two.
 */
FourierTransform::FourierTransform(const int cdim)
    : cdim(cdim), nreal(static_cast<size_t>(cdim) * cdim * cdim),
      nmodes(static_cast<size_t>(cdim) * cdim * (cdim / 2 + 1)),
      nzmodes(cdim / 2 + 1) {

  if (cdim < 2 || !isPowerOfTwo(cdim)) {
    config_error("The transform needs a power of two grid >= 2 (got %d)",
                 cdim);
  }

  std::lock_guard<std::mutex> lock(planner_mutex);

  this->real_buffer = fftw_alloc_real(this->nreal);
  this->complex_buffer = fftw_alloc_complex(this->nmodes);
  if (this->real_buffer == nullptr || this->complex_buffer == nullptr) {
    fftw_free(this->real_buffer);
    fftw_free(this->complex_buffer);
    error("Failed to allocate FFT buffers for a %d^3 grid", cdim);
  }

  // FFTW_ESTIMATE leaves the buffers untouched while planning
  this->forward_plan =
      fftw_plan_dft_r2c_3d(cdim, cdim, cdim, this->real_buffer,
                           this->complex_buffer, FFTW_ESTIMATE);
  this->inverse_plan =
      fftw_plan_dft_c2r_3d(cdim, cdim, cdim, this->complex_buffer,
                           this->real_buffer, FFTW_ESTIMATE);

  if (this->forward_plan == nullptr || this->inverse_plan == nullptr) {
    if (this->forward_plan != nullptr) {
      fftw_destroy_plan(this->forward_plan);
    }
    if (this->inverse_plan != nullptr) {
      fftw_destroy_plan(this->inverse_plan);
    }
    fftw_free(this->real_buffer);
    fftw_free(this->complex_buffer);
    error("FFTW failed to plan a %d^3 transform", cdim);
  }
}

/**
 * @brief Destroy the plans and free the buffers.
 */
FourierTransform::~FourierTransform() {
  std::lock_guard<std::mutex> lock(planner_mutex);
  fftw_destroy_plan(this->forward_plan);
  fftw_destroy_plan(this->inverse_plan);
  fftw_free(this->real_buffer);
  fftw_free(this->complex_buffer);
}

/**
 * @brief Forward transform of a real field.
 *
 * @param field The real field (cdim^3 values)
 * @param modes The half-complex spectrum (resized to nmodes)
 */
void FourierTransform::forward(const std::vector<double> &field,
                               std::vector<std::complex<double>> &modes) {

  if (field.size() != this->nreal) {
    config_error("Field of %zu values doesn't match the %d^3 transform",
                 field.size(), this->cdim);
  }

  std::copy(field.begin(), field.end(), this->real_buffer);

  fftw_execute(this->forward_plan);

  // std::complex<double> is layout compatible with fftw_complex
  modes.resize(this->nmodes);
  std::memcpy(modes.data(), this->complex_buffer,
              sizeof(fftw_complex) * this->nmodes);
}

/**
 * @brief Normalised inverse transform of a half-complex spectrum.
 *
 * Only the stored half of the spectrum is read, the result is the real field
 * whose spectrum is Hermitian-symmetric with that half.
 *
 * @param modes The half-complex spectrum (nmodes values)
 * @param field The real field (resized to cdim^3)
 */
void FourierTransform::inverse(const std::vector<std::complex<double>> &modes,
                               std::vector<double> &field) {

  if (modes.size() != this->nmodes) {
    config_error("Spectrum of %zu modes doesn't match the %d^3 transform",
                 modes.size(), this->cdim);
  }

  // The complex-to-real transform overwrites its input so we always work on
  // the plan's own copy
  std::memcpy(this->complex_buffer, modes.data(),
              sizeof(fftw_complex) * this->nmodes);

  fftw_execute(this->inverse_plan);

  const double norm = 1.0 / static_cast<double>(this->nreal);
  field.resize(this->nreal);
  for (size_t i = 0; i < this->nreal; i++) {
    field[i] = this->real_buffer[i] * norm;
  }
}

/**
 * @brief The version string of the linked FFTW library.
 */
const char *fftwVersion() { return fftw_version; }
