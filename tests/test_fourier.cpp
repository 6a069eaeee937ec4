// Third party includes
#include <gtest/gtest.h>

// Standard includes
#include <cmath>
#include <complex>
#include <random>
#include <string>
#include <vector>

// Local includes
#include "errors.hpp"
#include "fourier.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

TEST(FourierTransform, RoundTrip) {
  FourierTransform fft(8);

  std::mt19937_64 rng(3);
  std::uniform_real_distribution<double> uniform(-1.0, 1.0);
  std::vector<double> field(fft.nreal);
  for (double &v : field) {
    v = uniform(rng);
  }

  std::vector<std::complex<double>> modes;
  std::vector<double> back;
  fft.forward(field, modes);
  fft.inverse(modes, back);

  ASSERT_EQ(back.size(), field.size());
  for (size_t i = 0; i < field.size(); i++) {
    EXPECT_NEAR(back[i], field[i], 1e-12);
  }
}

TEST(FourierTransform, ConstantFieldOnlyHasMeanMode) {
  FourierTransform fft(4);
  std::vector<double> field(fft.nreal, 2.0);
  std::vector<std::complex<double>> modes;
  fft.forward(field, modes);

  ASSERT_EQ(modes.size(), fft.nmodes);
  EXPECT_NEAR(modes[0].real(), 2.0 * fft.nreal, 1e-10);
  for (size_t i = 1; i < modes.size(); i++) {
    EXPECT_NEAR(std::abs(modes[i]), 0.0, 1e-10);
  }
}

TEST(FourierTransform, SingleModeLandsInItsSlot) {
  const int n = 8;
  FourierTransform fft(n);
  std::vector<double> field(fft.nreal);
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) {
      for (int k = 0; k < n; k++) {
        field[(static_cast<size_t>(i) * n + j) * n + k] =
            std::cos(2.0 * M_PI * i / n);
      }
    }
  }

  std::vector<std::complex<double>> modes;
  fft.forward(field, modes);

  EXPECT_NEAR(modes[fft.modeIndex(1, 0, 0)].real(), 0.5 * fft.nreal, 1e-9);
  EXPECT_NEAR(modes[fft.modeIndex(n - 1, 0, 0)].real(), 0.5 * fft.nreal,
              1e-9);
  EXPECT_NEAR(std::abs(modes[fft.modeIndex(0, 1, 0)]), 0.0, 1e-9);
  EXPECT_NEAR(std::abs(modes[fft.modeIndex(0, 0, 1)]), 0.0, 1e-9);
}

TEST(FourierTransform, RejectsBadSizes) {
  EXPECT_THROW(FourierTransform fft(12), ConfigurationError);
  EXPECT_THROW(FourierTransform fft(1), ConfigurationError);
  EXPECT_THROW(FourierTransform fft(0), ConfigurationError);
}

TEST(FourierTransform, RejectsMismatchedFields) {
  FourierTransform fft(4);
  std::vector<double> field(10, 0.0);
  std::vector<std::complex<double>> modes;
  EXPECT_THROW(fft.forward(field, modes), ConfigurationError);
}

TEST(FourierTransform, ReportsVersion) {
  EXPECT_NE(std::string(fftwVersion()).find("fftw"), std::string::npos);
}
