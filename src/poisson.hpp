// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef POISSON_HPP
#define POISSON_HPP

// Standard includes
#include <complex>
#include <vector>

// Local includes
#include "fourier.hpp"
#include "grid.hpp"

/**
 * @brief Solves Poisson's equation on the periodic grid in Fourier space.
 *
 * For every mode k != 0 the potential is
 *
 *     phi(k) = -4 pi G rho(k) / k^2
 *
 * and the k = 0 mode is dropped (the mean density exerts no force in a
 * periodic box). The force per unit mass is the centred difference of the
 * real-space potential,
 *
 *     F_x(i) = -(phi(i+1) - phi(i-1)) / (2 h)
 *
 * scaled by the growth factor.
 */
class PoissonSolver {
public:
  //! The gravitational constant in code units
  const double G;

  //! Uniform amplification of the force field
  const double growth_factor;

  // Prototypes for member functions (defined in poisson.cpp)
  PoissonSolver(const Grid &grid, const double G, const double growth_factor);

  void solve(Grid &grid);

private:
  //! The transform (planned for the grid this solver was built for)
  FourierTransform fft;

  //! The box size the wavenumbers are computed for
  double box_size;

  //! Working spectra
  std::vector<std::complex<double>> density_modes;
  std::vector<std::complex<double>> potential_modes;

  void differentiatePotential(Grid &grid) const;
};

#endif // POISSON_HPP
