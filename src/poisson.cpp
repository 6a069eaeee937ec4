// Standard includes
#include <cmath>
#include <complex>
#include <vector>

// Local includes
#include "fourier.hpp"
#include "grid.hpp"
#include "logger.hpp"
#include "poisson.hpp"

// Define M_PI if not available (POSIX extension, not standard C++)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

/**
 * @brief Construct a solver for a grid.
 *
 * @param grid The grid the solver will be applied to
 * @param G The gravitational constant
 * @param growth_factor The force amplification
 */
PoissonSolver::PoissonSolver(const Grid &grid, const double G,
                             const double growth_factor)
    : G(G), growth_factor(growth_factor), fft(grid.cdim),
      box_size(grid.box_size) {
  this->density_modes.resize(this->fft.nmodes);
  this->potential_modes.resize(this->fft.nmodes);
}

/**
 * @brief Compute the potential and force fields from the grid's density.
 *
 * @param grid The grid, its density is read and its potential and force
 * arrays are overwritten.
 */
void PoissonSolver::solve(Grid &grid) {

  if (grid.cdim != this->fft.cdim || grid.box_size != this->box_size) {
    config_error("Solver built for a %d^3 grid of size %f was given a %d^3 "
                 "grid of size %f",
                 this->fft.cdim, this->box_size, grid.cdim, grid.box_size);
  }

  const int n = grid.cdim;
  const int nz = this->fft.nzmodes;
  const double kf = 2.0 * M_PI / grid.box_size;
  const double green_norm = -4.0 * M_PI * this->G;

  // Transform the density
  this->fft.forward(grid.density, this->density_modes);

  // Apply the Green's function
#pragma omp parallel for schedule(static)
  for (int i = 0; i < n; i++) {
    const double kx = kf * frequencyIndex(i, n);
    for (int j = 0; j < n; j++) {
      const double ky = kf * frequencyIndex(j, n);
      for (int k = 0; k < nz; k++) {
        const double kz = kf * k;
        const size_t mid = this->fft.modeIndex(i, j, k);
        const double k2 = kx * kx + ky * ky + kz * kz;

        // The mean density has no gravitational field
        if (k2 == 0.0) {
          this->potential_modes[mid] = 0.0;
        } else {
          this->potential_modes[mid] =
              green_norm * this->density_modes[mid] / k2;
        }
      }
    }
  }

  this->fft.inverse(this->potential_modes, grid.potential);

  differentiatePotential(grid);
}

/**
 * @brief Fill the force arrays with the centred difference of the potential.
 *
 * In Fourier space this is the potential times -i sin(k h) / h, which is
 * zero at the Nyquist frequency.
 *
 * @param grid The grid, its potential is read and its force arrays are
 * overwritten.
 */
void PoissonSolver::differentiatePotential(Grid &grid) const {

  const int n = grid.cdim;
  const double scale = this->growth_factor / (2.0 * grid.width);
  const std::vector<double> &phi = grid.potential;

#pragma omp parallel for schedule(static)
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) {
      for (int k = 0; k < n; k++) {
        const size_t cid = grid.index(i, j, k);
        grid.force[0][cid] = -scale * (phi[grid.index(i + 1, j, k)] -
                                       phi[grid.index(i - 1, j, k)]);
        grid.force[1][cid] = -scale * (phi[grid.index(i, j + 1, k)] -
                                       phi[grid.index(i, j - 1, k)]);
        grid.force[2][cid] = -scale * (phi[grid.index(i, j, k + 1)] -
                                       phi[grid.index(i, j, k - 1)]);
      }
    }
  }
}
