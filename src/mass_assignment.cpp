// Standard includes
#include <array>
#include <new>
#include <omp.h>
#include <vector>

// Local includes
#include "grid.hpp"
#include "logger.hpp"
#include "mass_assignment.hpp"
#include "particle.hpp"

/**
 * @brief Add one particle's mass to a density array with CIC weights.
 *
 * @param part The particle
 * @param grid The grid defining the geometry
 * @param density The (flattened) density array to accumulate into
 */
static void depositParticle(const Particle &part, const Grid &grid,
                            std::vector<double> &density) {

  const int n = grid.cdim;
  const CICWeights wx = cicWeights(part.pos[0], grid.inv_width, n);
  const CICWeights wy = cicWeights(part.pos[1], grid.inv_width, n);
  const CICWeights wz = cicWeights(part.pos[2], grid.inv_width, n);

  const double rho = part.mass / grid.cell_volume;

  const int ix[2] = {wx.lo, wx.hi};
  const int iy[2] = {wy.lo, wy.hi};
  const int iz[2] = {wz.lo, wz.hi};
  const double fx[2] = {wx.w_lo, wx.w_hi};
  const double fy[2] = {wy.w_lo, wy.w_hi};
  const double fz[2] = {wz.w_lo, wz.w_hi};

  for (int a = 0; a < 2; a++) {
    for (int b = 0; b < 2; b++) {
      const size_t row = (static_cast<size_t>(ix[a]) * n + iy[b]) * n;
      const double wab = rho * fx[a] * fy[b];
      for (int c = 0; c < 2; c++) {
        density[row + iz[c]] += wab * fz[c];
      }
    }
  }
}

/**
 * @brief Deposit the particles onto the grid's density field (CIC).
 *
 * The density is reset first. Each particle adds mass / cell_volume times its
 * eight trilinear weights to the surrounding nodes, wrapping periodically,
 * so sum(density) * cell_volume equals the total particle mass.
 *
 * With more than one thread every thread accumulates into its own copy of the
 * grid (static schedule) and the copies are summed in thread order. The result
 * therefore only depends on the particle order and the thread count.
 *
 * @param particles The particles
 * @param grid The grid to deposit onto
 */
void depositMass(const ParticleEnsemble &particles, Grid &grid) {

  grid.clearDensity();

  const size_t npart = particles.size();
  const int nthreads = omp_get_max_threads();

  // Serial reference path
  if (nthreads == 1 || npart < 1024) {
    for (size_t pid = 0; pid < npart; pid++) {
      depositParticle(particles[pid], grid, grid.density);
    }
    return;
  }

  // Per-thread partial grids (allocated up front, nothing may throw out of
  // the parallel region)
  std::vector<std::vector<double>> partial;
  try {
    partial.assign(nthreads, std::vector<double>(grid.ncells, 0.0));
  } catch (const std::bad_alloc &e) {
    error("Failed to allocate %d partial density grids: %s", nthreads,
          e.what());
  }

#pragma omp parallel num_threads(nthreads)
  {
    const int tid = omp_get_thread_num();
    const int nrunning = omp_get_num_threads();
    std::vector<double> &local = partial[tid];

    // Split the particles into contiguous blocks in thread order
    const size_t first = (npart * tid) / nrunning;
    const size_t last = (npart * (tid + 1)) / nrunning;
    for (size_t pid = first; pid < last; pid++) {
      depositParticle(particles[pid], grid, local);
    }
  }

  // Reduce the partial grids, every cell is owned by a single thread here
#pragma omp parallel for schedule(static)
  for (size_t cid = 0; cid < grid.ncells; cid++) {
    double sum = 0.0;
    for (int tid = 0; tid < nthreads; tid++) {
      sum += partial[tid][cid];
    }
    grid.density[cid] = sum;
  }
}

/**
 * @brief Interpolate a scalar grid field to a position (CIC).
 *
 * @param field The flattened field
 * @param grid The grid defining the geometry
 * @param pos The position
 * @return The trilinear combination of the eight surrounding nodes
 */
double interpolateField(const std::vector<double> &field, const Grid &grid,
                        const double pos[3]) {

  const int n = grid.cdim;
  const CICWeights wx = cicWeights(pos[0], grid.inv_width, n);
  const CICWeights wy = cicWeights(pos[1], grid.inv_width, n);
  const CICWeights wz = cicWeights(pos[2], grid.inv_width, n);

  const int ix[2] = {wx.lo, wx.hi};
  const int iy[2] = {wy.lo, wy.hi};
  const int iz[2] = {wz.lo, wz.hi};
  const double fx[2] = {wx.w_lo, wx.w_hi};
  const double fy[2] = {wy.w_lo, wy.w_hi};
  const double fz[2] = {wz.w_lo, wz.w_hi};

  double value = 0.0;
  for (int a = 0; a < 2; a++) {
    for (int b = 0; b < 2; b++) {
      const size_t row = (static_cast<size_t>(ix[a]) * n + iy[b]) * n;
      for (int c = 0; c < 2; c++) {
        value += fx[a] * fy[b] * fz[c] * field[row + iz[c]];
      }
    }
  }
  return value;
}

/**
 * @brief Interpolate the grid's force field to a position (CIC).
 */
std::array<double, 3> interpolateForce(const Grid &grid, const double pos[3]) {
  return {interpolateField(grid.force[0], grid, pos),
          interpolateField(grid.force[1], grid, pos),
          interpolateField(grid.force[2], grid, pos)};
}

/**
 * @brief Read the force field back at every particle into its acceleration.
 *
 * Uses the same stencil as depositMass so a particle exerts no net force on
 * itself.
 *
 * @param particles The particles to update
 * @param grid The grid holding the force field
 */
void interpolateForces(ParticleEnsemble &particles, const Grid &grid) {

  const size_t npart = particles.size();

#pragma omp parallel for schedule(static)
  for (size_t pid = 0; pid < npart; pid++) {
    Particle &part = particles[pid];
    const std::array<double, 3> acc = interpolateForce(grid, part.pos);
    part.acc[0] = acc[0];
    part.acc[1] = acc[1];
    part.acc[2] = acc[2];
  }
}
