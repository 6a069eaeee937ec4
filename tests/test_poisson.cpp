// Third party includes
#include <gtest/gtest.h>

// Standard includes
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

// Local includes
#include "debugging_utils.hpp"
#include "errors.hpp"
#include "grid.hpp"
#include "integrator.hpp"
#include "particle.hpp"
#include "poisson.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

// rho = 1 + A cos(k0 x) sampled at the cell centres
void fillCosineDensity(Grid &grid, const int m, const double amplitude) {
  const double k0 = 2.0 * M_PI * m / grid.box_size;
  for (int i = 0; i < grid.cdim; i++) {
    const double x = (i + 0.5) * grid.width;
    for (int j = 0; j < grid.cdim; j++) {
      for (int k = 0; k < grid.cdim; k++) {
        grid.density[grid.index(i, j, k)] = 1.0 + amplitude * std::cos(k0 * x);
      }
    }
  }
}

} // namespace

TEST(PoissonSolver, UniformDensityHasNoForce) {
  Grid grid(8, 10.0);
  std::fill(grid.density.begin(), grid.density.end(), 3.0);

  PoissonSolver solver(grid, 1.0, 1.0);
  solver.solve(grid);

  for (size_t cid = 0; cid < grid.ncells; cid++) {
    EXPECT_NEAR(grid.potential[cid], 0.0, 1e-12);
    EXPECT_NEAR(grid.force[0][cid], 0.0, 1e-12);
    EXPECT_NEAR(grid.force[1][cid], 0.0, 1e-12);
    EXPECT_NEAR(grid.force[2][cid], 0.0, 1e-12);
  }
}

TEST(PoissonSolver, CosineDensityMatchesAnalyticSolution) {
  // phi = -4 pi G A cos(k0 x) / k0^2. The centred difference of phi is
  // -dphi/dx = -4 pi G A sin(k0 x) / k0 damped by sin(k0 h) / (k0 h).
  const double G = 2.0;
  const double A = 0.3;
  const int m = 2;

  Grid grid(16, 16.0);
  fillCosineDensity(grid, m, A);

  PoissonSolver solver(grid, G, 1.0);
  solver.solve(grid);

  const double k0 = 2.0 * M_PI * m / grid.box_size;
  const double fscale = 4.0 * M_PI * G * A / k0;
  const double damping = std::sin(k0 * grid.width) / (k0 * grid.width);
  for (int i = 0; i < grid.cdim; i++) {
    const double x = (i + 0.5) * grid.width;
    for (int j = 0; j < grid.cdim; j++) {
      for (int k = 0; k < grid.cdim; k++) {
        const size_t cid = grid.index(i, j, k);
        EXPECT_NEAR(grid.potential[cid], -fscale * std::cos(k0 * x) / k0,
                    1e-10 * fscale);
        EXPECT_NEAR(grid.force[0][cid], -fscale * damping * std::sin(k0 * x),
                    1e-10 * fscale);
        EXPECT_NEAR(grid.force[1][cid], 0.0, 1e-10 * fscale);
        EXPECT_NEAR(grid.force[2][cid], 0.0, 1e-10 * fscale);
      }
    }
  }
}

TEST(PoissonSolver, GrowthFactorScalesTheForce) {
  Grid grid(8, 5.0);
  std::mt19937_64 rng(1);
  std::uniform_real_distribution<double> uniform(0.0, 2.0);
  for (double &rho : grid.density) {
    rho = uniform(rng);
  }

  PoissonSolver plain(grid, 1.0, 1.0);
  plain.solve(grid);
  const std::vector<double> phi = grid.potential;
  const std::vector<double> fx = grid.force[0];

  PoissonSolver grown(grid, 1.0, 2.0);
  grown.solve(grid);

  for (size_t cid = 0; cid < grid.ncells; cid++) {
    EXPECT_DOUBLE_EQ(grid.force[0][cid], 2.0 * fx[cid]);
    // The potential is not amplified
    EXPECT_DOUBLE_EQ(grid.potential[cid], phi[cid]);
  }

  PoissonSolver frozen(grid, 1.0, 0.0);
  frozen.solve(grid);
  for (size_t cid = 0; cid < grid.ncells; cid++) {
    EXPECT_EQ(grid.force[0][cid], 0.0);
  }
}

TEST(PoissonSolver, ForceFromParticlesHasZeroMean) {
  Grid grid(16, 20.0);
  PoissonSolver solver(grid, 1.0, 1.0);

  std::mt19937_64 rng(21);
  std::uniform_real_distribution<double> uniform(0.0, 20.0);
  const double vel[3] = {0.0, 0.0, 0.0};
  ParticleEnsemble particles;
  for (int i = 0; i < 2000; i++) {
    const double pos[3] = {uniform(rng), uniform(rng), uniform(rng)};
    particles.emplace_back(pos, vel, 1.0);
  }

  computeForces(particles, grid, solver);

  EXPECT_NO_THROW(validateZeroMeanForce(grid, 1e-8));
}

TEST(PoissonSolver, PairAttractsAtEverySeparation) {
  Grid grid(16, 16.0);
  PoissonSolver solver(grid, 1.0, 1.0);

  const double vel[3] = {0.0, 0.0, 0.0};
  double previous = 0.0;
  for (int sep = 1; sep <= 6; sep++) {
    const double left[3] = {6.5, 8.5, 8.5};
    const double right[3] = {6.5 + sep, 8.5, 8.5};
    ParticleEnsemble particles;
    particles.emplace_back(left, vel, 1.0);
    particles.emplace_back(right, vel, 1.0);

    computeForces(particles, grid, solver);

    EXPECT_GT(particles[0].acc[0], 0.0) << "separation " << sep;
    EXPECT_LT(particles[1].acc[0], 0.0) << "separation " << sep;
    EXPECT_NEAR(particles[0].acc[0], -particles[1].acc[0], 1e-10);
    EXPECT_NEAR(particles[0].acc[1], 0.0, 1e-10);
    EXPECT_NEAR(particles[0].acc[2], 0.0, 1e-10);

    // Weaker the further apart they are
    if (sep > 1) {
      EXPECT_LT(particles[0].acc[0], previous) << "separation " << sep;
    }
    previous = particles[0].acc[0];
  }
}

TEST(PoissonSolver, RejectsAForeignGrid) {
  Grid grid(8, 5.0);
  Grid other(16, 5.0);
  PoissonSolver solver(grid, 1.0, 1.0);
  EXPECT_THROW(solver.solve(other), ConfigurationError);
}
