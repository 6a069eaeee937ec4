// Third party includes
#include <gtest/gtest.h>

// Standard includes
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

// Local includes
#include "debugging_utils.hpp"
#include "errors.hpp"
#include "grid.hpp"
#include "mass_assignment.hpp"
#include "particle.hpp"

namespace {

ParticleEnsemble randomParticles(const size_t npart, const double box_size,
                                 const uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> uniform(0.0, box_size);
  ParticleEnsemble particles;
  const double vel[3] = {0.0, 0.0, 0.0};
  for (size_t i = 0; i < npart; i++) {
    const double pos[3] = {uniform(rng), uniform(rng), uniform(rng)};
    particles.emplace_back(pos, vel, 0.5 + static_cast<double>(i % 3));
  }
  return particles;
}

} // namespace

TEST(CICWeights, CellCentreTakesAllTheWeight) {
  const CICWeights w = cicWeights(2.5, 1.0, 8);
  EXPECT_EQ(w.lo, 2);
  EXPECT_EQ(w.hi, 3);
  EXPECT_DOUBLE_EQ(w.w_lo, 1.0);
  EXPECT_DOUBLE_EQ(w.w_hi, 0.0);
}

TEST(CICWeights, WrapsAtTheBoxEdge) {
  const CICWeights w = cicWeights(0.0, 1.0, 8);
  EXPECT_EQ(w.lo, 7);
  EXPECT_EQ(w.hi, 0);
  EXPECT_DOUBLE_EQ(w.w_lo, 0.5);
  EXPECT_DOUBLE_EQ(w.w_hi, 0.5);
}

TEST(DepositMass, ParticleAtCellCentre) {
  Grid grid(8, 8.0);
  const double pos[3] = {0.5, 1.5, 2.5};
  const double vel[3] = {0.0, 0.0, 0.0};
  ParticleEnsemble particles;
  particles.emplace_back(pos, vel, 2.0);

  depositMass(particles, grid);

  EXPECT_DOUBLE_EQ(grid.density[grid.index(0, 1, 2)], 2.0);
  EXPECT_DOUBLE_EQ(grid.totalMass(), 2.0);
}

TEST(DepositMass, ParticleAtCornerSharesWithWrappedCells) {
  Grid grid(8, 8.0);
  const double pos[3] = {0.0, 0.0, 0.0};
  const double vel[3] = {0.0, 0.0, 0.0};
  ParticleEnsemble particles;
  particles.emplace_back(pos, vel, 1.0);

  depositMass(particles, grid);

  for (int i : {-1, 0}) {
    for (int j : {-1, 0}) {
      for (int k : {-1, 0}) {
        EXPECT_DOUBLE_EQ(grid.density[grid.index(i, j, k)], 0.125);
      }
    }
  }
  EXPECT_DOUBLE_EQ(grid.density[grid.index(1, 1, 1)], 0.0);
}

TEST(DepositMass, ConservesMass) {
  Grid grid(16, 10.0);

  // Both the serial (few particles) and the threaded path
  for (const size_t npart : {100, 5000}) {
    const ParticleEnsemble particles = randomParticles(npart, 10.0, npart);
    double expected = 0.0;
    for (const Particle &part : particles) {
      expected += part.mass;
    }

    depositMass(particles, grid);

    EXPECT_NEAR(grid.totalMass(), expected, 1e-10 * expected);
    EXPECT_NO_THROW(validateMassConservation(particles, grid, 1e-10));
  }
}

TEST(DepositMass, IsRepeatable) {
  Grid grid(16, 10.0);
  const ParticleEnsemble particles = randomParticles(5000, 10.0, 11);

  depositMass(particles, grid);
  const std::vector<double> first = grid.density;
  depositMass(particles, grid);

  EXPECT_EQ(first, grid.density);
}

TEST(InterpolateField, ConstantFieldIsExact) {
  Grid grid(8, 4.0);
  std::vector<double> field(grid.ncells, 3.0);

  const double positions[4][3] = {
      {0.0, 0.0, 0.0}, {1.3, 2.7, 3.99}, {3.75, 0.25, 1.0}, {2.0, 2.0, 2.0}};
  for (const auto &pos : positions) {
    EXPECT_NEAR(interpolateField(field, grid, pos), 3.0, 1e-14);
  }
}

TEST(InterpolateField, IsTheAdjointOfDeposit) {
  // sum_p m_p f(x_p) == sum_cells rho f V for any field f
  Grid grid(8, 8.0);
  const ParticleEnsemble particles = randomParticles(50, 8.0, 5);
  depositMass(particles, grid);

  std::mt19937_64 rng(9);
  std::uniform_real_distribution<double> uniform(-1.0, 1.0);
  std::vector<double> field(grid.ncells);
  for (double &f : field) {
    f = uniform(rng);
  }

  double by_particles = 0.0;
  for (const Particle &part : particles) {
    by_particles += part.mass * interpolateField(field, grid, part.pos);
  }
  double by_cells = 0.0;
  for (size_t cid = 0; cid < grid.ncells; cid++) {
    by_cells += grid.density[cid] * field[cid] * grid.cell_volume;
  }

  EXPECT_NEAR(by_particles, by_cells, 1e-10);
}

TEST(InterpolateForces, FillsAccelerations) {
  Grid grid(4, 4.0);
  for (int axis = 0; axis < 3; axis++) {
    std::fill(grid.force[axis].begin(), grid.force[axis].end(),
              static_cast<double>(axis + 1));
  }

  ParticleEnsemble particles = randomParticles(10, 4.0, 2);
  interpolateForces(particles, grid);

  for (const Particle &part : particles) {
    EXPECT_NEAR(part.acc[0], 1.0, 1e-14);
    EXPECT_NEAR(part.acc[1], 2.0, 1e-14);
    EXPECT_NEAR(part.acc[2], 3.0, 1e-14);
  }
}

TEST(Grid, WrapKeepsValuesInTheBox) {
  EXPECT_DOUBLE_EQ(wrap(10.5, 10.0), 0.5);
  EXPECT_DOUBLE_EQ(wrap(-0.5, 10.0), 9.5);
  EXPECT_DOUBLE_EQ(wrap(10.0, 10.0), 0.0);
  EXPECT_GE(wrap(-1e-18, 10.0), 0.0);
  EXPECT_LT(wrap(-1e-18, 10.0), 10.0);
}

TEST(Grid, RejectsBadShapes) {
  EXPECT_THROW(Grid grid(12, 1.0), ConfigurationError);
  EXPECT_THROW(Grid grid(8, 0.0), ConfigurationError);
}
