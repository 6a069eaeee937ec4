// Standard includes
#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdint>
#include <new>
#include <random>
#include <vector>

// Local includes
#include "fourier.hpp"
#include "grid.hpp"
#include "initial_conditions.hpp"
#include "logger.hpp"
#include "particle.hpp"
#include "sim_config.hpp"

// Define M_PI if not available (POSIX extension, not standard C++)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

/**
 * @brief Make the self-redundant planes of a half-complex spectrum Hermitian.
 *
 * In the kz = 0 and kz = n/2 planes the mode (i, j) and its partner
 * (-i, -j) are both stored, so we keep the one with the lower flat index and
 * set the other to its conjugate. Self-conjugate modes get a zero imaginary
 * part.
 *
 * @param fft The transform defining the layout
 * @param modes The spectrum to fix
 */
static void enforceHermitianPlanes(const FourierTransform &fft,
                                   std::vector<std::complex<double>> &modes) {

  const int n = fft.cdim;
  const int planes[2] = {0, n / 2};

  for (const int k : planes) {
    for (int i = 0; i < n; i++) {
      for (int j = 0; j < n; j++) {
        const int pi = wrapIndex(-i, n);
        const int pj = wrapIndex(-j, n);
        const size_t mid = fft.modeIndex(i, j, k);
        const size_t pid = fft.modeIndex(pi, pj, k);

        if (mid == pid) {
          modes[mid] = std::complex<double>(modes[mid].real(), 0.0);
        } else if (pid < mid) {
          modes[mid] = std::conj(modes[pid]);
        }
      }
    }
  }
}

/**
 * @brief Synthesize a Gaussian random overdensity field.
 *
 * Every mode with k > 0 gets the amplitude |k|^spectral_index times a unit
 * complex Gaussian deviate, the k = 0 mode is zero so the field has zero
 * mean. After the Hermitian constraints are applied the inverse transform is
 * real. The field is finally rescaled to an rms of density_contrast (a field
 * with no power at all stays zero).
 *
 * @param fft The transform to use (defines the grid size)
 * @param box_size The width of the box
 * @param spectral_index The exponent of the amplitude spectrum
 * @param density_contrast The target rms of the field
 * @param rng The run's random generator
 * @param overdensity The output field (cdim^3 values)
 */
void synthesizeOverdensity(FourierTransform &fft, const double box_size,
                           const double spectral_index,
                           const double density_contrast, std::mt19937_64 &rng,
                           std::vector<double> &overdensity) {

  const int n = fft.cdim;
  const int nz = fft.nzmodes;
  const double kf = 2.0 * M_PI / box_size;
  std::normal_distribution<double> gaussian(0.0, 1.0);

  std::vector<std::complex<double>> modes(fft.nmodes);

  // Draw the modes in storage order (this order fixes the realisation)
  for (int i = 0; i < n; i++) {
    const double kx = kf * frequencyIndex(i, n);
    for (int j = 0; j < n; j++) {
      const double ky = kf * frequencyIndex(j, n);
      for (int k = 0; k < nz; k++) {
        const double kz = kf * k;
        const double k2 = kx * kx + ky * ky + kz * kz;

        const double re = gaussian(rng);
        const double im = gaussian(rng);

        // Zero mean, and no pow(0, negative)
        if (k2 == 0.0) {
          modes[fft.modeIndex(i, j, k)] = 0.0;
          continue;
        }

        const double amp = std::pow(std::sqrt(k2), spectral_index);
        modes[fft.modeIndex(i, j, k)] =
            std::complex<double>(re, im) * (amp / std::sqrt(2.0));
      }
    }
  }

  enforceHermitianPlanes(fft, modes);

  fft.inverse(modes, overdensity);

  // Normalise to the requested rms
  double sum2 = 0.0;
  for (const double d : overdensity) {
    sum2 += d * d;
  }
  const double rms = std::sqrt(sum2 / static_cast<double>(overdensity.size()));
  const double scale = (rms > 0.0) ? density_contrast / rms : 0.0;
  for (double &d : overdensity) {
    d *= scale;
  }

  v_message("Synthesized overdensity with rms %f (raw rms %e)",
            rms * scale, rms);
}

/**
 * @brief Draw particles with a probability proportional to 1 + overdensity.
 *
 * Negative densities (1 + delta < 0) get zero weight. A particle's host cell
 * is found by inverting the cumulative weight of the cells with a single
 * uniform deviate; it is then placed uniformly inside that cell and given an
 * isotropic Gaussian velocity.
 *
 * @param overdensity The overdensity field (cdim^3 values, cdim from config)
 * @param config The run configuration
 * @param rng The run's random generator
 * @return The particles
 */
ParticleEnsemble sampleParticles(const std::vector<double> &overdensity,
                                 const SimulationConfig &config,
                                 std::mt19937_64 &rng) {

  const int n = config.grid_size;
  const size_t ncells = static_cast<size_t>(n) * n * n;
  const double width = config.box_length / n;

  if (overdensity.size() != ncells) {
    config_error("Overdensity of %zu cells doesn't match a %d^3 grid",
                 overdensity.size(), n);
  }

  // Cumulative sampling weights
  std::vector<double> cumulative(ncells);
  double total = 0.0;
  for (size_t cid = 0; cid < ncells; cid++) {
    total += std::max(0.0, 1.0 + overdensity[cid]);
    cumulative[cid] = total;
  }
  if (!(total > 0.0)) {
    error("The overdensity field has no positive weight to sample from");
  }

  std::uniform_real_distribution<double> uniform(0.0, 1.0);
  std::normal_distribution<double> gaussian(0.0, 1.0);
  const double sigma_v = config.velocity_dispersion;

  ParticleEnsemble particles;
  try {
    particles.reserve(config.nparticles);
  } catch (const std::bad_alloc &e) {
    error("Failed to allocate %zu particles: %s", config.nparticles, e.what());
  }

  for (size_t pid = 0; pid < config.nparticles; pid++) {

    // Which cell hosts the particle?
    const double u = uniform(rng) * total;
    size_t cid = static_cast<size_t>(
        std::upper_bound(cumulative.begin(), cumulative.end(), u) -
        cumulative.begin());
    if (cid >= ncells) {
      cid = ncells - 1;
    }

    const int i = static_cast<int>(cid / (static_cast<size_t>(n) * n));
    const int j = static_cast<int>((cid / n) % n);
    const int k = static_cast<int>(cid % n);

    // Uniform inside the cell
    double pos[3];
    pos[0] = wrap((i + uniform(rng)) * width, config.box_length);
    pos[1] = wrap((j + uniform(rng)) * width, config.box_length);
    pos[2] = wrap((k + uniform(rng)) * width, config.box_length);

    // Small random velocities
    double vel[3] = {0.0, 0.0, 0.0};
    if (sigma_v > 0.0) {
      vel[0] = sigma_v * gaussian(rng);
      vel[1] = sigma_v * gaussian(rng);
      vel[2] = sigma_v * gaussian(rng);
    }

    particles.emplace_back(pos, vel, config.particle_mass);
  }

  return particles;
}

/**
 * @brief Build the initial particle ensemble of a run.
 *
 * @param config The run configuration
 * @param rng The run's random generator (seeded by the caller)
 * @return The particles
 */
ParticleEnsemble sampleInitialConditions(const SimulationConfig &config,
                                         std::mt19937_64 &rng) {

  tic();

  FourierTransform fft(config.grid_size);

  std::vector<double> overdensity;
  synthesizeOverdensity(fft, config.box_length, config.spectral_index,
                        config.density_contrast, rng, overdensity);

  ParticleEnsemble particles = sampleParticles(overdensity, config, rng);

  toc("Sampling initial conditions");

  return particles;
}

/**
 * @brief Build initial conditions from the essentials, everything else at its
 * default.
 *
 * @param nparticles The number of particles
 * @param grid_size The number of cells along an axis
 * @param box_length The width of the box
 * @param seed The random seed
 * @return The particles
 */
ParticleEnsemble sampleInitialConditions(const size_t nparticles,
                                         const int grid_size,
                                         const double box_length,
                                         const uint64_t seed) {
  SimulationConfig config;
  config.nparticles = nparticles;
  config.grid_size = grid_size;
  config.box_length = box_length;
  config.seed = seed;
  validateConfig(config);

  std::mt19937_64 rng(seed);
  return sampleInitialConditions(config, rng);
}
