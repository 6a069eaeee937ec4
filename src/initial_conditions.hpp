// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef INITIAL_CONDITIONS_HPP
#define INITIAL_CONDITIONS_HPP

// Standard includes
#include <cstdint>
#include <random>
#include <vector>

// Local includes
#include "fourier.hpp"
#include "particle.hpp"
#include "sim_config.hpp"

// Prototypes (defined in initial_conditions.cpp)
void synthesizeOverdensity(FourierTransform &fft, const double box_size,
                           const double spectral_index,
                           const double density_contrast, std::mt19937_64 &rng,
                           std::vector<double> &overdensity);
ParticleEnsemble sampleParticles(const std::vector<double> &overdensity,
                                 const SimulationConfig &config,
                                 std::mt19937_64 &rng);
ParticleEnsemble sampleInitialConditions(const SimulationConfig &config,
                                         std::mt19937_64 &rng);
ParticleEnsemble sampleInitialConditions(const size_t nparticles,
                                         const int grid_size,
                                         const double box_length,
                                         const uint64_t seed);

#endif // INITIAL_CONDITIONS_HPP
