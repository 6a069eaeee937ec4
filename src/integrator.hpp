// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef INTEGRATOR_HPP
#define INTEGRATOR_HPP

// Local includes
#include "grid.hpp"
#include "particle.hpp"
#include "poisson.hpp"

// Prototypes (defined in integrator.cpp)
void computeForces(ParticleEnsemble &particles, Grid &grid,
                   PoissonSolver &solver);
void kick(ParticleEnsemble &particles, const double dt);
void drift(ParticleEnsemble &particles, const double dt,
           const double box_size);
void stepKDK(ParticleEnsemble &particles, Grid &grid, PoissonSolver &solver,
             const double dt, const int step);
void checkParticleState(const ParticleEnsemble &particles, const int step);
void checkNumericalState(const ParticleEnsemble &particles, const Grid &grid,
                         const int step);
double kineticEnergy(const ParticleEnsemble &particles);
double potentialEnergy(const ParticleEnsemble &particles, const Grid &grid);

#endif // INTEGRATOR_HPP
