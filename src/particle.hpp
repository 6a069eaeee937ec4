// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef PARTICLE_HPP
#define PARTICLE_HPP

// Standard includes
#include <vector>

class Particle {
public:
  // Particle members
  double pos[3];
  double vel[3];
  double mass;

  //! The acceleration interpolated from the current force field
  double acc[3] = {0.0, 0.0, 0.0};

  // Constructor
  Particle(const double pos[3], const double vel[3], double mass) {
    this->pos[0] = pos[0];
    this->pos[1] = pos[1];
    this->pos[2] = pos[2];
    this->vel[0] = vel[0];
    this->vel[1] = vel[1];
    this->vel[2] = vel[2];
    this->mass = mass;
  }
};

//! The particles of a run. Fixed size and order for the run's lifetime.
using ParticleEnsemble = std::vector<Particle>;

#endif // PARTICLE_HPP
