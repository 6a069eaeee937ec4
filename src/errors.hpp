// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef ERRORS_HPP
#define ERRORS_HPP

// Standard includes
#include <stdexcept>
#include <string>

/**
 * @brief Raised when the run configuration can never produce a valid run
 * (bad grid size, non-positive box length or time step, no particles...).
 */
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Raised when NaN or Inf values appear in the density, force or
 * particle fields.
 *
 * Step 0 is the initial state, step n the state after the n-th
 * Kick-Drift-Kick step.
 */
class NumericalInstabilityError : public std::runtime_error {
public:
  NumericalInstabilityError(const std::string &msg, int step)
      : std::runtime_error(msg), step_(step) {}

  //! The integration step the instability was detected at
  int step() const { return step_; }

private:
  int step_;
};

/**
 * @brief Raised when two runs with an identical configuration and seed do
 * not produce identical maps. This is always a defect.
 */
class ReproducibilityViolation : public std::logic_error {
public:
  explicit ReproducibilityViolation(const std::string &msg)
      : std::logic_error(msg) {}
};

#endif // ERRORS_HPP
