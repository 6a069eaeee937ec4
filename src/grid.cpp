// Standard includes
#include <algorithm>
#include <new>

// Local includes
#include "grid.hpp"
#include "logger.hpp"
#include "sim_config.hpp"

/**
 * @brief Construct a new Grid object
 *
 * @param cdim The number of cells along an axis
 * @param box_size The width of the periodic box
 */
Grid::Grid(const int cdim, const double box_size)
    : cdim(cdim), box_size(box_size) {

  // The transforms need a cubic power of two lattice
  if (cdim < 2 || !isPowerOfTwo(cdim)) {
    config_error("Grid size must be a power of two >= 2 (got %d)", cdim);
  }
  if (!(box_size > 0.0)) {
    config_error("Box size must be positive (got %f)", box_size);
  }

  this->ncells = static_cast<size_t>(cdim) * cdim * cdim;
  this->width = box_size / cdim;
  this->inv_width = 1.0 / this->width;
  this->cell_volume = this->width * this->width * this->width;

  // Allocate the fields
  try {
    this->density.assign(this->ncells, 0.0);
    this->potential.assign(this->ncells, 0.0);
    for (int axis = 0; axis < 3; axis++) {
      this->force[axis].assign(this->ncells, 0.0);
    }
  } catch (const std::bad_alloc &e) {
    error("Memory allocation failed for a %d^3 grid: %s", cdim, e.what());
  }
}

/**
 * @brief Reset the density field ahead of a new deposit.
 */
void Grid::clearDensity() {
  std::fill(this->density.begin(), this->density.end(), 0.0);
}

/**
 * @brief The mass held by the density field (sum of density * cell volume).
 */
double Grid::totalMass() const {
  double sum = 0.0;
#pragma omp parallel for reduction(+ : sum)
  for (size_t cid = 0; cid < this->ncells; cid++) {
    sum += this->density[cid];
  }
  return sum * this->cell_volume;
}
