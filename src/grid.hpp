// This file is part of bayronik, a particle-mesh N-body emulator producing
// projected matter maps.
#ifndef GRID_HPP
#define GRID_HPP

// Standard includes
#include <cmath>
#include <cstddef>
#include <vector>

/**
 * @brief Wrap a coordinate into [0, box_size).
 *
 * Unlike the plain fmod this never returns a negative value or box_size
 * itself (rounding of x + box_size can land exactly on box_size).
 */
inline double wrap(const double x, const double box_size) {
  double y = std::fmod(x, box_size);
  if (y < 0.0) {
    y += box_size;
  }
  if (y >= box_size) {
    y -= box_size;
  }
  return y;
}

/**
 * @brief Wrap a grid index into [0, n).
 */
inline int wrapIndex(const int i, const int n) {
  const int j = i % n;
  return j < 0 ? j + n : j;
}

/**
 * @brief The signed frequency index of FFT bin i on an axis of n bins.
 *
 * Bins above n/2 hold the negative frequencies. The Nyquist bin n/2 maps to
 * +n/2.
 */
inline int frequencyIndex(const int i, const int n) {
  return (i <= n / 2) ? i : i - n;
}

/**
 * @brief The periodic mesh of a particle-mesh run.
 *
 * Holds the density, the potential and the three force components as
 * flattened row-major (x slowest, z fastest) arrays of cdim^3 values.
 * Allocated once per run; the density is rebuilt every step and the
 * potential and forces are recomputed from it.
 */
class Grid {
public:
  //! The number of cells along an axis
  int cdim;

  //! The total number of cells
  size_t ncells;

  //! The width of the periodic box
  double box_size;

  //! The width of a cell
  double width;

  //! The inverse of the width of a cell
  double inv_width;

  //! The volume of a cell
  double cell_volume;

  //! Mass density (mass per unit volume) at each cell centre
  std::vector<double> density;

  //! Gravitational potential at each cell centre
  std::vector<double> potential;

  //! Force per unit mass at each cell centre, one array per axis
  std::vector<double> force[3];

  // Prototypes for member functions (defined in grid.cpp)
  Grid(const int cdim, const double box_size);

  void clearDensity();
  double totalMass() const;

  /**
   * @brief The flat index of cell (i, j, k), each index wrapped periodically.
   */
  size_t index(const int i, const int j, const int k) const {
    return (static_cast<size_t>(wrapIndex(i, cdim)) * cdim +
            static_cast<size_t>(wrapIndex(j, cdim))) *
               cdim +
           static_cast<size_t>(wrapIndex(k, cdim));
  }
};

#endif // GRID_HPP
