#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for profile processing.

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace keyscope {

/// @brief Returns the index of the maximum element.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of the first maximum element (0 if empty)
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Computes the plain inner product of two vectors.
/// @details Accumulates strictly left to right, so templates covering the same
///          pitch classes score bit-identically against any profile.
/// @param a First vector
/// @param b Second vector
/// @param size Number of elements
/// @return Sum of a[i] * b[i]
double dot_product(const double* a, const double* b, size_t size);

/// @brief Divides every element by the total so the data sums to 1.
/// @param data Data to normalize in place
/// @param size Number of elements
/// @return The total before normalization; data is left untouched when it is 0
double normalize_sum(double* data, size_t size);

}  // namespace keyscope
