/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

namespace keyscope {

double dot_product(const double* a, const double* b, size_t size) {
  double dot = 0.0;
  for (size_t i = 0; i < size; ++i) {
    dot += a[i] * b[i];
  }
  return dot;
}

double normalize_sum(double* data, size_t size) {
  double total = 0.0;
  for (size_t i = 0; i < size; ++i) {
    total += data[i];
  }

  // Silence stays all-zero
  if (total == 0.0) {
    return total;
  }

  for (size_t i = 0; i < size; ++i) {
    data[i] /= total;
  }
  return total;
}

}  // namespace keyscope
