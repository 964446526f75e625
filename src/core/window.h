#pragma once

/// @file window.h
/// @brief Analysis window.

#include <vector>

namespace keyscope {

/// @brief Creates a periodic Hann window.
/// @param length Window length in samples
/// @return Coefficients 0.5 * (1 - cos(2*pi*n / length))
/// @details This is the DFT-even form (scipy `hann(N, sym=False)`), whose
///          period is exactly the frame length.
std::vector<float> hann_window(int length);

/// @brief Returns a cached periodic Hann window (thread-local cache).
/// @param length Window length in samples
/// @return Const reference to cached window coefficients
/// @details Thread-local, so concurrent analyses never share a cache entry.
const std::vector<float>& hann_window_cached(int length);

}  // namespace keyscope
