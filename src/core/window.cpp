/// @file window.cpp
/// @brief Implementation of the analysis window.

#include "core/window.h"

#include <cmath>
#include <map>

namespace keyscope {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

/// @brief Thread-local cache of Hann windows keyed by length.
thread_local std::map<int, std::vector<float>> g_window_cache;
}  // namespace

std::vector<float> hann_window(int length) {
  if (length <= 0) return {};
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = static_cast<float>(0.5 * (1.0 - std::cos(kTwoPi * i / length)));
  }
  return window;
}

const std::vector<float>& hann_window_cached(int length) {
  auto it = g_window_cache.find(length);
  if (it != g_window_cache.end()) {
    return it->second;
  }
  return g_window_cache.emplace(length, hann_window(length)).first->second;
}

}  // namespace keyscope
