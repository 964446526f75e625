/// @file window_test.cpp
/// @brief Tests for window functions.

#include "core/window.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>

using namespace keyscope;
using Catch::Matchers::WithinAbs;

TEST_CASE("hann_window is periodic", "[window]") {
  auto win = hann_window(4);

  // 0.5 * (1 - cos(2*pi*n/4))
  REQUIRE(win.size() == 4);
  REQUIRE_THAT(win[0], WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(win[1], WithinAbs(0.5f, 1e-6f));
  REQUIRE_THAT(win[2], WithinAbs(1.0f, 1e-6f));
  REQUIRE_THAT(win[3], WithinAbs(0.5f, 1e-6f));
}

TEST_CASE("hann_window analysis length", "[window]") {
  auto win = hann_window(4096);

  REQUIRE(win.size() == 4096);
  REQUIRE_THAT(win[0], WithinAbs(0.0f, 1e-7f));
  REQUIRE_THAT(win[2048], WithinAbs(1.0f, 1e-6f));
  // Periodic form: symmetric around N/2, last sample is not zero
  REQUIRE_THAT(win[1], WithinAbs(win[4095], 1e-6f));
  REQUIRE(win[4095] > 0.0f);
}

TEST_CASE("window edge cases", "[window]") {
  REQUIRE(hann_window(0).empty());
  REQUIRE(hann_window(-3).empty());
}

TEST_CASE("hann_window_cached", "[window]") {
  const auto& first = hann_window_cached(512);
  const auto& second = hann_window_cached(512);

  REQUIRE(&first == &second);
  REQUIRE(first == hann_window(512));
  REQUIRE(hann_window_cached(256).size() == 256);
}
