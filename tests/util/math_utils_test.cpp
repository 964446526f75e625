/// @file math_utils_test.cpp
/// @brief Tests for math utility functions.

#include "util/math_utils.h"

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

using namespace keyscope;
using Catch::Matchers::WithinAbs;

TEST_CASE("argmax", "[math_utils]") {
  std::vector<float> data = {1.0f, 5.0f, 3.0f, 2.0f};
  REQUIRE(argmax(data.data(), data.size()) == 1);

  // First maximum wins
  std::vector<double> ties = {0.5, 2.0, 2.0};
  REQUIRE(argmax(ties.data(), ties.size()) == 1);

  std::vector<float> empty;
  REQUIRE(argmax(empty.data(), empty.size()) == 0);
}

TEST_CASE("dot_product", "[math_utils]") {
  std::array<double, 3> a = {1.0, 2.0, 3.0};
  std::array<double, 3> b = {4.0, 5.0, 6.0};
  REQUIRE_THAT(dot_product(a.data(), b.data(), 3), WithinAbs(32.0, 1e-12));
  REQUIRE(dot_product(a.data(), b.data(), 0) == 0.0);
}

TEST_CASE("dot_product is position independent for equal terms", "[math_utils]") {
  // Same non-zero terms at different positions must give identical sums
  std::array<double, 12> observed;
  observed.fill(1.0 / 12.0);
  std::array<double, 12> first{};
  std::array<double, 12> second{};
  for (int i : {0, 2, 4, 5, 7, 9, 11}) first[i] = 1.0 / 7.0;
  for (int i : {1, 3, 5, 6, 8, 10, 0}) second[i] = 1.0 / 7.0;

  REQUIRE(dot_product(observed.data(), first.data(), 12) ==
          dot_product(observed.data(), second.data(), 12));
}

TEST_CASE("normalize_sum", "[math_utils]") {
  SECTION("positive data") {
    std::vector<double> data = {1.0, 3.0, 4.0};
    double total = normalize_sum(data.data(), data.size());
    REQUIRE_THAT(total, WithinAbs(8.0, 1e-12));
    REQUIRE_THAT(data[0], WithinAbs(0.125, 1e-12));
    REQUIRE_THAT(data[1], WithinAbs(0.375, 1e-12));
    REQUIRE_THAT(data[2], WithinAbs(0.5, 1e-12));
  }

  SECTION("all zero stays zero") {
    std::vector<double> data(12, 0.0);
    REQUIRE(normalize_sum(data.data(), data.size()) == 0.0);
    for (double v : data) {
      REQUIRE(v == 0.0);
    }
  }
}
