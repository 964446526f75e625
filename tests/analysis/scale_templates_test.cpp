/// @file scale_templates_test.cpp
/// @brief Tests for scale generation and templates.

#include "analysis/scale_templates.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace keyscope;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<std::string> note_names(const std::vector<PitchClass>& notes) {
  std::vector<std::string> names;
  for (PitchClass pc : notes) {
    names.push_back(pitch_class_name(pc));
  }
  return names;
}

}  // namespace

TEST_CASE("Scale definitions", "[scale]") {
  REQUIRE(kScaleDefinitions.size() == 9);
  for (int i = 0; i < kNumScaleTypes; ++i) {
    const ScaleDefinition& def = kScaleDefinitions[i];
    REQUIRE(static_cast<int>(def.type) == i);
    REQUIRE(std::accumulate(def.intervals.begin(), def.intervals.end(), 0) == 12);
  }

  REQUIRE(std::string(scale_name(ScaleType::Major)) == "Major");
  REQUIRE(std::string(scale_name(ScaleType::NaturalMinor)) == "Natural Minor");
  REQUIRE(std::string(scale_name(ScaleType::HarmonicMinor)) == "Harmonic Minor");
  REQUIRE(std::string(scale_name(ScaleType::Locrian)) == "Locrian");

  REQUIRE(scale_category(ScaleType::Major) == ScaleCategory::Key);
  REQUIRE(scale_category(ScaleType::MelodicMinor) == ScaleCategory::Key);
  REQUIRE(scale_category(ScaleType::Dorian) == ScaleCategory::Mode);
  REQUIRE(scale_category(ScaleType::Mixolydian) == ScaleCategory::Mode);
  REQUIRE(std::string(scale_category_name(ScaleCategory::Mode)) == "Mode");
}

TEST_CASE("Scale generation by name", "[scale]") {
  using Names = std::vector<std::string>;

  REQUIRE(note_names(generate_scale(PitchClass::C, ScaleType::Major)) ==
          Names{"C", "D", "E", "F", "G", "A", "B", "C"});
  REQUIRE(note_names(generate_scale(PitchClass::A, ScaleType::NaturalMinor)) ==
          Names{"A", "B", "C", "D", "E", "F", "G", "A"});
  REQUIRE(note_names(generate_scale(PitchClass::A, ScaleType::HarmonicMinor)) ==
          Names{"A", "B", "C", "D", "E", "F", "G#", "A"});
  REQUIRE(note_names(generate_scale(PitchClass::A, ScaleType::MelodicMinor)) ==
          Names{"A", "B", "C", "D", "E", "F#", "G#", "A"});
  REQUIRE(note_names(generate_scale(PitchClass::D, ScaleType::Dorian)) ==
          Names{"D", "E", "F", "G", "A", "B", "C", "D"});
  REQUIRE(note_names(generate_scale(PitchClass::E, ScaleType::Phrygian)) ==
          Names{"E", "F", "G", "A", "B", "C", "D", "E"});
  REQUIRE(note_names(generate_scale(PitchClass::F, ScaleType::Lydian)) ==
          Names{"F", "G", "A", "B", "C", "D", "E", "F"});
  REQUIRE(note_names(generate_scale(PitchClass::G, ScaleType::Mixolydian)) ==
          Names{"G", "A", "B", "C", "D", "E", "F", "G"});
  REQUIRE(note_names(generate_scale(PitchClass::B, ScaleType::Locrian)) ==
          Names{"B", "C", "D", "E", "F", "G", "A", "B"});
  REQUIRE(note_names(generate_scale(PitchClass::Fs, ScaleType::Major)) ==
          Names{"F#", "G#", "A#", "B", "C#", "D#", "F", "F#"});
}

TEST_CASE("Scale generation for every root", "[scale]") {
  // Semitone offsets of each note from the root
  const std::vector<std::vector<int>> offsets = {
      {0, 2, 4, 5, 7, 9, 11, 12},  // Major
      {0, 2, 3, 5, 7, 8, 10, 12},  // Natural Minor
      {0, 2, 3, 5, 7, 8, 11, 12},  // Harmonic Minor
      {0, 2, 3, 5, 7, 9, 11, 12},  // Melodic Minor
      {0, 2, 3, 5, 7, 9, 10, 12},  // Dorian
      {0, 1, 3, 5, 7, 8, 10, 12},  // Phrygian
      {0, 2, 4, 6, 7, 9, 11, 12},  // Lydian
      {0, 2, 4, 5, 7, 9, 10, 12},  // Mixolydian
      {0, 1, 3, 5, 6, 8, 10, 12},  // Locrian
  };

  for (int s = 0; s < kNumScaleTypes; ++s) {
    for (int root = 0; root < kNumPitchClasses; ++root) {
      auto scale = generate_scale(static_cast<PitchClass>(root), static_cast<ScaleType>(s));
      REQUIRE(scale.size() == 8);
      for (size_t i = 0; i < scale.size(); ++i) {
        REQUIRE(static_cast<int>(scale[i]) == (root + offsets[s][i]) % 12);
      }
      REQUIRE(scale.front() == scale.back());
    }
  }
}

TEST_CASE("Scale generation from raw intervals", "[scale]") {
  SECTION("no intervals gives the root only") {
    auto scale = generate_scale(PitchClass::E, std::vector<int>{});
    REQUIRE(scale.size() == 1);
    REQUIRE(scale[0] == PitchClass::E);
  }

  SECTION("steps wrap around the octave") {
    auto scale = generate_scale(PitchClass::A, std::vector<int>{3, 12, 5});
    REQUIRE(note_names(scale) == std::vector<std::string>{"A", "C", "C", "F"});
  }

  SECTION("negative steps walk downwards") {
    auto scale = generate_scale(PitchClass::C, std::vector<int>{-1, -2, -13});
    REQUIRE(note_names(scale) == std::vector<std::string>{"C", "B", "A", "G#"});
  }

  SECTION("invalid root") {
    REQUIRE_THROWS_AS(generate_scale(static_cast<PitchClass>(12), std::vector<int>{2}),
                      KeyscopeException);
    REQUIRE_THROWS_AS(generate_scale(static_cast<PitchClass>(-1), ScaleType::Major),
                      KeyscopeException);
  }
}

TEST_CASE("Scale profile", "[scale]") {
  SECTION("seven distinct notes share equally") {
    PitchClassProfile profile = scale_profile(generate_scale(PitchClass::C, ScaleType::Major));
    for (int pc : {0, 2, 4, 5, 7, 9, 11}) {
      REQUIRE_THAT(profile[pc], WithinAbs(1.0 / 7.0, 1e-12));
    }
    for (int pc : {1, 3, 6, 8, 10}) {
      REQUIRE(profile[pc] == 0.0);
    }
    REQUIRE_THAT(std::accumulate(profile.begin(), profile.end(), 0.0), WithinAbs(1.0, 1e-9));
  }

  SECTION("repeats count once") {
    PitchClassProfile profile =
        scale_profile({PitchClass::C, PitchClass::C, PitchClass::G, PitchClass::C});
    REQUIRE(profile[0] == 0.5);
    REQUIRE(profile[7] == 0.5);
  }

  SECTION("empty note list") {
    PitchClassProfile profile = scale_profile({});
    for (double value : profile) {
      REQUIRE(value == 0.0);
    }
  }
}

TEST_CASE("Scale type parsing", "[scale]") {
  REQUIRE(parse_scale_type("Major") == ScaleType::Major);
  REQUIRE(parse_scale_type("natural minor") == ScaleType::NaturalMinor);
  REQUIRE(parse_scale_type("HARMONIC_MINOR") == ScaleType::HarmonicMinor);
  REQUIRE(parse_scale_type("melodic-minor") == ScaleType::MelodicMinor);
  REQUIRE(parse_scale_type("mixolydian") == ScaleType::Mixolydian);
  REQUIRE_THROWS_AS(parse_scale_type("blues"), KeyscopeException);
  REQUIRE_THROWS_AS(parse_scale_type(""), KeyscopeException);
}

TEST_CASE("ScaleTemplateTable", "[scale]") {
  const ScaleTemplateTable& table = ScaleTemplateTable::instance();
  REQUIRE(table.size() == 108);
  REQUIRE(&table == &ScaleTemplateTable::instance());

  for (const auto& def : kScaleDefinitions) {
    for (int root = 0; root < kNumPitchClasses; ++root) {
      PitchClass pc = static_cast<PitchClass>(root);
      REQUIRE(table.profile(def.type, pc) == scale_profile(generate_scale(pc, def.type)));
      REQUIRE(table.profiles(def.type)[root] == table.profile(def.type, pc));
    }
  }

  // C Major and A Natural Minor use the same notes
  REQUIRE(table.profile(ScaleType::Major, PitchClass::C) ==
          table.profile(ScaleType::NaturalMinor, PitchClass::A));

  REQUIRE_THROWS_AS(table.profile(ScaleType::Major, static_cast<PitchClass>(12)),
                    KeyscopeException);
}
