/// @file key_classifier_test.cpp
/// @brief Tests for template-matching key classification.

#include "analysis/key_classifier.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <string>

using namespace keyscope;
using Catch::Matchers::WithinAbs;

namespace {

PitchClassProfile template_of(PitchClass root, ScaleType type) {
  return scale_profile(generate_scale(root, type));
}

}  // namespace

TEST_CASE("template_score", "[classifier]") {
  PitchClassProfile profile{};
  profile[0] = 0.5;
  profile[7] = 0.5;

  REQUIRE_THAT(template_score(profile, template_of(PitchClass::C, ScaleType::Major)),
               WithinAbs(1.0 / 7.0, 1e-12));
  REQUIRE_THAT(template_score(profile, template_of(PitchClass::Cs, ScaleType::Major)),
               WithinAbs(0.5 / 7.0, 1e-12));
  REQUIRE(template_score(PitchClassProfile{}, template_of(PitchClass::C, ScaleType::Major)) ==
          0.0);
}

TEST_CASE("KeyClassifier all-zero profile", "[classifier]") {
  KeyClassifier classifier;
  PitchClassProfile zero{};

  KeyDetection detection = classifier.classify(zero);
  REQUIRE(detection.kind == DetectionKind::Key);
  REQUIRE(detection.root == PitchClass::C);
  REQUIRE(detection.scale == ScaleType::Major);
  REQUIRE(detection.score == 0.0);
  REQUIRE(detection.to_string() == "C Major");

  auto ranked = classifier.rank(zero);
  REQUIRE(ranked.size() == 108);
  for (const auto& c : ranked) {
    REQUIRE(c.score == 0.0);
  }
}

TEST_CASE("KeyClassifier uniform profile", "[classifier]") {
  KeyClassifier classifier;
  PitchClassProfile uniform;
  uniform.fill(1.0 / 12.0);

  REQUIRE_FALSE(classifier.is_single_tone(uniform));
  KeyDetection detection = classifier.classify(uniform);
  REQUIRE(detection.to_string() == "C Major");
  REQUIRE_THAT(detection.score, WithinAbs(1.0 / 12.0, 1e-12));
}

TEST_CASE("KeyClassifier single tone threshold", "[classifier]") {
  KeyClassifier classifier;

  SECTION("dominant share above threshold") {
    PitchClassProfile profile{};
    profile[9] = 0.41;
    profile[0] = 0.3;
    profile[4] = 0.29;
    REQUIRE(classifier.is_single_tone(profile));

    KeyDetection detection = classifier.classify(profile);
    REQUIRE(detection.kind == DetectionKind::SingleTone);
    REQUIRE(detection.root == PitchClass::A);
    REQUIRE_FALSE(detection.scale.has_value());
    REQUIRE(detection.score == 0.41);
    REQUIRE(detection.to_string() == "A (Single Tone)");
  }

  SECTION("exactly at threshold is not a single tone") {
    PitchClassProfile profile{};
    profile[9] = 0.4;
    profile[0] = 0.3;
    profile[4] = 0.3;
    REQUIRE_FALSE(classifier.is_single_tone(profile));
    REQUIRE(classifier.classify(profile).kind != DetectionKind::SingleTone);
  }

  SECTION("custom threshold") {
    ClassifierConfig config;
    config.single_tone_threshold = 0.9;
    KeyClassifier strict(ScaleTemplateTable::instance(), config);

    PitchClassProfile profile{};
    profile[9] = 0.8;
    profile[2] = 0.2;
    REQUIRE_FALSE(strict.is_single_tone(profile));
    REQUIRE(classifier.is_single_tone(profile));
    REQUIRE(strict.config().single_tone_threshold == 0.9);
  }
}

TEST_CASE("KeyClassifier ranking order", "[classifier]") {
  KeyClassifier classifier;
  auto ranked = classifier.rank(template_of(PitchClass::C, ScaleType::Major));
  REQUIRE(ranked.size() == 108);

  // Every scale sharing the C major notes ties; roots break the tie
  const char* expected[] = {"C Major",      "D Dorian",         "E Phrygian", "F Lydian",
                            "G Mixolydian", "A Natural Minor", "B Locrian"};
  for (int i = 0; i < 7; ++i) {
    REQUIRE(ranked[i].to_string() == expected[i]);
    REQUIRE(ranked[i].score == ranked[0].score);
  }
  REQUIRE(ranked[7].score < ranked[0].score);

  for (size_t i = 1; i < ranked.size(); ++i) {
    REQUIRE(ranked[i - 1].score >= ranked[i].score);
    if (ranked[i - 1].score == ranked[i].score) {
      int prev_root = static_cast<int>(ranked[i - 1].root);
      int root = static_cast<int>(ranked[i].root);
      REQUIRE(prev_root <= root);
      if (prev_root == root) {
        REQUIRE(static_cast<int>(ranked[i - 1].scale) < static_cast<int>(ranked[i].scale));
      }
    }
  }
}

TEST_CASE("KeyClassifier resolves keys and modes", "[classifier]") {
  KeyClassifier classifier;

  SECTION("relative minor resolves to the lower root") {
    KeyDetection detection = classifier.classify(template_of(PitchClass::A, ScaleType::NaturalMinor));
    REQUIRE(detection.to_string() == "C Major");
  }

  SECTION("harmonic minor has no rotation among the other scales") {
    KeyDetection detection =
        classifier.classify(template_of(PitchClass::C, ScaleType::HarmonicMinor));
    REQUIRE(detection.kind == DetectionKind::Key);
    REQUIRE(detection.to_string() == "C Harmonic Minor");
    REQUIRE_THAT(detection.score, WithinAbs(1.0 / 7.0, 1e-12));
  }

  SECTION("lydian beats the major scale of its fifth") {
    KeyDetection detection = classifier.classify(template_of(PitchClass::C, ScaleType::Lydian));
    REQUIRE(detection.kind == DetectionKind::Mode);
    REQUIRE(detection.to_string() == "C Lydian");
  }
}

TEST_CASE("KeyClassifier detection_for", "[classifier]") {
  KeyCandidate mode{PitchClass::D, ScaleType::Dorian, 0.25};
  KeyDetection detection = KeyClassifier::detection_for(mode);
  REQUIRE(detection.kind == DetectionKind::Mode);
  REQUIRE(detection.root == PitchClass::D);
  REQUIRE(detection.scale == ScaleType::Dorian);
  REQUIRE(detection.score == 0.25);
  REQUIRE(detection.to_string() == "D Dorian");

  KeyCandidate key{PitchClass::Gs, ScaleType::MelodicMinor, 0.1};
  REQUIRE(key.category() == ScaleCategory::Key);
  REQUIRE(KeyClassifier::detection_for(key).kind == DetectionKind::Key);
  REQUIRE(key.to_string() == "G# Melodic Minor");

  REQUIRE(std::string(detection_kind_name(DetectionKind::SingleTone)) == "Single Tone");
  REQUIRE(std::string(detection_kind_name(DetectionKind::Mode)) == "Mode");
}
