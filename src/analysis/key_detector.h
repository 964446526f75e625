#pragma once

/// @file key_detector.h
/// @brief End-to-end key/mode detection from audio.

#include <vector>

#include "analysis/key_classifier.h"
#include "analysis/scale_templates.h"
#include "core/audio.h"
#include "core/spectrum.h"
#include "feature/pitch_class_profile.h"
#include "util/types.h"

namespace keyscope {

/// @brief Configuration for key detection.
struct KeyDetectorConfig {
  SpectrumConfig spectrum;              ///< Averaged spectrum parameters
  PitchClassConfig pitch_class;         ///< Folding range
  ClassifierConfig classifier;          ///< Single-tone threshold
  SpectrumWarningCallback on_warning;   ///< Receives non-fatal warnings (stderr when null)
};

/// @brief Key detector running spectrum -> pitch class profile -> classification.
/// @details Each detector owns its spectrum and profile; only the template
/// table is shared, read-only, between detectors.
class KeyDetector {
 public:
  /// @brief Analyzes audio.
  /// @param audio Mono input audio
  /// @param config Detector configuration
  /// @param templates Shared template table
  /// @throws KeyscopeException on invalid configuration or sample rate
  explicit KeyDetector(const Audio& audio, const KeyDetectorConfig& config = KeyDetectorConfig(),
                       const ScaleTemplateTable& templates = ScaleTemplateTable::instance());

  /// @brief Classifies a pre-computed spectrum.
  /// @param spectrum Averaged spectrum
  /// @param config Detector configuration (spectrum parameters are ignored)
  /// @param templates Shared template table
  explicit KeyDetector(SpectrumFrame spectrum,
                       const KeyDetectorConfig& config = KeyDetectorConfig(),
                       const ScaleTemplateTable& templates = ScaleTemplateTable::instance());

  /// @brief Returns the detection result.
  const KeyDetection& detection() const { return detection_; }

  /// @brief Returns the detected root (or tone).
  PitchClass root() const { return detection_.root; }

  /// @brief Returns whether a tone, key or mode was detected.
  DetectionKind kind() const { return detection_.kind; }

  /// @brief Returns the averaged spectrum.
  const SpectrumFrame& spectrum() const { return spectrum_; }

  /// @brief Returns the observed pitch class profile.
  const PitchClassProfile& profile() const { return profile_; }

  /// @brief Returns all ranked candidates (empty when a single tone was detected).
  const std::vector<KeyCandidate>& candidates() const { return candidates_; }

  /// @brief Returns the top ranked candidates.
  /// @param top_n Number of candidates to return
  std::vector<KeyCandidate> candidates(int top_n) const;

 private:
  void analyze(const ScaleTemplateTable& templates);

  KeyDetectorConfig config_;
  SpectrumFrame spectrum_;
  PitchClassProfile profile_;
  std::vector<KeyCandidate> candidates_;
  KeyDetection detection_;
};

/// @brief Quick key detection function.
/// @param audio Input audio
/// @param config Detector configuration
/// @return Detection result
KeyDetection detect_key(const Audio& audio, const KeyDetectorConfig& config = KeyDetectorConfig());

}  // namespace keyscope
