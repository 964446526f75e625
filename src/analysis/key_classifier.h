#pragma once

/// @file key_classifier.h
/// @brief Key/mode classification by template matching.

#include <optional>
#include <string>
#include <vector>

#include "analysis/scale_templates.h"
#include "util/types.h"

namespace keyscope {

/// @brief What a detection reports.
enum class DetectionKind {
  SingleTone,  ///< One pitch class dominates; no scale is reported
  Key,         ///< Best scale is Major or one of the minors
  Mode,        ///< Best scale is a church mode
};

/// @brief Returns "Single Tone", "Key" or "Mode".
const char* detection_kind_name(DetectionKind kind);

/// @brief Score of one root/scale template against an observed profile.
struct KeyCandidate {
  PitchClass root;  ///< Template root
  ScaleType scale;  ///< Template scale
  double score;     ///< Inner product of observed profile and template

  /// @brief Returns "Key" or "Mode" for the candidate's scale.
  ScaleCategory category() const { return scale_category(scale); }

  /// @brief Returns candidate name (e.g., "C Major").
  std::string to_string() const;
};

/// @brief Result of classifying one profile.
struct KeyDetection {
  DetectionKind kind;               ///< Single tone, key or mode
  PitchClass root;                  ///< Detected root / tone
  std::optional<ScaleType> scale;   ///< Detected scale (empty for a single tone)
  double score;                     ///< Winning template score, or the tone's share

  /// @brief Returns "A (Single Tone)", "C Major", "C Dorian", ...
  std::string to_string() const;
};

/// @brief Configuration for the classifier.
struct ClassifierConfig {
  /// @brief A profile whose largest bin exceeds this is reported as a single tone.
  double single_tone_threshold = 0.4;
};

/// @brief Matches observed pitch class profiles against scale templates.
/// @details Holds a reference to a template table that must outlive it. The
/// classifier itself is stateless after construction and may be shared.
class KeyClassifier {
 public:
  /// @brief Constructs a classifier.
  /// @param templates Shared, immutable template table
  /// @param config Classifier configuration
  explicit KeyClassifier(const ScaleTemplateTable& templates = ScaleTemplateTable::instance(),
                         const ClassifierConfig& config = ClassifierConfig());

  /// @brief Classifies an observed profile.
  /// @details A dominant bin above the threshold short-circuits to a single
  /// tone. Otherwise the first entry of rank() wins. Never fails: an all-zero
  /// profile scores 0 everywhere and resolves to C Major.
  /// @param profile Observed pitch class profile
  /// @return Detection
  KeyDetection classify(const PitchClassProfile& profile) const;

  /// @brief Scores and ranks every template.
  /// @details Sorted by score descending, then root in chromatic order, then
  /// scale in canonical order.
  /// @param profile Observed pitch class profile
  /// @return All scales x roots candidates
  std::vector<KeyCandidate> rank(const PitchClassProfile& profile) const;

  /// @brief Builds the key/mode detection reported for a ranked candidate.
  static KeyDetection detection_for(const KeyCandidate& candidate);

  /// @brief Returns true if the profile takes the single-tone shortcut.
  bool is_single_tone(const PitchClassProfile& profile) const;

  /// @brief Returns the configuration.
  const ClassifierConfig& config() const { return config_; }

 private:
  const ScaleTemplateTable& templates_;
  ClassifierConfig config_;
};

/// @brief Scores a profile against one template (plain inner product).
double template_score(const PitchClassProfile& profile, const PitchClassProfile& templ);

}  // namespace keyscope
