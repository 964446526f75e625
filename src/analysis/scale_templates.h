#pragma once

/// @file scale_templates.h
/// @brief Diatonic scale definitions and their pitch class templates.

#include <array>
#include <string>
#include <vector>

#include "util/types.h"

namespace keyscope {

/// @brief Supported scale types, in canonical order.
enum class ScaleType {
  Major,
  NaturalMinor,
  HarmonicMinor,
  MelodicMinor,
  Dorian,
  Phrygian,
  Lydian,
  Mixolydian,
  Locrian,
};

/// @brief Number of supported scale types.
constexpr int kNumScaleTypes = 9;

/// @brief Whether a scale is reported as a key or as a mode.
enum class ScaleCategory {
  Key,
  Mode,
};

/// @brief Static description of a seven-note scale.
struct ScaleDefinition {
  ScaleType type;                ///< Scale type
  const char* name;              ///< Display name (e.g. "Natural Minor")
  ScaleCategory category;        ///< Key or Mode
  std::array<int, 7> intervals;  ///< Semitone steps from the root
};

/// @brief All scale definitions, indexed by ScaleType.
inline constexpr std::array<ScaleDefinition, kNumScaleTypes> kScaleDefinitions = {{
    {ScaleType::Major, "Major", ScaleCategory::Key, {2, 2, 1, 2, 2, 2, 1}},
    {ScaleType::NaturalMinor, "Natural Minor", ScaleCategory::Key, {2, 1, 2, 2, 1, 2, 2}},
    {ScaleType::HarmonicMinor, "Harmonic Minor", ScaleCategory::Key, {2, 1, 2, 2, 1, 3, 1}},
    {ScaleType::MelodicMinor, "Melodic Minor", ScaleCategory::Key, {2, 1, 2, 2, 2, 2, 1}},
    {ScaleType::Dorian, "Dorian", ScaleCategory::Mode, {2, 1, 2, 2, 2, 1, 2}},
    {ScaleType::Phrygian, "Phrygian", ScaleCategory::Mode, {1, 2, 2, 2, 1, 2, 2}},
    {ScaleType::Lydian, "Lydian", ScaleCategory::Mode, {2, 2, 2, 1, 2, 2, 1}},
    {ScaleType::Mixolydian, "Mixolydian", ScaleCategory::Mode, {2, 2, 1, 2, 2, 1, 2}},
    {ScaleType::Locrian, "Locrian", ScaleCategory::Mode, {1, 2, 2, 1, 2, 2, 2}},
}};

/// @brief Returns the definition of a scale type.
const ScaleDefinition& scale_definition(ScaleType type);

/// @brief Returns the display name of a scale type.
inline const char* scale_name(ScaleType type) { return scale_definition(type).name; }

/// @brief Returns whether the scale is a key or a mode.
inline ScaleCategory scale_category(ScaleType type) { return scale_definition(type).category; }

/// @brief Returns "Key" or "Mode".
inline const char* scale_category_name(ScaleCategory category) {
  return category == ScaleCategory::Key ? "Key" : "Mode";
}

/// @brief Parses a scale name.
/// @param name Display name; case, spaces, '_' and '-' are ignored ("natural_minor" works)
/// @return Scale type
/// @throws KeyscopeException (InvalidParameter) for an unknown name
ScaleType parse_scale_type(const std::string& name);

/// @brief Walks semitone steps around the chromatic circle.
/// @param root Starting pitch class
/// @param intervals Semitone steps (any count; they need not sum to 12)
/// @return Root followed by one note per step (size = intervals.size() + 1)
/// @throws KeyscopeException (InvalidParameter) if root is not one of the 12 pitch classes
std::vector<PitchClass> generate_scale(PitchClass root, const std::vector<int>& intervals);

/// @brief Generates the 8 notes (root..root) of a supported scale.
std::vector<PitchClass> generate_scale(PitchClass root, ScaleType type);

/// @brief Builds the uniform template of a set of notes.
/// @details Every distinct pitch class present gets 1/k (k = number of distinct
/// classes); repeats count once. An empty note list gives an all-zero profile.
/// @param notes Scale notes
/// @return Profile indexed by pitch class
PitchClassProfile scale_profile(const std::vector<PitchClass>& notes);

/// @brief Immutable table of the 9 x 12 scale templates.
/// @details Built once and only read afterwards, so one instance can be shared
/// by any number of concurrent classifiers without locking.
class ScaleTemplateTable {
 public:
  /// @brief Builds all templates.
  ScaleTemplateTable();

  /// @brief Returns the process-wide table (constructed on first use).
  static const ScaleTemplateTable& instance();

  /// @brief Returns the template of one scale at one root.
  const PitchClassProfile& profile(ScaleType type, PitchClass root) const;

  /// @brief Returns the 12 templates of a scale, indexed by root.
  const std::array<PitchClassProfile, kNumPitchClasses>& profiles(ScaleType type) const;

  /// @brief Returns the number of templates (scales x roots).
  size_t size() const { return static_cast<size_t>(kNumScaleTypes) * kNumPitchClasses; }

 private:
  std::array<std::array<PitchClassProfile, kNumPitchClasses>, kNumScaleTypes> profiles_;
};

}  // namespace keyscope
