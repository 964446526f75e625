#include "analysis/scale_templates.h"

#include <cctype>

#include "util/exception.h"
#include "util/math_utils.h"

namespace keyscope {

namespace {

/// @brief Lower-cases and drops separators so "Natural Minor" == "natural_minor".
std::string canonical_scale_key(const std::string& name) {
  std::string key;
  for (char c : name) {
    if (c == ' ' || c == '_' || c == '-') continue;
    key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return key;
}

int scale_index(ScaleType type) {
  int index = static_cast<int>(type);
  KEYSCOPE_CHECK_MSG(index >= 0 && index < kNumScaleTypes, ErrorCode::InvalidParameter,
                     "Unknown scale type");
  return index;
}

}  // namespace

const ScaleDefinition& scale_definition(ScaleType type) { return kScaleDefinitions[scale_index(type)]; }

ScaleType parse_scale_type(const std::string& name) {
  std::string key = canonical_scale_key(name);
  for (const auto& def : kScaleDefinitions) {
    if (canonical_scale_key(def.name) == key) {
      return def.type;
    }
  }
  throw KeyscopeException(ErrorCode::InvalidParameter, "Unknown scale: " + name);
}

std::vector<PitchClass> generate_scale(PitchClass root, const std::vector<int>& intervals) {
  KEYSCOPE_CHECK_MSG(is_valid_pitch_class(root), ErrorCode::InvalidParameter,
                     "Root is not a chromatic pitch class");

  std::vector<PitchClass> scale;
  scale.reserve(intervals.size() + 1);
  scale.push_back(root);

  int index = static_cast<int>(root);
  for (int step : intervals) {
    index = ((index + step) % kNumPitchClasses + kNumPitchClasses) % kNumPitchClasses;
    scale.push_back(static_cast<PitchClass>(index));
  }
  return scale;
}

std::vector<PitchClass> generate_scale(PitchClass root, ScaleType type) {
  const auto& intervals = scale_definition(type).intervals;
  return generate_scale(root, std::vector<int>(intervals.begin(), intervals.end()));
}

PitchClassProfile scale_profile(const std::vector<PitchClass>& notes) {
  PitchClassProfile profile{};
  for (PitchClass note : notes) {
    KEYSCOPE_CHECK(is_valid_pitch_class(note), ErrorCode::InvalidParameter);
    profile[static_cast<int>(note)] = 1.0;
  }

  // Total is the number of distinct notes
  normalize_sum(profile.data(), profile.size());
  return profile;
}

ScaleTemplateTable::ScaleTemplateTable() {
  for (const auto& def : kScaleDefinitions) {
    auto& row = profiles_[static_cast<int>(def.type)];
    for (int root = 0; root < kNumPitchClasses; ++root) {
      row[root] = scale_profile(generate_scale(static_cast<PitchClass>(root), def.type));
    }
  }
}

const ScaleTemplateTable& ScaleTemplateTable::instance() {
  static const ScaleTemplateTable table;
  return table;
}

const PitchClassProfile& ScaleTemplateTable::profile(ScaleType type, PitchClass root) const {
  KEYSCOPE_CHECK(is_valid_pitch_class(root), ErrorCode::InvalidParameter);
  return profiles_[scale_index(type)][static_cast<int>(root)];
}

const std::array<PitchClassProfile, kNumPitchClasses>& ScaleTemplateTable::profiles(
    ScaleType type) const {
  return profiles_[scale_index(type)];
}

}  // namespace keyscope
