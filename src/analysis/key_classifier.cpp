#include "analysis/key_classifier.h"

#include <algorithm>

#include "feature/pitch_class_profile.h"
#include "util/math_utils.h"

namespace keyscope {

const char* detection_kind_name(DetectionKind kind) {
  switch (kind) {
    case DetectionKind::SingleTone:
      return "Single Tone";
    case DetectionKind::Key:
      return "Key";
    case DetectionKind::Mode:
      return "Mode";
  }
  return "Unknown";
}

std::string KeyCandidate::to_string() const {
  return std::string(pitch_class_name(root)) + " " + scale_name(scale);
}

std::string KeyDetection::to_string() const {
  std::string root_name = pitch_class_name(root);
  if (kind == DetectionKind::SingleTone || !scale) {
    return root_name + " (Single Tone)";
  }
  return root_name + " " + scale_name(*scale);
}

double template_score(const PitchClassProfile& profile, const PitchClassProfile& templ) {
  return dot_product(profile.data(), templ.data(), profile.size());
}

KeyClassifier::KeyClassifier(const ScaleTemplateTable& templates, const ClassifierConfig& config)
    : templates_(templates), config_(config) {}

bool KeyClassifier::is_single_tone(const PitchClassProfile& profile) const {
  return dominant_share(profile) > config_.single_tone_threshold;
}

std::vector<KeyCandidate> KeyClassifier::rank(const PitchClassProfile& profile) const {
  std::vector<KeyCandidate> candidates;
  candidates.reserve(templates_.size());

  for (const auto& def : kScaleDefinitions) {
    const auto& profiles = templates_.profiles(def.type);
    for (int root = 0; root < kNumPitchClasses; ++root) {
      KeyCandidate candidate;
      candidate.root = static_cast<PitchClass>(root);
      candidate.scale = def.type;
      candidate.score = template_score(profile, profiles[root]);
      candidates.push_back(candidate);
    }
  }

  // Stable: equal score and root keep canonical scale order
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const KeyCandidate& a, const KeyCandidate& b) {
                     if (a.score != b.score) {
                       return a.score > b.score;
                     }
                     return static_cast<int>(a.root) < static_cast<int>(b.root);
                   });
  return candidates;
}

KeyDetection KeyClassifier::classify(const PitchClassProfile& profile) const {
  KeyDetection detection;

  if (is_single_tone(profile)) {
    detection.kind = DetectionKind::SingleTone;
    detection.root = dominant_pitch_class(profile);
    detection.score = dominant_share(profile);
    return detection;
  }

  return detection_for(rank(profile).front());
}

KeyDetection KeyClassifier::detection_for(const KeyCandidate& candidate) {
  KeyDetection detection;
  detection.kind =
      candidate.category() == ScaleCategory::Key ? DetectionKind::Key : DetectionKind::Mode;
  detection.root = candidate.root;
  detection.scale = candidate.scale;
  detection.score = candidate.score;
  return detection;
}

}  // namespace keyscope
