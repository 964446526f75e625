#include "analysis/key_detector.h"

#include <algorithm>

namespace keyscope {

KeyDetector::KeyDetector(const Audio& audio, const KeyDetectorConfig& config,
                         const ScaleTemplateTable& templates)
    : config_(config), profile_{} {
  spectrum_ = SpectrumFrame::compute(audio, config_.spectrum, config_.on_warning);
  analyze(templates);
}

KeyDetector::KeyDetector(SpectrumFrame spectrum, const KeyDetectorConfig& config,
                         const ScaleTemplateTable& templates)
    : config_(config), spectrum_(std::move(spectrum)), profile_{} {
  analyze(templates);
}

void KeyDetector::analyze(const ScaleTemplateTable& templates) {
  profile_ = compute_pitch_class_profile(spectrum_, config_.pitch_class);

  KeyClassifier classifier(templates, config_.classifier);
  if (classifier.is_single_tone(profile_)) {
    detection_ = classifier.classify(profile_);
    return;
  }

  candidates_ = classifier.rank(profile_);
  detection_ = KeyClassifier::detection_for(candidates_.front());
}

std::vector<KeyCandidate> KeyDetector::candidates(int top_n) const {
  int n = std::max(0, std::min(top_n, static_cast<int>(candidates_.size())));
  return std::vector<KeyCandidate>(candidates_.begin(), candidates_.begin() + n);
}

KeyDetection detect_key(const Audio& audio, const KeyDetectorConfig& config) {
  KeyDetector detector(audio, config);
  return detector.detection();
}

}  // namespace keyscope
