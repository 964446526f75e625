/// @file quick.cpp
/// @brief Implementation of simple function API.

#include "quick.h"

#include "analysis/key_detector.h"
#include "core/audio.h"
#include "core/spectrum.h"
#include "feature/pitch_class_profile.h"

namespace keyscope {
namespace quick {

KeyDetection detect_key(const float* samples, size_t size, int sample_rate) {
  Audio audio = Audio::from_buffer(samples, size, sample_rate);
  return keyscope::detect_key(audio);
}

std::vector<KeyCandidate> key_scores(const float* samples, size_t size, int sample_rate) {
  KeyClassifier classifier;
  return classifier.rank(pitch_class_profile(samples, size, sample_rate));
}

PitchClassProfile pitch_class_profile(const float* samples, size_t size, int sample_rate) {
  SpectrumFrame spectrum = SpectrumFrame::compute(samples, size, sample_rate);
  return compute_pitch_class_profile(spectrum);
}

}  // namespace quick
}  // namespace keyscope
