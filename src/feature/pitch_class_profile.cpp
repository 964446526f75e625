#include "feature/pitch_class_profile.h"

#include <algorithm>

#include "core/convert.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace keyscope {

PitchClassProfile compute_pitch_class_profile(const SpectrumFrame& spectrum,
                                              const PitchClassConfig& config) {
  return compute_pitch_class_profile(spectrum.frequencies().data(), spectrum.magnitudes().data(),
                                     spectrum.size(), config);
}

PitchClassProfile compute_pitch_class_profile(const float* frequencies, const float* magnitudes,
                                              size_t n_bins, const PitchClassConfig& config) {
  KEYSCOPE_CHECK_MSG(config.fmin > 0.0f && config.fmin <= config.fmax,
                     ErrorCode::InvalidParameter, "Folding range must satisfy 0 < fmin <= fmax");

  PitchClassProfile profile{};
  for (size_t i = 0; i < n_bins; ++i) {
    float freq = frequencies[i];
    if (freq < config.fmin || freq > config.fmax) {
      continue;
    }
    int pc = static_cast<int>(hz_to_pitch_class(freq));
    profile[pc] += static_cast<double>(magnitudes[i]);
  }

  normalize_sum(profile.data(), profile.size());
  return profile;
}

PitchClass dominant_pitch_class(const PitchClassProfile& profile) {
  return static_cast<PitchClass>(argmax(profile.data(), profile.size()));
}

double dominant_share(const PitchClassProfile& profile) {
  return *std::max_element(profile.begin(), profile.end());
}

}  // namespace keyscope
