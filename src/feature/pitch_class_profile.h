#pragma once

/// @file pitch_class_profile.h
/// @brief Folding of a magnitude spectrum into a 12-bin pitch class profile.

#include <cstddef>

#include "core/spectrum.h"
#include "util/types.h"

namespace keyscope {

/// @brief Frequency range folded into the profile (both bounds inclusive).
struct PitchClassConfig {
  float fmin = 20.0f;    ///< Lowest folded frequency in Hz
  float fmax = 5000.0f;  ///< Highest folded frequency in Hz
};

/// @brief Folds spectrum magnitudes into pitch classes.
/// @details Each bin with fmin <= f <= fmax adds its magnitude to the pitch
/// class of the nearest equal-tempered note (A4 = 440 Hz, C = index 0). The
/// result is divided by its total; when the total is zero it stays all-zero.
/// @param spectrum Averaged magnitude spectrum
/// @param config Folding range
/// @return Profile summing to 1, or all-zero for silence
PitchClassProfile compute_pitch_class_profile(const SpectrumFrame& spectrum,
                                              const PitchClassConfig& config = PitchClassConfig());

/// @brief Folds raw frequency/magnitude arrays into pitch classes.
/// @param frequencies Bin frequencies in Hz
/// @param magnitudes Magnitude per bin
/// @param n_bins Number of bins
/// @param config Folding range
/// @return Profile summing to 1, or all-zero for silence
PitchClassProfile compute_pitch_class_profile(const float* frequencies, const float* magnitudes,
                                              size_t n_bins,
                                              const PitchClassConfig& config = PitchClassConfig());

/// @brief Returns the strongest pitch class (lowest index on ties).
PitchClass dominant_pitch_class(const PitchClassProfile& profile);

/// @brief Returns the share of the strongest pitch class.
double dominant_share(const PitchClassProfile& profile);

}  // namespace keyscope
