#pragma once

/// @file quick.h
/// @brief Simple function API for quick key detection.
/// @details Stateless functions over raw sample buffers.

#include <cstddef>
#include <vector>

#include "analysis/key_classifier.h"

namespace keyscope {
namespace quick {

/// @brief Detects the key, mode or single tone of audio samples.
/// @param samples Pointer to audio samples (mono, float32, in [-1, 1])
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Detection result
KeyDetection detect_key(const float* samples, size_t size, int sample_rate);

/// @brief Returns every key/mode candidate in ranked order.
/// @param samples Pointer to audio samples (mono, float32, in [-1, 1])
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Ranked candidates; scored even when the input is a single tone
std::vector<KeyCandidate> key_scores(const float* samples, size_t size, int sample_rate);

/// @brief Computes the observed pitch class profile of audio samples.
/// @param samples Pointer to audio samples (mono, float32, in [-1, 1])
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Profile summing to 1, or all-zero for silence / too-short input
PitchClassProfile pitch_class_profile(const float* samples, size_t size, int sample_rate);

}  // namespace quick
}  // namespace keyscope
