#pragma once

/// @file audio.h
/// @brief Mono sample buffer handed to the key detector.

#include <cstddef>
#include <string>
#include <vector>

namespace keyscope {

/// @brief Mono audio buffer.
/// @details Samples are a single channel, amplitude-normalized to [-1, 1] by
/// whoever produced them.
class Audio {
 public:
  /// @brief Default constructor creates an empty Audio.
  Audio();

  /// @brief Creates Audio from existing samples.
  /// @param samples Pointer to sample data (will be copied)
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @return Audio object
  /// @throws KeyscopeException if sample_rate is not positive
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates Audio from a vector of samples.
  /// @param samples Vector of samples (will be moved)
  /// @param sample_rate Sample rate in Hz
  /// @return Audio object
  /// @throws KeyscopeException if sample_rate is not positive
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Loads Audio from a file (WAV or MP3).
  /// @param path Path to audio file
  /// @return Audio object holding the first channel, peak-normalized
  /// @throws KeyscopeException on file not found or decode error
  static Audio from_file(const std::string& path);

  /// @brief Returns pointer to sample data (nullptr when empty).
  const float* data() const { return samples_.empty() ? nullptr : samples_.data(); }

  /// @brief Returns number of samples.
  size_t size() const { return samples_.size(); }

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds.
  float duration() const;

  /// @brief Returns true if audio is empty.
  bool empty() const { return samples_.empty(); }

 private:
  Audio(std::vector<float> samples, int sample_rate);

  std::vector<float> samples_;
  int sample_rate_;
};

}  // namespace keyscope
