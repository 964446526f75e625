#pragma once

/// @file spectrum.h
/// @brief Averaged short-time magnitude spectrum.

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/audio.h"

namespace keyscope {

/// @brief Callback receiving non-fatal diagnostics (e.g. input too short).
/// @param message Human-readable warning text
using SpectrumWarningCallback = std::function<void(const std::string& message)>;

/// @brief Configuration for the averaged spectrum.
struct SpectrumConfig {
  int window_length = 4096;  ///< Segment length (also the FFT size)
  int hop_length = 2048;     ///< Offset between consecutive segments

  /// @brief Returns the number of one-sided frequency bins.
  int n_bins() const { return window_length / 2 + 1; }
};

/// @brief Magnitude spectrum averaged over overlapping Hann-windowed segments.
/// @details frequencies[k] = k * sample_rate / window_length for k in [0, window_length/2].
/// Segments start at 0, hop, 2*hop, ... while the whole window fits in the
/// signal; nothing is padded. When no segment fits, magnitudes stay all-zero.
class SpectrumFrame {
 public:
  /// @brief Default constructor creates an empty frame.
  SpectrumFrame();

  /// @brief Creates a frame from existing data.
  /// @param frequencies Bin frequencies in Hz
  /// @param magnitudes Magnitude per bin (same length as frequencies)
  /// @param n_segments Number of segments averaged
  /// @param sample_rate Sample rate of the source signal
  /// @throws KeyscopeException if the two vectors differ in length
  SpectrumFrame(std::vector<float> frequencies, std::vector<float> magnitudes, int n_segments = 1,
                int sample_rate = 0);

  /// @brief Computes the averaged spectrum of a mono signal.
  /// @param audio Input audio
  /// @param config Spectrum configuration
  /// @param warning_callback Receives the "not enough data" warning; when null it goes to stderr
  /// @return Spectrum frame with config.n_bins() bins
  /// @throws KeyscopeException on invalid configuration or sample rate
  static SpectrumFrame compute(const Audio& audio, const SpectrumConfig& config = SpectrumConfig(),
                               SpectrumWarningCallback warning_callback = nullptr);

  /// @brief Computes the averaged spectrum of a raw sample buffer.
  /// @param samples Mono samples
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  /// @param config Spectrum configuration
  /// @param warning_callback Warning sink (stderr when null)
  /// @return Spectrum frame
  static SpectrumFrame compute(const float* samples, size_t size, int sample_rate,
                               const SpectrumConfig& config = SpectrumConfig(),
                               SpectrumWarningCallback warning_callback = nullptr);

  /// @brief Returns bin frequencies in Hz.
  const std::vector<float>& frequencies() const { return frequencies_; }

  /// @brief Returns averaged magnitudes.
  const std::vector<float>& magnitudes() const { return magnitudes_; }

  /// @brief Returns number of bins.
  size_t size() const { return frequencies_.size(); }

  /// @brief Returns true if the frame has no bins.
  bool empty() const { return frequencies_.empty(); }

  /// @brief Returns number of segments that were averaged (0 for too-short input).
  int n_segments() const { return n_segments_; }

  /// @brief Returns sample rate of the analyzed signal.
  int sample_rate() const { return sample_rate_; }

 private:
  std::vector<float> frequencies_;
  std::vector<float> magnitudes_;
  int n_segments_;
  int sample_rate_;
};

}  // namespace keyscope
