#include "core/spectrum.h"

#include <Eigen/Core>
#include <iostream>

#include "core/convert.h"
#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"

namespace keyscope {

namespace {

void default_warning(const std::string& message) { std::cerr << "Warning: " << message << "\n"; }

}  // namespace

SpectrumFrame::SpectrumFrame() : n_segments_(0), sample_rate_(0) {}

SpectrumFrame::SpectrumFrame(std::vector<float> frequencies, std::vector<float> magnitudes,
                             int n_segments, int sample_rate)
    : frequencies_(std::move(frequencies)),
      magnitudes_(std::move(magnitudes)),
      n_segments_(n_segments),
      sample_rate_(sample_rate) {
  KEYSCOPE_CHECK_MSG(frequencies_.size() == magnitudes_.size(), ErrorCode::InvalidParameter,
                     "Frequency and magnitude vectors must have the same length");
}

SpectrumFrame SpectrumFrame::compute(const Audio& audio, const SpectrumConfig& config,
                                     SpectrumWarningCallback warning_callback) {
  return compute(audio.data(), audio.size(), audio.sample_rate(), config,
                 std::move(warning_callback));
}

SpectrumFrame SpectrumFrame::compute(const float* samples, size_t size, int sample_rate,
                                     const SpectrumConfig& config,
                                     SpectrumWarningCallback warning_callback) {
  KEYSCOPE_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  KEYSCOPE_CHECK(config.window_length > 0, ErrorCode::InvalidParameter);
  KEYSCOPE_CHECK(config.hop_length > 0, ErrorCode::InvalidParameter);
  KEYSCOPE_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);

  const int n_fft = config.window_length;
  const int n_bins = config.n_bins();
  const size_t win = static_cast<size_t>(n_fft);
  const size_t hop = static_cast<size_t>(config.hop_length);

  std::vector<float> frequencies(n_bins);
  for (int k = 0; k < n_bins; ++k) {
    frequencies[k] = static_cast<float>(bin_to_hz(k, sample_rate, n_fft));
  }

  FFT fft(n_fft);
  const std::vector<float>& window = hann_window_cached(n_fft);
  Eigen::Map<const Eigen::ArrayXf> window_map(window.data(), n_fft);

  std::vector<float> segment(win);
  std::vector<float> segment_magnitude(n_bins);
  Eigen::Map<Eigen::ArrayXf> segment_map(segment.data(), n_fft);
  Eigen::Map<const Eigen::ArrayXf> magnitude_map(segment_magnitude.data(), n_bins);

  Eigen::ArrayXf accum = Eigen::ArrayXf::Zero(n_bins);
  int n_segments = 0;

  for (size_t offset = 0; offset + win <= size; offset += hop) {
    segment_map = Eigen::Map<const Eigen::ArrayXf>(samples + offset, n_fft) * window_map;
    fft.magnitude(segment.data(), segment_magnitude.data());
    accum += magnitude_map;
    ++n_segments;
  }

  if (n_segments > 0) {
    accum /= static_cast<float>(n_segments);
  } else {
    const std::string message = "Not enough data for FFT.";
    if (warning_callback) {
      warning_callback(message);
    } else {
      default_warning(message);
    }
  }

  std::vector<float> magnitudes(accum.data(), accum.data() + n_bins);
  return SpectrumFrame(std::move(frequencies), std::move(magnitudes), n_segments, sample_rate);
}

}  // namespace keyscope
