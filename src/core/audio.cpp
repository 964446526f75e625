#include "core/audio.h"

#include "core/audio_io.h"
#include "util/exception.h"

namespace keyscope {

Audio::Audio() : sample_rate_(0) {}

Audio::Audio(std::vector<float> samples, int sample_rate)
    : samples_(std::move(samples)), sample_rate_(sample_rate) {}

Audio Audio::from_buffer(const float* samples, size_t size, int sample_rate) {
  KEYSCOPE_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);
  return from_vector(std::vector<float>(samples, samples + size), sample_rate);
}

Audio Audio::from_vector(std::vector<float> samples, int sample_rate) {
  KEYSCOPE_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  return Audio(std::move(samples), sample_rate);
}

Audio Audio::from_file(const std::string& path) {
  auto [samples, sample_rate] = load_audio(path);
  return from_vector(std::move(samples), sample_rate);
}

float Audio::duration() const {
  if (sample_rate_ == 0) {
    return 0.0f;
  }
  return static_cast<float>(samples_.size()) / static_cast<float>(sample_rate_);
}

}  // namespace keyscope
