#include "core/audio_io.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace keyscope {

namespace {

/// @brief RAII guard for MP3 decode buffer.
/// @details Ensures mp3dec_file_info_t.buffer is freed even on exception.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief Reads entire file into memory.
std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  KEYSCOPE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  KEYSCOPE_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  return buffer;
}

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: frame sync or ID3 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

std::vector<float> select_channel(const float* data, size_t total_samples, int channels,
                                  int channel) {
  KEYSCOPE_CHECK(channels > 0 && channel >= 0 && channel < channels, ErrorCode::InvalidParameter);

  size_t frame_count = total_samples / static_cast<size_t>(channels);
  std::vector<float> mono(frame_count);
  for (size_t i = 0; i < frame_count; ++i) {
    mono[i] = data[i * channels + channel];
  }
  return mono;
}

void normalize_peak(std::vector<float>& samples) {
  float peak = 0.0f;
  for (float v : samples) {
    peak = std::max(peak, std::abs(v));
  }
  if (peak == 0.0f) {
    return;
  }
  for (float& v : samples) {
    v /= peak;
  }
}

AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  KEYSCOPE_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  size_t total_samples = wav.totalPCMFrameCount * wav.channels;
  std::vector<float> samples(total_samples);

  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, samples.data());
  int sample_rate = static_cast<int>(wav.sampleRate);
  int channels = static_cast<int>(wav.channels);

  drwav_uninit(&wav);

  KEYSCOPE_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");

  std::vector<float> mono = select_channel(samples.data(), frames_read * channels, channels);
  return {std::move(mono), sample_rate};
}

AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  KEYSCOPE_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  KEYSCOPE_CHECK_MSG(info.samples > 0, ErrorCode::DecodeFailed, "No audio samples in MP3 data");

  int channels = info.channels;
  KEYSCOPE_CHECK_MSG(channels > 0, ErrorCode::DecodeFailed, "Invalid channel count in MP3 data");

  // First channel only, int16 to float
  size_t frame_count = static_cast<size_t>(info.samples) / static_cast<size_t>(channels);
  std::vector<float> mono(frame_count);
  for (size_t i = 0; i < frame_count; ++i) {
    mono[i] = static_cast<float>(info.buffer[i * channels]) / 32768.0f;
  }

  return {std::move(mono), info.hz};
}

AudioLoadResult load_buffer(const uint8_t* data, size_t size, const AudioLoadOptions& options) {
  AudioLoadResult result;
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      result = load_buffer_wav(data, size);
      break;
    case AudioFormat::MP3:
      result = load_buffer_mp3(data, size);
      break;
    default:
      throw KeyscopeException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }

  if (options.normalize_peak) {
    normalize_peak(std::get<0>(result));
  }
  return result;
}

AudioLoadResult load_audio(const std::string& path, const AudioLoadOptions& options) {
  if (options.max_file_size > 0) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    KEYSCOPE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
    auto size = file.tellg();
    KEYSCOPE_CHECK_MSG(static_cast<size_t>(size) <= options.max_file_size,
                       ErrorCode::InvalidParameter,
                       "File too large: " + std::to_string(size) + " bytes (max: " +
                           std::to_string(options.max_file_size) + " bytes)");
  }

  std::vector<uint8_t> data = read_file(path);
  return load_buffer(data.data(), data.size(), options);
}

void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate,
              int bits_per_sample) {
  KEYSCOPE_CHECK_MSG(samples != nullptr, ErrorCode::InvalidParameter, "Samples pointer is null");
  KEYSCOPE_CHECK_MSG(n_samples > 0, ErrorCode::InvalidParameter, "No samples to save");
  KEYSCOPE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");
  KEYSCOPE_CHECK_MSG(bits_per_sample == 16 || bits_per_sample == 24, ErrorCode::InvalidParameter,
                     "bits_per_sample must be 16 or 24");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = static_cast<drwav_uint32>(bits_per_sample);

  drwav wav;
  drwav_bool32 ok = drwav_init_file_write(&wav, path.c_str(), &format, nullptr);
  KEYSCOPE_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  drwav_uint64 written = 0;
  if (bits_per_sample == 16) {
    std::vector<int16_t> int_samples(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
      float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
      int_samples[i] = static_cast<int16_t>(clamped * 32767.0f);
    }
    written = drwav_write_pcm_frames(&wav, n_samples, int_samples.data());
  } else {
    // 24-bit samples are packed as 3 little-endian bytes
    std::vector<uint8_t> packed(n_samples * 3);
    for (size_t i = 0; i < n_samples; ++i) {
      float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
      int32_t value = static_cast<int32_t>(clamped * 8388607.0f);  // 2^23 - 1
      packed[i * 3] = static_cast<uint8_t>(value & 0xFF);
      packed[i * 3 + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
      packed[i * 3 + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    }
    written = drwav_write_pcm_frames(&wav, n_samples, packed.data());
  }
  drwav_uninit(&wav);
  KEYSCOPE_CHECK_MSG(written == n_samples, ErrorCode::DecodeFailed, "Failed to write all samples");
}

void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate,
              int bits_per_sample) {
  save_wav(path, samples.data(), samples.size(), sample_rate, bits_per_sample);
}

}  // namespace keyscope
