#pragma once

/// @file audio_io.h
/// @brief Audio file loading utilities using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace keyscope {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Result of audio loading: samples and sample rate.
using AudioLoadResult = std::tuple<std::vector<float>, int>;

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 500 * 1024 * 1024;

  /// @brief Scale samples so the loudest one reaches magnitude 1.
  bool normalize_peak = true;
};

/// @brief Default audio load options.
inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Keeps one channel of interleaved audio.
/// @param data Interleaved samples
/// @param total_samples Number of samples across all channels
/// @param channels Channel count
/// @param channel Channel to keep (0 = first)
/// @return Samples of the selected channel
std::vector<float> select_channel(const float* data, size_t total_samples, int channels,
                                  int channel = 0);

/// @brief Divides all samples by the peak absolute value.
/// @param samples Samples to normalize in place; all-zero input is left unchanged
void normalize_peak(std::vector<float>& samples);

/// @brief Loads WAV from memory buffer.
/// @param data Pointer to WAV data
/// @param size Size of data in bytes
/// @return Tuple of (first-channel samples in [-1,1], sample rate)
/// @throws KeyscopeException on decode error
AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Loads MP3 from memory buffer.
/// @param data Pointer to MP3 data
/// @param size Size of data in bytes
/// @return Tuple of (first-channel samples in [-1,1], sample rate)
/// @throws KeyscopeException on decode error
AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Loads audio from memory buffer (auto-detect format).
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @param options Loading options
/// @return Tuple of (mono samples, sample rate)
/// @throws KeyscopeException on unknown format or decode error
AudioLoadResult load_buffer(const uint8_t* data, size_t size,
                            const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Loads audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options (max file size, peak normalization)
/// @return Tuple of (mono samples, sample rate)
/// @throws KeyscopeException on file not found, unknown format, file too large, or decode error
AudioLoadResult load_audio(const std::string& path,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Saves audio samples to a mono PCM WAV file.
/// @param path Output file path
/// @param samples Audio samples (normalized to [-1,1])
/// @param n_samples Number of samples
/// @param sample_rate Sample rate in Hz
/// @param bits_per_sample Bit depth (16 or 24, default 16)
/// @throws KeyscopeException on write error
void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate,
              int bits_per_sample = 16);

/// @brief Saves audio samples to a mono PCM WAV file.
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate,
              int bits_per_sample = 16);

}  // namespace keyscope
