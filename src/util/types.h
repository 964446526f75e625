#pragma once

/// @file types.h
/// @brief Common type definitions for keyscope.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace keyscope {

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
};

/// @brief Number of chromatic pitch classes.
constexpr int kNumPitchClasses = 12;

/// @brief Pitch class (0-11, C=0).
/// @details The order is the canonical chromatic order used both for
///          profile indexing and for tie-breaking between candidates.
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Twelve-bin distribution indexed by pitch class (C=0).
using PitchClassProfile = std::array<double, kNumPitchClasses>;

/// @brief Returns the name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  return names[static_cast<int>(pc)];
}

/// @brief Returns true if the value is one of the twelve pitch classes.
inline bool is_valid_pitch_class(PitchClass pc) {
  int index = static_cast<int>(pc);
  return index >= 0 && index < kNumPitchClasses;
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
  }
  return "Unknown error";
}

}  // namespace keyscope
