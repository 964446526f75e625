#pragma once

/// @file convert.h
/// @brief Unit conversion functions for frequency and pitch.

#include <string>

#include "util/types.h"

namespace keyscope {

/// @brief Reference pitch of A4 in Hz.
constexpr double kA4Hz = 440.0;

/// @brief MIDI note number of A4.
constexpr double kA4Midi = 69.0;

/// @brief Converts Hz to (fractional) MIDI note number.
/// @param hz Frequency in Hz
/// @return 69 + 12 * log2(hz / 440); 0 for non-positive input
double hz_to_midi(double hz);

/// @brief Converts MIDI note number to Hz.
/// @param midi MIDI note number
/// @return Frequency in Hz
double midi_to_hz(double midi);

/// @brief Rounds a fractional MIDI number to the nearest note.
/// @details Exact halves round to the even note number.
int nearest_midi_note(double midi);

/// @brief Maps a frequency to the pitch class of its nearest equal-tempered note.
/// @param hz Frequency in Hz (must be positive)
/// @return Pitch class anchored at C = 0 (440 Hz maps to PitchClass::A)
PitchClass hz_to_pitch_class(double hz);

/// @brief Converts note name to Hz.
/// @param note Note name (e.g., "A4", "C#5", "Db4"); octave defaults to 4
/// @return Frequency in Hz, 0 if the name cannot be parsed
double note_to_hz(const std::string& note);

/// @brief Parses a pitch class name.
/// @param name Name such as "C", "F#" or "Bb"
/// @return Parsed pitch class
/// @throws KeyscopeException (InvalidParameter) if the name is not a pitch class
PitchClass parse_pitch_class(const std::string& name);

/// @brief Converts FFT bin index to Hz.
/// @param bin Bin index
/// @param sr Sample rate
/// @param n_fft FFT size
/// @return Frequency in Hz
double bin_to_hz(int bin, int sr, int n_fft);

}  // namespace keyscope
