#include "core/convert.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

#include "util/exception.h"

namespace keyscope {

namespace {

/// Semitone offsets of the natural notes A..G from C
const int kNaturalOffsets[] = {
    9,   // A
    11,  // B
    0,   // C
    2,   // D
    4,   // E
    5,   // F
    7,   // G
};

/// @brief Parses "<letter>[#|b]" at the start of a note name.
/// @return Semitone offset from C (may be -1 or 12 before wrapping), or -100 on failure
int parse_note_offset(const std::string& note, size_t& idx) {
  if (note.empty()) return -100;

  char base = static_cast<char>(std::toupper(static_cast<unsigned char>(note[0])));
  if (base < 'A' || base > 'G') return -100;

  int offset = kNaturalOffsets[base - 'A'];
  idx = 1;
  if (idx < note.size()) {
    if (note[idx] == '#') {
      offset += 1;
      idx++;
    } else if (note[idx] == 'b') {
      offset -= 1;
      idx++;
    }
  }
  return offset;
}

}  // namespace

double hz_to_midi(double hz) {
  if (hz <= 0.0) return 0.0;
  return kA4Midi + 12.0 * std::log2(hz / kA4Hz);
}

double midi_to_hz(double midi) { return kA4Hz * std::pow(2.0, (midi - kA4Midi) / 12.0); }

int nearest_midi_note(double midi) {
  // nearbyint honours the default rounding mode (round half to even)
  return static_cast<int>(std::nearbyint(midi));
}

PitchClass hz_to_pitch_class(double hz) {
  KEYSCOPE_CHECK_MSG(hz > 0.0, ErrorCode::InvalidParameter, "Frequency must be positive");
  int note = nearest_midi_note(hz_to_midi(hz));
  int pc = ((note % kNumPitchClasses) + kNumPitchClasses) % kNumPitchClasses;
  return static_cast<PitchClass>(pc);
}

double note_to_hz(const std::string& note) {
  size_t idx = 0;
  int offset = parse_note_offset(note, idx);
  if (offset == -100) return 0.0;

  int octave = 4;  // default
  if (idx < note.size()) {
    try {
      size_t pos = 0;
      octave = std::stoi(note.substr(idx), &pos);
      if (pos != note.size() - idx) {
        return 0.0;  // Trailing garbage
      }
    } catch (const std::exception&) {
      return 0.0;
    }
  }

  int midi = (octave + 1) * kNumPitchClasses + offset;
  return midi_to_hz(static_cast<double>(midi));
}

PitchClass parse_pitch_class(const std::string& name) {
  size_t idx = 0;
  int offset = parse_note_offset(name, idx);
  KEYSCOPE_CHECK_MSG(offset != -100 && idx == name.size(), ErrorCode::InvalidParameter,
                     "Unknown pitch class: " + name);
  return static_cast<PitchClass>((offset + kNumPitchClasses) % kNumPitchClasses);
}

double bin_to_hz(int bin, int sr, int n_fft) {
  return static_cast<double>(bin) * static_cast<double>(sr) / static_cast<double>(n_fft);
}

}  // namespace keyscope
