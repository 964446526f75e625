#pragma once

/// @file note_labels.h
/// @brief Sparse note-name labels for annotating a spectrum plot.

#include <string>
#include <vector>

#include "core/spectrum.h"

namespace keyscope {

/// @brief Placement rules for spectrum note labels.
struct NoteLabelConfig {
  float fmin = 20.0f;             ///< Lowest labelled frequency (inclusive)
  float fmax = 20000.0f;          ///< Highest labelled frequency (inclusive)
  float min_spacing_hz = 1000.0f; ///< A label must lie more than this above the previous one
};

/// @brief A labelled position on the frequency axis.
struct NoteLabel {
  float frequency;   ///< Bin frequency in Hz
  std::string note;  ///< Pitch class name of the nearest note (e.g. "A")
};

/// @brief Picks sparse note labels along the spectrum's frequency axis.
/// @details Walks the bins in ascending order; a bin inside [fmin, fmax] gets a
/// label when it is the first one or lies more than min_spacing_hz above the
/// last labelled bin. Purely a rendering aid, it never affects detection.
/// @param spectrum Spectrum whose frequency axis is labelled
/// @param config Placement rules
/// @return Labels in ascending frequency
std::vector<NoteLabel> spectrum_note_labels(const SpectrumFrame& spectrum,
                                            const NoteLabelConfig& config = NoteLabelConfig());

}  // namespace keyscope
