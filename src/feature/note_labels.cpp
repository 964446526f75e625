#include "feature/note_labels.h"

#include "core/convert.h"

namespace keyscope {

std::vector<NoteLabel> spectrum_note_labels(const SpectrumFrame& spectrum,
                                            const NoteLabelConfig& config) {
  std::vector<NoteLabel> labels;
  for (float freq : spectrum.frequencies()) {
    if (freq < config.fmin || freq > config.fmax || freq <= 0.0f) {
      continue;
    }
    if (labels.empty() || freq - labels.back().frequency > config.min_spacing_hz) {
      labels.push_back({freq, pitch_class_name(hz_to_pitch_class(freq))});
    }
  }
  return labels;
}

}  // namespace keyscope
