#pragma once

/// @file keyscope.h
/// @brief Main header for keyscope - musical key and mode detection.
/// @details Include this file to access all keyscope functionality.

// Version information
#define KEYSCOPE_VERSION_MAJOR 1
#define KEYSCOPE_VERSION_MINOR 0
#define KEYSCOPE_VERSION_PATCH 0
#define KEYSCOPE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio.h"
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/fft.h"
#include "core/spectrum.h"
#include "core/window.h"

// Features
#include "feature/note_labels.h"
#include "feature/pitch_class_profile.h"

// Analysis
#include "analysis/key_classifier.h"
#include "analysis/key_detector.h"
#include "analysis/scale_templates.h"

// Quick API
#include "quick.h"

namespace keyscope {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return KEYSCOPE_VERSION_STRING; }

}  // namespace keyscope
