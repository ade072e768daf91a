#pragma once

#include <cstdint>
#include <string>

#include "color.h"
#include "effects.h"
#include "sampler.h"

// Mode names as accepted on the command line and in config files:
//   "ambilight", "gaming", "film", "static", "rainbow", "breathing", "cycle"
// ("color_cycle" and "steady" are accepted as aliases).
// Returns false if the name is not recognized.
bool parse_mode(const std::string& name, Mode& out);
const char* mode_name(Mode mode);

// Tuning applied when a capture mode with a preset is selected.
struct ModePreset {
    int smoothing;  // %
    int fps;
    int edge;       // %
};

// Returns false for modes without a preset (everything but gaming/film).
bool mode_preset(Mode mode, ModePreset& out);

// Parse a color given as a name ("red", "warm", ...), "#rrggbb", "rrggbb"
// or "r,g,b" (decimal, 0-255 each).
// Returns false if the string is not recognized.
bool parse_color(const std::string& s, LedColor& out);

// Aspect-ratio presets for letterbox cropping:
//   "full" (no crop), "16:9", "16:10", "21:9", "32:9", "4:3",
//   "2.35:1", "2.39:1", "1:1"
// Any "W:H" with positive numbers is accepted as well.
// ratio is set to 0 for "full". Returns false if not recognized.
bool parse_aspect(const std::string& name, double& ratio);

// Crop that trims a screen of screen_w x screen_h down to content of the
// given aspect ratio, split evenly between opposite sides. A ratio of 0, or
// one within 0.01 of the screen's own, yields no crop.
CropRegion crop_for_aspect(int screen_w, int screen_h, double ratio);

// Print all recognized mode, color and aspect names to stdout
// (for --list-presets)
void list_presets();
