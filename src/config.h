#pragma once

#include <istream>
#include <string>

#include "capture.h"
#include "color.h"
#include "effects.h"
#include "engine.h"
#include "sampler.h"

// User-facing settings as read from an INI file and the command line.
// Percentages are kept on the UI scale and converted by to_engine_config().
//
//   [engine]
//   mode       = ambilight      ; see --list-presets
//   brightness = 80             ; 0-100 %
//   smoothing  = 25             ; 0-90 %
//   fps        = 90             ; 15-144
//   edge       = 6              ; 2-20 % of the shorter side
//   speed      = 50             ; 5-100 %
//   mirror     = no
//   color      = #ff0050        ; or r,g,b or a color name
//
//   [crop]
//   aspect = 21:9               ; or left/top/right/bottom fractions
//
//   [capture]
//   display = :0
//   region  = 2560x1440+0+0
struct Config {
    // [engine] section
    struct EngineSection {
        Mode     mode       = Mode::Ambilight;
        int      brightness = 80;
        int      smoothing  = 25;
        int      fps        = 90;
        int      edge       = 6;
        int      speed      = 50;
        bool     mirror     = false;
        LedColor color      = {255, 0, 80};
    } engine;

    // [crop] section
    struct CropSection {
        bool       use_aspect = false;  // true if an aspect preset was chosen
        double     aspect     = 0.0;    // 0 = full screen
        CropRegion region;              // used when use_aspect is false
    } crop;

    // [capture] section
    struct CaptureSection {
        std::string   display;  // "" = $DISPLAY
        CaptureRegion region;   // zero size = whole screen
    } capture;
};

// Slider ranges; values outside are clamped.
static constexpr int BRIGHTNESS_MIN = 0,  BRIGHTNESS_MAX = 100;
static constexpr int SMOOTHING_MIN  = 0,  SMOOTHING_MAX  = 90;
static constexpr int FPS_MIN        = 15, FPS_MAX        = 144;
static constexpr int EDGE_MIN       = 2,  EDGE_MAX       = 20;
static constexpr int SPEED_MIN      = 5,  SPEED_MAX      = 100;

// Apply one `key = value` of `section` to `cfg`.
// Throws std::runtime_error if the value is malformed; returns false if the
// section or key is unknown. Setting the mode also applies its preset.
bool apply_setting(Config& cfg, const std::string& section,
                   const std::string& key, const std::string& value);

// Parse INI text. Throws std::runtime_error (with the line number) on
// malformed values or lines.
Config parse_config(std::istream& in);

// Parse an INI config file from disk.
// Throws std::runtime_error if the file cannot be read or has syntax errors.
Config parse_config_file(const std::string& path);

// Validate a parsed Config and throw std::runtime_error if the crop leaves
// nothing to sample.
void validate_config(const Config& cfg);

// Parse a capture region given as "WxH+X+Y" (the +X+Y part is optional).
// Returns false if the string is malformed or the size is not positive.
bool parse_region(const std::string& s, CaptureRegion& out);

// Parse "L,T,R,B" crop fractions. Returns false if malformed.
bool parse_crop(const std::string& s, CropRegion& out);

// Build the engine snapshot. The screen size resolves aspect presets.
EngineConfig to_engine_config(const Config& cfg, int screen_w, int screen_h);
