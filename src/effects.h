#pragma once

#include "color.h"

// LED source selected by the user. The first three sample the screen and
// differ only in their tuning presets (see data.h).
enum class Mode : uint8_t {
    Ambilight = 0,
    Gaming,
    Film,
    Static,
    Rainbow,
    Breathing,
    Cycle,
};

static constexpr int MODE_COUNT = 7;

bool is_capture_mode(Mode mode);

// Inputs of a procedural effect for one tick.
struct EffectParams {
    double   elapsed    = 0.0;  // seconds since the render loop started
    double   speed      = 1.0;  // 1.0 = 50% on the speed scale
    double   brightness = 1.0;  // 0..1
    LedColor base       = {255, 0, 80};
};

// All four effects light the 36 LEDs with one shared color.
LedFrame effect_static(const EffectParams& p);
LedFrame effect_rainbow(const EffectParams& p);     // hue turns at 0.3 rev/s
LedFrame effect_breathing(const EffectParams& p);   // sin pulse, 1.5 rad/s
LedFrame effect_cycle(const EffectParams& p);       // hue turns at 0.1 rev/s

// Dispatch on `mode`. Capture modes have no effect and yield black.
LedFrame render_effect(Mode mode, const EffectParams& p);
