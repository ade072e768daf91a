#pragma once

#include <array>
#include <cstdint>

// -----------------------------------------------------------------------
// DX-Light strip geometry
//
// 36 LEDs in three groups of 12, wired around the monitor:
//
//   index  | edge   | direction
//   -------|--------|------------------
//    0..11 | left   | bottom -> top
//   12..23 | top    | left -> right
//   24..35 | right  | top -> bottom
//
// The zone order is what the wire encoder and the physical strip expect;
// it never changes.
// -----------------------------------------------------------------------
static constexpr int LEDS_PER_EDGE = 12;
static constexpr int LED_COUNT     = 3 * LEDS_PER_EDGE;

static constexpr int LEFT_BEGIN  = 0;
static constexpr int TOP_BEGIN   = LEDS_PER_EDGE;
static constexpr int RIGHT_BEGIN = 2 * LEDS_PER_EDGE;

struct LedColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const LedColor& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const LedColor& o) const { return !(*this == o); }
};

using LedFrame = std::array<LedColor, LED_COUNT>;

// A frame with every LED set to `c`.
LedFrame solid_frame(LedColor c);

// Truncate toward zero and clamp into [0,255].
uint8_t clamp_channel(double v);

// Multiply every channel by `factor` (truncated, clamped).
LedColor scale_color(LedColor c, double factor);

// HSV -> RGB, all components in [0,1]. Hue wraps.
void hsv_to_rgb(double h, double s, double v, double& r, double& g, double& b);

// Full-saturation, full-value hue mapped to 8-bit RGB and scaled by
// `brightness`.
LedColor hue_color(double hue, double brightness);
