#include "color.h"

#include <algorithm>
#include <cmath>

LedFrame solid_frame(LedColor c) {
    LedFrame f;
    f.fill(c);
    return f;
}

uint8_t clamp_channel(double v) {
    // NaN compares false against everything; treat it as black.
    if (!(v > 0.0)) return 0;
    if (v >= 255.0) return 255;
    return static_cast<uint8_t>(v);  // truncates toward zero
}

LedColor scale_color(LedColor c, double factor) {
    return {clamp_channel(c.r * factor),
            clamp_channel(c.g * factor),
            clamp_channel(c.b * factor)};
}

void hsv_to_rgb(double h, double s, double v, double& r, double& g, double& b) {
    if (s <= 0.0) {
        r = g = b = v;
        return;
    }

    h = h - std::floor(h);
    int    i = static_cast<int>(h * 6.0);
    double f = h * 6.0 - i;
    double p = v * (1.0 - s);
    double q = v * (1.0 - s * f);
    double t = v * (1.0 - s * (1.0 - f));

    switch (i % 6) {
        case 0: r = v; g = t; b = p; break;
        case 1: r = q; g = v; b = p; break;
        case 2: r = p; g = v; b = t; break;
        case 3: r = p; g = q; b = v; break;
        case 4: r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }
}

LedColor hue_color(double hue, double brightness) {
    double r, g, b;
    hsv_to_rgb(hue, 1.0, 1.0, r, g, b);
    return {clamp_channel(r * 255.0 * brightness),
            clamp_channel(g * 255.0 * brightness),
            clamp_channel(b * 255.0 * brightness)};
}
