#include "smoother.h"

uint8_t smooth_channel(uint8_t previous, uint8_t target, double alpha) {
    if (previous == target) return target;

    double blended = previous + (static_cast<int>(target) - previous) * (1.0 - alpha);
    uint8_t out = clamp_channel(blended);

    // Truncation can stall a rising channel one step short of its target.
    if (out == previous)
        out = static_cast<uint8_t>(target > previous ? previous + 1 : previous - 1);
    return out;
}

LedFrame smooth_frame(const LedFrame& previous, const LedFrame& target, double alpha) {
    if (alpha <= 0.0) return target;

    LedFrame out;
    for (int i = 0; i < LED_COUNT; ++i) {
        out[i].r = smooth_channel(previous[i].r, target[i].r, alpha);
        out[i].g = smooth_channel(previous[i].g, target[i].g, alpha);
        out[i].b = smooth_channel(previous[i].b, target[i].b, alpha);
    }
    return out;
}
