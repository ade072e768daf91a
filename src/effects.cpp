#include "effects.h"

#include <cmath>

bool is_capture_mode(Mode mode) {
    return mode == Mode::Ambilight || mode == Mode::Gaming || mode == Mode::Film;
}

// Position in a hue cycle advancing `rate` turns per second at speed 1.0.
static double hue_at(const EffectParams& p, double rate) {
    double h = std::fmod(p.elapsed * p.speed * rate, 1.0);
    return h < 0.0 ? h + 1.0 : h;
}

LedFrame effect_static(const EffectParams& p) {
    return solid_frame(scale_color(p.base, p.brightness));
}

LedFrame effect_rainbow(const EffectParams& p) {
    return solid_frame(hue_color(hue_at(p, 0.3), p.brightness));
}

LedFrame effect_breathing(const EffectParams& p) {
    double pulse = (std::sin(p.elapsed * p.speed * 1.5) + 1.0) / 2.0;
    return solid_frame(scale_color(p.base, pulse * p.brightness));
}

LedFrame effect_cycle(const EffectParams& p) {
    return solid_frame(hue_color(hue_at(p, 0.1), p.brightness));
}

LedFrame render_effect(Mode mode, const EffectParams& p) {
    switch (mode) {
        case Mode::Static:    return effect_static(p);
        case Mode::Rainbow:   return effect_rainbow(p);
        case Mode::Breathing: return effect_breathing(p);
        case Mode::Cycle:     return effect_cycle(p);
        default:              return LedFrame{};
    }
}
