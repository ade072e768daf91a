#include <unity.h>

#include <cmath>

#include "effects.h"

void setUp() {}
void tearDown() {}

static void assert_color(LedColor expected, LedColor actual) {
    TEST_ASSERT_EQUAL_UINT8(expected.r, actual.r);
    TEST_ASSERT_EQUAL_UINT8(expected.g, actual.g);
    TEST_ASSERT_EQUAL_UINT8(expected.b, actual.b);
}

static void assert_uniform(const LedFrame& f) {
    for (int i = 1; i < LED_COUNT; ++i)
        assert_color(f[0], f[i]);
}

void test_capture_modes() {
    TEST_ASSERT_TRUE(is_capture_mode(Mode::Ambilight));
    TEST_ASSERT_TRUE(is_capture_mode(Mode::Gaming));
    TEST_ASSERT_TRUE(is_capture_mode(Mode::Film));
    TEST_ASSERT_FALSE(is_capture_mode(Mode::Static));
    TEST_ASSERT_FALSE(is_capture_mode(Mode::Rainbow));
    TEST_ASSERT_FALSE(is_capture_mode(Mode::Breathing));
    TEST_ASSERT_FALSE(is_capture_mode(Mode::Cycle));
}

void test_static_default_color() {
    EffectParams p;
    LedFrame f = effect_static(p);
    for (const LedColor& c : f)
        assert_color({255, 0, 80}, c);
}

void test_static_brightness() {
    EffectParams p;
    p.brightness = 0.5;
    assert_color({127, 0, 40}, effect_static(p)[17]);
}

void test_rainbow_starts_red() {
    EffectParams p;
    assert_color({255, 0, 0}, effect_rainbow(p)[0]);
}

void test_cycle_starts_red() {
    EffectParams p;
    assert_color({255, 0, 0}, effect_cycle(p)[35]);
}

// Doubling speed is the same as doubling elapsed time.
void test_cycle_speed_scales_time() {
    EffectParams a;
    a.elapsed = 2.0;
    a.speed   = 1.0;

    EffectParams b;
    b.elapsed = 1.0;
    b.speed   = 2.0;

    assert_color(effect_cycle(a)[0], effect_cycle(b)[0]);
}

void test_rainbow_moves_faster_than_cycle() {
    EffectParams p;
    p.elapsed = 0.5;
    // rainbow hue 0.15, cycle hue 0.05: both in the red->yellow sextant
    LedColor rainbow = effect_rainbow(p)[0];
    LedColor cycle   = effect_cycle(p)[0];
    TEST_ASSERT_EQUAL_UINT8(255, rainbow.r);
    TEST_ASSERT_EQUAL_UINT8(255, cycle.r);
    TEST_ASSERT_GREATER_THAN(cycle.g, rainbow.g);
}

void test_breathing_pulse() {
    EffectParams p;
    p.base = {200, 100, 50};

    // sin(0) = 0: half brightness
    assert_color({100, 50, 25}, effect_breathing(p)[0]);

    // sin(pi/2) = 1: full
    p.elapsed = M_PI / 3.0;
    LedColor peak = effect_breathing(p)[0];
    TEST_ASSERT_UINT8_WITHIN(1, 200, peak.r);
    TEST_ASSERT_UINT8_WITHIN(1, 100, peak.g);
    TEST_ASSERT_UINT8_WITHIN(1, 50, peak.b);

    // sin(3pi/2) = -1: off
    p.elapsed = M_PI;
    LedColor trough = effect_breathing(p)[0];
    TEST_ASSERT_UINT8_WITHIN(1, 0, trough.r);
}

void test_effects_are_uniform() {
    const Mode modes[] = {Mode::Static, Mode::Rainbow, Mode::Breathing, Mode::Cycle};
    for (Mode m : modes) {
        for (int step = 0; step < 50; ++step) {
            EffectParams p;
            p.elapsed    = step * 0.173;
            p.speed      = 0.1 + step * 0.04;
            p.brightness = 0.8;
            assert_uniform(render_effect(m, p));
        }
    }
}

void test_render_effect_capture_mode_is_black() {
    EffectParams p;
    LedFrame f = render_effect(Mode::Ambilight, p);
    for (const LedColor& c : f)
        assert_color({0, 0, 0}, c);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_capture_modes);
    RUN_TEST(test_static_default_color);
    RUN_TEST(test_static_brightness);
    RUN_TEST(test_rainbow_starts_red);
    RUN_TEST(test_cycle_starts_red);
    RUN_TEST(test_cycle_speed_scales_time);
    RUN_TEST(test_rainbow_moves_faster_than_cycle);
    RUN_TEST(test_breathing_pulse);
    RUN_TEST(test_effects_are_uniform);
    RUN_TEST(test_render_effect_capture_mode_is_black);

    return UNITY_END();
}
