#include <unity.h>

#include <cmath>
#include <limits>

#include "color.h"

void setUp() {}
void tearDown() {}

static void assert_color(LedColor expected, LedColor actual) {
    TEST_ASSERT_EQUAL_UINT8(expected.r, actual.r);
    TEST_ASSERT_EQUAL_UINT8(expected.g, actual.g);
    TEST_ASSERT_EQUAL_UINT8(expected.b, actual.b);
}

void test_strip_layout() {
    TEST_ASSERT_EQUAL_INT(36, LED_COUNT);
    TEST_ASSERT_EQUAL_INT(0, LEFT_BEGIN);
    TEST_ASSERT_EQUAL_INT(12, TOP_BEGIN);
    TEST_ASSERT_EQUAL_INT(24, RIGHT_BEGIN);
}

void test_clamp_channel_truncates_and_clamps() {
    TEST_ASSERT_EQUAL_UINT8(12, clamp_channel(12.9));
    TEST_ASSERT_EQUAL_UINT8(0, clamp_channel(-4.0));
    TEST_ASSERT_EQUAL_UINT8(255, clamp_channel(255.0));
    TEST_ASSERT_EQUAL_UINT8(255, clamp_channel(1000.0));
    TEST_ASSERT_EQUAL_UINT8(0, clamp_channel(std::numeric_limits<double>::quiet_NaN()));
}

void test_scale_color() {
    assert_color({127, 0, 40}, scale_color({255, 0, 80}, 0.5));
    assert_color({0, 0, 0}, scale_color({255, 255, 255}, 0.0));
    assert_color({255, 255, 255}, scale_color({200, 200, 200}, 2.0));
}

void test_solid_frame_fills_every_led() {
    LedFrame f = solid_frame({1, 2, 3});
    TEST_ASSERT_EQUAL_INT(LED_COUNT, static_cast<int>(f.size()));
    for (const LedColor& c : f)
        assert_color({1, 2, 3}, c);
}

void test_hue_color_primaries() {
    assert_color({255, 0, 0}, hue_color(0.0, 1.0));
    assert_color({0, 255, 255}, hue_color(0.5, 1.0));
    assert_color({127, 255, 0}, hue_color(0.25, 1.0));
}

void test_hue_wraps() {
    assert_color(hue_color(0.25, 1.0), hue_color(1.25, 1.0));
    assert_color(hue_color(0.25, 1.0), hue_color(-0.75, 1.0));
}

void test_hue_color_brightness() {
    assert_color({127, 0, 0}, hue_color(0.0, 0.5));
    assert_color({0, 0, 0}, hue_color(0.0, 0.0));
}

void test_hsv_zero_saturation_is_grey() {
    double r, g, b;
    hsv_to_rgb(0.7, 0.0, 0.4, r, g, b);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.4f, static_cast<float>(r));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.4f, static_cast<float>(g));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.4f, static_cast<float>(b));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_strip_layout);
    RUN_TEST(test_clamp_channel_truncates_and_clamps);
    RUN_TEST(test_scale_color);
    RUN_TEST(test_solid_frame_fills_every_led);
    RUN_TEST(test_hue_color_primaries);
    RUN_TEST(test_hue_wraps);
    RUN_TEST(test_hue_color_brightness);
    RUN_TEST(test_hsv_zero_saturation_is_grey);

    return UNITY_END();
}
