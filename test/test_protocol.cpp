#include <unity.h>

#include "protocol.h"

void setUp() {}
void tearDown() {}

static void assert_color(LedColor expected, LedColor actual) {
    TEST_ASSERT_EQUAL_UINT8(expected.r, actual.r);
    TEST_ASSERT_EQUAL_UINT8(expected.g, actual.g);
    TEST_ASSERT_EQUAL_UINT8(expected.b, actual.b);
}

// Every LED distinct so ordering mistakes show up.
static LedFrame gradient_frame() {
    LedFrame f;
    for (int i = 0; i < LED_COUNT; ++i)
        f[i] = {static_cast<uint8_t>(i + 1),
                static_cast<uint8_t>(100 + i),
                static_cast<uint8_t>(255 - i)};
    return f;
}

// Byte `i` of the 192-byte frame as carried in the reports.
static uint8_t wire_byte(const ReportSet& reports, int i) {
    return reports[i / DXLIGHT_PAYLOAD_SIZE][1 + i % DXLIGHT_PAYLOAD_SIZE];
}

static LedColor wire_color(const ReportSet& reports, int offset) {
    return {wire_byte(reports, offset), wire_byte(reports, offset + 1),
            wire_byte(reports, offset + 2)};
}

void test_three_reports_of_65_bytes() {
    ReportSet reports = build_reports(gradient_frame(), 0, false);
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(reports.size()));
    for (const Report& r : reports) {
        TEST_ASSERT_EQUAL_INT(65, static_cast<int>(r.size()));
        TEST_ASSERT_EQUAL_UINT8(0x00, r[0]);
    }
}

void test_header_and_counter() {
    ReportSet reports = build_reports(gradient_frame(), 0x2a, false);
    const uint8_t expected[] = {0x53, 0x43, 0x00, 0xb1, 0x2a, 0x80, 0x01};
    for (int i = 0; i < 7; ++i)
        TEST_ASSERT_EQUAL_HEX8(expected[i], wire_byte(reports, i));
}

// assembled[0] is the top LED of the left group.
void test_first_led_without_index() {
    LedFrame leds = gradient_frame();
    ReportSet reports = build_reports(leds, 0, false);
    assert_color(leds[LEFT_BEGIN + 11], wire_color(reports, 7));
}

void test_running_index_bytes() {
    ReportSet reports = build_reports(gradient_frame(), 0, false);
    for (int led = 0; led < LED_COUNT; ++led) {
        int p = DXLIGHT_BLOCKS_OFFSET + led * DXLIGHT_BYTES_PER_LED;
        TEST_ASSERT_EQUAL_UINT8(2 * led + 1, wire_byte(reports, p));
        TEST_ASSERT_EQUAL_UINT8(2 * led + 2, wire_byte(reports, p + 1));
    }
}

void test_block_layout() {
    LedFrame leds = gradient_frame();
    ReportSet reports = build_reports(leds, 0, false);

    // Block 1 starts at assembled[1]: second LED from the top of the left group.
    assert_color(leds[LEFT_BEGIN + 10], wire_color(reports, 10 + 2));

    // Block 1 ends and block 2 begins on assembled[12], the first top LED.
    assert_color(leds[TOP_BEGIN], wire_color(reports, 10 + 11 * 5 + 2));
    assert_color(leds[TOP_BEGIN], wire_color(reports, 10 + 12 * 5 + 2));

    // Block 3 is the right group top -> bottom.
    assert_color(leds[RIGHT_BEGIN], wire_color(reports, 10 + 24 * 5 + 2));
    assert_color(leds[RIGHT_BEGIN + 11], wire_color(reports, 10 + 35 * 5 + 2));

    TEST_ASSERT_EQUAL_UINT8(0, wire_byte(reports, 190));
    TEST_ASSERT_EQUAL_UINT8(0, wire_byte(reports, 191));
}

void test_round_trip() {
    LedFrame leds = gradient_frame();
    for (bool mirror : {false, true}) {
        ReportSet reports = build_reports(leds, 77, mirror);
        LedFrame decoded{};
        uint8_t counter = 0;
        TEST_ASSERT_TRUE(decode_reports(reports, mirror, decoded, counter));
        TEST_ASSERT_EQUAL_UINT8(77, counter);
        for (int i = 0; i < LED_COUNT; ++i)
            assert_color(leds[i], decoded[i]);
    }
}

void test_mirror_twice_is_identity() {
    LedFrame leds = gradient_frame();
    LedFrame twice = mirror_leds(mirror_leds(leds));
    for (int i = 0; i < LED_COUNT; ++i)
        assert_color(leds[i], twice[i]);
}

void test_mirror_swaps_sides() {
    LedFrame leds = gradient_frame();
    LedFrame m = mirror_leds(leds);
    assert_color(leds[RIGHT_BEGIN + 11], m[LEFT_BEGIN]);
    assert_color(leds[LEFT_BEGIN], m[RIGHT_BEGIN + 11]);
    assert_color(leds[TOP_BEGIN + 11], m[TOP_BEGIN]);

    ReportSet direct   = build_reports(leds, 3, true);
    ReportSet premixed = build_reports(m, 3, false);
    for (int r = 0; r < DXLIGHT_REPORT_COUNT; ++r)
        TEST_ASSERT_EQUAL_UINT8_ARRAY(premixed[r].data(), direct[r].data(), DXLIGHT_REPORT_SIZE);
}

void test_counter_wraps() {
    ReportSet reports = build_reports(gradient_frame(), 255, false);
    TEST_ASSERT_EQUAL_UINT8(255, wire_byte(reports, DXLIGHT_COUNTER_OFFSET));
}

void test_decode_rejects_corruption() {
    LedFrame out{};
    uint8_t counter = 0;
    const ReportSet good = build_reports(gradient_frame(), 1, false);

    ReportSet bad_id = good;
    bad_id[1][0] = 0x01;
    TEST_ASSERT_FALSE(decode_reports(bad_id, false, out, counter));

    ReportSet bad_header = good;
    bad_header[0][1] = 0x54;
    TEST_ASSERT_FALSE(decode_reports(bad_header, false, out, counter));

    ReportSet bad_index = good;
    bad_index[0][1 + DXLIGHT_BLOCKS_OFFSET] = 0x09;
    TEST_ASSERT_FALSE(decode_reports(bad_index, false, out, counter));

    // Block 2's copy of the shared LED (offset 70 + 2) no longer matches block 1's.
    ReportSet bad_overlap = good;
    bad_overlap[1][1 + (72 - 64)] ^= 0xff;
    TEST_ASSERT_FALSE(decode_reports(bad_overlap, false, out, counter));

    ReportSet bad_tail = good;
    bad_tail[2][64] = 0x01;
    TEST_ASSERT_FALSE(decode_reports(bad_tail, false, out, counter));

    TEST_ASSERT_TRUE(decode_reports(good, false, out, counter));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_three_reports_of_65_bytes);
    RUN_TEST(test_header_and_counter);
    RUN_TEST(test_first_led_without_index);
    RUN_TEST(test_running_index_bytes);
    RUN_TEST(test_block_layout);
    RUN_TEST(test_round_trip);
    RUN_TEST(test_mirror_twice_is_identity);
    RUN_TEST(test_mirror_swaps_sides);
    RUN_TEST(test_counter_wraps);
    RUN_TEST(test_decode_rejects_corruption);

    return UNITY_END();
}
