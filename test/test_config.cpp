#include <unity.h>

#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config.h"

void setUp() {}
void tearDown() {}

static Config parse(const std::string& text) {
    std::istringstream in(text);
    return parse_config(in);
}

// Message of the exception thrown by parsing `text`, or "" if none.
static std::string parse_error(const std::string& text) {
    try {
        parse(text);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

void test_defaults() {
    Config cfg = parse("");
    TEST_ASSERT_TRUE(cfg.engine.mode == Mode::Ambilight);
    TEST_ASSERT_EQUAL_INT(80, cfg.engine.brightness);
    TEST_ASSERT_EQUAL_INT(25, cfg.engine.smoothing);
    TEST_ASSERT_EQUAL_INT(90, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(6, cfg.engine.edge);
    TEST_ASSERT_EQUAL_INT(50, cfg.engine.speed);
    TEST_ASSERT_FALSE(cfg.engine.mirror);
    TEST_ASSERT_EQUAL_UINT8(255, cfg.engine.color.r);
    TEST_ASSERT_EQUAL_UINT8(0, cfg.engine.color.g);
    TEST_ASSERT_EQUAL_UINT8(80, cfg.engine.color.b);
    TEST_ASSERT_FALSE(cfg.crop.use_aspect);
}

void test_full_file() {
    Config cfg = parse(
        "# living room\n"
        "[engine]\n"
        "mode = static\n"
        "brightness = 60\n"
        "smoothing=40\n"
        "fps = 120   ; high refresh\n"
        "edge = 8\n"
        "speed = 75\n"
        "mirror = yes\n"
        "color = #ff8000\n"
        "\n"
        "[crop]\n"
        "aspect = 21:9\n"
        "\n"
        "[capture]\n"
        "display = :1\n"
        "region = 2560x1440+1920+0\n");

    TEST_ASSERT_TRUE(cfg.engine.mode == Mode::Static);
    TEST_ASSERT_EQUAL_INT(60, cfg.engine.brightness);
    TEST_ASSERT_EQUAL_INT(40, cfg.engine.smoothing);
    TEST_ASSERT_EQUAL_INT(120, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(8, cfg.engine.edge);
    TEST_ASSERT_EQUAL_INT(75, cfg.engine.speed);
    TEST_ASSERT_TRUE(cfg.engine.mirror);
    TEST_ASSERT_EQUAL_UINT8(255, cfg.engine.color.r);
    TEST_ASSERT_EQUAL_UINT8(128, cfg.engine.color.g);
    TEST_ASSERT_EQUAL_UINT8(0, cfg.engine.color.b);
    TEST_ASSERT_TRUE(cfg.crop.use_aspect);
    TEST_ASSERT_EQUAL_STRING(":1", cfg.capture.display.c_str());
    TEST_ASSERT_EQUAL_INT(2560, cfg.capture.region.width);
    TEST_ASSERT_EQUAL_INT(1440, cfg.capture.region.height);
    TEST_ASSERT_EQUAL_INT(1920, cfg.capture.region.x);
    TEST_ASSERT_EQUAL_INT(0, cfg.capture.region.y);
}

void test_values_clamped_to_slider_ranges() {
    Config cfg = parse(
        "[engine]\n"
        "brightness = 150\n"
        "smoothing = 95\n"
        "fps = 5\n"
        "edge = 40\n"
        "speed = 1\n");
    TEST_ASSERT_EQUAL_INT(100, cfg.engine.brightness);
    TEST_ASSERT_EQUAL_INT(90, cfg.engine.smoothing);
    TEST_ASSERT_EQUAL_INT(15, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(20, cfg.engine.edge);
    TEST_ASSERT_EQUAL_INT(5, cfg.engine.speed);

    cfg = parse("[engine]\nfps = 500\nbrightness = -3\n");
    TEST_ASSERT_EQUAL_INT(144, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(0, cfg.engine.brightness);
}

void test_mode_preset_then_override() {
    Config cfg = parse("[engine]\nmode = gaming\n");
    TEST_ASSERT_TRUE(cfg.engine.mode == Mode::Gaming);
    TEST_ASSERT_EQUAL_INT(10, cfg.engine.smoothing);
    TEST_ASSERT_EQUAL_INT(144, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(4, cfg.engine.edge);

    cfg = parse("[engine]\nmode = film\nfps = 30\n");
    TEST_ASSERT_EQUAL_INT(50, cfg.engine.smoothing);
    TEST_ASSERT_EQUAL_INT(30, cfg.engine.fps);
    TEST_ASSERT_EQUAL_INT(10, cfg.engine.edge);
}

void test_errors_name_the_line() {
    std::string err = parse_error("[engine]\nmode = disco\n");
    TEST_ASSERT_NOT_NULL(std::strstr(err.c_str(), "disco"));
    TEST_ASSERT_NOT_NULL(std::strstr(err.c_str(), "line 2"));

    err = parse_error("[engine]\n\nbrightness = bright\n");
    TEST_ASSERT_NOT_NULL(std::strstr(err.c_str(), "line 3"));

    err = parse_error("[engine]\nthis is not a setting\n");
    TEST_ASSERT_NOT_NULL(std::strstr(err.c_str(), "line 2"));
}

void test_rejected_values() {
    TEST_ASSERT_TRUE(parse_error("[engine]\nfps = 0\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[engine]\nfps = 60fps\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[engine]\ncolor = chartreuse-ish\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[engine]\nmirror = maybe\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[crop]\naspect = wide\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[crop]\nleft = 1.5\n").size() > 0);
    TEST_ASSERT_TRUE(parse_error("[capture]\nregion = big\n").size() > 0);
}

void test_unknown_keys_ignored() {
    Config cfg = parse("[engine]\ngamma = 2.2\n[network]\nport = 80\n");
    TEST_ASSERT_EQUAL_INT(80, cfg.engine.brightness);
}

void test_validate_crop() {
    Config cfg = parse("[crop]\nleft = 0.6\nright = 0.5\n");
    bool threw = false;
    try {
        validate_config(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    cfg = parse("[crop]\ntop = 0.1\nbottom = 0.1\n");
    validate_config(cfg);  // must not throw
    TEST_ASSERT_FALSE(cfg.crop.use_aspect);
}

void test_parse_region() {
    CaptureRegion r;
    TEST_ASSERT_TRUE(parse_region("1920x1080", r));
    TEST_ASSERT_EQUAL_INT(1920, r.width);
    TEST_ASSERT_EQUAL_INT(0, r.x);

    TEST_ASSERT_TRUE(parse_region("800x600+10+20", r));
    TEST_ASSERT_EQUAL_INT(10, r.x);
    TEST_ASSERT_EQUAL_INT(20, r.y);

    TEST_ASSERT_FALSE(parse_region("0x600", r));
    TEST_ASSERT_FALSE(parse_region("800x", r));
    TEST_ASSERT_FALSE(parse_region("800x600+10", r));
}

void test_parse_crop() {
    CropRegion c;
    TEST_ASSERT_TRUE(parse_crop("0,0.12,0,0.12", c));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.12f, static_cast<float>(c.top));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.12f, static_cast<float>(c.bottom));
    TEST_ASSERT_FALSE(parse_crop("0,0.1,0", c));
    TEST_ASSERT_FALSE(parse_crop("0,0.1,0,x", c));
}

void test_to_engine_config() {
    Config cfg = parse(
        "[engine]\nmode = breathing\nbrightness = 80\nsmoothing = 30\n"
        "fps = 60\nedge = 10\nspeed = 100\n");
    EngineConfig e = to_engine_config(cfg, 1920, 1080);

    TEST_ASSERT_TRUE(e.mode == Mode::Breathing);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.8f, static_cast<float>(e.brightness));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.3f, static_cast<float>(e.smoothing));
    TEST_ASSERT_EQUAL_INT(60, e.target_fps);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.1f, static_cast<float>(e.edge_depth));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 2.0f, static_cast<float>(e.speed));
}

void test_aspect_resolved_against_screen() {
    // 21:9 content on a 16:9 screen: bars top and bottom.
    Config cfg = parse("[crop]\naspect = 21:9\n");
    EngineConfig e = to_engine_config(cfg, 1920, 1080);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.119f, static_cast<float>(e.crop.top));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.119f, static_cast<float>(e.crop.bottom));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, static_cast<float>(e.crop.left));

    // 4:3 content: bars left and right.
    cfg = parse("[crop]\naspect = 4:3\n");
    e = to_engine_config(cfg, 1920, 1080);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.125f, static_cast<float>(e.crop.left));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.125f, static_cast<float>(e.crop.right));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, static_cast<float>(e.crop.top));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_defaults);
    RUN_TEST(test_full_file);
    RUN_TEST(test_values_clamped_to_slider_ranges);
    RUN_TEST(test_mode_preset_then_override);
    RUN_TEST(test_errors_name_the_line);
    RUN_TEST(test_rejected_values);
    RUN_TEST(test_unknown_keys_ignored);
    RUN_TEST(test_validate_crop);
    RUN_TEST(test_parse_region);
    RUN_TEST(test_parse_crop);
    RUN_TEST(test_to_engine_config);
    RUN_TEST(test_aspect_resolved_against_screen);

    return UNITY_END();
}
