#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// One captured video frame: width x height pixels, 3 bytes per pixel in
// R,G,B order, rows packed without padding.
struct RawFrame {
    int width  = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    bool empty() const { return width <= 0 || height <= 0; }

    const uint8_t* pixel(int x, int y) const {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * 3;
    }
};

// Area of the screen to grab. A zero width or height means the whole
// screen.
struct CaptureRegion {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;
};

// Supplies one frame per render tick.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Grab the current screen contents into `out` (RGB order).
    // Returns false on a transient failure; the caller keeps its last
    // good result.
    virtual bool capture(RawFrame& out) = 0;

    // Dimensions of the captured area in pixels (used for aspect presets).
    virtual int width() const = 0;
    virtual int height() const = 0;
};
