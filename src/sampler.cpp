#include "sampler.h"

#include <algorithm>
#include <cmath>

// -----------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------

// The cropped area of the source frame, viewed through a decimation stride.
// Region pixel (rx, ry) is source pixel (x0 + rx*stride, y0 + ry*stride).
struct SampleRegion {
    const RawFrame& frame;
    int x0;
    int y0;
    int stride;
    int w;
    int h;
};

// Mean color of the region rectangle [cx, cx+cw) x [cy, cy+ch), scaled by
// brightness. An empty rectangle is black.
static LedColor average(const SampleRegion& rg, int cx, int cy, int cw, int ch,
                        double brightness) {
    if (cw <= 0 || ch <= 0) return {};

    // Up to ~130k pixels per strip at 360p; 8-bit sums need a wide type.
    uint64_t sum[3] = {0, 0, 0};
    for (int ry = cy; ry < cy + ch; ++ry) {
        int sy = rg.y0 + ry * rg.stride;
        for (int rx = cx; rx < cx + cw; ++rx) {
            const uint8_t* px = rg.frame.pixel(rg.x0 + rx * rg.stride, sy);
            sum[0] += px[0];
            sum[1] += px[1];
            sum[2] += px[2];
        }
    }

    double n = static_cast<double>(cw) * ch;
    return {clamp_channel(sum[0] / n * brightness),
            clamp_channel(sum[1] / n * brightness),
            clamp_channel(sum[2] / n * brightness)};
}

// Split a vertical strip (columns [cx, cx+cw), all rows) into 12 zones,
// top to bottom.
static void sample_vertical(const SampleRegion& rg, int cx, int cw, double brightness,
                            LedColor out[LEDS_PER_EDGE]) {
    int zone_h = rg.h / LEDS_PER_EDGE;
    if (zone_h == 0) {
        LedColor c = average(rg, cx, 0, cw, rg.h, brightness);
        std::fill(out, out + LEDS_PER_EDGE, c);
        return;
    }
    for (int z = 0; z < LEDS_PER_EDGE; ++z)
        out[z] = average(rg, cx, z * zone_h, cw, zone_h, brightness);
}

// Split a horizontal strip (rows [cy, cy+ch), all columns) into 12 zones,
// left to right.
static void sample_horizontal(const SampleRegion& rg, int cy, int ch, double brightness,
                              LedColor out[LEDS_PER_EDGE]) {
    int zone_w = rg.w / LEDS_PER_EDGE;
    if (zone_w == 0) {
        LedColor c = average(rg, 0, cy, rg.w, ch, brightness);
        std::fill(out, out + LEDS_PER_EDGE, c);
        return;
    }
    for (int z = 0; z < LEDS_PER_EDGE; ++z)
        out[z] = average(rg, z * zone_w, cy, zone_w, ch, brightness);
}

// -----------------------------------------------------------------------
// Zone sampling
// -----------------------------------------------------------------------

LedFrame sample_zones(const RawFrame& frame, const CropRegion& crop,
                      double edge_depth, double brightness) {
    LedFrame leds{};
    if (frame.empty() ||
        frame.pixels.size() < static_cast<size_t>(frame.width) * frame.height * 3)
        return leds;

    const int w = frame.width;
    const int h = frame.height;

    // Crop rectangle in source pixels, at least 1x1.
    int x0 = std::clamp(static_cast<int>(w * crop.left), 0, w - 1);
    int y0 = std::clamp(static_cast<int>(h * crop.top),  0, h - 1);
    int x1 = std::clamp(std::max(x0 + 1, static_cast<int>(w * (1.0 - crop.right))),  x0 + 1, w);
    int y1 = std::clamp(std::max(y0 + 1, static_cast<int>(h * (1.0 - crop.bottom))), y0 + 1, h);

    const int crop_w = x1 - x0;
    const int crop_h = y1 - y0;
    const int stride = std::max(1, std::min(crop_w, crop_h) / SAMPLE_TARGET_PX);

    // Every stride-th row/column starting at the crop origin.
    SampleRegion rg{frame, x0, y0, stride,
              (crop_w + stride - 1) / stride,
              (crop_h + stride - 1) / stride};

    const int shorter = std::min(rg.w, rg.h);
    const int edge = std::clamp(static_cast<int>(shorter * edge_depth), 1, shorter);

    LedColor left[LEDS_PER_EDGE];
    LedColor top[LEDS_PER_EDGE];
    LedColor right[LEDS_PER_EDGE];

    sample_vertical(rg, 0, edge, brightness, left);
    sample_horizontal(rg, 0, edge, brightness, top);
    sample_vertical(rg, std::max(0, rg.w - edge), std::min(edge, rg.w), brightness, right);

    // Left runs bottom -> top on the strip; the sampled zones are top -> bottom.
    for (int i = 0; i < LEDS_PER_EDGE; ++i) {
        leds[LEFT_BEGIN  + i] = left[LEDS_PER_EDGE - 1 - i];
        leds[TOP_BEGIN   + i] = top[i];
        leds[RIGHT_BEGIN + i] = right[i];
    }
    return leds;
}
