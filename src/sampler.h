#pragma once

#include "capture.h"
#include "color.h"

// Fractions of the frame excluded from sampling on each side (letterbox
// bars). Valid when left+right < 1 and top+bottom < 1.
struct CropRegion {
    double left   = 0.0;
    double top    = 0.0;
    double right  = 0.0;
    double bottom = 0.0;
};

// The cropped region is decimated by an integer stride so its shorter side
// ends up around this many pixels.
static constexpr int SAMPLE_TARGET_PX = 360;

// Reduce a frame to the 36 zone colors.
//
//   crop       - area excluded from sampling
//   edge_depth - strip thickness as a fraction of the shorter side of the
//                downsampled region
//   brightness - multiplier applied to every averaged channel
//
// Always returns exactly LED_COUNT colors in strip order (see color.h).
LedFrame sample_zones(const RawFrame& frame, const CropRegion& crop,
                      double edge_depth, double brightness);
