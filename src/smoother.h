#pragma once

#include "color.h"

// First-order IIR blend, applied per LED and per channel:
//
//   out = previous + (target - previous) * (1 - alpha)
//
// truncated toward zero. alpha = 0 returns `target` unchanged; alpha close
// to 1 barely moves. A channel that differs from its target always moves at
// least one step, so a constant target is reached in bounded time.
uint8_t smooth_channel(uint8_t previous, uint8_t target, double alpha);

LedFrame smooth_frame(const LedFrame& previous, const LedFrame& target, double alpha);
