#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "color.h"
#include "transport.h"

// -----------------------------------------------------------------------
// DX-Light frame layout (192 bytes, sent as 3 x 64-byte output reports)
//
//  Byte     | Role
//  ---------|--------------------------------------------------------------
//   0-3     | 53 43 00 b1 (fixed)
//   4       | Frame counter, +1 per sent frame, wraps at 256
//   5-6     | 80 01 (fixed)
//   7-9     | R G B of assembled[0], no LED index
//  10-189   | 36 x [idx_lo idx_hi R G B]
//           |   block 1 = assembled[1..13), block 2 = assembled[12..24),
//           |   block 3 = assembled[24..36)
//  190-191  | 00 00
//
// assembled = reverse(left) ++ top ++ right, where the groups come from the
// LedFrame (left = 0..11, top = 12..23, right = 24..35). With mirroring
// the groups become left = reverse(right), right = reverse(left),
// top = reverse(top).
//
// The first block starting at index 1 and overlapping the second block by
// one LED is how the vendor firmware lays the three group arrays out in
// memory. The strip expects exactly this; do not "fix" it.
//
// The two index bytes per LED are one running counter that starts at 1 and
// advances once per byte (so LED n carries 2n+1, 2n+2), wrapping at 256.
// -----------------------------------------------------------------------

static constexpr int DXLIGHT_FRAME_SIZE   = 192;
static constexpr int DXLIGHT_REPORT_COUNT = DXLIGHT_FRAME_SIZE / DXLIGHT_PAYLOAD_SIZE;

static constexpr int DXLIGHT_HEADER_SIZE     = 7;
static constexpr int DXLIGHT_COUNTER_OFFSET  = 4;
static constexpr int DXLIGHT_FIRST_LED_OFFSET = 7;
static constexpr int DXLIGHT_BLOCKS_OFFSET   = 10;
static constexpr int DXLIGHT_BYTES_PER_LED   = 5;

static constexpr std::array<uint8_t, DXLIGHT_HEADER_SIZE> DXLIGHT_HEADER = {
    0x53, 0x43, 0x00, 0xb1, 0x00, 0x80, 0x01
};

// Start index into `assembled` of each 12-LED block.
static constexpr int DXLIGHT_BLOCK_STARTS[3] = {1, 12, 24};

using WireFrame = std::array<uint8_t, DXLIGHT_FRAME_SIZE>;
using ReportSet = std::array<Report, DXLIGHT_REPORT_COUNT>;

// -----------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------

// Reorder the 36 logical LEDs into the wire order described above.
LedFrame assemble_leds(const LedFrame& leds, bool mirror);

// Undo assemble_leds().
LedFrame disassemble_leds(const LedFrame& assembled, bool mirror);

// The flipped strip as a logical LedFrame (left <-> right swapped and
// reversed, top reversed). Applying it twice returns the input.
LedFrame mirror_leds(const LedFrame& leds);

// Build the 192-byte logical frame.
WireFrame build_wire_frame(const LedFrame& leds, uint8_t counter, bool mirror);

// Cut a wire frame into three reports with the leading report-ID byte.
ReportSet split_reports(const WireFrame& frame);

// build_wire_frame() + split_reports().
ReportSet build_reports(const LedFrame& leds, uint8_t counter, bool mirror);

// -----------------------------------------------------------------------
// Decoding (verification / diagnostics)
// -----------------------------------------------------------------------

// Reassemble and check three reports: report-ID bytes, fixed header bytes,
// the running index bytes and the LED shared by blocks 1 and 2.
// On success stores the logical LEDs and the frame counter and returns
// true. Returns false on any mismatch.
bool decode_reports(const ReportSet& reports, bool mirror,
                    LedFrame& leds, uint8_t& counter);

// Pretty-print a report as a hex dump to stdout
void hexdump_report(const Report& r, const std::string& label = "");
