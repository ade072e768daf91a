#include "protocol.h"

#include <algorithm>
#include <iomanip>
#include <iostream>

// -----------------------------------------------------------------------
// LED ordering
// -----------------------------------------------------------------------

LedFrame mirror_leds(const LedFrame& leds) {
    LedFrame out;
    for (int i = 0; i < LEDS_PER_EDGE; ++i) {
        int j = LEDS_PER_EDGE - 1 - i;
        out[LEFT_BEGIN  + i] = leds[RIGHT_BEGIN + j];
        out[TOP_BEGIN   + i] = leds[TOP_BEGIN   + j];
        out[RIGHT_BEGIN + i] = leds[LEFT_BEGIN  + j];
    }
    return out;
}

LedFrame assemble_leds(const LedFrame& leds, bool mirror) {
    const LedFrame src = mirror ? mirror_leds(leds) : leds;

    // The firmware walks the left group top -> bottom.
    LedFrame a;
    for (int i = 0; i < LEDS_PER_EDGE; ++i) {
        a[LEFT_BEGIN  + i] = src[LEFT_BEGIN + LEDS_PER_EDGE - 1 - i];
        a[TOP_BEGIN   + i] = src[TOP_BEGIN + i];
        a[RIGHT_BEGIN + i] = src[RIGHT_BEGIN + i];
    }
    return a;
}

LedFrame disassemble_leds(const LedFrame& assembled, bool mirror) {
    // Reversing the left group is its own inverse, and so is mirroring.
    LedFrame src = assemble_leds(assembled, false);
    return mirror ? mirror_leds(src) : src;
}

// -----------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------

WireFrame build_wire_frame(const LedFrame& leds, uint8_t counter, bool mirror) {
    WireFrame buf{};
    std::copy(DXLIGHT_HEADER.begin(), DXLIGHT_HEADER.end(), buf.begin());
    buf[DXLIGHT_COUNTER_OFFSET] = counter;

    const LedFrame a = assemble_leds(leds, mirror);

    buf[DXLIGHT_FIRST_LED_OFFSET]     = a[0].r;
    buf[DXLIGHT_FIRST_LED_OFFSET + 1] = a[0].g;
    buf[DXLIGHT_FIRST_LED_OFFSET + 2] = a[0].b;

    int     p   = DXLIGHT_BLOCKS_OFFSET;
    uint8_t idx = 1;  // running LED index, one step per index byte
    for (int start : DXLIGHT_BLOCK_STARTS) {
        for (int i = 0; i < LEDS_PER_EDGE; ++i) {
            const LedColor& c = a[start + i];
            buf[p]     = idx++;
            buf[p + 1] = idx++;
            buf[p + 2] = c.r;
            buf[p + 3] = c.g;
            buf[p + 4] = c.b;
            p += DXLIGHT_BYTES_PER_LED;
        }
    }
    return buf;
}

ReportSet split_reports(const WireFrame& frame) {
    ReportSet reports{};
    for (int i = 0; i < DXLIGHT_REPORT_COUNT; ++i) {
        reports[i][0] = 0x00;  // report ID
        std::copy(frame.begin() + i * DXLIGHT_PAYLOAD_SIZE,
                  frame.begin() + (i + 1) * DXLIGHT_PAYLOAD_SIZE,
                  reports[i].begin() + 1);
    }
    return reports;
}

ReportSet build_reports(const LedFrame& leds, uint8_t counter, bool mirror) {
    return split_reports(build_wire_frame(leds, counter, mirror));
}

// -----------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------

bool decode_reports(const ReportSet& reports, bool mirror,
                    LedFrame& leds, uint8_t& counter) {
    WireFrame buf{};
    for (int i = 0; i < DXLIGHT_REPORT_COUNT; ++i) {
        if (reports[i][0] != 0x00) return false;
        std::copy(reports[i].begin() + 1, reports[i].end(),
                  buf.begin() + i * DXLIGHT_PAYLOAD_SIZE);
    }

    for (int i = 0; i < DXLIGHT_HEADER_SIZE; ++i) {
        if (i == DXLIGHT_COUNTER_OFFSET) continue;
        if (buf[i] != DXLIGHT_HEADER[i]) return false;
    }

    LedFrame a{};
    a[0] = {buf[DXLIGHT_FIRST_LED_OFFSET],
            buf[DXLIGHT_FIRST_LED_OFFSET + 1],
            buf[DXLIGHT_FIRST_LED_OFFSET + 2]};

    int     p   = DXLIGHT_BLOCKS_OFFSET;
    uint8_t idx = 1;
    for (int start : DXLIGHT_BLOCK_STARTS) {
        for (int i = 0; i < LEDS_PER_EDGE; ++i) {
            if (buf[p] != idx++ || buf[p + 1] != idx++) return false;

            LedColor c{buf[p + 2], buf[p + 3], buf[p + 4]};
            int slot = start + i;

            // Block 1 ends on assembled[12], which block 2 repeats.
            if (start == DXLIGHT_BLOCK_STARTS[1] && i == 0 && a[slot] != c)
                return false;
            a[slot] = c;
            p += DXLIGHT_BYTES_PER_LED;
        }
    }

    for (int i = p; i < DXLIGHT_FRAME_SIZE; ++i)
        if (buf[i] != 0x00) return false;

    leds    = disassemble_leds(a, mirror);
    counter = buf[DXLIGHT_COUNTER_OFFSET];
    return true;
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

void hexdump_report(const Report& r, const std::string& label) {
    if (!label.empty())
        std::cout << label << "\n";

    std::cout << std::hex << std::setfill('0');
    for (int i = 0; i < DXLIGHT_REPORT_SIZE; ++i) {
        std::cout << std::setw(2) << static_cast<int>(r[i]);
        if (i % 16 == 15 || i == DXLIGHT_REPORT_SIZE - 1) std::cout << "\n";
        else                                                std::cout << " ";
    }
    std::cout << std::dec;
}
