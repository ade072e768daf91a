#pragma once

#include <array>
#include <cstdint>

// DX-Light (Robobloq) backlight strip USB identifiers
static constexpr uint16_t DXLIGHT_VID = 0x1a86;
static constexpr uint16_t DXLIGHT_PID = 0xfe07;

// One HID output report as handed to the transport: a leading report-ID
// byte (always 0x00) followed by 64 payload bytes.
static constexpr int DXLIGHT_PAYLOAD_SIZE = 64;
static constexpr int DXLIGHT_REPORT_SIZE  = DXLIGHT_PAYLOAD_SIZE + 1;

using Report = std::array<uint8_t, DXLIGHT_REPORT_SIZE>;

// Device link used by the render loop. Implementations report failures by
// throwing std::runtime_error.
class HidTransport {
public:
    virtual ~HidTransport() = default;

    // Open the device by VID/PID. Throws if it cannot be found or opened.
    virtual void open(uint16_t vid = DXLIGHT_VID, uint16_t pid = DXLIGHT_PID) = 0;

    // Release the device. Safe to call when not open.
    virtual void close() = 0;

    // Send one 65-byte report. Throws on failure.
    virtual void send(const Report& report) = 0;

    virtual bool is_open() const = 0;
};
