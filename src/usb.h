#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <libusb.h>

#include "transport.h"

// Control transfer parameters for HID SET_REPORT (host -> device)
static constexpr uint8_t  CTRL_REQUEST_TYPE = 0x21;    // host-to-device, class, interface
static constexpr uint8_t  CTRL_REQUEST      = 0x09;    // HID SET_REPORT
static constexpr uint16_t CTRL_VALUE_OUTPUT = 0x0200;  // report type Output, ID in low byte
static constexpr uint16_t CTRL_INDEX        = 0x0000;  // interface 0

// The strip's only interface carries the LED output reports
static constexpr int HID_INTERFACE = 0;

// Timeout for USB transfers in milliseconds. Several frames long; it only
// bounds how long a stalled strip blocks the render loop, and stays well
// under the engine's stop timeout.
static constexpr unsigned int USB_TIMEOUT_MS = 500;

class UsbLightStrip : public HidTransport {
public:
    UsbLightStrip();
    ~UsbLightStrip() override;

    // Non-copyable
    UsbLightStrip(const UsbLightStrip&) = delete;
    UsbLightStrip& operator=(const UsbLightStrip&) = delete;

    // Open the strip by VID/PID (detaches the kernel HID driver)
    void open(uint16_t vid = DXLIGHT_VID, uint16_t pid = DXLIGHT_PID) override;

    // Release the interface and reattach the kernel driver
    void close() override;

    // Send one 65-byte report. Byte 0 is the report ID and travels in the
    // SET_REPORT wValue; the 64 payload bytes go in the data stage.
    // Throws std::runtime_error on failure
    void send(const Report& report) override;

    // Print all USB interfaces and endpoints for this device to stdout.
    void probe();

    bool is_open() const override { return _handle != nullptr; }

private:
    libusb_context*       _ctx    = nullptr;
    libusb_device_handle* _handle = nullptr;

    bool _detached = false;

    void _claim_interface(int iface, bool& detached_flag);
    void _release_interface(int iface, bool detached_flag);
};
