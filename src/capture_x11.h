#pragma once

#include <string>

#include "capture.h"

struct _XDisplay;

// Grabs a rectangle of the X11 root window with XGetImage.
class X11FrameSource : public FrameSource {
public:
    // display_name: X display to connect to ("" = $DISPLAY).
    // region: area to grab; clipped to the root window.
    // Throws std::runtime_error if the display cannot be opened or the
    // region lies outside the screen.
    explicit X11FrameSource(const std::string& display_name = "",
                            const CaptureRegion& region = {});
    ~X11FrameSource() override;

    // Non-copyable
    X11FrameSource(const X11FrameSource&) = delete;
    X11FrameSource& operator=(const X11FrameSource&) = delete;

    bool capture(RawFrame& out) override;

    int width() const override { return _region.width; }
    int height() const override { return _region.height; }

private:
    _XDisplay*    _display = nullptr;
    unsigned long _root    = 0;
    CaptureRegion _region;
};
