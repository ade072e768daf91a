#include "capture_x11.h"

#include <stdexcept>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

// Xlib's default error handler exits the process. A failed XGetImage (for
// example while the screen is being reconfigured) is a transient capture
// failure here, so errors are recorded and reported through capture().
static volatile bool g_x_error = false;
static int handle_x_error(Display*, XErrorEvent*) {
    g_x_error = true;
    return 0;
}

// Position of the lowest set bit of a channel mask.
static int mask_shift(unsigned long mask) {
    int shift = 0;
    while (mask && !(mask & 1)) {
        mask >>= 1;
        ++shift;
    }
    return shift;
}

// Expand a channel of `max + 1` levels (e.g. 5 or 6 bits) to 8 bits.
static uint8_t scale_channel(unsigned long value, unsigned long max) {
    if (max == 0) return 0;
    if (max == 0xff) return static_cast<uint8_t>(value);
    return static_cast<uint8_t>(value * 255 / max);
}

X11FrameSource::X11FrameSource(const std::string& display_name,
                               const CaptureRegion& region) {
    XInitThreads();
    XSetErrorHandler(handle_x_error);

    _display = XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
    if (!_display) {
        throw std::runtime_error(
            "Cannot open X display '" +
            (display_name.empty() ? std::string("$DISPLAY") : display_name) + "'");
    }
    _root = DefaultRootWindow(_display);

    XWindowAttributes attrs;
    XGetWindowAttributes(_display, _root, &attrs);

    _region = region;
    if (_region.width <= 0 || _region.height <= 0) {
        _region = {0, 0, attrs.width, attrs.height};
    } else {
        // Clip to the root window.
        if (_region.x < 0) { _region.width  += _region.x; _region.x = 0; }
        if (_region.y < 0) { _region.height += _region.y; _region.y = 0; }
        if (_region.x + _region.width  > attrs.width)  _region.width  = attrs.width  - _region.x;
        if (_region.y + _region.height > attrs.height) _region.height = attrs.height - _region.y;
    }

    if (_region.width <= 0 || _region.height <= 0) {
        XCloseDisplay(_display);
        _display = nullptr;
        throw std::runtime_error("Capture region lies outside the screen");
    }
}

X11FrameSource::~X11FrameSource() {
    if (_display) {
        XCloseDisplay(_display);
        _display = nullptr;
    }
}

bool X11FrameSource::capture(RawFrame& out) {
    g_x_error = false;
    XImage* img = XGetImage(_display, _root,
                            _region.x, _region.y,
                            static_cast<unsigned>(_region.width),
                            static_cast<unsigned>(_region.height),
                            AllPlanes, ZPixmap);
    if (!img || g_x_error) {
        if (img) XDestroyImage(img);
        return false;
    }

    const int w = img->width;
    const int h = img->height;
    out.width  = w;
    out.height = h;
    out.pixels.resize(static_cast<size_t>(w) * h * 3);

    const unsigned long rm = img->red_mask;
    const unsigned long gm = img->green_mask;
    const unsigned long bm = img->blue_mask;
    const int rs = mask_shift(rm);
    const int gs = mask_shift(gm);
    const int bs = mask_shift(bm);

    uint8_t* dst = out.pixels.data();

    if (img->bits_per_pixel == 32 && rm == 0xff0000 && gm == 0x00ff00 && bm == 0x0000ff &&
        img->byte_order == LSBFirst) {
        // Common case: 24-bit TrueColor stored as B,G,R,X bytes.
        for (int y = 0; y < h; ++y) {
            const uint8_t* src = reinterpret_cast<const uint8_t*>(img->data) +
                                 static_cast<size_t>(y) * img->bytes_per_line;
            for (int x = 0; x < w; ++x) {
                dst[0] = src[2];
                dst[1] = src[1];
                dst[2] = src[0];
                src += 4;
                dst += 3;
            }
        }
    } else {
        // Any other visual: go through XGetPixel and the channel masks.
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                unsigned long px = XGetPixel(img, x, y);
                dst[0] = scale_channel((px & rm) >> rs, rm >> rs);
                dst[1] = scale_channel((px & gm) >> gs, gm >> gs);
                dst[2] = scale_channel((px & bm) >> bs, bm >> bs);
                dst += 3;
            }
        }
    }

    XDestroyImage(img);
    return true;
}
