#include "usb.h"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

// "<what>: <libusb message>"
static std::runtime_error usb_error(const std::string& what, int code) {
    return std::runtime_error(what + ": " + libusb_strerror(static_cast<libusb_error>(code)));
}

// "1a86:fe07"
static std::string usb_id(uint16_t vid, uint16_t pid) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(4) << vid << ":" << std::setw(4) << pid;
    return ss.str();
}

static const char* transfer_type_name(uint8_t attrs) {
    switch (attrs & LIBUSB_TRANSFER_TYPE_MASK) {
        case LIBUSB_TRANSFER_TYPE_CONTROL:     return "control";
        case LIBUSB_TRANSFER_TYPE_ISOCHRONOUS: return "isochronous";
        case LIBUSB_TRANSFER_TYPE_BULK:        return "bulk";
        default:                               return "interrupt";
    }
}

UsbLightStrip::UsbLightStrip() {
    int r = libusb_init(&_ctx);
    if (r < 0) {
        _ctx = nullptr;
        throw usb_error("libusb_init failed", r);
    }
}

UsbLightStrip::~UsbLightStrip() {
    close();
    if (_ctx) libusb_exit(_ctx);
}

void UsbLightStrip::open(uint16_t vid, uint16_t pid) {
    if (_handle) return;

    _handle = libusb_open_device_with_vid_pid(_ctx, vid, pid);
    if (!_handle) {
        throw std::runtime_error(
            "DX-Light strip " + usb_id(vid, pid) + " not found or not accessible"
            " - is it plugged in? Try sudo or install the udev rule.");
    }

    try {
        _claim_interface(HID_INTERFACE, _detached);
    } catch (const std::runtime_error&) {
        libusb_close(_handle);
        _handle = nullptr;
        throw;
    }
}

void UsbLightStrip::close() {
    if (!_handle) return;

    _release_interface(HID_INTERFACE, _detached);
    _detached = false;

    libusb_close(_handle);
    _handle = nullptr;
}

void UsbLightStrip::send(const Report& report) {
    if (!_handle)
        throw std::runtime_error("Strip is not open");

    // The report ID travels in wValue, only the payload goes on the wire.
    // libusb wants a mutable buffer even for OUT transfers.
    uint8_t payload[DXLIGHT_PAYLOAD_SIZE];
    std::memcpy(payload, report.data() + 1, sizeof(payload));

    int r = libusb_control_transfer(_handle, CTRL_REQUEST_TYPE, CTRL_REQUEST,
                                    static_cast<uint16_t>(CTRL_VALUE_OUTPUT | report[0]),
                                    CTRL_INDEX, payload, sizeof(payload), USB_TIMEOUT_MS);
    if (r < 0)
        throw usb_error("SET_REPORT failed", r);
    if (r != DXLIGHT_PAYLOAD_SIZE) {
        throw std::runtime_error("Short SET_REPORT: " + std::to_string(r) + " of " +
                                 std::to_string(DXLIGHT_PAYLOAD_SIZE) + " bytes sent");
    }
}

void UsbLightStrip::probe() {
    if (!_handle)
        throw std::runtime_error("Strip is not open");

    libusb_device* dev = libusb_get_device(_handle);

    libusb_device_descriptor desc;
    int r = libusb_get_device_descriptor(dev, &desc);
    if (r < 0)
        throw usb_error("Cannot read device descriptor", r);

    std::cout << "Device " << usb_id(desc.idVendor, desc.idProduct)
              << " on bus " << static_cast<int>(libusb_get_bus_number(dev))
              << " address " << static_cast<int>(libusb_get_device_address(dev))
              << ", USB " << std::hex << (desc.bcdUSB >> 8) << "." << ((desc.bcdUSB >> 4) & 0xf)
              << std::dec << ", " << static_cast<int>(desc.bNumConfigurations)
              << " configuration(s)\n";

    libusb_config_descriptor* cfg = nullptr;
    r = libusb_get_active_config_descriptor(dev, &cfg);
    if (r < 0)
        throw usb_error("Cannot read configuration descriptor", r);

    for (int i = 0; i < cfg->bNumInterfaces; ++i) {
        const libusb_interface& iface = cfg->interface[i];
        for (int a = 0; a < iface.num_altsetting; ++a) {
            const libusb_interface_descriptor& alt = iface.altsetting[a];
            std::cout << "  Interface " << static_cast<int>(alt.bInterfaceNumber)
                      << (alt.bInterfaceClass == LIBUSB_CLASS_HID ? " (HID)" : "")
                      << " class " << static_cast<int>(alt.bInterfaceClass)
                      << "/" << static_cast<int>(alt.bInterfaceSubClass)
                      << "/" << static_cast<int>(alt.bInterfaceProtocol) << "\n";

            for (int e = 0; e < alt.bNumEndpoints; ++e) {
                const libusb_endpoint_descriptor& ep = alt.endpoint[e];
                std::cout << "    EP 0x" << std::hex << std::setfill('0') << std::setw(2)
                          << static_cast<int>(ep.bEndpointAddress) << std::dec
                          << ((ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) ? " in  " : " out ")
                          << transfer_type_name(ep.bmAttributes)
                          << ", " << ep.wMaxPacketSize << " bytes every "
                          << static_cast<int>(ep.bInterval) << " ms\n";
            }
        }
    }

    libusb_free_config_descriptor(cfg);
}

// --- private helpers ---

void UsbLightStrip::_claim_interface(int iface, bool& detached_flag) {
    detached_flag = false;

    // The kernel binds usbhid to the strip; take it over for the session.
    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        if (r < 0)
            throw usb_error("Cannot detach kernel driver from interface " + std::to_string(iface), r);
        detached_flag = true;
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0) {
        if (detached_flag) libusb_attach_kernel_driver(_handle, iface);
        detached_flag = false;
        throw usb_error("Cannot claim interface " + std::to_string(iface), r);
    }
}

void UsbLightStrip::_release_interface(int iface, bool detached_flag) {
    libusb_release_interface(_handle, iface);
    if (detached_flag) libusb_attach_kernel_driver(_handle, iface);
}
