#pragma once

#include <cstdint>
#include <iosfwd>

#include <libusb.h>

// Read-only view of the keyboard's USB descriptors through libusb.
// Used by --probe to show which interfaces the keyboard exposes when the
// HID collections do not resolve. Nothing is claimed or opened.
class UsbProbe {
public:
    UsbProbe();
    ~UsbProbe();

    // Non-copyable
    UsbProbe(const UsbProbe&) = delete;
    UsbProbe& operator=(const UsbProbe&) = delete;

    // Print every interface and endpoint of each attached vid/pid device.
    // Throws DeviceNotFoundError if none is attached, std::runtime_error
    // if libusb fails.
    void print_interfaces(uint16_t vid, uint16_t pid, std::ostream& out);

private:
    libusb_context* _ctx = nullptr;
};
