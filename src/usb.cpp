#include "usb.h"
#include "errors.h"
#include "hid.h"

#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <string>

static std::string usb_error(int r) {
    return libusb_strerror(static_cast<libusb_error>(r));
}

static const char* transfer_type_name(uint8_t attrs) {
    switch (attrs & LIBUSB_TRANSFER_TYPE_MASK) {
        case LIBUSB_TRANSFER_TYPE_CONTROL:     return "Control";
        case LIBUSB_TRANSFER_TYPE_ISOCHRONOUS: return "Isochronous";
        case LIBUSB_TRANSFER_TYPE_BULK:        return "Bulk";
        default:                               return "Interrupt";
    }
}

static void print_config(const libusb_config_descriptor* cfg, std::ostream& out) {
    out << "USB descriptor: " << static_cast<int>(cfg->bNumInterfaces)
        << " interface(s)\n";

    for (int i = 0; i < cfg->bNumInterfaces; ++i) {
        const auto& iface = cfg->interface[i];
        for (int a = 0; a < iface.num_altsetting; ++a) {
            const auto& alt = iface.altsetting[a];
            out << "  Interface " << static_cast<int>(alt.bInterfaceNumber)
                << " (class " << static_cast<int>(alt.bInterfaceClass)
                << ", subclass " << static_cast<int>(alt.bInterfaceSubClass)
                << ", protocol " << static_cast<int>(alt.bInterfaceProtocol)
                << ")  endpoints: " << static_cast<int>(alt.bNumEndpoints) << "\n";
            for (int e = 0; e < alt.bNumEndpoints; ++e) {
                const auto& ep = alt.endpoint[e];
                uint8_t addr = ep.bEndpointAddress;
                const char* dir = (addr & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN
                                      ? "IN " : "OUT";
                out << "    EP 0x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(addr) << std::dec
                    << "  " << dir << "  " << transfer_type_name(ep.bmAttributes)
                    << "  maxPacket=" << ep.wMaxPacketSize
                    << "  interval=" << static_cast<int>(ep.bInterval) << "ms\n";
            }
        }
    }
}

UsbProbe::UsbProbe() {
    int r = libusb_init(&_ctx);
    if (r < 0)
        throw std::runtime_error("libusb_init failed: " + usb_error(r));
}

UsbProbe::~UsbProbe() {
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void UsbProbe::print_interfaces(uint16_t vid, uint16_t pid, std::ostream& out) {
    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(_ctx, &devs);
    if (cnt < 0)
        throw std::runtime_error("libusb_get_device_list failed: " +
                                 usb_error(static_cast<int>(cnt)));

    int found = 0;
    std::string failure;
    for (ssize_t i = 0; i < cnt; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != 0 ||
            desc.idVendor != vid || desc.idProduct != pid)
            continue;

        ++found;
        out << "Bus " << static_cast<int>(libusb_get_bus_number(devs[i]))
            << " device " << static_cast<int>(libusb_get_device_address(devs[i]))
            << ": " << format_vid_pid(vid, pid) << "\n";

        libusb_config_descriptor* cfg = nullptr;
        int r = libusb_get_active_config_descriptor(devs[i], &cfg);
        if (r < 0) {
            failure = "Could not get config descriptor: " + usb_error(r);
            break;
        }
        print_config(cfg, out);
        libusb_free_config_descriptor(cfg);
    }
    libusb_free_device_list(devs, 1);

    if (!failure.empty())
        throw std::runtime_error(failure);
    if (found == 0)
        throw DeviceNotFoundError(
            "No USB device matching VID:PID " + format_vid_pid(vid, pid) + " found");
}
