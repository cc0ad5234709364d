#include "hid.h"
#include "errors.h"

#include <hidapi.h>

#include <iomanip>
#include <sstream>
#include <utility>

namespace {

struct HidDeleter {
    void operator()(hid_device* dev) const noexcept {
        if (dev) hid_close(dev);
    }
};

// hidapi reports errors as wide strings; device error text is plain ASCII
std::string narrow(const wchar_t* ws) {
    if (!ws) return "unknown error";
    std::string out;
    for (; *ws; ++ws)
        out += (*ws >= 0 && *ws < 0x80) ? static_cast<char>(*ws) : '?';
    return out;
}

class HidapiChannel : public HidChannel {
public:
    HidapiChannel(std::string path, hid_device* dev)
        : _path(std::move(path)), _dev(dev) {}

    const std::string& path() const override { return _path; }

    int send_feature_report(const Bytes& report) override {
        int r = hid_send_feature_report(_dev.get(), report.data(), report.size());
        if (r < 0) {
            throw TransportError(
                "hid_send_feature_report failed: " + narrow(hid_error(_dev.get())));
        }
        return r;
    }

    Bytes get_feature_report(uint8_t report_id, size_t max_length) override {
        Bytes buf(max_length, 0);
        if (!buf.empty()) buf[0] = report_id;

        int r = hid_get_feature_report(_dev.get(), buf.data(), buf.size());
        if (r < 0) {
            std::ostringstream ss;
            ss << "hid_get_feature_report 0x" << std::hex << std::setw(2)
               << std::setfill('0') << static_cast<int>(report_id)
               << " failed: " << narrow(hid_error(_dev.get()));
            throw TransportError(ss.str());
        }
        buf.resize(static_cast<size_t>(r));
        return buf;
    }

private:
    std::string _path;
    std::unique_ptr<hid_device, HidDeleter> _dev;
};

}  // namespace

HidapiTransport::HidapiTransport() {
    if (hid_init() != 0)
        throw TransportError("hid_init failed");
}

HidapiTransport::~HidapiTransport() {
    hid_exit();
}

std::vector<HidInterfaceInfo> HidapiTransport::enumerate(uint16_t vid, uint16_t pid) {
    std::vector<HidInterfaceInfo> out;

    hid_device_info* devs = hid_enumerate(vid, pid);
    for (hid_device_info* cur = devs; cur; cur = cur->next) {
        HidInterfaceInfo info;
        info.path             = cur->path ? cur->path : "";
        info.interface_number = cur->interface_number;
        info.usage            = cur->usage;
        info.usage_page       = cur->usage_page;
        info.vendor_id        = cur->vendor_id;
        info.product_id       = cur->product_id;
        out.push_back(std::move(info));
    }
    hid_free_enumeration(devs);

    return out;
}

std::unique_ptr<HidChannel> HidapiTransport::open(const std::string& path) {
    hid_device* dev = hid_open_path(path.c_str());
    if (!dev) {
        throw TransportError(
            "Could not open " + path +
            " - is the keyboard plugged in? Try running with sudo or install the udev rule.");
    }
    return std::make_unique<HidapiChannel>(path, dev);
}

std::string format_vid_pid(uint16_t vid, uint16_t pid) {
    std::ostringstream ss;
    ss << std::hex << std::setw(4) << std::setfill('0') << vid
       << ":" << std::setw(4) << std::setfill('0') << pid;
    return ss.str();
}
