#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "hid.h"

// In-memory HidTransport. Serves a fixed enumeration, answers
// get_feature_report from `responses` (keyed by path) and records every
// call so tests can check which channel saw what.
class FakeTransport : public HidTransport {
public:
    struct Sent {
        std::string path;
        Bytes       bytes;
    };
    struct Get {
        std::string path;
        uint8_t     report_id;
        size_t      max_length;
    };

    std::vector<HidInterfaceInfo> interfaces;
    std::map<std::string, Bytes>  responses;
    std::string                   fail_send_path;  // send on this path throws
    std::string                   fail_get_path;   // get on this path throws

    int enumerate_calls = 0;
    std::vector<std::string> opened;
    std::vector<std::string> closed;
    std::vector<Sent>        sent;
    std::vector<Get>         gets;

    std::vector<HidInterfaceInfo> enumerate(uint16_t vid, uint16_t pid) override {
        ++enumerate_calls;
        std::vector<HidInterfaceInfo> out;
        for (const auto& info : interfaces)
            if (info.vendor_id == vid && info.product_id == pid)
                out.push_back(info);
        return out;
    }

    std::unique_ptr<HidChannel> open(const std::string& path) override {
        opened.push_back(path);
        return std::make_unique<Channel>(*this, path);
    }

private:
    class Channel : public HidChannel {
    public:
        Channel(FakeTransport& owner, std::string path)
            : _owner(owner), _path(std::move(path)) {}
        ~Channel() override { _owner.closed.push_back(_path); }

        const std::string& path() const override { return _path; }

        int send_feature_report(const Bytes& report) override {
            if (_path == _owner.fail_send_path)
                throw TransportError("device disconnected");
            _owner.sent.push_back({_path, report});
            return static_cast<int>(report.size());
        }

        Bytes get_feature_report(uint8_t report_id, size_t max_length) override {
            if (_path == _owner.fail_get_path)
                throw TransportError("device disconnected");
            _owner.gets.push_back({_path, report_id, max_length});
            auto it = _owner.responses.find(_path);
            return it == _owner.responses.end() ? Bytes{} : it->second;
        }

    private:
        FakeTransport& _owner;
        std::string    _path;
    };
};

// A vendor-usage interface of the stock keyboard
inline HidInterfaceInfo vendor_iface(const std::string& path, int iface = 1) {
    HidInterfaceInfo info;
    info.path             = path;
    info.interface_number = iface;
    info.usage            = 0x0001;
    info.usage_page       = 0xff00;
    info.vendor_id        = 0x05ac;
    info.product_id       = 0x024f;
    return info;
}

// Windows-style collection path as hidapi reports it
inline std::string col_path(int collection) {
    std::string col = (collection < 10 ? "0" : "") + std::to_string(collection);
    return "\\\\?\\HID#VID_05AC&PID_024F&MI_01&Col" + col +
           "#8&1f2c3d4&0&000" + std::to_string(collection - 1) +
           "#{4d1e55b2-f16f-11cf-88cb-001111000030}";
}
