#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Raw bytes of a feature report, report id included as byte 0
using Bytes = std::vector<uint8_t>;

// One HID interface (top-level collection) as reported by enumeration.
// Copied out of hidapi's list so it outlives hid_free_enumeration().
struct HidInterfaceInfo {
    std::string path;                   // opaque, host-specific
    int         interface_number = -1;  // -1: not a distinct USB interface
    uint16_t    usage            = 0;
    uint16_t    usage_page       = 0;
    uint16_t    vendor_id        = 0;
    uint16_t    product_id       = 0;
};

// An open HID interface. Closed when destroyed.
class HidChannel {
public:
    virtual ~HidChannel() = default;

    virtual const std::string& path() const = 0;

    // Send a feature report (byte 0 = report id).
    // Returns the byte count the transport reports as sent.
    // Throws TransportError on failure.
    virtual int send_feature_report(const Bytes& report) = 0;

    // Fetch feature report `report_id`, at most `max_length` bytes including
    // the report id byte. The result may be shorter than max_length.
    // Throws TransportError on failure.
    virtual Bytes get_feature_report(uint8_t report_id, size_t max_length) = 0;
};

// Host HID access: enumeration plus opening interfaces by path.
class HidTransport {
public:
    virtual ~HidTransport() = default;

    // Every HID interface exposed for vid/pid, in host enumeration order
    virtual std::vector<HidInterfaceInfo> enumerate(uint16_t vid, uint16_t pid) = 0;

    virtual std::unique_ptr<HidChannel> open(const std::string& path) = 0;
};

// HidTransport backed by hidapi. hid_init() on construction, hid_exit() on
// destruction, so every channel must be released before the transport.
class HidapiTransport : public HidTransport {
public:
    HidapiTransport();
    ~HidapiTransport() override;

    // Non-copyable
    HidapiTransport(const HidapiTransport&) = delete;
    HidapiTransport& operator=(const HidapiTransport&) = delete;

    std::vector<HidInterfaceInfo> enumerate(uint16_t vid, uint16_t pid) override;
    std::unique_ptr<HidChannel> open(const std::string& path) override;
};

// "05ac:024f"
std::string format_vid_pid(uint16_t vid, uint16_t pid);
