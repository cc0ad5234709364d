#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hid.h"

// Keyboard USB identifiers
static constexpr uint16_t KEYBOARD_VID = 0x05ac;
static constexpr uint16_t KEYBOARD_PID = 0x024f;

// The keyboard exposes its vendor protocol on top-level collections with
// usage page 0xff00, usage 1. Two of those collections carry the protocol;
// on Windows their paths are tagged &Col05 (request) and &Col06 (data).
static constexpr uint16_t VENDOR_USAGE_PAGE = 0xff00;
static constexpr uint16_t VENDOR_USAGE      = 0x0001;

struct DeviceConfig {
    uint16_t    vendor_id      = KEYBOARD_VID;
    uint16_t    product_id     = KEYBOARD_PID;
    uint16_t    usage          = VENDOR_USAGE;
    uint16_t    usage_page     = VENDOR_USAGE_PAGE;
    std::string request_marker = "&Col05";
    std::string data_marker    = "&Col06";
};

enum class ChannelKind {
    Request,    // receives the read command
    Data,       // returns read results and takes write frames
    Unrelated,
};

// Result of resolve_channels(): both paths are non-empty
struct ChannelSelection {
    std::string request_path;
    std::string data_path;
};

// Classify one interface. Anything that is not a distinct vendor-usage
// interface is Unrelated; otherwise the path marker decides.
ChannelKind channel_kind(const HidInterfaceInfo& info, const DeviceConfig& cfg);

// "request", "data" or "-"
const char* channel_kind_name(ChannelKind kind);

// Pick exactly one request and one data interface out of an enumeration.
// Throws DeviceNotFoundError if `interfaces` is empty,
// AmbiguousDeviceError if a marker matches twice and
// ChannelNotFoundError if a marker matches nothing.
ChannelSelection select_channels(const std::vector<HidInterfaceInfo>& interfaces,
                                 const DeviceConfig& cfg);

// Enumerate the configured VID/PID through `transport` and select the
// channels. Opens nothing.
ChannelSelection resolve_channels(HidTransport& transport, const DeviceConfig& cfg);
