#include "device.h"
#include "errors.h"

ChannelKind channel_kind(const HidInterfaceInfo& info, const DeviceConfig& cfg) {
    // interface_number == -1 is the catch-all entry for the composite device
    if (info.interface_number == -1 ||
        info.usage != cfg.usage ||
        info.usage_page != cfg.usage_page)
        return ChannelKind::Unrelated;

    if (info.path.find(cfg.request_marker) != std::string::npos)
        return ChannelKind::Request;
    if (info.path.find(cfg.data_marker) != std::string::npos)
        return ChannelKind::Data;
    return ChannelKind::Unrelated;
}

const char* channel_kind_name(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::Request: return "request";
        case ChannelKind::Data:    return "data";
        default:                   return "-";
    }
}

ChannelSelection select_channels(const std::vector<HidInterfaceInfo>& interfaces,
                                 const DeviceConfig& cfg) {
    if (interfaces.empty()) {
        throw DeviceNotFoundError(
            "No devices matching VID:PID " +
            format_vid_pid(cfg.vendor_id, cfg.product_id) + " found");
    }

    ChannelSelection sel;
    for (const auto& info : interfaces) {
        ChannelKind kind = channel_kind(info, cfg);
        if (kind == ChannelKind::Unrelated) continue;

        std::string& slot = (kind == ChannelKind::Request) ? sel.request_path
                                                           : sel.data_path;
        if (!slot.empty())
            throw AmbiguousDeviceError(channel_kind_name(kind), slot, info.path);
        slot = info.path;
    }

    if (sel.request_path.empty())
        throw ChannelNotFoundError("request");
    if (sel.data_path.empty())
        throw ChannelNotFoundError("data");

    return sel;
}

ChannelSelection resolve_channels(HidTransport& transport, const DeviceConfig& cfg) {
    return select_channels(transport.enumerate(cfg.vendor_id, cfg.product_id), cfg);
}
