#include "protocol.h"
#include "errors.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

// -----------------------------------------------------------------------
// Frame builders
// -----------------------------------------------------------------------

Bytes build_read_request(const ProtocolConfig& proto) {
    return proto.read_header;
}

Bytes build_write_frame(const ProtocolConfig& proto, const Bytes& keymap) {
    Bytes frame;
    frame.reserve(proto.write_header.size() + keymap.size());
    frame.insert(frame.end(), proto.write_header.begin(), proto.write_header.end());
    frame.insert(frame.end(), keymap.begin(), keymap.end());
    return frame;
}

Bytes strip_response_header(const ProtocolConfig& proto, const Bytes& response) {
    if (response.size() <= proto.response_header_size)
        return {};
    return Bytes(response.begin() + static_cast<std::ptrdiff_t>(proto.response_header_size),
                 response.end());
}

// -----------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------

// Prefix a transport failure with the protocol step and channel it happened on
template <typename Fn>
static auto run_step(const char* step, const HidChannel& channel, Fn&& fn)
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const TransportError& e) {
        throw TransportError(std::string(step) + " (" + channel.path() + "): " + e.what());
    }
}

ReadResult read_keymap(HidChannel& request, HidChannel& data,
                       const ProtocolConfig& proto) {
    ReadResult res;

    const Bytes cmd = build_read_request(proto);
    res.bytes_sent = run_step("Sending read command", request, [&] {
        return request.send_feature_report(cmd);
    });

    const Bytes response = run_step("Receiving keymap", data, [&] {
        return data.get_feature_report(proto.read_report_id, proto.max_report_size);
    });
    res.bytes_received = response.size();

    res.keymap = strip_response_header(proto, response);
    return res;
}

int write_keymap(HidChannel& data, const ProtocolConfig& proto, const Bytes& keymap) {
    const Bytes frame = build_write_frame(proto, keymap);
    return run_step("Sending keymap", data, [&] {
        return data.send_feature_report(frame);
    });
}

// -----------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------

std::string format_hex_dump(const Bytes& bytes) {
    static constexpr size_t COLUMNS = 4;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); i += COLUMNS) {
        ss << std::setw(4) << i << " ";
        for (size_t j = i; j < i + COLUMNS && j < bytes.size(); ++j)
            ss << " " << std::setw(2) << static_cast<int>(bytes[j]);
        ss << "\n";
    }
    return ss.str();
}

Bytes parse_hex(const std::string& text) {
    Bytes out;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        size_t used = 0;
        unsigned long v = 0;
        try {
            v = std::stoul(token, &used, 16);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid hex byte '" + token + "'");
        }
        if (used != token.size() || v > 0xff)
            throw std::runtime_error("Invalid hex byte '" + token + "'");
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}
