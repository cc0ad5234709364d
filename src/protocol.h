#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "hid.h"

// -----------------------------------------------------------------------
// Keymap feature-report protocol
//
// Read (two reports, two channels):
//   request channel  <-- SET_FEATURE  05 84 d8 00 00 00
//   data channel     --> GET_FEATURE  report 0x06, up to 0x7ff bytes
//                        bytes 0..7  response header (report id + echo)
//                        bytes 8..   keymap
//
// Write (one report, data channel only):
//   data channel     <-- SET_FEATURE  06 04 d8 00 40 00 00 00 <keymap>
//
// There is no acknowledgement for a write; the sent byte count is all the
// host gets back.
// -----------------------------------------------------------------------

// Largest feature report the keyboard serves (and largest keymap it holds)
static constexpr size_t KEYMAP_MAX_REPORT_SIZE = 0x7ff;

// Report id of the read response on the data channel
static constexpr uint8_t KEYMAP_READ_REPORT_ID = 0x06;

// Bytes preceding the keymap in a read response
static constexpr size_t KEYMAP_RESPONSE_HEADER_SIZE = 8;

struct ProtocolConfig {
    Bytes  read_header          = {0x05, 0x84, 0xd8, 0x00, 0x00, 0x00};
    Bytes  write_header         = {0x06, 0x04, 0xd8, 0x00, 0x40, 0x00, 0x00, 0x00};
    uint8_t read_report_id      = KEYMAP_READ_REPORT_ID;
    size_t max_report_size      = KEYMAP_MAX_REPORT_SIZE;
    size_t response_header_size = KEYMAP_RESPONSE_HEADER_SIZE;
};

struct ReadResult {
    int    bytes_sent     = 0;  // as reported by the transport, informational
    size_t bytes_received = 0;  // full response length, header included
    Bytes  keymap;
};

// -----------------------------------------------------------------------
// Frame builders
// -----------------------------------------------------------------------

// The read command frame (header only)
Bytes build_read_request(const ProtocolConfig& proto);

// write_header followed by the whole keymap. No length check.
Bytes build_write_frame(const ProtocolConfig& proto, const Bytes& keymap);

// Drop the response header. Responses no longer than the header give an
// empty keymap rather than an error.
Bytes strip_response_header(const ProtocolConfig& proto, const Bytes& response);

// -----------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------

// Send the read command on `request`, fetch the response from `data` and
// return the keymap. TransportError from either step propagates.
ReadResult read_keymap(HidChannel& request, HidChannel& data,
                       const ProtocolConfig& proto);

// Send one write frame on `data`. Returns the transport's sent count.
int write_keymap(HidChannel& data, const ProtocolConfig& proto, const Bytes& keymap);

// -----------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------

// Offset-prefixed dump, four bytes per line:
//   0000  05 84 d8 00
//   0004  00 00
std::string format_hex_dump(const Bytes& bytes);

// Parse "05 84 d8" (whitespace separated, optional 0x prefix).
// Throws std::runtime_error on a malformed or out-of-range token.
Bytes parse_hex(const std::string& text);
