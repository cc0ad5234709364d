#pragma once

#include <string>

#include "device.h"
#include "protocol.h"

// Everything keymap-ctl needs to find the keyboard and talk to it.
// Defaults match the stock keyboard; an INI file can override any field.
struct Config {
    DeviceConfig   device;
    ProtocolConfig protocol;
};

// Parse an INI config file from disk on top of the defaults.
//
//   [device]    vendor_id, product_id, usage, usage_page,
//               request_marker, data_marker
//   [protocol]  read_header, write_header (hex bytes), read_report_id,
//               max_report_size, response_header_size
//
// Numbers accept decimal or 0x-prefixed hex. Unknown sections and keys are
// ignored. Throws std::runtime_error if the file cannot be read or a value
// is malformed.
Config parse_config_file(const std::string& path);

// Same as parse_config_file, reading from an in-memory string
Config parse_config_string(const std::string& text);

// Throw std::runtime_error if the config cannot drive the protocol
void validate_config(const Config& cfg);
