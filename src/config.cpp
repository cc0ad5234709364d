#include "config.h"

#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string at_line(int lineno) {
    return " at line " + std::to_string(lineno);
}

// Decimal or 0x-prefixed hex, 0..max
static unsigned long parse_number(const std::string& key, const std::string& value,
                                  unsigned long max, int lineno) {
    size_t used = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(value, &used, 0);
    } catch (const std::exception&) {
        throw std::runtime_error(
            "Invalid " + key + " '" + value + "'" + at_line(lineno));
    }
    if (used != value.size() || value[0] == '-' || v > max)
        throw std::runtime_error(
            "Invalid " + key + " '" + value + "'" + at_line(lineno));
    return v;
}

static Bytes parse_header(const std::string& key, const std::string& value, int lineno) {
    try {
        return parse_hex(value);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(
            std::string(e.what()) + " in " + key + at_line(lineno));
    }
}

// -----------------------------------------------------------------------
// Section handlers
// -----------------------------------------------------------------------

static void apply_device_key(DeviceConfig& dev, const std::string& key,
                             const std::string& value, int lineno) {
    if (key == "vendor_id")
        dev.vendor_id = static_cast<uint16_t>(parse_number(key, value, 0xffff, lineno));
    else if (key == "product_id")
        dev.product_id = static_cast<uint16_t>(parse_number(key, value, 0xffff, lineno));
    else if (key == "usage")
        dev.usage = static_cast<uint16_t>(parse_number(key, value, 0xffff, lineno));
    else if (key == "usage_page")
        dev.usage_page = static_cast<uint16_t>(parse_number(key, value, 0xffff, lineno));
    else if (key == "request_marker")
        dev.request_marker = value;
    else if (key == "data_marker")
        dev.data_marker = value;
    // Unknown device keys are silently ignored
}

static void apply_protocol_key(ProtocolConfig& proto, const std::string& key,
                               const std::string& value, int lineno) {
    if (key == "read_header")
        proto.read_header = parse_header(key, value, lineno);
    else if (key == "write_header")
        proto.write_header = parse_header(key, value, lineno);
    else if (key == "read_report_id")
        proto.read_report_id = static_cast<uint8_t>(parse_number(key, value, 0xff, lineno));
    else if (key == "max_report_size")
        proto.max_report_size = parse_number(key, value, 0xffffffffUL, lineno);
    else if (key == "response_header_size")
        proto.response_header_size = parse_number(key, value, 0xffffffffUL, lineno);
    // Unknown protocol keys are silently ignored
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

static Config parse_config_stream(std::istream& in) {
    Config cfg;
    std::string section;
    int lineno = 0;

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            throw std::runtime_error("Syntax error" + at_line(lineno) + ": " + line);

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());
        if (key.empty())
            throw std::runtime_error("Missing key" + at_line(lineno));

        if (section == "device")
            apply_device_key(cfg.device, key, value, lineno);
        else if (section == "protocol")
            apply_protocol_key(cfg.protocol, key, value, lineno);
        // Unknown sections are silently ignored
    }

    return cfg;
}

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);
    return parse_config_stream(f);
}

Config parse_config_string(const std::string& text) {
    std::istringstream in(text);
    return parse_config_stream(in);
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    const DeviceConfig&   dev   = cfg.device;
    const ProtocolConfig& proto = cfg.protocol;

    if (dev.request_marker.empty() || dev.data_marker.empty())
        throw std::runtime_error("request_marker and data_marker must not be empty");
    if (dev.request_marker == dev.data_marker)
        throw std::runtime_error(
            "request_marker and data_marker must differ (both '" +
            dev.request_marker + "')");

    if (proto.read_header.empty())
        throw std::runtime_error("read_header must not be empty");
    if (proto.write_header.empty())
        throw std::runtime_error("write_header must not be empty");
    if (proto.read_report_id == 0)
        throw std::runtime_error("read_report_id must be non-zero");
    if (proto.max_report_size == 0 || proto.max_report_size > 0xffff)
        throw std::runtime_error(
            "max_report_size must be 1-65535 (got " +
            std::to_string(proto.max_report_size) + ")");
}
