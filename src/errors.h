#pragma once

#include <stdexcept>
#include <string>

// Base for every failure keymap-ctl reports. All of them end the current
// invocation; nothing is retried.
class KeymapError : public std::runtime_error {
public:
    explicit KeymapError(const std::string& what) : std::runtime_error(what) {}
};

// Enumeration returned no HID interfaces for the VID/PID pair
class DeviceNotFoundError : public KeymapError {
public:
    using KeymapError::KeymapError;
};

// One of the two protocol channels has no matching interface
class ChannelNotFoundError : public KeymapError {
public:
    explicit ChannelNotFoundError(const std::string& channel)
        : KeymapError("No " + channel + " device found"), _channel(channel) {}

    const std::string& channel() const { return _channel; }

private:
    std::string _channel;
};

// Two interfaces matched the same channel marker
class AmbiguousDeviceError : public KeymapError {
public:
    AmbiguousDeviceError(const std::string& channel,
                         const std::string& first,
                         const std::string& second)
        : KeymapError("Multiple " + channel + " devices found: " + first +
                      " and " + second),
          _first(first), _second(second) {}

    const std::string& first_path() const { return _first; }
    const std::string& second_path() const { return _second; }

private:
    std::string _first;
    std::string _second;
};

// A hidapi call failed; the message names the step and carries the host error
class TransportError : public KeymapError {
public:
    using KeymapError::KeymapError;
};

// Invalid or conflicting command-line invocation
class UsageError : public KeymapError {
public:
    using KeymapError::KeymapError;
};
