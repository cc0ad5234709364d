#pragma once

#include <iosfwd>
#include <string>

#include "config.h"
#include "hid.h"

// KEYMAP_CTL_VERSION comes from the build (project() version)
#ifndef KEYMAP_CTL_VERSION
#error "KEYMAP_CTL_VERSION must be defined by the build"
#endif

struct Options {
    std::string read_path;    // -r: keymap destination
    std::string write_path;   // -w: keymap source
    std::string config_path;  // -c
    bool        force   = false;
    bool        list    = false;
    bool        probe   = false;
    bool        help    = false;
    bool        version = false;

    bool has_operation() const { return !read_path.empty() || !write_path.empty(); }
};

// Parse argv with getopt_long. Throws UsageError on unknown options,
// missing arguments, stray operands or a bad read/write combination.
// --help and --version skip the combination check.
Options parse_options(int argc, char* argv[]);

// Exactly one of read/write, unless only diagnostics (--list/--probe)
// were asked for. Throws UsageError.
void validate_options(const Options& opts);

void print_help(const char* prog, std::ostream& out);
void print_version(std::ostream& out);

// Print one line per HID interface of the configured keyboard and how
// channel_kind() classifies it. Opens nothing.
void list_interfaces(HidTransport& transport, const DeviceConfig& cfg, std::ostream& out);

// Run the read or write selected in `opts` over `transport`.
// Without --force the channels are opened under placeholder names instead
// of being resolved, so `transport` should be a DryRunTransport.
// Progress goes to `out`, warnings to `err`. Errors propagate.
void run_keymap_operation(const Options& opts, const Config& cfg,
                          HidTransport& transport,
                          std::ostream& out, std::ostream& err);
