#include "cli.h"
#include "device.h"
#include "errors.h"
#include "keymap_file.h"
#include "protocol.h"

#include <getopt.h>
#include <iomanip>
#include <memory>
#include <ostream>

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------

void print_help(const char* prog, std::ostream& out) {
    out <<
R"(Usage: )" << prog << R"( [OPTIONS]

Read a keymap from the keyboard or write one to it.

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit

  -r, --read FILE          Read the keymap from the keyboard and save it
                           to FILE. Without -f, only display the command.
  -w, --write FILE         Write the keymap in FILE to the keyboard.
                           Without -f, only display the command.
  -f, --force              Execute the read or write operation. Without
                           this flag the frame is printed, not sent.

  -c, --config FILE        Override device and protocol constants from an
                           INI config file

  --list                   List the keyboard's HID interfaces and which
                           channel each one resolves to
  --probe                  Show USB interfaces and endpoints for the device

Examples:
  keymap-ctl --read keymap.bin               # show the read command
  keymap-ctl --read keymap.bin --force       # save the keymap
  keymap-ctl --write keymap.bin --force      # flash the keymap
  keymap-ctl --list --config examples/linux-hidraw.ini

Note: Run as root or install the udev rule for non-root access:
  sudo cp udev/99-keymap-ctl.rules /etc/udev/rules.d/
  sudo udevadm control --reload-rules && sudo udevadm trigger
)";
}

void print_version(std::ostream& out) {
    out << "keymap-ctl " << KEYMAP_CTL_VERSION << "\n";
}

// -----------------------------------------------------------------------
// Option parsing
// -----------------------------------------------------------------------

void validate_options(const Options& opts) {
    if (!opts.read_path.empty() && !opts.write_path.empty())
        throw UsageError(
            "You can't specify both read and write operations at the same time.");
    if (!opts.has_operation() && !opts.list && !opts.probe)
        throw UsageError("You must specify either a read or write operation.");
}

// A consumed long option is still in argv; glibc also sets optopt to its
// val when its argument is missing, so check for "--" first
static std::string offending_option(char* argv[]) {
    const std::string last = argv[optind - 1];
    if (last.rfind("--", 0) == 0 || !optopt)
        return last;
    return std::string("-") + static_cast<char>(optopt);
}

Options parse_options(int argc, char* argv[]) {
    struct option long_opts[] = {
        {"help",    no_argument,       nullptr, 'h'},
        {"version", no_argument,       nullptr, 'V'},
        {"read",    required_argument, nullptr, 'r'},
        {"write",   required_argument, nullptr, 'w'},
        {"force",   no_argument,       nullptr, 'f'},
        {"config",  required_argument, nullptr, 'c'},
        {"list",    no_argument,       nullptr, 1001},
        {"probe",   no_argument,       nullptr, 1002},
        {nullptr, 0, nullptr, 0}
    };

    Options opts;

    // getopt keeps state in globals; 0 forces a full rescan
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":hVr:w:fc:", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': opts.help    = true;    break;
        case 'V': opts.version = true;    break;
        case 'r': opts.read_path   = optarg; break;
        case 'w': opts.write_path  = optarg; break;
        case 'f': opts.force   = true;    break;
        case 'c': opts.config_path = optarg; break;
        case 1001: opts.list   = true;    break;
        case 1002: opts.probe  = true;    break;

        case ':':
            throw UsageError("Option " + offending_option(argv) + " requires an argument");

        default:
            throw UsageError("Unrecognized option " + offending_option(argv));
        }
    }

    if (optind < argc)
        throw UsageError(std::string("Unexpected argument '") + argv[optind] + "'");

    if (opts.help || opts.version)
        return opts;

    validate_options(opts);
    return opts;
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

void list_interfaces(HidTransport& transport, const DeviceConfig& cfg, std::ostream& out) {
    auto interfaces = transport.enumerate(cfg.vendor_id, cfg.product_id);

    out << "HID interfaces for " << format_vid_pid(cfg.vendor_id, cfg.product_id)
        << ": " << interfaces.size() << "\n";
    for (const auto& info : interfaces) {
        out << "  iface " << std::setw(2) << std::setfill(' ') << info.interface_number
            << "  page 0x" << std::hex << std::setw(4) << std::setfill('0') << info.usage_page
            << "  usage 0x" << std::setw(4) << info.usage << std::dec
            << "  " << std::setw(7) << std::setfill(' ') << std::left
            << channel_kind_name(channel_kind(info, cfg)) << std::right
            << "  " << info.path << "\n";
    }
}

// -----------------------------------------------------------------------
// Read / write
// -----------------------------------------------------------------------

static void run_read(const Options& opts, const Config& cfg,
                     HidChannel& request, HidChannel& data,
                     std::ostream& out, std::ostream& err) {
    const std::string& path = opts.read_path;

    if (opts.force)
        out << "Reading keymap from keyboard and saving to " << path << ".\n";
    else
        out << "Command to read keymap and save to " << path
            << " (no action taken, use -f to execute).\n";

    ReadResult res = read_keymap(request, data, cfg.protocol);
    if (!opts.force) return;

    out << "Sent " << res.bytes_sent << " bytes to keyboard.\n";
    out << "Received " << res.bytes_received << " bytes from keyboard.\n";
    if (res.keymap.empty())
        err << "Warning: response carried no keymap data (" << res.bytes_received
            << " bytes, header is " << cfg.protocol.response_header_size
            << "); " << path << " will be empty\n";

    write_keymap_file(path, res.keymap);
}

static void run_write(const Options& opts, const Config& cfg, const Bytes& keymap,
                      HidChannel& data, std::ostream& out, std::ostream& err) {
    const std::string& path = opts.write_path;

    if (keymap.size() > cfg.protocol.max_report_size)
        err << "Warning: " << path << " is " << keymap.size()
            << " bytes, larger than the keyboard's "
            << cfg.protocol.max_report_size << "-byte keymap\n";

    if (opts.force)
        out << "Writing keymap from " << path << " to keyboard.\n";
    else
        out << "Command to write keymap from " << path
            << " to keyboard (no action taken, use -f to execute).\n";

    int sent = write_keymap(data, cfg.protocol, keymap);
    if (opts.force)
        out << "Sent " << sent << " bytes to keyboard.\n";
}

void run_keymap_operation(const Options& opts, const Config& cfg,
                          HidTransport& transport,
                          std::ostream& out, std::ostream& err) {
    validate_options(opts);
    if (!opts.has_operation()) return;

    // Load the source file before touching the keyboard
    Bytes keymap;
    if (!opts.write_path.empty())
        keymap = read_keymap_file(opts.write_path);

    ChannelSelection sel;
    if (opts.force) {
        sel = resolve_channels(transport, cfg.device);
    } else {
        sel.request_path = "request";
        sel.data_path    = "data";
    }

    std::unique_ptr<HidChannel> request = transport.open(sel.request_path);
    std::unique_ptr<HidChannel> data    = transport.open(sel.data_path);

    if (!opts.read_path.empty())
        run_read(opts, cfg, *request, *data, out, err);
    else
        run_write(opts, cfg, keymap, *data, out, err);
}
