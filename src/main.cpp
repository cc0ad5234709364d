#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "cli.h"
#include "config.h"
#include "dry_run.h"
#include "errors.h"
#include "hid.h"
#include "usb.h"

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage.\n";
        return 2;
    }

    if (opts.help) {
        print_help(argv[0], std::cout);
        return 0;
    }
    if (opts.version) {
        print_version(std::cout);
        return 0;
    }

    try {
        Config cfg;
        if (!opts.config_path.empty())
            cfg = parse_config_file(opts.config_path);
        validate_config(cfg);

        // ---- --probe ----
        if (opts.probe) {
            std::cout << "=== USB interface probe ===\n";
            UsbProbe usb;
            usb.print_interfaces(cfg.device.vendor_id, cfg.device.product_id, std::cout);
        }

        // Real HID access only when something needs the keyboard
        std::unique_ptr<HidapiTransport> hid;
        if (opts.list || (opts.force && opts.has_operation()))
            hid = std::make_unique<HidapiTransport>();

        // ---- --list ----
        if (opts.list) {
            std::cout << "=== HID interfaces ===\n";
            list_interfaces(*hid, cfg.device, std::cout);
        }

        // ---- --read / --write ----
        if (opts.has_operation()) {
            if (opts.force) {
                run_keymap_operation(opts, cfg, *hid, std::cout, std::cerr);
            } else {
                DryRunTransport dry_run(std::cout);
                run_keymap_operation(opts, cfg, dry_run, std::cout, std::cerr);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
