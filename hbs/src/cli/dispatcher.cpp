//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the `hbs` tool. It sets up
//! logging, parses command-line arguments and routes to a command handler.
//!
//! ```text
//! hbs_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ scan           → run_scan()
//!   └─ check          → run_check()
//! ```
//!
//! Logging flags (`-v`, `--log-level=...`, see `parse_log_options()`) may
//! appear anywhere on the command line; the command parsers skip them.

#include "commands/cmd_scan.hpp"
#include "driver.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

/// Main entry point for the `hbs` CLI.
///
/// | Code | Meaning                                       |
/// |------|-----------------------------------------------|
/// | 0    | Success                                       |
/// | 1    | Scan errors, bad options or unreadable file   |
int hbs_main(int argc, char* argv[]) {
    using namespace hbs::cli;

    hbs::log::Logger::init(hbs::log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "scan" || command == "check") {
        auto opts = parse_scan_args(command, argc, argv);
        if (!opts) {
            return 1;
        }
        HBS_LOG_DEBUG("cli", "Running " << command << " on " << opts->path);
        int result = command == "scan" ? run_scan(*opts) : run_check(*opts);
        hbs::log::Logger::instance().flush();
        return result;
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'hbs --help' for usage.\n";
    return 1;
}
