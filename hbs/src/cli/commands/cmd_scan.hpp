//! # Scan Commands Interface
//!
//! | Function      | Command     | Output                          |
//! |---------------|-------------|---------------------------------|
//! | `run_scan()`  | `hbs scan`  | Token stream and diagnostics    |
//! | `run_check()` | `hbs check` | Diagnostics and a summary line  |

#pragma once
#include "lexer/options.hpp"

#include <optional>
#include <string>

namespace hbs::cli {

/// Arguments shared by the scan commands.
struct ScanCommandOptions {
    std::string path;
    std::optional<std::string> delimiters; ///< `"OPEN CLOSE"` override
    lexer::OptionMap options;
};

/// Collects the arguments of `scan` and `check` from `argv[2..]`, skipping
/// logging flags. Returns nullopt after printing a message to stderr if they
/// are malformed.
std::optional<ScanCommandOptions> parse_scan_args(const std::string& command, int argc,
                                                  char* argv[]);

int run_scan(const ScanCommandOptions& opts);
int run_check(const ScanCommandOptions& opts);

} // namespace hbs::cli
