#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace hbs::cli {

void print_usage() {
    std::cout << "HBS Template Tokenizer " << VERSION << "\n\n";
    std::cout << "Usage: hbs <command> <file> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  scan      Print the token stream of a template\n";
    std::cout << "  check     Report scan errors only\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --delimiters=\"OPEN CLOSE\"  Scan with a custom delimiter pair\n";
    std::cout << "  --gettext                  Enable {{_ ...}} and {{ngettext ...}}\n";
    std::cout << "  --option key=value         Set a tokenizer option\n";
    std::cout << "  --help, -h                 Show this help\n";
    std::cout << "  --version, -V              Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv, -vvv              Info, debug or trace output\n";
    std::cout << "  -q, --quiet                Errors only\n";
    std::cout << "  --log-level=<level>        trace|debug|info|warn|error|fatal|off\n";
    std::cout << "  --log-filter=<spec>        Per-module levels, e.g. lexer=trace\n";
    std::cout << "  --log-file=<path>          Also write log records to a file\n";
    std::cout << "  --log-format=<text|json>   Log record format\n";
    std::cout << "\nThe HBS_LOG environment variable is read when no level is given.\n";
}

void print_version() {
    std::cout << "hbs " << VERSION << "\n";
}

} // namespace hbs::cli
