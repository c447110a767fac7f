//! # Scan Commands
//!
//! Both commands read one template, build a tokenizer from the collected
//! options and scan it. Diagnostics go to stderr in the form
//!
//! ```text
//! page.hbs:3:5: error[L001]: unterminated tag, expected '}}' before end of input
//! ```
//!
//! and make the command exit with 1.

#include "cmd_scan.hpp"

#include "lexer/tokenizer.hpp"
#include "log/log.hpp"

#include <functional>
#include <iostream>
#include <string_view>

namespace hbs::cli {

namespace {

struct ScanOutcome {
    lexer::Source source;
    std::vector<lexer::Token> tokens;
    std::vector<lexer::ScanError> errors;
};

/// Loads the template and runs the tokenizer. Returns nullopt after logging
/// if the file or the options are unusable.
auto scan_file(const ScanCommandOptions& opts) -> std::optional<ScanOutcome> {
    auto source_result = lexer::Source::from_file(opts.path);
    if (is_err(source_result)) {
        HBS_LOG_ERROR("cli", unwrap_err(source_result));
        return std::nullopt;
    }

    auto tokenizer_result = lexer::Tokenizer::create(opts.options);
    if (is_err(tokenizer_result)) {
        // Already logged by Tokenizer::create
        return std::nullopt;
    }

    auto& tokenizer = unwrap(tokenizer_result);
    auto& source = unwrap(source_result);

    std::optional<std::string_view> delimiters;
    if (opts.delimiters) {
        delimiters = *opts.delimiters;
    }

    auto tokens = tokenizer.scan(std::cref<lexer::TextProvider>(source), delimiters);
    return ScanOutcome{.source = std::move(source),
                       .tokens = std::move(tokens),
                       .errors = tokenizer.errors()};
}

/// Parses `key=value` into `opts.options`. Returns false if there is no `=`.
bool add_option(ScanCommandOptions& opts, std::string_view pair) {
    auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return false;
    }
    opts.options[std::string(pair.substr(0, eq))] = lexer::parse_option_value(pair.substr(eq + 1));
    return true;
}

void emit_errors(const std::string& path, const std::vector<lexer::ScanError>& errors) {
    for (const auto& error : errors) {
        std::cerr << path << ":" << error.span.start.line << ":" << error.span.start.column
                  << ": error[" << error.code << "]: " << error.message << "\n";
    }
}

} // anonymous namespace

std::optional<ScanCommandOptions> parse_scan_args(const std::string& command, int argc,
                                                  char* argv[]) {
    ScanCommandOptions opts;

    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg.starts_with("--delimiters=")) {
            opts.delimiters = std::string(arg.substr(13));
        } else if (arg == "--gettext") {
            opts.options[std::string(lexer::OPTION_ENABLE_GETTEXT)] = true;
        } else if (arg == "--option") {
            if (i + 1 >= argc || !add_option(opts, argv[i + 1])) {
                std::cerr << "error: --option expects key=value\n";
                return std::nullopt;
            }
            ++i;
        } else if (arg.starts_with("--option=")) {
            if (!add_option(opts, arg.substr(9))) {
                std::cerr << "error: --option expects key=value\n";
                return std::nullopt;
            }
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (opts.path.empty()) {
            opts.path = std::string(arg);
        } else {
            std::cerr << "error: " << command << " takes a single template file\n";
            return std::nullopt;
        }
    }

    if (opts.path.empty()) {
        std::cerr << "Usage: hbs " << command
                  << " <file> [--delimiters=\"OPEN CLOSE\"] [--gettext] [--option key=value]\n";
        return std::nullopt;
    }
    return opts;
}

int run_scan(const ScanCommandOptions& opts) {
    auto outcome = scan_file(opts);
    if (!outcome) {
        return 1;
    }

    for (const auto& token : outcome->tokens) {
        std::cout << token.span.start.line << ":" << token.span.start.column << " "
                  << lexer::format_token(token) << "\n";
    }

    emit_errors(opts.path, outcome->errors);
    HBS_LOG_INFO("cli", "Scanned " << outcome->tokens.size() << " tokens from " << opts.path);
    return outcome->errors.empty() ? 0 : 1;
}

int run_check(const ScanCommandOptions& opts) {
    auto outcome = scan_file(opts);
    if (!outcome) {
        return 1;
    }

    emit_errors(opts.path, outcome->errors);
    if (outcome->errors.empty()) {
        std::cout << opts.path << ": ok (" << outcome->tokens.size() << " tokens, "
                  << outcome->source.line_count() << " lines)\n";
        return 0;
    }
    std::cout << opts.path << ": " << outcome->errors.size() << " error(s)\n";
    return 1;
}

} // namespace hbs::cli
