//! # Tokenizer Options
//!
//! Construction-time configuration for `Tokenizer`.
//!
//! Options arrive either typed (`TokenizerOptions`) or as a loosely typed
//! `OptionMap`, e.g. collected from `--option key=value` command-line flags.
//! The map form is validated by `TokenizerOptions::from_map()`:
//!
//! | Key              | Type | Default | Effect                               |
//! |------------------|------|---------|--------------------------------------|
//! | `enable_gettext` | bool | false   | Recognize `{{_ ...}}` and `ngettext` |
//!
//! Unknown keys are ignored with a warning.

#ifndef HBS_LEXER_OPTIONS_HPP
#define HBS_LEXER_OPTIONS_HPP

#include "common.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace hbs::lexer {

constexpr std::string_view OPTION_ENABLE_GETTEXT = "enable_gettext";

/// A loosely typed option value.
using OptionValue = std::variant<bool, int64_t, double, std::string>;

/// Option key to value.
using OptionMap = std::map<std::string, OptionValue, std::less<>>;

/// An invalid construction-time option.
struct ConfigError {
    std::string option;  ///< Offending option key.
    std::string message; ///< Human-readable description.
};

/// Returns the type name of an option value ("bool", "integer", ...).
[[nodiscard]] auto option_type_name(const OptionValue& value) -> std::string_view;

/// Converts command-line text to an option value by its shape.
///
/// `true`/`false` become bool, integer literals become integers, decimal
/// literals become doubles and anything else stays a string.
[[nodiscard]] auto parse_option_value(std::string_view text) -> OptionValue;

struct TokenizerOptions {
    /// Enables the `_` gettext sigil and `ngettext` tag reclassification.
    bool enable_gettext = false;

    /// Validates an option map.
    [[nodiscard]] static auto from_map(const OptionMap& options)
        -> Result<TokenizerOptions, ConfigError>;
};

} // namespace hbs::lexer

#endif // HBS_LEXER_OPTIONS_HPP
