//! # Tag Delimiters
//!
//! The open/close markers bounding a tag. The active pair starts as
//! `{{`/`}}`, may be overridden for a whole scan, and may be redefined
//! mid-template by a delimiter-change tag:
//!
//! ```text
//! {{=<% %>=}}<% name %>
//! ```

#ifndef HBS_LEXER_DELIMITERS_HPP
#define HBS_LEXER_DELIMITERS_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace hbs::lexer {

constexpr std::string_view DEFAULT_OPEN_DELIMITER = "{{";
constexpr std::string_view DEFAULT_CLOSE_DELIMITER = "}}";

/// An open/close delimiter pair. Both parts are never empty.
struct DelimiterPair {
    std::string open{DEFAULT_OPEN_DELIMITER};
    std::string close{DEFAULT_CLOSE_DELIMITER};

    /// Parses `"OPEN CLOSE"`.
    ///
    /// Leading and trailing whitespace is ignored and the parts may be
    /// separated by any run of whitespace. Anything other than exactly two
    /// non-empty parts is an error.
    [[nodiscard]] static auto parse(std::string_view spec) -> Result<DelimiterPair, std::string>;

    [[nodiscard]] auto is_default() const -> bool {
        return open == DEFAULT_OPEN_DELIMITER && close == DEFAULT_CLOSE_DELIMITER;
    }

    [[nodiscard]] auto operator==(const DelimiterPair& other) const -> bool = default;
};

/// Returns true for the characters treated as whitespace in tag bodies.
[[nodiscard]] auto is_blank(char c) -> bool;

/// Strips leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

} // namespace hbs::lexer

#endif // HBS_LEXER_DELIMITERS_HPP
