//! # Token Definitions
//!
//! This module defines the tokens produced by the template tokenizer.
//!
//! ## Overview
//!
//! A template is a run of plain text interleaved with tags. A tag starts with
//! the open delimiter (`{{` by default), an optional one-character sigil that
//! selects the tag kind, the tag body, and the close delimiter (`}}`).
//!
//! | Sigil      | Kind            | Example              |
//! |------------|-----------------|----------------------|
//! | (none)     | `Escaped`       | `{{name}}`           |
//! | `{`        | `Unescaped`     | `{{{html}}}`         |
//! | `&`        | `UnescapedAmp`  | `{{&html}}`          |
//! | `#`        | `Section`       | `{{#each items}}`    |
//! | `^`        | `Inverted`      | `{{^items}}`         |
//! | `/`        | `EndSection`    | `{{/each}}`          |
//! | `!`        | `Comment`       | `{{! note }}`        |
//! | `>`        | `Partial`       | `{{> header}}`       |
//! | `<`        | `PartialAlt`    | `{{< layout}}`       |
//! | `=`        | `DelimChange`   | `{{=<% %>=}}`        |
//! | `_`        | `Gettext`       | `{{_ Hello}}`        |
//! | `ngettext` | `NGettext`      | `{{ngettext a b}}`   |
//!
//! `Gettext` and `NGettext` are only recognized when the gettext extension
//! is enabled on the tokenizer.

#ifndef HBS_LEXER_TOKEN_HPP
#define HBS_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hbs::lexer {

/// All token kinds produced by the tokenizer.
enum class TagKind : uint8_t {
    Text,         ///< Plain template text (including single `"\n"` tokens)
    Escaped,      ///< `{{name}}` - HTML-escaped interpolation
    Unescaped,    ///< `{{{name}}}` - raw interpolation
    UnescapedAmp, ///< `{{&name}}` - raw interpolation
    Section,      ///< `{{#name args}}` - section open
    Inverted,     ///< `{{^name}}` - inverted section open
    EndSection,   ///< `{{/name}}` - section close
    Comment,      ///< `{{!text}}` - comment
    Partial,      ///< `{{>name args}}` - partial
    PartialAlt,   ///< `{{<name args}}` - partial, alternate spelling
    DelimChange,  ///< `{{=<% %>=}}` - delimiter change (never emitted)
    Gettext,      ///< `{{_ text}}` - translated text
    NGettext,     ///< `{{ngettext singular plural}}` - pluralized translation
};

/// A template token.
///
/// Plain-text tokens carry their text in both `name` and `value`. Tag tokens
/// carry the trimmed body in `name` and, for kinds accepting parameters, the
/// raw parameter text in `args`.
struct Token {
    /// The kind of token.
    TagKind kind = TagKind::Text;

    /// Trimmed tag body, or literal text for plain-text tokens.
    std::string name;

    /// Raw text (plain-text tokens only).
    std::string value;

    /// Delimiters active when the token was produced.
    std::string open_delimiter;
    std::string close_delimiter;

    /// Source offset used by the parser.
    ///
    /// - `EndSection`: offset of the close tag's open delimiter
    /// - other tags: offset just past the close delimiter
    /// - text: offset just past the text run
    size_t index = 0;

    /// Leading whitespace of a standalone partial.
    std::optional<std::string> indent;

    /// Parameter text for `Section`, `Partial`, `PartialAlt` and `NGettext`.
    std::optional<std::string> args;

    /// Location of the text run or the whole tag, delimiters included.
    SourceSpan span{};

    [[nodiscard]] auto is(TagKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TagKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_text() const -> bool {
        return kind == TagKind::Text;
    }

    [[nodiscard]] auto is_tag() const -> bool {
        return kind != TagKind::Text;
    }

    [[nodiscard]] auto is_partial() const -> bool {
        return kind == TagKind::Partial || kind == TagKind::PartialAlt;
    }
};

/// Returns true for kinds whose output is visible where the tag stands.
///
/// A line holding one of these is never treated as standalone.
[[nodiscard]] auto is_interpolating(TagKind kind) -> bool;

/// Returns true for kinds whose body is split into a name and `args`.
[[nodiscard]] auto accepts_args(TagKind kind) -> bool;

/// Returns a stable lowercase name for a kind (e.g., "section").
[[nodiscard]] auto tag_kind_to_string(TagKind kind) -> std::string_view;

/// Returns the sigil written after the open delimiter for a kind.
///
/// Empty for `Text` and `Escaped`; `"ngettext "` for `NGettext`.
[[nodiscard]] auto tag_kind_sigil(TagKind kind) -> std::string_view;

/// Renders a token on one line for debugging, e.g. `section "each" args="items" @12`.
[[nodiscard]] auto format_token(const Token& token) -> std::string;

/// Rebuilds template text from a token stream.
///
/// Literal occurrences of the first open-delimiter character are escaped and
/// delimiter changes are re-emitted, so re-scanning the result yields the
/// same tokens for streams without standalone lines.
[[nodiscard]] auto tokens_to_source(const std::vector<Token>& tokens) -> std::string;

} // namespace hbs::lexer

#endif // HBS_LEXER_TOKEN_HPP
