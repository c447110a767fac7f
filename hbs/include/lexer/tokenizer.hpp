//! # HBS Template Tokenizer
//!
//! This module implements the lexical scanner for Mustache/Handlebars-style
//! templates. It converts template text into the flat token sequence a
//! parser turns into sections, partials and text.
//!
//! ## Features
//!
//! - **Escapes**: `\{{` produces a literal `{` instead of opening a tag
//! - **Custom delimiters**: per-scan override and `{{=<% %>=}}` tags
//! - **Standalone lines**: whitespace around lone block tags is dropped
//! - **Partial indentation**: captured from standalone partial lines
//! - **Gettext extension**: `{{_ text}}` and `{{ngettext one other}}`
//!
//! ## State Machine
//!
//! ```text
//!   Text ──open delimiter──▶ TagSniff ──sigil──▶ InTag ──close delimiter──┐
//!    ▲                          │                                         │
//!    └────────── `=` ───────────┘◀────────────────────────────────────────┘
//! ```
//!
//! ## Error Recovery
//!
//! Scanning never stops early. Unterminated tags and malformed delimiter
//! changes are recorded as `ScanError`s and can be retrieved via `errors()`.
//!
//! ## Example
//!
//! ```cpp
//! Tokenizer tokenizer;
//! auto tokens = tokenizer.scan("{{#items}}\n- {{name}}\n{{/items}}\n");
//! if (tokenizer.has_errors()) {
//!     for (const auto& err : tokenizer.errors()) {
//!         report(err);
//!     }
//! }
//! ```

#ifndef HBS_LEXER_TOKENIZER_HPP
#define HBS_LEXER_TOKENIZER_HPP

#include "common.hpp"
#include "lexer/cursor.hpp"
#include "lexer/delimiters.hpp"
#include "lexer/options.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hbs::lexer {

/// Character that makes the following open-delimiter character literal.
constexpr char ESCAPE_CHAR = '\\';

/// Keyword that turns a plain interpolation into `NGettext`.
constexpr std::string_view NGETTEXT_KEYWORD = "ngettext";

/// Scanner mode.
enum class TokenizerState : uint8_t {
    Text,     ///< Accumulating plain text.
    TagSniff, ///< At an open delimiter, about to read the sigil.
    InTag,    ///< Accumulating a tag body until the close delimiter.
};

/// A recoverable problem found while scanning.
struct ScanError {
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in the template.
    std::string code;    ///< Error code (e.g. "L001").
};

/// The sigil characters a tokenizer recognizes after an open delimiter.
///
/// Chosen once at construction: the base set, or the base set plus the
/// gettext sigils.
class SigilTable {
public:
    [[nodiscard]] static auto base() -> const SigilTable&;
    [[nodiscard]] static auto with_gettext() -> const SigilTable&;

    /// Returns the kind selected by `c`, or nullopt if `c` is not a sigil.
    [[nodiscard]] auto lookup(char c) const -> std::optional<TagKind>;

    /// Returns true if `kind` is registered in this table.
    [[nodiscard]] auto contains(TagKind kind) const -> bool;

private:
    explicit SigilTable(bool gettext) : gettext_(gettext) {}

    bool gettext_;
};

/// Template tokenizer.
///
/// A tokenizer resets all scan state at the start of every `scan()` call,
/// so one instance can be reused for any number of templates. It is not
/// safe to call `scan()` on the same instance from several threads at once.
class Tokenizer {
public:
    explicit Tokenizer(TokenizerOptions options = {});

    /// Builds a tokenizer from a loosely typed option map.
    ///
    /// Fails with a `ConfigError` if `enable_gettext` is present and not a
    /// boolean.
    [[nodiscard]] static auto create(const OptionMap& options) -> Result<Tokenizer, ConfigError>;

    /// Tokenizes a whole template.
    ///
    /// `delimiters` optionally replaces the default `{{ }}` pair for this
    /// scan, written as `"OPEN CLOSE"`. Delimiter-change tags inside the
    /// template still take effect after it.
    ///
    /// The result is dense: tokens dropped by standalone-line trimming are
    /// removed, never left as placeholders.
    [[nodiscard]] auto scan(const TemplateInput& input,
                            std::optional<std::string_view> delimiters = std::nullopt)
        -> std::vector<Token>;

    /// Returns the errors found by the last scan.
    [[nodiscard]] auto errors() const -> const std::vector<ScanError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    [[nodiscard]] auto options() const -> const TokenizerOptions& {
        return options_;
    }

private:
    // ========================================================================
    // Configuration
    // ========================================================================

    TokenizerOptions options_;
    const SigilTable* sigils_;

    // ========================================================================
    // Scan State
    // ========================================================================

    const Source* source_ = nullptr;           ///< Template being scanned.
    TokenizerState state_ = TokenizerState::Text;
    DelimiterPair delimiters_;                 ///< Active delimiter pair.
    TagKind tag_kind_ = TagKind::Escaped;      ///< Kind of the tag being read.
    size_t tag_start_ = 0;                     ///< Offset of the tag's open delimiter.
    std::string buffer_;                       ///< Pending text or tag body.
    size_t buffer_start_ = 0;                  ///< Offset where `buffer_` began.
    std::vector<Token> tokens_;                ///< Output stream.
    size_t line_start_ = 0;                    ///< First token of the current line.
    bool seen_tag_ = false;                    ///< A tag occurred on the current line.
    std::vector<ScanError> errors_;

    void reset(const Source& source);

    // ========================================================================
    // State Handlers
    // ========================================================================

    /// Handles one step in `Text` state.
    void scan_text(Cursor& cursor);

    /// Reads the open delimiter and sigil of a tag.
    void sniff_tag(Cursor& cursor);

    /// Handles one step in `InTag` state.
    void scan_tag_body(Cursor& cursor);

    /// Appends the current character to the buffer.
    void buffer_char(char c, size_t offset);

    // ========================================================================
    // Delimiters
    // ========================================================================

    /// Applies a `scan()` delimiter override.
    void apply_delimiter_override(std::string_view spec);

    /// Reads a `=OPEN CLOSE=` body starting at the `=` sigil under the cursor.
    void change_delimiters(Cursor& cursor);

    // ========================================================================
    // Token Building
    // ========================================================================

    /// Emits pending text as a plain-text token. `end` is the offset where
    /// the text run stops in the source.
    void flush_buffer(size_t end);

    /// Builds a tag token from the buffer. `close_at` is the offset of the
    /// close delimiter.
    void emit_tag(size_t close_at);

    /// Drops the trailing `}` of a triple-brace tag read under custom delimiters.
    void trim_triple_brace();

    // ========================================================================
    // Line Whitespace Filter
    // ========================================================================

    /// Finishes the current line. `newline_at` is the offset of the `\n`, or
    /// nullopt at end of input.
    void filter_line(std::optional<size_t> newline_at);

    /// True if no token since `line_start_` produces visible output.
    [[nodiscard]] auto line_is_whitespace() const -> bool;

    // ========================================================================
    // Error Reporting
    // ========================================================================

    void report_error(const std::string& code, const std::string& message, size_t start,
                      size_t end);
};

} // namespace hbs::lexer

#endif // HBS_LEXER_TOKENIZER_HPP
