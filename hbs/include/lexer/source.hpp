//! # Template Sources
//!
//! This module provides the template text abstractions consumed by the
//! tokenizer.
//!
//! ## Features
//!
//! - **Text providers**: Any object exposing `text()` can be scanned
//! - **Tagged input**: `TemplateInput` is either raw text or a provider,
//!   resolved once at the top of a scan
//! - **Line tracking**: Line/column lookup from byte offsets for diagnostics
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("page.hbs");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//!
//! Tokenizer tokenizer;
//! auto tokens = tokenizer.scan(source);            // provider
//! auto more = tokenizer.scan("Hello {{name}}");     // raw text
//! ```

#ifndef HBS_LEXER_SOURCE_HPP
#define HBS_LEXER_SOURCE_HPP

#include "common.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hbs::lexer {

/// An object that can hand out the template text it wraps.
class TextProvider {
public:
    virtual ~TextProvider() = default;

    /// Returns the underlying template text.
    [[nodiscard]] virtual auto text() const -> std::string = 0;

    /// Name used in diagnostics.
    [[nodiscard]] virtual auto name() const -> std::string {
        return "<provider>";
    }
};

/// Input accepted by `Tokenizer::scan()`: raw text or a text provider.
///
/// The provider alternative is held by reference; the provider must outlive
/// the `scan()` call.
using TemplateInput = std::variant<std::string_view, std::reference_wrapper<const TextProvider>>;

/// A named template with an index of line start offsets.
///
/// String views returned by `content()`, `slice()` and `line()` are valid
/// as long as the Source object exists.
class Source : public TextProvider {
public:
    /// Constructs a source from a name and content. Builds the line index.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto text() const -> std::string override {
        return content_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return filename_;
    }

    /// Returns the entire content as a string view.
    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    /// Returns the length of the source in bytes.
    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the character (byte) at the given offset, or '\0' if out of bounds.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-indexed line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns a span covering `[start, end)`.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan;

    /// Returns the content of a 1-indexed line without its line terminator.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a template from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

/// Resolves a `TemplateInput` into its name and text.
[[nodiscard]] auto resolve_input(const TemplateInput& input) -> Source;

} // namespace hbs::lexer

#endif // HBS_LEXER_SOURCE_HPP
