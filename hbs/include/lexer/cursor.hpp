//! # Scan Cursor
//!
//! A read position over template text with the lookahead operations the
//! tokenizer needs: single-character peeks, multi-character matches against
//! a delimiter, and forward searches.

#ifndef HBS_LEXER_CURSOR_HPP
#define HBS_LEXER_CURSOR_HPP

#include <algorithm>
#include <string_view>

namespace hbs::lexer {

class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    /// Returns the current character, or '\0' at end of input.
    [[nodiscard]] auto peek() const -> char {
        return peek_n(0);
    }

    /// Returns the character `n` positions ahead, or '\0' past the end.
    [[nodiscard]] auto peek_n(size_t n) const -> char {
        return pos_ + n < text_.size() ? text_[pos_ + n] : '\0';
    }

    /// Returns true if the input at the cursor starts with `seq`.
    [[nodiscard]] auto matches(std::string_view seq) const -> bool {
        return text_.substr(std::min(pos_, text_.size())).starts_with(seq);
    }

    /// Consumes and returns the current character.
    auto advance() -> char {
        char c = peek();
        advance(1);
        return c;
    }

    /// Moves forward `n` characters, stopping at end of input.
    void advance(size_t n) {
        pos_ = std::min(pos_ + n, text_.size());
    }

    /// Moves to an absolute offset, clamped to end of input.
    void seek(size_t offset) {
        pos_ = std::min(offset, text_.size());
    }

    /// Offset of the first occurrence of `seq` at or after `from`, or npos.
    [[nodiscard]] auto find(std::string_view seq, size_t from) const -> size_t {
        return text_.find(seq, from);
    }

    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view {
        start = std::min(start, text_.size());
        end = std::clamp(end, start, text_.size());
        return text_.substr(start, end - start);
    }

    [[nodiscard]] auto pos() const -> size_t {
        return pos_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return text_.size();
    }

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace hbs::lexer

#endif // HBS_LEXER_CURSOR_HPP
