//! # Tokenizer Core
//!
//! This file implements the scan loop and the three scanner states:
//!
//! - **Text**: escapes, open-delimiter detection, line ends
//! - **TagSniff**: sigil lookup after an open delimiter
//! - **InTag**: body accumulation until the close delimiter
//!
//! It also owns delimiter management (scan override and `{{=... =}}` tags)
//! and error reporting.
//!
//! ## Error Codes
//!
//! | Code | Condition                                  |
//! |------|--------------------------------------------|
//! | L001 | Unterminated tag                           |
//! | L002 | Delimiter change without `=CLOSE`          |
//! | L003 | Delimiter change body is not two parts     |
//! | L004 | Invalid delimiter override passed to scan  |

#include "lexer/tokenizer.hpp"
#include "log/log.hpp"

namespace hbs::lexer {

Tokenizer::Tokenizer(TokenizerOptions options)
    : options_(options),
      sigils_(options.enable_gettext ? &SigilTable::with_gettext() : &SigilTable::base()) {}

auto Tokenizer::create(const OptionMap& options) -> Result<Tokenizer, ConfigError> {
    auto parsed = TokenizerOptions::from_map(options);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        HBS_LOG_ERROR("options", error.message);
        return error;
    }
    return Tokenizer(unwrap(parsed));
}

void Tokenizer::reset(const Source& source) {
    source_ = &source;
    state_ = TokenizerState::Text;
    delimiters_ = DelimiterPair{};
    tag_kind_ = TagKind::Escaped;
    tag_start_ = 0;
    buffer_.clear();
    buffer_start_ = 0;
    tokens_.clear();
    line_start_ = 0;
    seen_tag_ = false;
    errors_.clear();
}

auto Tokenizer::scan(const TemplateInput& input, std::optional<std::string_view> delimiters)
    -> std::vector<Token> {
    Source source = resolve_input(input);
    reset(source);

    if (delimiters) {
        apply_delimiter_override(*delimiters);
    }

    Cursor cursor(source.content());
    while (!cursor.at_end()) {
        switch (state_) {
        case TokenizerState::Text:
            scan_text(cursor);
            break;
        case TokenizerState::TagSniff:
            sniff_tag(cursor);
            break;
        case TokenizerState::InTag:
            scan_tag_body(cursor);
            break;
        }
    }

    if (state_ != TokenizerState::Text) {
        report_error("L001",
                     "unterminated tag, expected '" + delimiters_.close + "' before end of input",
                     tag_start_, source.length());
        buffer_.clear();
        state_ = TokenizerState::Text;
    }

    filter_line(std::nullopt);

    HBS_LOG_DEBUG("lexer", "Scanned " << source.name() << ": " << tokens_.size() << " tokens, "
                                      << errors_.size() << " errors");

    source_ = nullptr;
    return std::move(tokens_);
}

// ============================================================================
// State Handlers
// ============================================================================

void Tokenizer::buffer_char(char c, size_t offset) {
    if (buffer_.empty()) {
        buffer_start_ = offset;
    }
    buffer_ += c;
}

void Tokenizer::scan_text(Cursor& cursor) {
    char c = cursor.peek();

    if (c == ESCAPE_CHAR && cursor.pos() + 1 < cursor.size() &&
        cursor.peek_n(1) == delimiters_.open.front()) {
        buffer_char(cursor.peek_n(1), cursor.pos());
        cursor.advance(2);
        return;
    }

    if (cursor.matches(delimiters_.open)) {
        flush_buffer(cursor.pos());
        state_ = TokenizerState::TagSniff;
        return;
    }

    size_t offset = cursor.pos();
    cursor.advance();
    if (c == '\n') {
        filter_line(offset);
    } else {
        buffer_char(c, offset);
    }
}

void Tokenizer::sniff_tag(Cursor& cursor) {
    tag_start_ = cursor.pos();
    seen_tag_ = true;
    cursor.advance(delimiters_.open.size());

    auto kind = sigils_->lookup(cursor.peek());
    if (kind == TagKind::DelimChange) {
        change_delimiters(cursor);
        state_ = TokenizerState::Text;
        return;
    }

    if (kind) {
        cursor.advance();
        tag_kind_ = *kind;
    } else {
        tag_kind_ = TagKind::Escaped;
    }
    state_ = TokenizerState::InTag;
}

void Tokenizer::scan_tag_body(Cursor& cursor) {
    if (!cursor.matches(delimiters_.close)) {
        size_t offset = cursor.pos();
        buffer_char(cursor.advance(), offset);
        return;
    }

    emit_tag(cursor.pos());
    cursor.advance(delimiters_.close.size());
    state_ = TokenizerState::Text;

    if (tag_kind_ == TagKind::Unescaped) {
        if (delimiters_.close == DEFAULT_CLOSE_DELIMITER) {
            // `{{{name}}}`: the sniff consumed one of three opening braces.
            cursor.advance(1);
            tokens_.back().span = source_->span(tag_start_, cursor.pos());
        } else {
            trim_triple_brace();
        }
    }
}

// ============================================================================
// Delimiters
// ============================================================================

void Tokenizer::apply_delimiter_override(std::string_view spec) {
    if (trim(spec).empty()) {
        return;
    }

    auto parsed = DelimiterPair::parse(spec);
    if (is_err(parsed)) {
        report_error("L004", "invalid delimiters: " + unwrap_err(parsed), 0, 0);
        return;
    }
    delimiters_ = std::move(unwrap(parsed));
    HBS_LOG_DEBUG("lexer", "Scanning with delimiters " << delimiters_.open << " "
                                                       << delimiters_.close);
}

void Tokenizer::change_delimiters(Cursor& cursor) {
    size_t body_start = cursor.pos() + 1;
    std::string terminator = "=" + delimiters_.close;
    size_t terminator_at = cursor.find(terminator, body_start);

    if (terminator_at == std::string_view::npos) {
        report_error("L002", "unterminated delimiter change, expected '" + terminator + "'",
                     tag_start_, cursor.size());
        cursor.seek(cursor.size());
        return;
    }

    auto parsed = DelimiterPair::parse(cursor.slice(body_start, terminator_at));
    if (is_err(parsed)) {
        report_error("L003", "invalid delimiter change: " + unwrap_err(parsed), tag_start_,
                     terminator_at + terminator.size());
    } else {
        delimiters_ = std::move(unwrap(parsed));
        HBS_LOG_DEBUG("lexer", "Delimiters changed to " << delimiters_.open << " "
                                                        << delimiters_.close << " at offset "
                                                        << tag_start_);
    }

    cursor.seek(terminator_at + terminator.size());
}

// ============================================================================
// Error Reporting
// ============================================================================

void Tokenizer::report_error(const std::string& code, const std::string& message, size_t start,
                             size_t end) {
    HBS_LOG_DEBUG("lexer", code << " at offset " << start << ": " << message);
    errors_.push_back(
        ScanError{.message = message, .span = source_->span(start, end), .code = code});
}

} // namespace hbs::lexer
