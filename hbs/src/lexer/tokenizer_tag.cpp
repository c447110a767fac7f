//! # Tokenizer - Token Building
//!
//! This file turns buffered text and tag bodies into tokens.
//!
//! ## Tag Bodies
//!
//! Bodies are trimmed. Kinds that accept parameters split the body on its
//! first whitespace run:
//!
//! | Template                    | Kind        | name      | args        |
//! |-----------------------------|-------------|-----------|-------------|
//! | `{{#each items}}`           | Section     | `each`    | `items`     |
//! | `{{> row  cols=2}}`         | Partial     | `row`     | `cols=2`    |
//! | `{{#if}}`                   | Section     | `if`      | (empty)     |
//! | `{{ngettext one other}}`    | NGettext    | `one`     | `other`     |
//!
//! `ngettext` is a keyword rather than a sigil: a plain interpolation whose
//! body starts with `ngettext` and whitespace is reclassified when the
//! gettext extension is enabled.

#include "lexer/tokenizer.hpp"
#include "log/log.hpp"

#include <utility>

namespace hbs::lexer {

namespace {

/// Splits `body` at its first whitespace run.
auto split_first_word(std::string_view body) -> std::pair<std::string_view, std::string_view> {
    size_t ws = 0;
    while (ws < body.size() && !is_blank(body[ws])) {
        ++ws;
    }
    if (ws == body.size()) {
        return {body, {}};
    }
    size_t rest = ws;
    while (rest < body.size() && is_blank(body[rest])) {
        ++rest;
    }
    return {body.substr(0, ws), body.substr(rest)};
}

/// Returns true if `body` is `ngettext` followed by whitespace.
auto starts_with_ngettext(std::string_view body) -> bool {
    return body.size() > NGETTEXT_KEYWORD.size() && body.starts_with(NGETTEXT_KEYWORD) &&
           is_blank(body[NGETTEXT_KEYWORD.size()]);
}

} // anonymous namespace

// ============================================================================
// Sigil Tables
// ============================================================================

auto SigilTable::base() -> const SigilTable& {
    static const SigilTable table(false);
    return table;
}

auto SigilTable::with_gettext() -> const SigilTable& {
    static const SigilTable table(true);
    return table;
}

auto SigilTable::lookup(char c) const -> std::optional<TagKind> {
    switch (c) {
    case '#':
        return TagKind::Section;
    case '^':
        return TagKind::Inverted;
    case '/':
        return TagKind::EndSection;
    case '!':
        return TagKind::Comment;
    case '>':
        return TagKind::Partial;
    case '<':
        return TagKind::PartialAlt;
    case '=':
        return TagKind::DelimChange;
    case '{':
        return TagKind::Unescaped;
    case '&':
        return TagKind::UnescapedAmp;
    case '_':
        if (gettext_) {
            return TagKind::Gettext;
        }
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

auto SigilTable::contains(TagKind kind) const -> bool {
    switch (kind) {
    case TagKind::Text:
        return false;
    case TagKind::Gettext:
    case TagKind::NGettext:
        return gettext_;
    default:
        return true;
    }
}

// ============================================================================
// Token Builder
// ============================================================================

void Tokenizer::flush_buffer(size_t end) {
    if (buffer_.empty()) {
        return;
    }

    Token token;
    token.kind = TagKind::Text;
    token.name = buffer_;
    token.value = std::move(buffer_);
    token.open_delimiter = delimiters_.open;
    token.close_delimiter = delimiters_.close;
    token.index = end;
    token.span = source_->span(buffer_start_, end);
    tokens_.push_back(std::move(token));

    buffer_.clear();
}

void Tokenizer::emit_tag(size_t close_at) {
    std::string_view body = trim(buffer_);
    TagKind kind = tag_kind_;

    if (options_.enable_gettext && kind == TagKind::Escaped && starts_with_ngettext(body)) {
        kind = TagKind::NGettext;
        body = trim(body.substr(NGETTEXT_KEYWORD.size()));
    }

    Token token;
    token.kind = kind;
    token.open_delimiter = delimiters_.open;
    token.close_delimiter = delimiters_.close;

    if (accepts_args(kind)) {
        auto [name, args] = split_first_word(body);
        token.name = std::string(name);
        token.args = std::string(args);
    } else {
        token.name = std::string(body);
    }

    size_t tag_end = close_at + delimiters_.close.size();
    token.index = kind == TagKind::EndSection ? tag_start_ : tag_end;
    token.span = source_->span(tag_start_, tag_end);

    HBS_LOG_TRACE("lexer", "Tag " << format_token(token));

    tokens_.push_back(std::move(token));
    buffer_.clear();
}

void Tokenizer::trim_triple_brace() {
    if (tokens_.empty()) {
        return;
    }
    auto& name = tokens_.back().name;
    if (!name.empty() && name.back() == '}') {
        name.pop_back();
        name = std::string(trim(name));
    }
}

} // namespace hbs::lexer
