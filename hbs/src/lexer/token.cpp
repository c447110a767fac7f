//! # Token Utilities
//!
//! This file implements token utility functions.
//!
//! ## Functions
//!
//! - `tag_kind_to_string()`: Convert a kind to its display name
//! - `tag_kind_sigil()`: Sigil text written for a kind
//! - `is_interpolating()` / `accepts_args()`: Kind classification
//! - `format_token()`: One-line debug rendering
//! - `tokens_to_source()`: Template text reconstruction

#include "lexer/token.hpp"

#include "lexer/delimiters.hpp"

#include <sstream>

namespace hbs::lexer {

auto is_interpolating(TagKind kind) -> bool {
    switch (kind) {
    case TagKind::Escaped:
    case TagKind::Unescaped:
    case TagKind::UnescapedAmp:
    case TagKind::Gettext:
    case TagKind::NGettext:
        return true;
    default:
        return false;
    }
}

auto accepts_args(TagKind kind) -> bool {
    return kind == TagKind::Section || kind == TagKind::Partial || kind == TagKind::PartialAlt ||
           kind == TagKind::NGettext;
}

auto tag_kind_to_string(TagKind kind) -> std::string_view {
    switch (kind) {
    case TagKind::Text:
        return "text";
    case TagKind::Escaped:
        return "escaped";
    case TagKind::Unescaped:
        return "unescaped";
    case TagKind::UnescapedAmp:
        return "unescaped_amp";
    case TagKind::Section:
        return "section";
    case TagKind::Inverted:
        return "inverted";
    case TagKind::EndSection:
        return "end_section";
    case TagKind::Comment:
        return "comment";
    case TagKind::Partial:
        return "partial";
    case TagKind::PartialAlt:
        return "partial_alt";
    case TagKind::DelimChange:
        return "delim_change";
    case TagKind::Gettext:
        return "gettext";
    case TagKind::NGettext:
        return "ngettext";
    }
    return "unknown";
}

auto tag_kind_sigil(TagKind kind) -> std::string_view {
    switch (kind) {
    case TagKind::Unescaped:
        return "{";
    case TagKind::UnescapedAmp:
        return "&";
    case TagKind::Section:
        return "#";
    case TagKind::Inverted:
        return "^";
    case TagKind::EndSection:
        return "/";
    case TagKind::Comment:
        return "!";
    case TagKind::Partial:
        return ">";
    case TagKind::PartialAlt:
        return "<";
    case TagKind::DelimChange:
        return "=";
    case TagKind::Gettext:
        return "_";
    case TagKind::NGettext:
        return "ngettext ";
    case TagKind::Text:
    case TagKind::Escaped:
        return "";
    }
    return "";
}

static void write_quoted(std::ostringstream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        default:
            out << c;
        }
    }
    out << '"';
}

auto format_token(const Token& token) -> std::string {
    std::ostringstream out;
    out << tag_kind_to_string(token.kind) << " ";
    write_quoted(out, token.is_text() ? token.value : token.name);
    if (token.args) {
        out << " args=";
        write_quoted(out, *token.args);
    }
    if (token.indent) {
        out << " indent=";
        write_quoted(out, *token.indent);
    }
    if (token.is_tag()) {
        out << " delims=" << token.open_delimiter << " " << token.close_delimiter;
    }
    out << " @" << token.index;
    return out.str();
}

namespace {

constexpr std::string_view DEFAULT_OPEN = "{{";
constexpr std::string_view DEFAULT_CLOSE = "}}";
constexpr std::string_view ALL_SIGILS = "{&#^/!><=_";

void append_text(std::string& out, std::string_view text, char open_first) {
    for (char c : text) {
        if (c == open_first) {
            out += '\\';
        }
        out += c;
    }
}

void append_tag(std::string& out, const Token& token) {
    out += token.open_delimiter;
    out += tag_kind_sigil(token.kind);
    if (token.kind == TagKind::Escaped &&
        (token.name.empty() || ALL_SIGILS.find(token.name.front()) != std::string_view::npos)) {
        // Keep a body that looks like a sigil from being read as one.
        out += ' ';
    }
    out += token.name;
    if (token.args && !token.args->empty()) {
        out += ' ';
        out += *token.args;
    }
    if (token.kind == TagKind::Unescaped) {
        out += '}';
    }
    out += token.close_delimiter;
}

/// True when the line starting at `tokens[first]` holds only blank text.
auto line_is_blank(const std::vector<Token>& tokens, size_t first) -> bool {
    for (size_t i = first; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.is_tag()) {
            return false;
        }
        if (token.value == "\n") {
            return true;
        }
        for (char c : token.value) {
            if (!is_blank(c)) {
                return false;
            }
        }
    }
    return true;
}

} // anonymous namespace

auto tokens_to_source(const std::vector<Token>& tokens) -> std::string {
    std::string out;
    std::string open(DEFAULT_OPEN);
    std::string close(DEFAULT_CLOSE);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        bool changed = !token.open_delimiter.empty() &&
                       (token.open_delimiter != open || token.close_delimiter != close);
        if (changed) {
            bool at_line_start = out.empty() || out.back() == '\n';
            out += open;
            out += '=';
            out += token.open_delimiter;
            out += ' ';
            out += token.close_delimiter;
            out += '=';
            out += close;
            open = token.open_delimiter;
            close = token.close_delimiter;

            // A change tag in front of a blank line would make that line
            // standalone. Put the change on a line of its own instead.
            if (at_line_start && line_is_blank(tokens, i)) {
                out += '\n';
            }
        }
        if (token.is_text()) {
            append_text(out, token.value, open.front());
        } else {
            append_tag(out, token);
        }
    }
    return out;
}

} // namespace hbs::lexer
