#include "lexer/delimiters.hpp"

#include <vector>

namespace hbs::lexer {

auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view text) -> std::string_view {
    size_t start = 0;
    while (start < text.size() && is_blank(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && is_blank(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

auto DelimiterPair::parse(std::string_view spec) -> Result<DelimiterPair, std::string> {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos < spec.size()) {
        while (pos < spec.size() && is_blank(spec[pos])) {
            ++pos;
        }
        size_t start = pos;
        while (pos < spec.size() && !is_blank(spec[pos])) {
            ++pos;
        }
        if (pos > start) {
            parts.push_back(spec.substr(start, pos - start));
        }
    }

    if (parts.size() != 2) {
        return "expected two delimiters separated by whitespace, got '" + std::string(spec) + "'";
    }
    return DelimiterPair{.open = std::string(parts[0]), .close = std::string(parts[1])};
}

} // namespace hbs::lexer
