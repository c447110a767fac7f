//! # Tokenizer - Line Whitespace Filter
//!
//! Runs at every newline and at end of input. A line that holds at least one
//! tag and otherwise only whitespace is "standalone": its text tokens are
//! dropped along with the newline, so block tags on their own lines leave no
//! trace in the output.
//!
//! ```text
//! "  {{#items}}\n"   ->  [Section items]
//! "  {{> row}}\n"    ->  [Partial row indent="  "]
//! "  {{name}}\n"     ->  [Text "  "] [Escaped name] [Text "\n"]
//! ```

#include "lexer/tokenizer.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace hbs::lexer {

auto Tokenizer::line_is_whitespace() const -> bool {
    for (size_t i = line_start_; i < tokens_.size(); ++i) {
        const Token& token = tokens_[i];
        if (token.is_text()) {
            if (!std::all_of(token.value.begin(), token.value.end(), is_blank)) {
                return false;
            }
        } else if (is_interpolating(token.kind)) {
            return false;
        }
    }
    return true;
}

void Tokenizer::filter_line(std::optional<size_t> newline_at) {
    flush_buffer(newline_at ? *newline_at : source_->length());

    if (seen_tag_ && line_is_whitespace()) {
        auto first = tokens_.begin() + static_cast<std::ptrdiff_t>(line_start_);

        for (auto it = first; it != tokens_.end(); ++it) {
            auto next = it + 1;
            if (it->is_text() && next != tokens_.end() && next->is_partial()) {
                next->indent = it->value;
            }
        }

        auto kept = std::remove_if(first, tokens_.end(),
                                   [](const Token& token) { return token.is_text(); });
        HBS_LOG_TRACE("lexer", "Standalone line, dropping "
                                   << std::distance(kept, tokens_.end()) << " text tokens");
        tokens_.erase(kept, tokens_.end());
    } else if (newline_at) {
        Token token;
        token.kind = TagKind::Text;
        token.name = "\n";
        token.value = "\n";
        token.open_delimiter = delimiters_.open;
        token.close_delimiter = delimiters_.close;
        token.index = *newline_at + 1;
        token.span = source_->span(*newline_at, *newline_at + 1);
        tokens_.push_back(std::move(token));
    }

    seen_tag_ = false;
    line_start_ = tokens_.size();
}

} // namespace hbs::lexer
