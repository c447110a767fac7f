#include "lexer/options.hpp"

#include "log/log.hpp"

#include <charconv>

namespace hbs::lexer {

auto option_type_name(const OptionValue& value) -> std::string_view {
    switch (value.index()) {
    case 0:
        return "bool";
    case 1:
        return "integer";
    case 2:
        return "float";
    default:
        return "string";
    }
}

auto parse_option_value(std::string_view text) -> OptionValue {
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (!text.empty()) {
        int64_t integer = 0;
        auto [int_end, int_ec] = std::from_chars(first, last, integer);
        if (int_ec == std::errc{} && int_end == last) {
            return integer;
        }
        double number = 0.0;
        auto [dbl_end, dbl_ec] = std::from_chars(first, last, number);
        if (dbl_ec == std::errc{} && dbl_end == last) {
            return number;
        }
    }
    return std::string(text);
}

auto TokenizerOptions::from_map(const OptionMap& options) -> Result<TokenizerOptions, ConfigError> {
    TokenizerOptions result;

    for (const auto& [key, value] : options) {
        if (key == OPTION_ENABLE_GETTEXT) {
            const bool* flag = std::get_if<bool>(&value);
            if (!flag) {
                return ConfigError{.option = key,
                                   .message = "option \"" + key + "\" must be a boolean, got " +
                                              std::string(option_type_name(value))};
            }
            result.enable_gettext = *flag;
        } else {
            HBS_LOG_WARN("options", "Ignoring unknown tokenizer option '" << key << "'");
        }
    }

    return result;
}

} // namespace hbs::lexer
