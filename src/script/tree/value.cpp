#include "common/parse.hpp"
#include "common/to_chars.hpp"

#include "script/tree/value.hpp"

namespace paradox_data::script {

std::optional<Rgb_Color> parse_rgb_color(std::string_view text) noexcept
{
    text = trim(text);
    if (!text.starts_with('{') || !text.ends_with('}')) {
        return {};
    }
    text = text.substr(1, text.length() - 2);

    Uint8 components[3];
    for (Uint8& component : components) {
        text.remove_prefix(match_whitespace(text));
        const Size digits = match_digits(text);
        if (digits == 0) {
            return {};
        }
        const std::optional<Int> value = parse_integer(text.substr(0, digits));
        if (!value || *value > 255) {
            return {};
        }
        component = Uint8(*value);
        text.remove_prefix(digits);
        if (!text.empty() && !is_space(text[0])) {
            return {};
        }
    }
    if (!trim(text).empty()) {
        return {};
    }
    return Rgb_Color { components[0], components[1], components[2] };
}

std::string to_string(const Value& value)
{
    struct Visitor {
        std::string operator()(const std::string& text) const
        {
            return text;
        }
        std::string operator()(Int integer) const
        {
            return std::string { to_characters(integer).as_string() };
        }
        std::string operator()(double number) const
        {
            return std::string { to_characters(number).as_string() };
        }
        std::string operator()(bool boolean) const
        {
            return boolean ? "yes" : "no";
        }
        std::string operator()(const Date& date) const
        {
            return to_string(date);
        }
    };
    return std::visit(Visitor {}, value);
}

} // namespace paradox_data::script
