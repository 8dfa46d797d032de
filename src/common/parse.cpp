#include <charconv>
#include <system_error>

#include "common/parse.hpp"

namespace paradox_data {

Size match_identifier(std::string_view str) noexcept
{
    if (str.empty() || !is_identifier_start(str[0])) {
        return 0;
    }
    const auto end = std::find_if_not(str.begin() + 1, str.end(), is_identifier_char);
    return Size(end - str.begin());
}

std::optional<Text_Match> match_line_comment(std::string_view s) noexcept
{
    if (!s.starts_with('#')) {
        return {};
    }
    const Size end = s.find('\n', 1);
    if (end == std::string_view::npos) {
        return Text_Match { .length = s.length(), .is_terminated = false };
    }
    return Text_Match { .length = end, .is_terminated = true };
}

std::optional<Text_Match> match_string_literal(std::string_view s) noexcept
{
    if (!s.starts_with('"')) {
        return {};
    }
    for (Size i = 1; i < s.length(); ++i) {
        if (s[i] == '\\' && i + 1 < s.length() && s[i + 1] == '"') {
            ++i;
        }
        else if (s[i] == '"') {
            return Text_Match { .length = i + 1, .is_terminated = true };
        }
    }
    return Text_Match { .length = s.length(), .is_terminated = false };
}

std::string unquote_string_literal(std::string_view literal)
{
    if (literal.starts_with('"')) {
        literal.remove_prefix(1);
    }
    if (literal.ends_with('"') && !literal.ends_with("\\\"")) {
        literal.remove_suffix(1);
    }

    std::string result;
    result.reserve(literal.size());
    for (Size i = 0; i < literal.size(); ++i) {
        if (literal[i] == '\\' && i + 1 < literal.size() && literal[i + 1] == '"') {
            ++i;
        }
        result.push_back(literal[i]);
    }
    return result;
}

std::string_view trim(std::string_view str) noexcept
{
    const Size leading = match_whitespace(str);
    str.remove_prefix(leading);
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

bool equals_ascii_ignore_case(std::string_view x, std::string_view y) noexcept
{
    constexpr auto to_lower = [](char c) { return c >= 'A' && c <= 'Z' ? char(c + 'a' - 'A') : c; };
    return x.length() == y.length()
        && std::equal(x.begin(), x.end(), y.begin(), [&](char a, char b) {
               return to_lower(a) == to_lower(b);
           });
}

std::optional<Int> parse_integer(std::string_view str) noexcept
{
    Int result;
    const char* const end = str.data() + str.size();
    const auto [p, ec] = std::from_chars(str.data(), end, result);
    if (ec != std::errc {} || p != end) {
        return {};
    }
    return result;
}

std::optional<double> parse_double(std::string_view str) noexcept
{
    double result;
    const char* const end = str.data() + str.size();
    const auto [p, ec] = std::from_chars(str.data(), end, result, std::chars_format::general);
    if (ec != std::errc {} || p != end) {
        return {};
    }
    return result;
}

std::optional<bool> parse_boolean(std::string_view str) noexcept
{
    if (equals_ascii_ignore_case(str, "yes") || equals_ascii_ignore_case(str, "true")) {
        return true;
    }
    if (equals_ascii_ignore_case(str, "no") || equals_ascii_ignore_case(str, "false")) {
        return false;
    }
    return {};
}

} // namespace paradox_data
