#include <limits>

#include "common/parse.hpp"
#include "common/to_chars.hpp"

#include "script/tree/date.hpp"

namespace paradox_data::script {

std::optional<Date> parse_date(std::string_view text) noexcept
{
    int parts[3];
    for (int i = 0; i < 3; ++i) {
        const Size dot = text.find('.');
        if ((dot == std::string_view::npos) != (i == 2)) {
            return {};
        }
        const std::optional<Int> part = parse_integer(text.substr(0, dot));
        if (!part || *part < std::numeric_limits<int>::min()
            || *part > std::numeric_limits<int>::max()) {
            return {};
        }
        parts[i] = int(*part);
        if (dot != std::string_view::npos) {
            text.remove_prefix(dot + 1);
        }
    }

    const Date result { .year = parts[0], .month = parts[1], .day = parts[2] };
    if (!is_valid(result)) {
        return {};
    }
    return result;
}

std::string to_string(const Date& date)
{
    std::string result;
    result += to_characters(date.year).as_string();
    result += '.';
    result += to_characters(date.month).as_string();
    result += '.';
    result += to_characters(date.day).as_string();
    return result;
}

} // namespace paradox_data::script
