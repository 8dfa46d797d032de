#ifndef PARADOX_DATA_SCRIPT_DATE_HPP
#define PARADOX_DATA_SCRIPT_DATE_HPP

#include <compare>
#include <optional>
#include <string>
#include <string_view>

#include "common/config.hpp"

#include "script/fwd.hpp"

namespace paradox_data::script {

/// @brief A calendar date as written in historical blocks, e.g. `1444.11.11`.
/// Any day in `[1, 31]` is accepted for every month, so `1444.2.30` is a valid `Date`.
struct Date {
    static constexpr int min_year = 1;
    static constexpr int max_year = 9999;

    int year = min_year;
    int month = 1;
    int day = 1;

    [[nodiscard]] friend constexpr auto operator<=>(const Date&, const Date&) = default;
};

/// @brief Returns `true` if all components of `date` are within their ranges.
[[nodiscard]] constexpr bool is_valid(const Date& date) noexcept
{
    return date.year >= Date::min_year && date.year <= Date::max_year //
        && date.month >= 1 && date.month <= 12 //
        && date.day >= 1 && date.day <= 31;
}

/// @brief Parses a date of the form `Y.M.D` where each part is a decimal integer.
/// @return The date, or `std::nullopt` if there are not exactly three parts, a part is no
/// integer, or a part is out of range.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// @brief Returns `Y.M.D` without zero padding, e.g. `"1444.11.11"`.
[[nodiscard]] std::string to_string(const Date& date);

} // namespace paradox_data::script

#endif
