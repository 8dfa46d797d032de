#ifndef PARADOX_DATA_SCRIPT_COERCE_HPP
#define PARADOX_DATA_SCRIPT_COERCE_HPP

#include <cmath>
#include <concepts>
#include <optional>
#include <string>
#include <utility>

#include "common/config.hpp"
#include "common/parse.hpp"

#include "script/tree/value.hpp"

namespace paradox_data::script {

/// @brief Converts a scalar value to `T`, leniently.
///
/// - `bool` accepts booleans, the texts `yes`, `true`, `no`, and `false` (ignoring case),
///   and numbers, where non-zero is `true`.
/// - Integer types accept integers within range, integral texts, booleans, and floating-point
///   numbers, which are rounded.
/// - Floating-point types accept any number, texts parsed with `.` as decimal separator, and
///   booleans.
/// - `std::string` accepts every value, see `to_string(const Value&)`.
/// - `Date` accepts dates and texts of the form `Y.M.D`.
/// - `Rgb_Color` accepts texts of the form `{ r g b }`.
/// @return The converted value, or `std::nullopt` if no conversion applies.
template <typename T>
[[nodiscard]] std::optional<T> coerce(const Value& value)
{
    if constexpr (std::same_as<T, bool>) {
        if (const auto* b = std::get_if<bool>(&value)) {
            return *b;
        }
        if (const auto* text = std::get_if<std::string>(&value)) {
            return parse_boolean(*text);
        }
        if (const auto* integer = std::get_if<Int>(&value)) {
            return *integer != 0;
        }
        if (const auto* number = std::get_if<double>(&value)) {
            return *number != 0;
        }
        return {};
    }
    else if constexpr (std::integral<T>) {
        std::optional<Int> integer;
        if (const auto* i = std::get_if<Int>(&value)) {
            integer = *i;
        }
        else if (const auto* text = std::get_if<std::string>(&value)) {
            integer = parse_integer(trim(*text));
        }
        else if (const auto* b = std::get_if<bool>(&value)) {
            integer = *b ? 1 : 0;
        }
        else if (const auto* number = std::get_if<double>(&value)) {
            // Outside of this range, llround is unspecified.
            constexpr double limit = 0x1p63;
            if (std::isfinite(*number) && *number > -limit && *number < limit) {
                integer = std::llround(*number);
            }
        }
        if (!integer || !std::in_range<T>(*integer)) {
            return {};
        }
        return static_cast<T>(*integer);
    }
    else if constexpr (std::floating_point<T>) {
        if (const auto* number = std::get_if<double>(&value)) {
            return static_cast<T>(*number);
        }
        if (const auto* integer = std::get_if<Int>(&value)) {
            return static_cast<T>(*integer);
        }
        if (const auto* text = std::get_if<std::string>(&value)) {
            if (const std::optional<double> parsed = parse_double(trim(*text))) {
                return static_cast<T>(*parsed);
            }
            return {};
        }
        if (const auto* b = std::get_if<bool>(&value)) {
            return *b ? T(1) : T(0);
        }
        return {};
    }
    else if constexpr (std::same_as<T, std::string>) {
        return to_string(value);
    }
    else if constexpr (std::same_as<T, Date>) {
        if (const auto* date = std::get_if<Date>(&value)) {
            return *date;
        }
        if (const auto* text = std::get_if<std::string>(&value)) {
            return parse_date(*text);
        }
        return {};
    }
    else if constexpr (std::same_as<T, Rgb_Color>) {
        if (const auto* text = std::get_if<std::string>(&value)) {
            return parse_rgb_color(*text);
        }
        return {};
    }
    else {
        static_assert(dependent_false<T>, "No coercion from a scalar value to T exists.");
    }
}

} // namespace paradox_data::script

#endif
