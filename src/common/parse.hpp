#ifndef PARADOX_DATA_PARSE_HPP
#define PARADOX_DATA_PARSE_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "common/config.hpp"

namespace paradox_data {

struct Text_Match {
    Size length;
    bool is_terminated;
};

/// @brief Returns `true` if the given character is a decimal digit (`0` through `9`).
[[nodiscard]] constexpr bool is_decimal_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Returns true if the given character is whitespace.
[[nodiscard]] constexpr bool is_space(char c) noexcept
{
    return c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// @brief Returns `true` if `c` can begin an identifier.
/// Bytes of multi-byte UTF-8 sequences count as letters so that names such as `Württemberg`
/// form a single identifier.
[[nodiscard]] constexpr bool is_identifier_start(char c) noexcept
{
    return is_ascii_alpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

/// @brief Returns `true` if `c` can continue an identifier, such as the `:` in `modifier:tax`.
[[nodiscard]] constexpr bool is_identifier_char(char c) noexcept
{
    return is_identifier_start(c) || is_decimal_digit(c) || c == ':';
}

/// @brief Matches leading whitespace.
/// @return The number of leading whitespace characters.
[[nodiscard]] inline Size match_whitespace(std::string_view str) noexcept
{
    return Size(std::find_if_not(str.begin(), str.end(), is_space) - str.begin());
}

/// @brief Matches as many decimal digits as possible.
[[nodiscard]] inline Size match_digits(std::string_view str) noexcept
{
    return Size(std::find_if_not(str.begin(), str.end(), is_decimal_digit) - str.begin());
}

/// @brief Returns the number of lines in `str`.
/// A final line without terminating newline counts; an empty string has no lines.
[[nodiscard]] inline Size count_lines(std::string_view str) noexcept
{
    const auto newlines = Size(std::count(str.begin(), str.end(), '\n'));
    return newlines + (!str.empty() && !str.ends_with('\n'));
}

/// @brief Matches an identifier, i.e. an identifier start followed by identifier characters.
/// @return The length of the identifier if it could be matched, zero otherwise.
[[nodiscard]] Size match_identifier(std::string_view str) noexcept;

/// @brief Matches a `#` line comment, up to but excluding the terminating newline.
/// @return The match or `std::nullopt`.
[[nodiscard]] std::optional<Text_Match> match_line_comment(std::string_view str) noexcept;

/// @brief Matches a double-quoted string literal where `\"` is an escaped quote.
/// If no closing quote exists, the match extends to the end of `str` and is not terminated.
/// @return The match, including quotes, or `std::nullopt`.
[[nodiscard]] std::optional<Text_Match> match_string_literal(std::string_view str) noexcept;

/// @brief Removes the surrounding quotes of a string literal and replaces `\"` with `"`.
/// A missing closing quote is tolerated.
[[nodiscard]] std::string unquote_string_literal(std::string_view literal);

/// @brief Removes leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view str) noexcept;

/// @brief Compares two strings, ignoring the case of ASCII letters.
[[nodiscard]] bool equals_ascii_ignore_case(std::string_view x, std::string_view y) noexcept;

/// @brief Parses a decimal integer with optional leading `-`.
/// The whole string has to be consumed.
/// @return The integer, or `std::nullopt` if `str` is no integer or out of range.
[[nodiscard]] std::optional<Int> parse_integer(std::string_view str) noexcept;

/// @brief Parses a floating-point number with `.` as the decimal separator, independent of
/// the global locale. The whole string has to be consumed.
[[nodiscard]] std::optional<double> parse_double(std::string_view str) noexcept;

/// @brief Parses a boolean spelled `yes`, `true`, `no`, or `false`, ignoring case.
[[nodiscard]] std::optional<bool> parse_boolean(std::string_view str) noexcept;

} // namespace paradox_data

#endif
