#ifndef PARADOX_DATA_TO_CHARS_HPP
#define PARADOX_DATA_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <limits>
#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

namespace paradox_data {

template <typename T>
constexpr int approximate_to_chars_decimal_digits_v
    = (std::numeric_limits<T>::digits * 100 / 310) + 1 + std::is_signed_v<T>;

/// @brief A fixed-capacity character buffer holding the decimal representation of a number.
template <Size N>
struct Characters {
    std::array<char, N> buffer;
    Size length;

    [[nodiscard]] std::string_view as_string() const
    {
        return { buffer.data(), length };
    }
};

template <std::integral T>
[[nodiscard]] constexpr Characters<approximate_to_chars_decimal_digits_v<T>> to_characters(T x)
{
    Characters<approximate_to_chars_decimal_digits_v<T>> chars {};
    auto result = std::to_chars(chars.buffer.data(), chars.buffer.data() + chars.buffer.size(), x);
    PARADOX_DATA_ASSERT(result.ec == std::errc {});
    chars.length = Size(result.ptr - chars.buffer.data());
    return chars;
}

/// @brief Buffer large enough for the shortest round-trip representation of a `double`.
using Double_Characters = Characters<32>;

/// @brief Converts `x` to its shortest decimal representation that round-trips,
/// independent of the global locale.
[[nodiscard]] Double_Characters to_characters(double x);

/// @brief Converts `x` to a decimal representation with exactly `precision` fractional digits.
/// Magnitudes too large for the buffer are printed in scientific notation instead.
[[nodiscard]] Characters<64> to_characters_fixed(double x, int precision);

} // namespace paradox_data

#endif
