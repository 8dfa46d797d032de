#include "common/to_chars.hpp"

namespace paradox_data {

static_assert(approximate_to_chars_decimal_digits_v<unsigned char> >= 3);
static_assert(approximate_to_chars_decimal_digits_v<unsigned short> >= 5);
static_assert(approximate_to_chars_decimal_digits_v<Int64> >= 20);

Double_Characters to_characters(double x)
{
    Double_Characters chars {};
    auto result = std::to_chars(chars.buffer.data(), chars.buffer.data() + chars.buffer.size(), x);
    PARADOX_DATA_ASSERT(result.ec == std::errc {});
    chars.length = Size(result.ptr - chars.buffer.data());
    return chars;
}

Characters<64> to_characters_fixed(double x, int precision)
{
    Characters<64> chars {};
    char* const first = chars.buffer.data();
    char* const last = first + chars.buffer.size();
    auto result = std::to_chars(first, last, x, std::chars_format::fixed, precision);
    if (result.ec != std::errc {}) {
        result = std::to_chars(first, last, x, std::chars_format::scientific, precision);
    }
    PARADOX_DATA_ASSERT(result.ec == std::errc {});
    chars.length = Size(result.ptr - first);
    return chars;
}

} // namespace paradox_data
