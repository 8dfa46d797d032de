#ifndef PARADOX_DATA_CONFIG_HPP
#define PARADOX_DATA_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace paradox_data {

/// @brief 64-bit signed integer.
using Int64 = std::int64_t;
/// @brief 8-bit unsigned integer.
using Uint8 = std::uint8_t;

/// @brief Convenience alias for std::size_t.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief The integer type stored in scalar nodes.
using Int = Int64;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define PARADOX_DATA_ENUM_STRING_CASE(...)                                                         \
    case __VA_ARGS__: return #__VA_ARGS__

template <typename>
inline constexpr bool dependent_false = false;

} // namespace paradox_data

#endif
