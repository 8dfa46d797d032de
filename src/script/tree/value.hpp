#ifndef PARADOX_DATA_SCRIPT_VALUE_HPP
#define PARADOX_DATA_SCRIPT_VALUE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "common/config.hpp"

#include "script/fwd.hpp"
#include "script/tree/date.hpp"

namespace paradox_data::script {

/// @brief The value of a scalar node.
/// The alternatives are, in order: text, integer, floating-point number, boolean, and date.
using Value = std::variant<std::string, Int, double, bool, Date>;

struct Rgb_Color {
    Uint8 r;
    Uint8 g;
    Uint8 b;

    [[nodiscard]] friend constexpr bool operator==(const Rgb_Color&, const Rgb_Color&) = default;
};

/// @brief Decodes an RGB literal of the form `{ r g b }`, where each component is a decimal
/// integer in `[0, 255]`.
[[nodiscard]] std::optional<Rgb_Color> parse_rgb_color(std::string_view text) noexcept;

/// @brief Returns the textual form of a value.
/// Text is returned as-is, booleans are `yes` or `no`, and numbers use their shortest
/// representation.
[[nodiscard]] std::string to_string(const Value& value);

} // namespace paradox_data::script

#endif
