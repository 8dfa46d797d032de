#ifndef PARADOX_DATA_SCRIPT_TOKEN_TYPE_HPP
#define PARADOX_DATA_SCRIPT_TOKEN_TYPE_HPP

#include <string_view>

#include "script/fwd.hpp"

namespace paradox_data::script {

enum struct Token_Type : Default_Underlying {
    /// @brief Key or bare word, e.g. `owner`, `FRA`, `modifier:tax`.
    identifier,
    /// @brief Double-quoted string, including the quotes.
    string,
    /// @brief Integer or decimal number with optional leading `-`.
    number,
    /// @brief Calendar date `Y.M.D`.
    date,
    /// @brief `yes`, in any case.
    yes,
    /// @brief `no`, in any case.
    no,
    /// @brief `=`
    equals,
    /// @brief `{`
    left_brace,
    /// @brief `}`
    right_brace,
    /// @brief `>`
    greater_than,
    /// @brief `<`
    less_than,
    /// @brief `>=`
    greater_or_equal,
    /// @brief `<=`
    less_or_equal,
    /// @brief `!=`
    not_equals,
    /// @brief `#` line comment, excluding the newline.
    comment,
    /// @brief RGB color literal such as `{ 10 20 30 }`.
    rgb_color,
    /// @brief End of input. Always the last token and never anywhere else.
    eof,
};

/// @brief Returns the name of the enumerator, e.g. `"left_brace"`.
[[nodiscard]] std::string_view token_type_name(Token_Type type);

/// @brief Returns a name suitable for prose, e.g. `"'{'"`.
[[nodiscard]] std::string_view token_type_readable_name(Token_Type type);

/// @brief Returns `true` if the token type can appear as the value of a statement or as a
/// list item.
[[nodiscard]] constexpr bool is_value_token(Token_Type type) noexcept
{
    using enum Token_Type;
    return type == identifier || type == string || type == number || type == date || type == yes
        || type == no || type == rgb_color;
}

} // namespace paradox_data::script

#endif
