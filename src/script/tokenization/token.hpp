#ifndef PARADOX_DATA_SCRIPT_TOKEN_HPP
#define PARADOX_DATA_SCRIPT_TOKEN_HPP

#include <string_view>

#include "common/config.hpp"
#include "common/source_position.hpp"

#include "script/tokenization/token_type.hpp"

namespace paradox_data::script {

/// @brief A token, referring to a span of the source text it was produced from.
struct Token {
    Local_Source_Span pos {};
    Token_Type type = Token_Type::eof;

    /// @brief Default constructor.
    /// Creates an `eof` `Token` at the start of a file.
    [[nodiscard]] Token() = default;

    [[nodiscard]] Token(const Local_Source_Span& pos, Token_Type type) noexcept
        : pos { pos }
        , type { type }
    {
    }

    /// @brief Returns the literal text of this token within `source`.
    /// @param source the text which this token was produced from
    [[nodiscard]] std::string_view text_in(std::string_view source) const
    {
        return source.substr(pos.begin, pos.length);
    }

    [[nodiscard]] friend constexpr bool operator==(const Token&, const Token&) = default;
};

} // namespace paradox_data::script

#endif
