#ifndef PARADOX_DATA_SCRIPT_TOKEN_CURSOR_HPP
#define PARADOX_DATA_SCRIPT_TOKEN_CURSOR_HPP

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/config.hpp"

#include "script/fwd.hpp"
#include "script/parsing/diagnostic.hpp"
#include "script/tokenization/token.hpp"

namespace paradox_data::script {

/// @brief A position within a token sequence, shared by all parsers built on `Basic_Parser`.
/// The sequence has to end with an `eof` token; the cursor never moves past it.
struct Token_Cursor {
private:
    std::span<const Token> m_tokens;
    std::string_view m_source;
    Diagnostic_Consumer& m_diagnostics;
    Size m_pos = 0;

public:
    /// @param tokens the tokens, terminated by `eof`
    /// @param source the text which the tokens were produced from
    /// @param diagnostics receives all errors and warnings
    [[nodiscard]] Token_Cursor(std::span<const Token> tokens,
                               std::string_view source,
                               Diagnostic_Consumer& diagnostics);

    [[nodiscard]] std::string_view get_source() const noexcept
    {
        return m_source;
    }

    [[nodiscard]] Size get_position() const noexcept
    {
        return m_pos;
    }

    /// @brief Returns the literal text of `token`.
    [[nodiscard]] std::string_view text(const Token& token) const
    {
        return token.text_in(m_source);
    }

    /// @brief Returns the token `lookahead` tokens ahead, or the `eof` token if there are fewer.
    [[nodiscard]] const Token& peek(Size lookahead = 0) const noexcept;

    /// @brief Like `peek`, but does not count comments.
    [[nodiscard]] const Token& peek_significant(Size lookahead) const noexcept;

    /// @brief Returns `true` if the next token is of the given type.
    [[nodiscard]] bool peek(Token_Type type) const noexcept
    {
        return peek().type == type;
    }

    [[nodiscard]] bool eof() const noexcept
    {
        return peek(Token_Type::eof);
    }

    /// @brief Returns the next token and advances past it, unless it is `eof`.
    const Token& consume() noexcept;

    /// @brief Checks whether the next token equals the expected type.
    /// If so, the cursor advances by one token.
    /// Otherwise, does nothing and returns `nullptr`.
    /// @return The consumed token or `nullptr`.
    const Token* expect(Token_Type type) noexcept;

    /// @brief Like `expect`, but reports an error with the given code on mismatch.
    const Token* require(Token_Type type, Diagnostic_Code code);

    void skip_comments() noexcept;

    /// @brief Skips a `{ ... }` region including nested braces.
    /// Does nothing unless the next token is `{`.
    void skip_balanced_braces() noexcept;

    /// @brief Skips tokens up to but excluding the next `}` or `eof`.
    void skip_to_right_brace() noexcept;

    /// @brief Describes a token for messages, e.g. `identifier 'FRA'` or `end of file`.
    [[nodiscard]] std::string describe(const Token& token) const;

    void error(Diagnostic_Code code, const Token& at, std::string message);

    void warning(Diagnostic_Code code, const Token& at, std::string message);

    /// @brief Parses `{ a "b" 3 }` as a list of texts.
    /// Strings are unquoted; other tokens are skipped with a warning.
    [[nodiscard]] std::vector<std::string> parse_string_list();

    /// @brief Parses `{ 1 2 3 }` as a list of integers.
    /// Numbers which are not integers and other tokens are skipped with a warning.
    [[nodiscard]] std::vector<Int> parse_integer_list();

    /// @brief Parses `{ a = 1 "b" = 2 }` as a map from keys to integers.
    /// Repeated keys keep the last value; malformed entries are skipped with a warning.
    [[nodiscard]] std::map<std::string, Int, std::less<>> parse_string_integer_map();
};

} // namespace paradox_data::script

#endif
