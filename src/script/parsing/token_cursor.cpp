#include <optional>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "script/parsing/diagnostic_consumer.hpp"
#include "script/parsing/token_cursor.hpp"

namespace paradox_data::script {

Token_Cursor::Token_Cursor(std::span<const Token> tokens,
                           std::string_view source,
                           Diagnostic_Consumer& diagnostics)
    : m_tokens(tokens)
    , m_source(source)
    , m_diagnostics(diagnostics)
{
    PARADOX_DATA_ASSERT(!m_tokens.empty());
    PARADOX_DATA_ASSERT(m_tokens.back().type == Token_Type::eof);
}

const Token& Token_Cursor::peek(Size lookahead) const noexcept
{
    const Size index = std::min(m_pos + lookahead, m_tokens.size() - 1);
    return m_tokens[index];
}

const Token& Token_Cursor::peek_significant(Size lookahead) const noexcept
{
    Size index = m_pos;
    while (true) {
        while (index + 1 < m_tokens.size() && m_tokens[index].type == Token_Type::comment) {
            ++index;
        }
        if (lookahead == 0 || index + 1 >= m_tokens.size()) {
            return m_tokens[index];
        }
        --lookahead;
        ++index;
    }
}

const Token& Token_Cursor::consume() noexcept
{
    const Token& result = peek();
    if (result.type != Token_Type::eof) {
        ++m_pos;
    }
    return result;
}

const Token* Token_Cursor::expect(Token_Type type) noexcept
{
    if (peek().type != type) {
        return nullptr;
    }
    return &consume();
}

const Token* Token_Cursor::require(Token_Type type, Diagnostic_Code code)
{
    if (const Token* result = expect(type)) {
        return result;
    }
    const Token& actual = peek();
    error(code, actual,
          "Expected " + std::string(token_type_readable_name(type)) + ", but got "
              + describe(actual) + ".");
    return nullptr;
}

void Token_Cursor::skip_comments() noexcept
{
    while (peek(Token_Type::comment)) {
        consume();
    }
}

void Token_Cursor::skip_balanced_braces() noexcept
{
    if (!expect(Token_Type::left_brace)) {
        return;
    }
    Size depth = 1;
    while (depth != 0 && !eof()) {
        switch (consume().type) {
        case Token_Type::left_brace: ++depth; break;
        case Token_Type::right_brace: --depth; break;
        default: break;
        }
    }
}

void Token_Cursor::skip_to_right_brace() noexcept
{
    while (!eof() && !peek(Token_Type::right_brace)) {
        consume();
    }
}

std::string Token_Cursor::describe(const Token& token) const
{
    std::string result { token_type_readable_name(token.type) };
    switch (token.type) {
    case Token_Type::identifier:
    case Token_Type::string:
    case Token_Type::number:
    case Token_Type::date:
    case Token_Type::yes:
    case Token_Type::no:
    case Token_Type::rgb_color:
        result += " '";
        result += text(token);
        result += '\'';
        break;
    default: break;
    }
    return result;
}

void Token_Cursor::error(Diagnostic_Code code, const Token& at, std::string message)
{
    m_diagnostics(Diagnostic { Severity::error, code, at.pos, std::move(message) });
}

void Token_Cursor::warning(Diagnostic_Code code, const Token& at, std::string message)
{
    m_diagnostics(Diagnostic { Severity::warning, code, at.pos, std::move(message) });
}

std::vector<std::string> Token_Cursor::parse_string_list()
{
    std::vector<std::string> result;
    if (!require(Token_Type::left_brace, Diagnostic_Code::expected_left_brace)) {
        return result;
    }

    while (true) {
        skip_comments();
        if (eof() || peek(Token_Type::right_brace)) {
            break;
        }
        const Token& t = consume();
        switch (t.type) {
        case Token_Type::string: result.push_back(unquote_string_literal(text(t))); break;
        case Token_Type::identifier:
        case Token_Type::number: result.emplace_back(text(t)); break;
        default:
            warning(Diagnostic_Code::unexpected_list_item, t,
                    "Unexpected " + describe(t) + " in list.");
        }
    }

    require(Token_Type::right_brace, Diagnostic_Code::expected_right_brace);
    return result;
}

std::vector<Int> Token_Cursor::parse_integer_list()
{
    std::vector<Int> result;
    if (!require(Token_Type::left_brace, Diagnostic_Code::expected_left_brace)) {
        return result;
    }

    while (true) {
        skip_comments();
        if (eof() || peek(Token_Type::right_brace)) {
            break;
        }
        const Token& t = consume();
        if (t.type != Token_Type::number) {
            warning(Diagnostic_Code::unexpected_list_item, t,
                    "Expected a number in integer list, but got " + describe(t) + ".");
        }
        else if (const std::optional<Int> value = parse_integer(text(t))) {
            result.push_back(*value);
        }
        else {
            warning(Diagnostic_Code::invalid_integer, t,
                    "Cannot parse '" + std::string(text(t)) + "' as an integer.");
        }
    }

    require(Token_Type::right_brace, Diagnostic_Code::expected_right_brace);
    return result;
}

std::map<std::string, Int, std::less<>> Token_Cursor::parse_string_integer_map()
{
    std::map<std::string, Int, std::less<>> result;
    if (!require(Token_Type::left_brace, Diagnostic_Code::expected_left_brace)) {
        return result;
    }

    while (true) {
        skip_comments();
        if (eof() || peek(Token_Type::right_brace)) {
            break;
        }
        const Token& key = peek();
        if (key.type != Token_Type::string && key.type != Token_Type::identifier) {
            warning(Diagnostic_Code::unexpected_token, key,
                    "Expected a key, but got " + describe(key) + ".");
            skip_to_right_brace();
            continue;
        }
        consume();
        if (!require(Token_Type::equals, Diagnostic_Code::expected_equals)) {
            skip_to_right_brace();
            continue;
        }

        const Token& value = consume();
        const std::optional<Int> integer
            = value.type == Token_Type::number ? parse_integer(text(value)) : std::nullopt;
        if (!integer) {
            warning(Diagnostic_Code::invalid_integer, value,
                    "Expected an integer value, but got " + describe(value) + ".");
            continue;
        }
        std::string key_text = key.type == Token_Type::string ? unquote_string_literal(text(key))
                                                              : std::string(text(key));
        result.insert_or_assign(std::move(key_text), *integer);
    }

    require(Token_Type::right_brace, Diagnostic_Code::expected_right_brace);
    return result;
}

} // namespace paradox_data::script
