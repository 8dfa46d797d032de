#include <optional>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "script/tokenization/tokenize.hpp"
#include "script/tree/date.hpp"

namespace paradox_data::script {

using enum Token_Type;

namespace {

constexpr Int max_color_component = 255;

/// @brief The scanning position within the source.
/// All speculative scans save a `Cursor` and restore it exactly when they fail.
struct Cursor {
    Size begin = 0;
    Size line = 0;
    Size column = 0;
};

/// @brief A helper class which manages some shared state for tokenization, and performs it.
struct Tokenizer {
    const std::string_view m_source;
    Cursor m_cursor {};

    void tokenize(std::vector<Token>& out);

private:
    /// @brief Scans a single token at the current position, which is not whitespace.
    /// @return The type of the scanned token, or `std::nullopt` if the characters were skipped.
    std::optional<Token_Type> scan_token();

    Token_Type scan_number_or_date();

    Token_Type scan_identifier();

    bool try_scan_rgb_color();

    bool try_scan_date_suffix(Size token_begin);

    [[nodiscard]] bool at_end() const
    {
        return m_cursor.begin >= m_source.length();
    }

    [[nodiscard]] char current() const
    {
        return at_end() ? '\0' : m_source[m_cursor.begin];
    }

    [[nodiscard]] std::string_view remainder() const
    {
        return m_source.substr(m_cursor.begin);
    }

    [[nodiscard]] Cursor checkpoint() const
    {
        return m_cursor;
    }

    void rollback(const Cursor& saved)
    {
        m_cursor = saved;
    }

    void advance(Size length = 1)
    {
        PARADOX_DATA_ASSERT(m_cursor.begin + length <= m_source.length());
        for (Size i = 0; i < length; ++i) {
            if (m_source[m_cursor.begin] == '\n') {
                m_cursor.line += 1;
                m_cursor.column = 0;
            }
            else {
                m_cursor.column += 1;
            }
            m_cursor.begin += 1;
        }
    }

    void skip_whitespace()
    {
        advance(match_whitespace(remainder()));
    }
};

void Tokenizer::tokenize(std::vector<Token>& out)
{
    m_cursor = {};
    while (true) {
        skip_whitespace();
        if (at_end()) {
            break;
        }

        const Cursor start = checkpoint();
        const std::optional<Token_Type> type = scan_token();
        PARADOX_DATA_ASSERT(m_cursor.begin > start.begin);
        if (!type) {
            continue;
        }
        const Local_Source_Span pos { { .line = start.line,
                                        .column = start.column,
                                        .begin = start.begin },
                                      m_cursor.begin - start.begin };
        out.push_back({ pos, *type });
    }

    out.push_back({ Local_Source_Span { { .line = m_cursor.line,
                                          .column = m_cursor.column,
                                          .begin = m_cursor.begin },
                                        0 },
                    eof });
}

std::optional<Token_Type> Tokenizer::scan_token()
{
    const std::string_view rest = remainder();
    PARADOX_DATA_ASSERT(!rest.empty());
    PARADOX_DATA_ASSERT(!is_space(rest[0]));

    if (const std::optional<Text_Match> m = match_line_comment(rest)) {
        advance(m->length);
        return comment;
    }
    if (const std::optional<Text_Match> m = match_string_literal(rest)) {
        advance(m->length);
        return string;
    }

    switch (rest[0]) {
    case '=': advance(); return equals;
    case '{': {
        if (try_scan_rgb_color()) {
            return rgb_color;
        }
        advance();
        return left_brace;
    }
    case '}': advance(); return right_brace;
    case '>': {
        advance();
        if (current() == '=') {
            advance();
            return greater_or_equal;
        }
        return greater_than;
    }
    case '<': {
        advance();
        if (current() == '=') {
            advance();
            return less_or_equal;
        }
        return less_than;
    }
    case '!': {
        advance();
        if (current() == '=') {
            advance();
            return not_equals;
        }
        return std::nullopt;
    }
    default: break;
    }

    const bool is_negative_number
        = rest[0] == '-' && rest.length() > 1 && is_decimal_digit(rest[1]);
    if (is_decimal_digit(rest[0]) || is_negative_number) {
        return scan_number_or_date();
    }
    if (is_identifier_start(rest[0])) {
        return scan_identifier();
    }

    advance();
    return std::nullopt;
}

Token_Type Tokenizer::scan_number_or_date()
{
    const Size begin = m_cursor.begin;
    if (current() == '-') {
        advance();
    }
    while (is_decimal_digit(current()) || current() == '.') {
        advance();
    }
    const std::string_view text = m_source.substr(begin, m_cursor.begin - begin);
    return parse_date(text) ? date : number;
}

Token_Type Tokenizer::scan_identifier()
{
    const Size begin = m_cursor.begin;
    advance(match_identifier(remainder()));
    const std::string_view text = m_source.substr(begin, m_cursor.begin - begin);

    if (equals_ascii_ignore_case(text, "yes")) {
        return yes;
    }
    if (equals_ascii_ignore_case(text, "no")) {
        return no;
    }
    if (current() == '.' && try_scan_date_suffix(begin)) {
        return date;
    }
    return identifier;
}

bool Tokenizer::try_scan_date_suffix(Size token_begin)
{
    const Cursor saved = checkpoint();

    PARADOX_DATA_ASSERT(current() == '.');
    advance();
    advance(match_digits(remainder()));
    if (current() != '.') {
        rollback(saved);
        return false;
    }
    advance();
    advance(match_digits(remainder()));

    if (!parse_date(m_source.substr(token_begin, m_cursor.begin - token_begin))) {
        rollback(saved);
        return false;
    }
    return true;
}

bool Tokenizer::try_scan_rgb_color()
{
    const Cursor saved = checkpoint();
    const auto fail = [&] {
        rollback(saved);
        return false;
    };

    PARADOX_DATA_ASSERT(current() == '{');
    advance();
    skip_whitespace();

    for (int i = 0; i < 3; ++i) {
        const Size digits = match_digits(remainder());
        if (digits == 0) {
            return fail();
        }
        const std::optional<Int> component = parse_integer(remainder().substr(0, digits));
        if (!component || *component > max_color_component) {
            return fail();
        }
        advance(digits);
        skip_whitespace();
    }

    if (current() != '}') {
        return fail();
    }
    advance();
    // `{ 1 2 3 }4` is a brace followed by numbers rather than a color.
    if (is_decimal_digit(current())) {
        return fail();
    }
    return true;
}

} // namespace

void tokenize(std::vector<Token>& out, std::string_view source)
{
    Tokenizer tokenizer { source };
    tokenizer.tokenize(out);
}

std::vector<Token> tokenize(std::string_view source)
{
    std::vector<Token> result;
    tokenize(result, source);
    return result;
}

} // namespace paradox_data::script
