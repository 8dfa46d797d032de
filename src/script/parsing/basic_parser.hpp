#ifndef PARADOX_DATA_SCRIPT_BASIC_PARSER_HPP
#define PARADOX_DATA_SCRIPT_BASIC_PARSER_HPP

#include <string_view>
#include <vector>

#include "common/parse.hpp"

#include "script/fwd.hpp"
#include "script/parsing/diagnostic_consumer.hpp"
#include "script/parsing/metrics.hpp"
#include "script/parsing/token_cursor.hpp"
#include "script/tokenization/tokenize.hpp"

namespace paradox_data::script {

/// @brief The common frame of every script parser.
///
/// `parse` resets the diagnostics and metrics of the previous call, tokenizes the text,
/// measures both phases, and delegates the construction of the result to `parse_tokens`.
/// Derived parsers only decide what to build from the tokens, using the helpers of
/// `Token_Cursor`.
/// @tparam T the type of the parse result
template <typename T>
struct Basic_Parser {
protected:
    Diagnostic_Log m_diagnostics;
    Parsing_Metrics m_metrics;

public:
    virtual ~Basic_Parser() = default;

    /// @brief Parses `source`.
    /// Parsing never fails; problems are reported through `errors()` and `warnings()`.
    [[nodiscard]] T parse(std::string_view source)
    {
        reset();
        return parse_text(source);
    }

    /// @brief Returns the errors of the last call.
    [[nodiscard]] const std::vector<Diagnostic>& errors() const noexcept
    {
        return m_diagnostics.errors;
    }

    /// @brief Returns the warnings of the last call.
    [[nodiscard]] const std::vector<Diagnostic>& warnings() const noexcept
    {
        return m_diagnostics.warnings;
    }

    [[nodiscard]] bool has_errors() const noexcept
    {
        return !m_diagnostics.ok();
    }

    /// @brief Returns the metrics of the last call.
    [[nodiscard]] const Parsing_Metrics& metrics() const noexcept
    {
        return m_metrics;
    }

protected:
    /// @brief Builds the result from the tokens.
    /// The cursor reports diagnostics to this parser.
    virtual T parse_tokens(Token_Cursor& cursor) = 0;

    void reset()
    {
        m_diagnostics.clear();
        m_metrics.reset();
    }

    /// @brief Like `parse`, but without resetting diagnostics and metrics first.
    /// This lets file entry points record I/O and preprocessing before parsing.
    [[nodiscard]] T parse_text(std::string_view source)
    {
        m_metrics.input_size_bytes = source.size();
        m_metrics.lines_processed = count_lines(source);

        std::vector<Token> tokens;
        {
            Scoped_Timer timer { m_metrics.tokenization_time };
            tokenize(tokens, source);
        }
        // The trailing eof token is not counted.
        m_metrics.tokens_processed = tokens.size() - 1;

        Token_Cursor cursor { tokens, source, m_diagnostics };
        T result = [&] {
            Scoped_Timer timer { m_metrics.parsing_time };
            return parse_tokens(cursor);
        }();

        m_metrics.error_count = m_diagnostics.error_count();
        m_metrics.warning_count = m_diagnostics.warning_count();
        return result;
    }
};

} // namespace paradox_data::script

#endif
