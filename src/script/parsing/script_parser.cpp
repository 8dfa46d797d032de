#include <string>
#include <vector>

#include "common/assert.hpp"
#include "common/encoding.hpp"
#include "common/parse.hpp"

#include "script/parsing/diagnostic.hpp"
#include "script/parsing/include.hpp"
#include "script/parsing/metrics.hpp"
#include "script/parsing/script_parser.hpp"
#include "script/parsing/token_cursor.hpp"
#include "script/tree/date.hpp"
#include "script/tree/value.hpp"

namespace paradox_data::script {

namespace {

using enum Token_Type;

/// @brief Where a statement appears, which decides where error recovery stops.
enum struct Context : Default_Underlying { root, block };

[[nodiscard]] bool is_key_token(Token_Type type) noexcept
{
    return type == identifier || type == date;
}

struct Grammar {
    Token_Cursor& cursor;
    const Parse_Options& options;
    Size depth = 0;

    [[nodiscard]] Node parse_file()
    {
        Node root = Node::object("root");
        while (true) {
            cursor.skip_comments();
            const Token& next = cursor.peek();
            if (next.type == eof) {
                break;
            }
            if (is_key_token(next.type)) {
                if (std::optional<Node> statement = parse_statement(Context::root)) {
                    add_to_block(root, std::move(*statement));
                }
                continue;
            }
            cursor.warning(Diagnostic_Code::unexpected_token, next,
                           "Unexpected " + cursor.describe(next) + " where a statement was "
                           "expected.");
            cursor.consume();
        }
        return root;
    }

private:
    void add_to_block(Node& block, Node&& child)
    {
        if (options.accumulate_repeated_keys) {
            block.add_child_accumulating(std::move(child));
        }
        else {
            block.add_child(std::move(child));
        }
    }

    /// @brief Parses `key = value` or `key = { ... }`, where the next token is the key.
    /// @return The statement's node, or `std::nullopt` if the statement was malformed.
    [[nodiscard]] std::optional<Node> parse_statement(Context context)
    {
        const Token& key_token = cursor.consume();
        PARADOX_DATA_ASSERT(is_key_token(key_token.type));
        std::string key { cursor.text(key_token) };

        cursor.skip_comments();
        if (!cursor.require(equals, Diagnostic_Code::expected_equals)) {
            // Within a block, this stops before an unbalanced `}` rather than consuming it.
            skip_to_next_statement(context);
            return {};
        }

        cursor.skip_comments();
        const Token& next = cursor.peek();
        if (next.type == left_brace) {
            if (key_token.type != date) {
                return parse_block(std::move(key));
            }
            if (!enter_block(next)) {
                return {};
            }
            const std::optional<Date> block_date = parse_date(key);
            PARADOX_DATA_ASSERT(block_date.has_value());
            Node result = Node::date(std::move(key), *block_date);
            parse_object_body(result, cursor.consume());
            --depth;
            return result;
        }
        if (is_value_token(next.type)) {
            return Node::scalar(std::move(key), parse_value(cursor.consume()));
        }

        cursor.error(Diagnostic_Code::expected_value, next,
                     "Expected a value or '{' after '" + key + " =', but got "
                         + cursor.describe(next) + ".");
        return {};
    }

    /// @brief Checks the nesting limit before the block opened by `open` is parsed.
    /// If the limit is reached, the block is reported and skipped.
    /// @return `true` if the block may be parsed, in which case `depth` was incremented.
    [[nodiscard]] bool enter_block(const Token& open)
    {
        PARADOX_DATA_ASSERT(open.type == left_brace);
        if (depth < options.max_nesting_depth) {
            ++depth;
            return true;
        }
        cursor.error(Diagnostic_Code::nesting_too_deep, open,
                     "Blocks are nested deeper than " + std::to_string(options.max_nesting_depth)
                         + " levels; this block is skipped.");
        cursor.skip_balanced_braces();
        return false;
    }

    /// @brief Parses `{ ... }` as an object, or as a list if the body starts with an item.
    /// @return The block, or `std::nullopt` if it was skipped for being nested too deeply.
    [[nodiscard]] std::optional<Node> parse_block(std::string key)
    {
        if (!enter_block(cursor.peek())) {
            return {};
        }
        const Token& open = cursor.consume();

        const Token& first = cursor.peek_significant(0);
        const bool is_list = first.type == left_brace
            || (is_value_token(first.type) && cursor.peek_significant(1).type != equals);

        Node result = is_list ? Node::list(std::move(key)) : Node::object(std::move(key));
        if (is_list) {
            parse_list_body(result, open);
        }
        else {
            parse_object_body(result, open);
        }
        --depth;
        return result;
    }

    void parse_object_body(Node& block, const Token& open)
    {
        while (true) {
            cursor.skip_comments();
            const Token& next = cursor.peek();
            if (next.type == right_brace) {
                cursor.consume();
                return;
            }
            if (next.type == eof) {
                report_unclosed(open);
                return;
            }
            if (is_key_token(next.type)) {
                if (std::optional<Node> statement = parse_statement(Context::block)) {
                    add_to_block(block, std::move(*statement));
                }
                continue;
            }
            cursor.warning(Diagnostic_Code::unexpected_token, next,
                           "Unexpected " + cursor.describe(next) + " in block.");
            cursor.consume();
        }
    }

    void parse_list_body(Node& list, const Token& open)
    {
        while (true) {
            cursor.skip_comments();
            const Token& next = cursor.peek();
            switch (next.type) {
            case right_brace: cursor.consume(); return;
            case eof: report_unclosed(open); return;
            case left_brace:
                if (std::optional<Node> block = parse_block({})) {
                    list.add_item(std::move(*block));
                }
                continue;
            default: break;
            }

            if (!is_value_token(next.type)) {
                cursor.warning(Diagnostic_Code::unexpected_token, next,
                               "Unexpected " + cursor.describe(next) + " in list.");
                cursor.consume();
                continue;
            }
            if (cursor.peek_significant(1).type == equals) {
                cursor.warning(Diagnostic_Code::unexpected_list_item, next,
                               "Assignment to " + cursor.describe(next)
                                   + " cannot be a list item and is ignored.");
                if (is_key_token(next.type)) {
                    // Parsed only to skip it as a unit.
                    (void)parse_statement(Context::block);
                }
                else {
                    cursor.consume();
                }
                continue;
            }
            list.add_item(Node::scalar({}, parse_value(cursor.consume())));
        }
    }

    void report_unclosed(const Token& open)
    {
        cursor.error(Diagnostic_Code::expected_right_brace, cursor.peek(),
                     "Expected '}' to close the block opened at line "
                         + std::to_string(open.pos.line + 1) + ", but got end of file.");
    }

    /// @brief Skips tokens until a token which can start a statement, treating `{ ... }`
    /// regions as a unit. Within a block, an unbalanced `}` also ends the skip.
    void skip_to_next_statement(Context context)
    {
        while (true) {
            const Token& next = cursor.peek();
            if (next.type == eof || is_key_token(next.type)) {
                return;
            }
            if (next.type == left_brace) {
                cursor.skip_balanced_braces();
            }
            else if (next.type == right_brace && context == Context::block) {
                return;
            }
            else {
                cursor.consume();
            }
        }
    }

    [[nodiscard]] Value parse_value(const Token& token)
    {
        const std::string_view text = cursor.text(token);
        switch (token.type) {
        case string: return unquote_string_literal(text);

        case number:
            if (const std::optional<Int> integer = parse_integer(text)) {
                return *integer;
            }
            if (const std::optional<double> floating = parse_double(text)) {
                return *floating;
            }
            return std::string(text);

        case yes: return true;
        case no: return false;

        case date:
            if (const std::optional<Date> result = parse_date(text)) {
                return *result;
            }
            return std::string(text);

        case identifier:
            if (const std::optional<bool> boolean = parse_boolean(text)) {
                return *boolean;
            }
            return std::string(text);

        default: return std::string(text);
        }
    }
};

} // namespace

Script_Parser::Script_Parser(const Parse_Options& options)
    : m_options(options)
{
}

Node Script_Parser::parse_with_includes(std::string_view source, const std::filesystem::path& file)
{
    reset();
    if (!m_options.expand_includes) {
        return parse_text(source);
    }

    std::string expanded;
    {
        Scoped_Timer timer { m_metrics.preprocessing_time };
        Include_Preprocessor preprocessor { m_diagnostics, m_metrics, m_options };
        expanded = preprocessor.expand(source, file);
    }
    return parse_text(expanded);
}

Result<Node, IO_Error> Script_Parser::parse_file(std::string_view path)
{
    reset();
    m_file_source.clear();

    Result<std::string, IO_Error> text = [&] {
        Scoped_Timer timer { m_metrics.file_io_time };
        return file_to_utf8(path, m_options.fallback_encoding);
    }();
    if (!text) {
        return text.error();
    }
    m_file_source = std::move(*text);

    if (!m_options.expand_includes) {
        return parse_text(m_file_source);
    }
    std::string expanded;
    {
        Scoped_Timer timer { m_metrics.preprocessing_time };
        Include_Preprocessor preprocessor { m_diagnostics, m_metrics, m_options };
        expanded = preprocessor.expand(m_file_source, std::filesystem::path { std::string(path) });
    }
    return parse_text(expanded);
}

std::optional<Node> Script_Parser::try_parse(std::string_view source)
{
    Node result = parse(source);
    if (has_errors()) {
        return {};
    }
    return result;
}

Node Script_Parser::parse_tokens(Token_Cursor& cursor)
{
    Grammar grammar { .cursor = cursor, .options = m_options };
    return grammar.parse_file();
}

} // namespace paradox_data::script
