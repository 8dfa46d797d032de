#include <chrono>
#include <variant>

#include "common/assert.hpp"
#include "common/diagnostics.hpp"
#include "common/to_chars.hpp"

#include "script/parsing/diagnostic.hpp"
#include "script/parsing/metrics.hpp"
#include "script/print.hpp"
#include "script/tokenization/token.hpp"
#include "script/tree/node.hpp"

namespace paradox_data::script {

namespace {

[[nodiscard]] Code_Span_Type code_span_type_of(Token_Type type)
{
    using enum Token_Type;
    switch (type) {
    case identifier: return Code_Span_Type::key;
    case string: return Code_Span_Type::string;
    case number: return Code_Span_Type::number;
    case date: return Code_Span_Type::date;
    case yes:
    case no: return Code_Span_Type::boolean;
    case equals:
    case greater_than:
    case less_than:
    case greater_or_equal:
    case less_or_equal:
    case not_equals: return Code_Span_Type::operation;
    case left_brace:
    case right_brace: return Code_Span_Type::bracket;
    case comment: return Code_Span_Type::comment;
    case rgb_color: return Code_Span_Type::color;
    case eof: return Code_Span_Type::text;
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid token type");
}

void print_value(Code_String& out, const Value& value)
{
    struct Visitor {
        Code_String& out;

        void operator()(const std::string& text) const
        {
            if (text.empty()) {
                out.append("\"\"", Code_Span_Type::string);
            }
            else {
                out.append(text, Code_Span_Type::string);
            }
        }
        void operator()(Int x) const
        {
            out.append_integer(x, Code_Span_Type::number);
        }
        void operator()(double x) const
        {
            out.append_double(x, Code_Span_Type::number);
        }
        void operator()(bool x) const
        {
            out.append(x ? "yes" : "no", Code_Span_Type::boolean);
        }
        void operator()(const Date& date) const
        {
            out.append(to_string(date), Code_Span_Type::date);
        }
    };
    std::visit(Visitor { out }, value);
}

struct Tree_Printer {
    Code_String& out;
    Tree_Print_Options options;

    void print(const Node& node, Size level)
    {
        out.append(options.indent_width * level, ' ');
        if (!node.get_key().empty()) {
            out.append(node.get_key(), node.is_date() ? Code_Span_Type::date : Code_Span_Type::key);
            out.append(' ');
            out.append('=', Code_Span_Type::operation);
            out.append(' ');
        }

        switch (node.get_kind()) {
        case Node_Kind::scalar: {
            const Value* value = node.get_scalar_value();
            PARADOX_DATA_ASSERT(value != nullptr);
            print_value(out, *value);
            out.append('\n');
            return;
        }
        case Node_Kind::list: //
            print_block(node.get_items(), '[', ']', level);
            return;
        case Node_Kind::object:
        case Node_Kind::date: //
            print_block(node.get_child_nodes(), '{', '}', level);
            return;
        }
        PARADOX_DATA_ASSERT_UNREACHABLE("invalid node kind");
    }

private:
    void print_block(std::span<const Node> nodes, char open, char close, Size level)
    {
        out.append(open, Code_Span_Type::bracket);
        out.append('\n');
        for (const Node& child : nodes) {
            print(child, level + 1);
        }
        out.append(options.indent_width * level, ' ');
        out.append(close, Code_Span_Type::bracket);
        out.append('\n');
    }
};

[[nodiscard]] double to_milliseconds(Duration d)
{
    return std::chrono::duration<double, std::milli>(d).count();
}

void append_milliseconds(Code_String& out, Duration d)
{
    out.build(Code_Span_Type::metric_value)
        .append(to_characters_fixed(to_milliseconds(d), 1).as_string())
        .append("ms");
}

void append_metric(Code_String& out, std::string_view name)
{
    out.append(name, Code_Span_Type::metric_name);
    out.append(": ");
}

} // namespace

void print_tokens(Code_String& out, std::span<const Token> tokens, std::string_view source)
{
    for (const Token& t : tokens) {
        const auto line_chars = to_characters(t.pos.line + 1);
        const auto column_chars = to_characters(t.pos.column + 1);
        const std::string_view line = line_chars.as_string();
        const std::string_view column = column_chars.as_string();
        out.append(line.length() < 2 ? 2 - line.length() : 0, ' ');
        out.append(line, Code_Span_Type::diagnostic_line_number);
        out.append(':', Code_Span_Type::punctuation);
        out.append(column.length() < 2 ? 2 - column.length() : 0, ' ');
        out.append(column, Code_Span_Type::diagnostic_line_number);
        out.append(": ");
        out.append(token_type_name(t.type), code_span_type_of(t.type));

        const std::string_view text = t.text_in(source);
        if (!text.empty()) {
            out.append('(');
            out.append(text);
            out.append(')');
        }
        out.append('\n');
    }
}

void print_tree(Code_String& out, const Node& node, Tree_Print_Options options)
{
    Tree_Printer { out, options }.print(node, 0);
}

std::string to_string(const Node& node)
{
    Code_String out;
    print_tree(out, node);
    return std::string(out.get_text());
}

void print_diagnostic(Code_String& out,
                      std::string_view file,
                      std::string_view source,
                      const Diagnostic& diagnostic)
{
    print_file_position(out, file, diagnostic.pos);
    out.append(' ');
    if (diagnostic.is_error()) {
        out.append("error:", Code_Span_Type::diagnostic_error);
    }
    else {
        out.append("warning:", Code_Span_Type::diagnostic_warning);
    }
    out.append(' ');
    out.append(diagnostic.message, Code_Span_Type::diagnostic_text);
    out.append(' ');
    out.build(Code_Span_Type::diagnostic_note)
        .append('[')
        .append(diagnostic_code_name(diagnostic.code))
        .append(']');
    out.append('\n');

    if (!source.empty()) {
        print_affected_line(out, source, diagnostic.pos);
    }
}

void print_metrics(Code_String& out, const Parsing_Metrics& metrics, bool detailed)
{
    const auto tokens_per_second_chars = to_characters_fixed(metrics.tokens_per_second(), 0);
    const std::string_view tokens_per_second = tokens_per_second_chars.as_string();

    if (!detailed) {
        out.append("Parsing Metrics: ");
        append_metric(out, "Total Time");
        append_milliseconds(out, metrics.total_time());
        out.append(", ");
        append_metric(out, "Tokens");
        out.append_integer(metrics.tokens_processed, Code_Span_Type::metric_value);
        out.append(", ");
        append_metric(out, "Throughput");
        out.append(tokens_per_second, Code_Span_Type::metric_value);
        out.append(" tokens/sec, ");
        append_metric(out, "Errors");
        out.append_integer(metrics.error_count, Code_Span_Type::metric_value);
        out.append(", ");
        append_metric(out, "Warnings");
        out.append_integer(metrics.warning_count, Code_Span_Type::metric_value);
        out.append('\n');
        return;
    }

    const auto timing_line = [&](std::string_view indent, std::string_view name, Duration d) {
        out.append(indent);
        append_metric(out, name);
        append_milliseconds(out, d);
        out.append('\n');
    };
    const auto count_line = [&](std::string_view indent, std::string_view name, Size value) {
        out.append(indent);
        append_metric(out, name);
        out.append_integer(value, Code_Span_Type::metric_value);
        out.append('\n');
    };

    out.append("=== Parsing Performance Metrics ===\n");
    timing_line("", "Total Time", metrics.total_time());
    timing_line("  - ", "File I/O", metrics.file_io_time);
    timing_line("  - ", "Preprocessing", metrics.preprocessing_time);
    timing_line("  - ", "Tokenization", metrics.tokenization_time);
    timing_line("  - ", "Parsing", metrics.parsing_time);
    count_line("", "Input Size (bytes)", metrics.input_size_bytes);
    count_line("", "Tokens Processed", metrics.tokens_processed);
    count_line("", "Lines Processed", metrics.lines_processed);

    append_metric(out, "Throughput");
    out.append(tokens_per_second, Code_Span_Type::metric_value);
    out.append(" tokens/sec, ");
    const auto kilobytes_per_second = to_characters_fixed(metrics.bytes_per_second() / 1024, 1);
    out.append(kilobytes_per_second.as_string(), Code_Span_Type::metric_value);
    out.append(" KB/sec\n");

    count_line("", "Errors", metrics.error_count);
    count_line("", "Warnings", metrics.warning_count);

    if (!metrics.custom_timings.empty()) {
        out.append("Custom Timings:\n");
        for (const auto& [name, duration] : metrics.custom_timings) {
            timing_line("  - ", name, duration);
        }
    }
    if (!metrics.counters.empty()) {
        out.append("Counters:\n");
        for (const auto& [name, value] : metrics.counters) {
            count_line("  - ", name, value);
        }
    }
}

} // namespace paradox_data::script
