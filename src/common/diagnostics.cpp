#include <ostream>

#include "common/diagnostics.hpp"
#include "common/to_chars.hpp"

namespace paradox_data {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text: return ansi::reset;

    case key: return ansi::h_white;

    case number:
    case date: return ansi::h_cyan;

    case string: return ansi::h_green;

    case boolean: return ansi::h_magenta;

    case color: return ansi::h_yellow;

    case comment:
    case operation: return ansi::h_black;

    case bracket:
    case punctuation: return ansi::black;

    case error: return ansi::h_red;

    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position: return ansi::h_black;

    case diagnostic_error: return ansi::h_red;

    case diagnostic_warning:
    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_note: return ansi::h_white;

    case diagnostic_position_indicator: return ansi::h_green;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case metric_name: return ansi::h_blue;

    case metric_value: return ansi::h_cyan;
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("Unknown code span type.");
}

} // namespace

std::string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case file_not_found: //
        return "The file does not exist.";
    case cannot_open: //
        return "Failed to open the file. Is the path correct and readable?";
    case read_error: //
        return "Failed to read the file contents.";
    case decode_error: //
        return "The file contents could not be decoded to text. Is the UTF-16 data malformed?";
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid io error code");
}

std::string_view find_line(std::string_view source, Size index)
{
    PARADOX_DATA_ASSERT(index <= source.size());

    // EOF positions and positions of a newline character belong to the line which ends there.
    const Size end = index == source.size() || source[index] == '\n'
        ? index
        : std::min(source.find('\n', index), source.size());

    const Size previous_newline
        = index == 0 ? std::string_view::npos : source.rfind('\n', index - 1);
    const Size begin = previous_newline == std::string_view::npos ? 0 : previous_newline + 1;

    return source.substr(begin, end - begin);
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool colon_suffix)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file)
        .append(':')
        .append_integer(pos.line + 1)
        .append(':')
        .append_integer(pos.column + 1);
    if (colon_suffix) {
        builder.append(':');
    }
}

void print_affected_line(Code_String& out,
                         std::string_view source,
                         const Local_Source_Position& pos)
{
    std::string_view line = find_line(source, pos.begin);
    if (line.ends_with('\r')) {
        line.remove_suffix(1);
    }

    const auto line_chars = to_characters(pos.line + 1);
    constexpr Size pad_max = 6;
    const Size pad_length = pad_max - std::min(line_chars.length, Size { pad_max - 1 });
    out.append(pad_length, ' ');
    out.append_integer(pos.line + 1, Code_Span_Type::diagnostic_line_number);
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    if (!line.empty()) {
        out.append(line, Code_Span_Type::diagnostic_code_citation);
    }
    out.append('\n');

    const Size align_length = std::max(pad_max, line_chars.length + 1);
    out.append(align_length, ' ');
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(pos.column, ' ');
    out.append('^', Code_Span_Type::diagnostic_position_indicator);
    out.append('\n');
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    // std::source_location is one-based already.
    const Local_Source_Position pos { .line = error.location.line() - 1,
                                      .column = error.location.column() - 1,
                                      .begin = {} };
    print_file_position(out, error.location.file_name(), pos);
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, const IO_Error& error)
{
    print_location_of_file(out, error.path);
    out.append(' ');
    out.append("error:", Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice
        = "This is an internal error in paradox-data. Please report this bug.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (Code_String_Span span : string) {
        const Size previous_end = previous.end();
        PARADOX_DATA_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.end();
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace paradox_data
