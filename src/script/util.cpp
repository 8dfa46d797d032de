#include "common/assert.hpp"
#include "common/config.hpp"

#include "script/parsing/diagnostic.hpp"
#include "script/tokenization/token_type.hpp"

namespace paradox_data::script {

std::string_view token_type_name(Token_Type type)
{
    using enum Token_Type;

    switch (type) {
        PARADOX_DATA_ENUM_STRING_CASE(identifier);
        PARADOX_DATA_ENUM_STRING_CASE(string);
        PARADOX_DATA_ENUM_STRING_CASE(number);
        PARADOX_DATA_ENUM_STRING_CASE(date);
        PARADOX_DATA_ENUM_STRING_CASE(yes);
        PARADOX_DATA_ENUM_STRING_CASE(no);
        PARADOX_DATA_ENUM_STRING_CASE(equals);
        PARADOX_DATA_ENUM_STRING_CASE(left_brace);
        PARADOX_DATA_ENUM_STRING_CASE(right_brace);
        PARADOX_DATA_ENUM_STRING_CASE(greater_than);
        PARADOX_DATA_ENUM_STRING_CASE(less_than);
        PARADOX_DATA_ENUM_STRING_CASE(greater_or_equal);
        PARADOX_DATA_ENUM_STRING_CASE(less_or_equal);
        PARADOX_DATA_ENUM_STRING_CASE(not_equals);
        PARADOX_DATA_ENUM_STRING_CASE(comment);
        PARADOX_DATA_ENUM_STRING_CASE(rgb_color);
        PARADOX_DATA_ENUM_STRING_CASE(eof);
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid token type");
}

std::string_view token_type_readable_name(Token_Type type)
{
    using enum Token_Type;

    switch (type) {
    case identifier: return "identifier";
    case string: return "string";
    case number: return "number";
    case date: return "date";
    case yes: return "'yes'";
    case no: return "'no'";
    case equals: return "'='";
    case left_brace: return "'{'";
    case right_brace: return "'}'";
    case greater_than: return "'>'";
    case less_than: return "'<'";
    case greater_or_equal: return "'>='";
    case less_or_equal: return "'<='";
    case not_equals: return "'!='";
    case comment: return "comment";
    case rgb_color: return "color";
    case eof: return "end of file";
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid token type");
}

std::string_view diagnostic_code_name(Diagnostic_Code code)
{
    using enum Diagnostic_Code;

    switch (code) {
        PARADOX_DATA_ENUM_STRING_CASE(expected_equals);
        PARADOX_DATA_ENUM_STRING_CASE(expected_value);
        PARADOX_DATA_ENUM_STRING_CASE(expected_left_brace);
        PARADOX_DATA_ENUM_STRING_CASE(expected_right_brace);
        PARADOX_DATA_ENUM_STRING_CASE(nesting_too_deep);
        PARADOX_DATA_ENUM_STRING_CASE(unexpected_token);
        PARADOX_DATA_ENUM_STRING_CASE(unexpected_list_item);
        PARADOX_DATA_ENUM_STRING_CASE(invalid_integer);
        PARADOX_DATA_ENUM_STRING_CASE(include_not_found);
        PARADOX_DATA_ENUM_STRING_CASE(circular_include);
        PARADOX_DATA_ENUM_STRING_CASE(include_depth_exceeded);
        PARADOX_DATA_ENUM_STRING_CASE(include_read_error);
        PARADOX_DATA_ENUM_STRING_CASE(empty_include_path);
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid diagnostic code");
}

std::string_view to_prose(Diagnostic_Code code)
{
    using enum Diagnostic_Code;

    switch (code) {
    case expected_equals: return "A key must be followed by '='.";
    case expected_value: return "An '=' must be followed by a value or a block.";
    case expected_left_brace: return "Expected '{' to open a list.";
    case expected_right_brace: return "A block was not closed before the end of the file.";
    case nesting_too_deep: return "Blocks are nested too deeply; the innermost was skipped.";
    case unexpected_token: return "This token cannot start a statement and was skipped.";
    case unexpected_list_item: return "Assignments are not permitted inside a list.";
    case invalid_integer: return "The number cannot be represented as an integer.";
    case include_not_found: return "The included file does not exist.";
    case circular_include: return "The file includes itself, directly or indirectly.";
    case include_depth_exceeded: return "Include directives are nested too deeply.";
    case include_read_error: return "The included file could not be read or decoded.";
    case empty_include_path: return "The include directive has no path.";
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid diagnostic code");
}

} // namespace paradox_data::script
