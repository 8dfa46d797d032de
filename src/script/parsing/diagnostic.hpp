#ifndef PARADOX_DATA_SCRIPT_DIAGNOSTIC_HPP
#define PARADOX_DATA_SCRIPT_DIAGNOSTIC_HPP

#include <string>
#include <string_view>

#include "common/source_position.hpp"

#include "script/fwd.hpp"

namespace paradox_data::script {

enum struct Severity : Default_Underlying { warning, error };

enum struct Diagnostic_Code : Default_Underlying {
    /// @brief A key is not followed by `=`.
    expected_equals,
    /// @brief `=` is not followed by a value or block.
    expected_value,
    /// @brief A list helper expected an opening `{`.
    expected_left_brace,
    /// @brief A block is not closed before the end of the file.
    expected_right_brace,
    /// @brief Blocks are nested deeper than `Parse_Options::max_nesting_depth`.
    nesting_too_deep,
    /// @brief A token appeared where a statement was expected.
    unexpected_token,
    /// @brief A token appeared in a list which cannot be a list item.
    unexpected_list_item,
    /// @brief A number could not be converted to an integer.
    invalid_integer,
    /// @brief The target of an `@include` directive does not exist.
    include_not_found,
    /// @brief An `@include` directive refers to a file which is already being included.
    circular_include,
    /// @brief `@include` directives are nested deeper than permitted.
    include_depth_exceeded,
    /// @brief The target of an `@include` directive could not be read or decoded.
    include_read_error,
    /// @brief An `@include` directive has no path.
    empty_include_path,
};

[[nodiscard]] std::string_view diagnostic_code_name(Diagnostic_Code code);

/// @brief Returns a general description of the problem, independent of the specific occurrence.
[[nodiscard]] std::string_view to_prose(Diagnostic_Code code);

/// @brief A content problem found during preprocessing or parsing.
/// Diagnostics never abort parsing; they are collected by a `Diagnostic_Consumer`.
struct Diagnostic {
    Severity severity;
    Diagnostic_Code code;
    /// @brief The position of the offending token or directive.
    Local_Source_Span pos;
    /// @brief A message describing this specific occurrence.
    std::string message;

    [[nodiscard]] bool is_error() const noexcept
    {
        return severity == Severity::error;
    }
};

} // namespace paradox_data::script

#endif
