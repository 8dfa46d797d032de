#ifndef PARADOX_DATA_CODE_SPAN_TYPE_HPP
#define PARADOX_DATA_CODE_SPAN_TYPE_HPP

#include "common/fwd.hpp"

namespace paradox_data {

/// @brief The type of a code span in highlighted output.
/// Script tokens and tree dumps all fall into these categories for the purpose of coloring.
enum struct Code_Span_Type : Default_Underlying {
    text,
    key,
    string,
    number,
    date,
    boolean,
    color,
    comment,
    operation,
    bracket,
    punctuation,
    error,
    diagnostic_text,
    diagnostic_code_position,
    diagnostic_error,
    diagnostic_warning,
    diagnostic_note,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_position_indicator,
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    metric_name,
    metric_value,
};

} // namespace paradox_data

#endif
