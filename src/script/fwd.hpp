#ifndef PARADOX_DATA_SCRIPT_FWD_HPP
#define PARADOX_DATA_SCRIPT_FWD_HPP

#include "common/config.hpp"

namespace paradox_data::script {

// tokenization/token_type.hpp
enum struct Token_Type : Default_Underlying;

// tokenization/token.hpp
struct Token;

// tree/date.hpp
struct Date;

// tree/value.hpp
struct Rgb_Color;

// tree/node.hpp
enum struct Node_Kind : Default_Underlying;
struct Node;
struct Invalid_Node_Operation;

// parsing/diagnostic.hpp
enum struct Severity : Default_Underlying;
enum struct Diagnostic_Code : Default_Underlying;
struct Diagnostic;

// parsing/diagnostic_consumer.hpp
struct Diagnostic_Consumer;
struct Diagnostic_Log;

// parsing/metrics.hpp
struct Parsing_Metrics;
struct Scoped_Timer;

// parsing/token_cursor.hpp
struct Token_Cursor;

// parsing/parse_options.hpp
struct Parse_Options;

// parsing/script_parser.hpp
struct Script_Parser;

// parsing/include.hpp
struct Include_Preprocessor;

// parsing/batch.hpp
struct Parse_Report;

} // namespace paradox_data::script

#endif
