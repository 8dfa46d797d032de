#ifndef PARADOX_DATA_SCRIPT_PARSE_OPTIONS_HPP
#define PARADOX_DATA_SCRIPT_PARSE_OPTIONS_HPP

#include "common/config.hpp"
#include "common/encoding.hpp"

#include "script/fwd.hpp"

namespace paradox_data::script {

struct Parse_Options {
    /// @brief If `true`, `@include` directives are expanded when parsing files.
    bool expand_includes = true;
    /// @brief The maximum nesting of `@include` directives.
    Size max_include_depth = 10;
    /// @brief The encoding assumed for files without byte order mark which are not valid UTF-8.
    Text_Encoding fallback_encoding = Text_Encoding::windows_1252;
    /// @brief The maximum number of nested blocks.
    /// Deeper blocks are reported and skipped, which bounds the recursion of the parser.
    Size max_nesting_depth = 256;
    /// @brief If `true`, repeated keys within a block are collected into a list instead of the
    /// last statement replacing the previous ones.
    bool accumulate_repeated_keys = false;
};

} // namespace paradox_data::script

#endif
