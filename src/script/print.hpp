#ifndef PARADOX_DATA_SCRIPT_PRINT_HPP
#define PARADOX_DATA_SCRIPT_PRINT_HPP

#include <span>
#include <string>
#include <string_view>

#include "common/code_string.hpp"

#include "script/fwd.hpp"

namespace paradox_data::script {

/// @brief Prints one line per token with its one-based position, type, and text.
void print_tokens(Code_String& out, std::span<const Token> tokens, std::string_view source);

struct Tree_Print_Options {
    Size indent_width = 2;
};

/// @brief Prints `node` and its descendants, one node per line.
/// Objects and date blocks are enclosed in `{ }`, lists in `[ ]`.
void print_tree(Code_String& out, const Node& node, Tree_Print_Options options = {});

/// @brief Returns the output of `print_tree` without highlighting.
[[nodiscard]] std::string to_string(const Node& node);

/// @brief Prints a diagnostic with its position, message, and the affected line of `source`.
/// @param file the name of the file, printed as part of the position
/// @param source the text the diagnostic refers to, possibly empty
void print_diagnostic(Code_String& out,
                      std::string_view file,
                      std::string_view source,
                      const Diagnostic& diagnostic);

/// @brief Prints a one-line summary of `metrics`, or a multi-line report if `detailed`.
void print_metrics(Code_String& out, const Parsing_Metrics& metrics, bool detailed = false);

} // namespace paradox_data::script

#endif
