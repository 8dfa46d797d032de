#ifndef PARADOX_DATA_SCRIPT_INCLUDE_HPP
#define PARADOX_DATA_SCRIPT_INCLUDE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "script/fwd.hpp"
#include "script/parsing/parse_options.hpp"

namespace paradox_data::script {

/// @brief Matches a line of the form `@include "path"` or `@include path`, where `@include`
/// may be surrounded by whitespace and is case-insensitive.
/// @return The path without quotes, which may be empty, or `std::nullopt` if `line` is no
/// directive.
[[nodiscard]] std::optional<std::string_view> match_include_directive(std::string_view line);

/// @brief Resolves the path of a directive found in `current_file`.
/// Relative paths are relative to the directory of `current_file`, or to the working
/// directory if `current_file` is empty.
[[nodiscard]] std::filesystem::path resolve_include_path(std::string_view include_path,
                                                         const std::filesystem::path& current_file);

/// @brief Replaces `@include` directives with the contents of the files they refer to.
///
/// The included text is framed by `# Included from: <path>` and `# End include: <path>` comment
/// lines and is itself expanded recursively.
/// Cycles and nesting beyond `Parse_Options::max_include_depth` are reported as errors, and the
/// offending directive expands to nothing.
struct Include_Preprocessor {
private:
    Diagnostic_Consumer& m_diagnostics;
    Parsing_Metrics& m_metrics;
    Parse_Options m_options;
    /// @brief The files currently being expanded, outermost first.
    std::vector<std::filesystem::path> m_stack;
    Size m_depth = 0;

public:
    [[nodiscard]] Include_Preprocessor(Diagnostic_Consumer& diagnostics,
                                       Parsing_Metrics& metrics,
                                       const Parse_Options& options);

    /// @brief Expands all directives in `content`.
    /// @param content the text to expand
    /// @param file the file `content` was read from, or an empty path
    [[nodiscard]] std::string expand(std::string_view content, const std::filesystem::path& file);

private:
    std::string expand_directives(std::string_view content, const std::filesystem::path& file);

    std::string include(std::string_view include_path,
                        const std::filesystem::path& current_file,
                        const Local_Source_Span& directive_pos);
};

} // namespace paradox_data::script

#endif
