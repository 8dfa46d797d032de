#ifndef PARADOX_DATA_SCRIPT_SCRIPT_PARSER_HPP
#define PARADOX_DATA_SCRIPT_SCRIPT_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "common/io_error.hpp"
#include "common/result.hpp"

#include "script/fwd.hpp"
#include "script/parsing/basic_parser.hpp"
#include "script/parsing/parse_options.hpp"
#include "script/tree/node.hpp"

namespace paradox_data::script {

/// @brief Parses game script text into a tree of `Node`s rooted in an object with the key
/// `"root"`.
///
/// Malformed statements are reported and skipped; the remaining statements are still parsed.
/// A parser instance is not thread-safe, but independent instances may be used concurrently.
struct Script_Parser final : Basic_Parser<Node> {
private:
    Parse_Options m_options;
    std::string m_file_source;

public:
    [[nodiscard]] explicit Script_Parser(const Parse_Options& options = {});

    [[nodiscard]] const Parse_Options& get_options() const noexcept
    {
        return m_options;
    }

    /// @brief Parses `source` as-is. `@include` directives are not expanded and end up as
    /// stray tokens.
    using Basic_Parser<Node>::parse;

    /// @brief Expands the `@include` directives of `source` and parses the result.
    /// If `Parse_Options::expand_includes` is `false`, this is equivalent to `parse`.
    /// @param source the text to parse
    /// @param file the file `source` was read from; relative include paths are resolved
    /// against its directory, or against the working directory if `file` is empty
    [[nodiscard]] Node parse_with_includes(std::string_view source,
                                           const std::filesystem::path& file = {});

    /// @brief Reads, decodes, preprocesses, and parses the file at `path`.
    /// @return The tree, or an `IO_Error` if the file could not be read or decoded.
    /// Problems within the content are reported through `errors()` and `warnings()` instead.
    [[nodiscard]] Result<Node, IO_Error> parse_file(std::string_view path);

    /// @brief Returns the decoded text of the file read by the last call to `parse_file`, before
    /// include expansion. Empty if that call failed to read the file.
    [[nodiscard]] std::string_view get_file_source() const noexcept
    {
        return m_file_source;
    }

    /// @brief Parses `source` and returns the tree only if no errors were reported.
    [[nodiscard]] std::optional<Node> try_parse(std::string_view source);

protected:
    Node parse_tokens(Token_Cursor& cursor) final;
};

} // namespace paradox_data::script

#endif
