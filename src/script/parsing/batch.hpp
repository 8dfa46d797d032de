#ifndef PARADOX_DATA_SCRIPT_BATCH_HPP
#define PARADOX_DATA_SCRIPT_BATCH_HPP

#include <span>
#include <string_view>
#include <vector>

#include "common/io_error.hpp"
#include "common/result.hpp"

#include "script/fwd.hpp"
#include "script/parsing/diagnostic.hpp"
#include "script/parsing/metrics.hpp"
#include "script/parsing/parse_options.hpp"
#include "script/tree/node.hpp"

namespace paradox_data::script {

/// @brief The complete outcome of parsing one document.
struct Parse_Report {
    Node root;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    Parsing_Metrics metrics;

    [[nodiscard]] bool ok() const noexcept
    {
        return errors.empty();
    }
};

/// @brief Parses each of `sources` on its own thread with its own `Script_Parser`.
/// @return One report per source, in the order of `sources`.
[[nodiscard]] std::vector<Parse_Report>
parse_concurrently(std::span<const std::string_view> sources, const Parse_Options& options = {});

/// @brief Like `parse_concurrently`, but reads each file with `Script_Parser::parse_file`.
[[nodiscard]] std::vector<Result<Parse_Report, IO_Error>>
parse_files_concurrently(std::span<const std::string_view> paths,
                         const Parse_Options& options = {});

} // namespace paradox_data::script

#endif
