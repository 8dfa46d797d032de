#include <future>

#include "script/parsing/batch.hpp"
#include "script/parsing/script_parser.hpp"

namespace paradox_data::script {

namespace {

[[nodiscard]] Parse_Report make_report(Script_Parser& parser, Node&& root)
{
    return { .root = std::move(root),
             .errors = parser.errors(),
             .warnings = parser.warnings(),
             .metrics = parser.metrics() };
}

/// @brief Launches `task(element)` asynchronously for every element and collects the results
/// in order.
template <typename R, typename F>
[[nodiscard]] std::vector<R> run_concurrently(std::span<const std::string_view> inputs, F task)
{
    std::vector<std::future<R>> futures;
    futures.reserve(inputs.size());
    for (const std::string_view input : inputs) {
        futures.push_back(std::async(std::launch::async, task, input));
    }

    std::vector<R> results;
    results.reserve(futures.size());
    for (std::future<R>& future : futures) {
        // Rethrows exceptions of the task, such as Assertion_Error.
        results.push_back(future.get());
    }
    return results;
}

} // namespace

std::vector<Parse_Report> parse_concurrently(std::span<const std::string_view> sources,
                                             const Parse_Options& options)
{
    return run_concurrently<Parse_Report>(sources, [&options](std::string_view source) {
        Script_Parser parser { options };
        Node root = parser.parse(source);
        return make_report(parser, std::move(root));
    });
}

std::vector<Result<Parse_Report, IO_Error>>
parse_files_concurrently(std::span<const std::string_view> paths, const Parse_Options& options)
{
    using File_Result = Result<Parse_Report, IO_Error>;
    return run_concurrently<File_Result>(paths, [&options](std::string_view path) -> File_Result {
        Script_Parser parser { options };
        Result<Node, IO_Error> root = parser.parse_file(path);
        if (!root) {
            return root.error();
        }
        return make_report(parser, std::move(*root));
    });
}

} // namespace paradox_data::script
