#include <algorithm>
#include <system_error>

#include "common/assert.hpp"
#include "common/encoding.hpp"
#include "common/io.hpp"
#include "common/parse.hpp"
#include "common/source_position.hpp"
#include "common/to_chars.hpp"

#include "script/parsing/diagnostic_consumer.hpp"
#include "script/parsing/include.hpp"
#include "script/parsing/metrics.hpp"

namespace paradox_data::script {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view include_keyword = "@include";

/// @brief Returns an absolute path without `.` or `..` components, resolving symbolic links of
/// existing path components.
[[nodiscard]] fs::path normalize(const fs::path& path)
{
    std::error_code error;
    fs::path result = fs::weakly_canonical(path, error);
    if (error) {
        result = fs::absolute(path, error);
        if (error) {
            return path.lexically_normal();
        }
    }
    return result.lexically_normal();
}

[[nodiscard]] std::string_view trim_quotes(std::string_view str) noexcept
{
    constexpr auto is_quote = [](char c) { return c == '"' || c == '\''; };
    while (!str.empty() && is_quote(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_quote(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

} // namespace

std::optional<std::string_view> match_include_directive(std::string_view line)
{
    const std::string_view trimmed = trim(line);
    if (trimmed.length() < include_keyword.length()
        || !equals_ascii_ignore_case(trimmed.substr(0, include_keyword.length()),
                                     include_keyword)) {
        return {};
    }
    return trim_quotes(trim(trimmed.substr(include_keyword.length())));
}

fs::path resolve_include_path(std::string_view include_path, const fs::path& current_file)
{
    const fs::path path { std::string(include_path) };
    if (path.is_absolute()) {
        return normalize(path);
    }
    if (current_file.empty()) {
        std::error_code error;
        const fs::path working_directory = fs::current_path(error);
        return normalize(error ? path : working_directory / path);
    }
    return normalize(current_file.parent_path() / path);
}

Include_Preprocessor::Include_Preprocessor(Diagnostic_Consumer& diagnostics,
                                           Parsing_Metrics& metrics,
                                           const Parse_Options& options)
    : m_diagnostics(diagnostics)
    , m_metrics(metrics)
    , m_options(options)
{
}

std::string Include_Preprocessor::expand(std::string_view content, const fs::path& file)
{
    PARADOX_DATA_ASSERT(m_stack.empty());
    if (file.empty()) {
        return expand_directives(content, file);
    }

    m_stack.push_back(normalize(file));
    std::string result = expand_directives(content, file);
    m_stack.pop_back();
    return result;
}

std::string Include_Preprocessor::expand_directives(std::string_view content, const fs::path& file)
{
    std::string result;
    result.reserve(content.size());

    Size line_number = 0;
    for (Size begin = 0; begin < content.size(); ++line_number) {
        const Size newline = content.find('\n', begin);
        const Size end = newline == std::string_view::npos ? content.size() : newline + 1;
        const std::string_view line_with_terminator = content.substr(begin, end - begin);
        const std::string_view line = trim(line_with_terminator);

        const std::optional<std::string_view> include_path = match_include_directive(line);
        if (!include_path) {
            result += line_with_terminator;
            begin = end;
            continue;
        }

        const Size column = match_whitespace(line_with_terminator);
        const Local_Source_Span pos {
            { .line = line_number, .column = column, .begin = begin + column }, line.length()
        };

        if (include_path->empty()) {
            m_diagnostics(Diagnostic { Severity::warning, Diagnostic_Code::empty_include_path, pos,
                                       "Empty include path in directive '" + std::string(line)
                                           + "'." });
            result += line_with_terminator;
            begin = end;
            continue;
        }

        const std::string included = include(*include_path, file, pos);
        result += "# Included from: ";
        result += *include_path;
        result += '\n';
        result += included;
        if (!included.empty() && !included.ends_with('\n')) {
            result += '\n';
        }
        result += "# End include: ";
        result += *include_path;
        result += '\n';
        begin = end;
    }

    return result;
}

std::string Include_Preprocessor::include(std::string_view include_path,
                                          const fs::path& current_file,
                                          const Local_Source_Span& directive_pos)
{
    const auto report_error = [&](Diagnostic_Code code, std::string message) {
        m_diagnostics(Diagnostic { Severity::error, code, directive_pos, std::move(message) });
        return std::string {};
    };

    const fs::path resolved = resolve_include_path(include_path, current_file);
    if (std::find(m_stack.begin(), m_stack.end(), resolved) != m_stack.end()) {
        return report_error(Diagnostic_Code::circular_include,
                            "Circular include detected: " + resolved.string());
    }
    if (m_depth >= m_options.max_include_depth) {
        const auto max_depth = to_characters(m_options.max_include_depth);
        return report_error(Diagnostic_Code::include_depth_exceeded,
                            "Maximum include depth (" + std::string(max_depth.as_string())
                                + ") exceeded when including " + resolved.string());
    }

    Scoped_Timer timer { m_metrics.custom_timing("include:" + resolved.filename().string()) };

    const Result<std::vector<char>, IO_Error_Code> bytes = file_to_bytes(resolved.string());
    if (!bytes) {
        if (bytes.error() == IO_Error_Code::file_not_found) {
            return report_error(Diagnostic_Code::include_not_found,
                                "Include file not found: " + resolved.string());
        }
        return report_error(Diagnostic_Code::include_read_error,
                            "Failed to read include file: " + resolved.string());
    }
    const Text_Encoding encoding = detect_encoding(*bytes, m_options.fallback_encoding);
    Result<std::string, IO_Error_Code> text = decode_to_utf8(*bytes, encoding);
    if (!text) {
        return report_error(Diagnostic_Code::include_read_error,
                            "Failed to decode include file as "
                                + std::string(encoding_name(encoding)) + ": "
                                + resolved.string());
    }

    m_metrics.increment_counter("includes_processed");
    m_stack.push_back(resolved);
    ++m_depth;
    std::string result = expand_directives(*text, resolved);
    --m_depth;
    m_stack.pop_back();
    return result;
}

} // namespace paradox_data::script
