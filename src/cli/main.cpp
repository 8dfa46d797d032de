#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/encoding.hpp"
#include "common/tty.hpp"

#include "script/parsing/batch.hpp"
#include "script/parsing/script_parser.hpp"
#include "script/print.hpp"
#include "script/tokenization/tokenize.hpp"

namespace paradox_data {
namespace {

int print_io_error_and_fail(const IO_Error& error)
{
    Code_String out;
    print_io_error(out, error);
    print_code_string(std::cout, out, is_stdout_tty);
    return 1;
}

void print_diagnostics(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const script::Parse_Report& report)
{
    for (const script::Diagnostic& d : report.errors) {
        script::print_diagnostic(out, file, source, d);
    }
    for (const script::Diagnostic& d : report.warnings) {
        script::print_diagnostic(out, file, source, d);
    }
}

int dump_tokens(std::string_view file)
{
    const Result<std::string, IO_Error> source = file_to_utf8(file);
    if (!source) {
        return print_io_error_and_fail(source.error());
    }
    const std::vector<script::Token> tokens = script::tokenize(*source);
    Code_String out;
    script::print_tokens(out, tokens, *source);
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

int dump_tree(std::string_view file)
{
    script::Script_Parser parser;
    const Result<script::Node, IO_Error> root = parser.parse_file(file);
    if (!root) {
        return print_io_error_and_fail(root.error());
    }
    Code_String out;
    script::print_tree(out, *root);
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

/// @brief Parses the file and prints its diagnostics and metrics.
/// Positions refer to the text after include expansion, so the affected line is only cited if
/// no includes were expanded.
int check(std::string_view file, bool detailed)
{
    script::Script_Parser parser;
    const Result<script::Node, IO_Error> root = parser.parse_file(file);
    if (!root) {
        return print_io_error_and_fail(root.error());
    }

    Code_String out;
    const bool cite_lines = parser.metrics().counter("includes_processed") == 0;
    const std::string_view cited = cite_lines ? parser.get_file_source() : std::string_view();
    for (const script::Diagnostic& d : parser.errors()) {
        script::print_diagnostic(out, file, cited, d);
    }
    for (const script::Diagnostic& d : parser.warnings()) {
        script::print_diagnostic(out, file, cited, d);
    }
    script::print_metrics(out, parser.metrics(), detailed);

    if (parser.has_errors()) {
        out.append("Checks failed.", Code_Span_Type::diagnostic_error);
    }
    else {
        out.append("All checks passed.", Code_Span_Type::diagnostic_position_indicator);
    }
    out.append('\n');
    print_code_string(std::cout, out, is_stdout_tty);
    return parser.has_errors() ? 1 : 0;
}

int check_all(std::span<const std::string_view> files)
{
    const std::vector<Result<script::Parse_Report, IO_Error>> reports
        = script::parse_files_concurrently(files);

    int result_code = 0;
    Code_String out;
    for (Size i = 0; i < reports.size(); ++i) {
        if (!reports[i]) {
            print_io_error(out, reports[i].error());
            result_code = 1;
            continue;
        }
        print_diagnostics(out, files[i], {}, *reports[i]);
        if (!reports[i]->ok()) {
            result_code = 1;
        }
    }

    Size failed = 0;
    for (const auto& report : reports) {
        failed += !report || !report->ok();
    }
    out.append_integer(reports.size() - failed, Code_Span_Type::metric_value);
    out.append(" of ");
    out.append_integer(reports.size(), Code_Span_Type::metric_value);
    out.append(" files passed.\n");
    print_code_string(std::cout, out, is_stdout_tty);
    return result_code;
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "dump_tokens", "FILE", "Prints the tokens of a script file." },
    { "dump_tree", "FILE", "Parses a script file, expanding includes, and prints the tree." },
    { "check", "FILE [--detailed]", "Prints the diagnostics and metrics of parsing a file." },
    { "check_all", "FILE...", "Parses multiple files concurrently and prints diagnostics." },
};

void print_help(std::string_view program_name)
{
    std::cout << ansi::black << "Usage: " << ansi::reset << program_name //
              << ansi::yellow << " COMMAND " //
              << ansi::h_green << "...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << ansi::yellow << help.name << " " //
                  << ansi::h_green << help.arguments << '\n' //
                  << "      " << ansi::reset << help.description << '\n';
    }
}

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.size() == 0 ? "paradox-data" : args[0];

    if (args.size() < 3) {
        print_help(program_name);
        return 1;
    }

    if (args[1] == "dump_tokens") {
        return dump_tokens(args[2]);
    }
    else if (args[1] == "dump_tree") {
        return dump_tree(args[2]);
    }
    else if (args[1] == "check") {
        const bool detailed = args.size() > 3 && args[3] == "--detailed";
        return check(args[2], detailed);
    }
    else if (args[1] == "check_all") {
        return check_all(std::span<const std::string_view>(args).subspan(2));
    }
    else {
        std::cout << "Unknown command '" << args[1] << "'\n";
        return 1;
    }
} catch (const Assertion_Error& e) {
    Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cout, out, is_stdout_tty);
    return 1;
} catch (const std::exception& e) {
    Code_String out;
    out.append("Unhandled exception! ", Code_Span_Type::diagnostic_error);
    out.append("An exception with the following message has been raised:",
               Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    out.append(e.what());
    out.append('\n');
    print_internal_error_notice(out);
    print_code_string(std::cout, out, is_stdout_tty);
    return 1;
}

} // namespace
} // namespace paradox_data

int main(int argc, const char** argv)
{
    return paradox_data::main(argc, argv);
}
