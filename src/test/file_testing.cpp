#include <fstream>
#include <iostream>
#include <system_error>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/encoding.hpp"
#include "common/tty.hpp"

#include "script/print.hpp"

#include "test/file_testing.hpp"

namespace paradox_data {

namespace {

const bool should_print_colors = is_tty(stdout);

} // namespace

std::string fixture_path(std::string_view name)
{
    return "test/" + std::string(name);
}

std::string load_fixture(std::string_view name)
{
    const std::string path = fixture_path(name);
    Result<std::string, IO_Error> text = file_to_utf8(path);
    if (!text) {
        Code_String out;
        print_io_error(out, text.error());
        print_code_string(std::cout, out, should_print_colors);
        return {};
    }
    return std::move(*text);
}

bool diagnostics_match(std::span<const script::Diagnostic> actual,
                       std::initializer_list<script::Diagnostic_Code> expected,
                       std::string_view source)
{
    bool match = actual.size() == expected.size();
    for (Size i = 0; match && i < actual.size(); ++i) {
        match = actual[i].code == expected.begin()[i];
    }
    if (match) {
        return true;
    }

    Code_String out;
    out.append("Test failed because diagnostics don't match. Expected ",
               Code_Span_Type::diagnostic_error);
    out.append_integer(expected.size(), Code_Span_Type::diagnostic_line_number);
    out.append(":\n");
    for (const script::Diagnostic_Code code : expected) {
        out.append("    ");
        out.append(script::diagnostic_code_name(code), Code_Span_Type::diagnostic_note);
        out.append('\n');
    }
    out.append("But got ", Code_Span_Type::diagnostic_error);
    out.append_integer(actual.size(), Code_Span_Type::diagnostic_line_number);
    out.append(":\n");
    for (const script::Diagnostic& d : actual) {
        script::print_diagnostic(out, "<source>", source, d);
    }
    print_code_string(std::cout, out, should_print_colors);
    return false;
}

Temporary_Directory::Temporary_Directory(std::string_view name)
    : m_path(std::filesystem::temp_directory_path() / ("paradox-data-" + std::string(name)))
{
    std::filesystem::remove_all(m_path);
    std::filesystem::create_directories(m_path);
}

Temporary_Directory::~Temporary_Directory()
{
    std::error_code error;
    std::filesystem::remove_all(m_path, error);
}

std::filesystem::path Temporary_Directory::write(std::string_view name,
                                                 std::string_view contents) const
{
    const std::filesystem::path file = m_path / std::string(name);
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out { file, std::ios::binary };
    out.write(contents.data(), std::streamsize(contents.size()));
    return file;
}

} // namespace paradox_data
