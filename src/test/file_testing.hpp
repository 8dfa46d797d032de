#ifndef PARADOX_DATA_TEST_FILE_TESTING_HPP
#define PARADOX_DATA_TEST_FILE_TESTING_HPP

#include <filesystem>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "script/fwd.hpp"
#include "script/parsing/diagnostic.hpp"

namespace paradox_data {

/// @brief Returns the path of a fixture file under `test/`, relative to the repository root.
[[nodiscard]] std::string fixture_path(std::string_view name);

/// @brief Loads a fixture file as UTF-8 text.
/// If the file cannot be loaded, the error is printed and the result is empty.
[[nodiscard]] std::string load_fixture(std::string_view name);

/// @brief Returns `true` if the codes of `actual` equal `expected`, in order.
/// Otherwise, prints all of `actual` along with the affected lines of `source`.
[[nodiscard]] bool diagnostics_match(std::span<const script::Diagnostic> actual,
                                     std::initializer_list<script::Diagnostic_Code> expected,
                                     std::string_view source);

/// @brief A fresh directory below the system temporary directory which is removed, including its
/// contents, on destruction.
struct Temporary_Directory {
private:
    std::filesystem::path m_path;

public:
    [[nodiscard]] explicit Temporary_Directory(std::string_view name);

    Temporary_Directory(const Temporary_Directory&) = delete;
    Temporary_Directory& operator=(const Temporary_Directory&) = delete;

    ~Temporary_Directory();

    [[nodiscard]] const std::filesystem::path& get_path() const noexcept
    {
        return m_path;
    }

    /// @brief Creates or overwrites the file `name` in this directory.
    /// @return The path of the file.
    std::filesystem::path write(std::string_view name, std::string_view contents) const;
};

} // namespace paradox_data

#endif
