#ifndef PARADOX_DATA_IO_HPP
#define PARADOX_DATA_IO_HPP

#include <string_view>
#include <vector>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace paradox_data {

/// @brief Reads the whole file at `path` as raw bytes.
/// @param path the file path
/// @return The bytes of the file, or `file_not_found`, `cannot_open`, or `read_error`.
[[nodiscard]] Result<std::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path);

} // namespace paradox_data

#endif
