#ifndef PARADOX_DATA_IO_ERROR_HPP
#define PARADOX_DATA_IO_ERROR_HPP

#include <string>

#include "common/config.hpp"

namespace paradox_data {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file does not exist.
    file_not_found,
    /// @brief The file exists but could not be opened, e.g. due to permissions.
    cannot_open,
    /// @brief The file was opened, but reading failed.
    read_error,
    /// @brief The bytes of the file could not be decoded to text.
    decode_error,
};

struct IO_Error {
    IO_Error_Code code;
    std::string path;

    [[nodiscard]] friend bool operator==(const IO_Error&, const IO_Error&) = default;
};

} // namespace paradox_data

#endif
