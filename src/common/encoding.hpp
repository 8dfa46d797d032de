#ifndef PARADOX_DATA_ENCODING_HPP
#define PARADOX_DATA_ENCODING_HPP

#include <span>
#include <string>
#include <string_view>

#include "common/config.hpp"
#include "common/io_error.hpp"
#include "common/result.hpp"

namespace paradox_data {

enum struct Text_Encoding : Default_Underlying {
    /// @brief UTF-8 without byte order mark.
    utf8,
    /// @brief UTF-8 with the byte order mark `EF BB BF`.
    utf8_bom,
    /// @brief UTF-16 little endian with the byte order mark `FF FE`.
    utf16_le,
    /// @brief UTF-16 big endian with the byte order mark `FE FF`.
    utf16_be,
    /// @brief The Windows-1252 code page, used by older game files.
    windows_1252,
};

[[nodiscard]] std::string_view encoding_name(Text_Encoding encoding);

/// @brief Returns `true` if `text` is well-formed UTF-8.
/// Overlong encodings, encoded surrogates, and code points above U+10FFFF are rejected.
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

/// @brief Detects the encoding of raw file contents.
/// A byte order mark wins; otherwise, the bytes are `utf8` if they are valid UTF-8 and
/// `fallback` if not.
/// @param bytes the raw file contents
/// @param fallback the encoding assumed for bytes without BOM which are not valid UTF-8
[[nodiscard]] Text_Encoding detect_encoding(std::span<const char> bytes,
                                            Text_Encoding fallback = Text_Encoding::windows_1252)
    noexcept;

/// @brief Appends the UTF-8 encoding of `code_point` to `out`.
void append_utf8(std::string& out, char32_t code_point);

/// @brief Decodes `bytes` in the given `encoding` to UTF-8, dropping any byte order mark.
/// For `utf8`, invalid sequences are replaced with U+FFFD.
/// @return The decoded text, or `decode_error` for malformed UTF-16.
[[nodiscard]] Result<std::string, IO_Error_Code> decode_to_utf8(std::span<const char> bytes,
                                                                Text_Encoding encoding);

/// @brief Reads the file at `path`, detects its encoding, and decodes it to UTF-8.
/// @param fallback see `detect_encoding`
[[nodiscard]] Result<std::string, IO_Error>
file_to_utf8(std::string_view path, Text_Encoding fallback = Text_Encoding::windows_1252);

} // namespace paradox_data

#endif
