#include <vector>

#include "common/assert.hpp"
#include "common/encoding.hpp"
#include "common/io.hpp"

namespace paradox_data {

namespace {

constexpr char32_t replacement_character = 0xFFFD;

// Code points of the bytes 0x80 through 0x9F.
// The five bytes without a Windows-1252 assignment map to the C1 control with the same value.
constexpr char16_t windows_1252_high_table[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, //
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F, //
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014, //
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178, //
};

[[nodiscard]] constexpr bool is_continuation(unsigned char c) noexcept
{
    return (c & 0xC0) == 0x80;
}

struct Utf8_Sequence {
    char32_t code_point;
    /// Zero if the sequence is malformed.
    Size length;
};

// `str` shall not be empty.
[[nodiscard]] Utf8_Sequence decode_utf8_sequence(std::string_view str) noexcept
{
    const auto lead = static_cast<unsigned char>(str[0]);
    if (lead < 0x80) {
        return { lead, 1 };
    }

    Size length;
    char32_t code_point;
    char32_t min_code_point;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
        min_code_point = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
        min_code_point = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
        min_code_point = 0x10000;
    }
    else {
        return { replacement_character, 0 };
    }

    if (str.length() < length) {
        return { replacement_character, 0 };
    }
    for (Size i = 1; i < length; ++i) {
        const auto c = static_cast<unsigned char>(str[i]);
        if (!is_continuation(c)) {
            return { replacement_character, 0 };
        }
        code_point = (code_point << 6) | (c & 0x3F);
    }

    if (code_point < min_code_point || code_point > 0x10FFFF
        || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return { replacement_character, 0 };
    }
    return { code_point, length };
}

[[nodiscard]] bool starts_with_bytes(std::span<const char> bytes, std::string_view prefix) noexcept
{
    return std::string_view { bytes.data(), bytes.size() }.starts_with(prefix);
}

constexpr std::string_view utf8_bom_bytes = "\xEF\xBB\xBF";
constexpr std::string_view utf16_le_bom_bytes = "\xFF\xFE";
constexpr std::string_view utf16_be_bom_bytes = "\xFE\xFF";

Result<std::string, IO_Error_Code> decode_utf16(std::span<const char> bytes, bool little_endian)
{
    if (bytes.size() % 2 != 0) {
        return IO_Error_Code::decode_error;
    }

    const auto unit_at = [&](Size i) -> char16_t {
        const auto first = static_cast<unsigned char>(bytes[i]);
        const auto second = static_cast<unsigned char>(bytes[i + 1]);
        return little_endian ? char16_t(first | (second << 8)) : char16_t((first << 8) | second);
    };

    std::string out;
    out.reserve(bytes.size());
    for (Size i = 0; i < bytes.size(); i += 2) {
        const char16_t unit = unit_at(i);
        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return IO_Error_Code::decode_error;
        }
        if (unit < 0xD800 || unit > 0xDBFF) {
            append_utf8(out, unit);
            continue;
        }
        if (i + 2 >= bytes.size()) {
            return IO_Error_Code::decode_error;
        }
        const char16_t low = unit_at(i + 2);
        if (low < 0xDC00 || low > 0xDFFF) {
            return IO_Error_Code::decode_error;
        }
        append_utf8(out, 0x10000 + ((char32_t(unit) - 0xD800) << 10) + (char32_t(low) - 0xDC00));
        i += 2;
    }
    return out;
}

std::string decode_lossy_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    while (!text.empty()) {
        const Utf8_Sequence sequence = decode_utf8_sequence(text);
        if (sequence.length == 0) {
            append_utf8(out, replacement_character);
            text.remove_prefix(1);
        }
        else {
            out.append(text.substr(0, sequence.length));
            text.remove_prefix(sequence.length);
        }
    }
    return out;
}

std::string decode_windows_1252(std::span<const char> bytes)
{
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80 && byte <= 0x9F) {
            append_utf8(out, windows_1252_high_table[byte - 0x80]);
        }
        else {
            append_utf8(out, byte);
        }
    }
    return out;
}

} // namespace

std::string_view encoding_name(Text_Encoding encoding)
{
    switch (encoding) {
        using enum Text_Encoding;
    case utf8: return "UTF-8";
    case utf8_bom: return "UTF-8 (BOM)";
    case utf16_le: return "UTF-16LE";
    case utf16_be: return "UTF-16BE";
    case windows_1252: return "Windows-1252";
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid text encoding");
}

bool is_valid_utf8(std::string_view text) noexcept
{
    while (!text.empty()) {
        const Utf8_Sequence sequence = decode_utf8_sequence(text);
        if (sequence.length == 0) {
            return false;
        }
        text.remove_prefix(sequence.length);
    }
    return true;
}

Text_Encoding detect_encoding(std::span<const char> bytes, Text_Encoding fallback) noexcept
{
    if (starts_with_bytes(bytes, utf8_bom_bytes)) {
        return Text_Encoding::utf8_bom;
    }
    if (starts_with_bytes(bytes, utf16_le_bom_bytes)) {
        return Text_Encoding::utf16_le;
    }
    if (starts_with_bytes(bytes, utf16_be_bom_bytes)) {
        return Text_Encoding::utf16_be;
    }
    return is_valid_utf8({ bytes.data(), bytes.size() }) ? Text_Encoding::utf8 : fallback;
}

void append_utf8(std::string& out, char32_t code_point)
{
    PARADOX_DATA_ASSERT(code_point <= 0x10FFFF);
    if (code_point < 0x80) {
        out.push_back(char(code_point));
    }
    else if (code_point < 0x800) {
        out.push_back(char(0xC0 | (code_point >> 6)));
        out.push_back(char(0x80 | (code_point & 0x3F)));
    }
    else if (code_point < 0x10000) {
        out.push_back(char(0xE0 | (code_point >> 12)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(char(0x80 | (code_point & 0x3F)));
    }
    else {
        out.push_back(char(0xF0 | (code_point >> 18)));
        out.push_back(char(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(char(0x80 | (code_point & 0x3F)));
    }
}

Result<std::string, IO_Error_Code> decode_to_utf8(std::span<const char> bytes,
                                                  Text_Encoding encoding)
{
    switch (encoding) {
        using enum Text_Encoding;
    case utf8: return decode_lossy_utf8({ bytes.data(), bytes.size() });
    case utf8_bom: {
        if (starts_with_bytes(bytes, utf8_bom_bytes)) {
            bytes = bytes.subspan(utf8_bom_bytes.size());
        }
        return decode_lossy_utf8({ bytes.data(), bytes.size() });
    }
    case utf16_le: {
        if (starts_with_bytes(bytes, utf16_le_bom_bytes)) {
            bytes = bytes.subspan(utf16_le_bom_bytes.size());
        }
        return decode_utf16(bytes, true);
    }
    case utf16_be: {
        if (starts_with_bytes(bytes, utf16_be_bom_bytes)) {
            bytes = bytes.subspan(utf16_be_bom_bytes.size());
        }
        return decode_utf16(bytes, false);
    }
    case windows_1252: return decode_windows_1252(bytes);
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid text encoding");
}

Result<std::string, IO_Error> file_to_utf8(std::string_view path, Text_Encoding fallback)
{
    Result<std::vector<char>, IO_Error_Code> bytes = file_to_bytes(path);
    if (!bytes) {
        return IO_Error { bytes.error(), std::string(path) };
    }
    Result<std::string, IO_Error_Code> text
        = decode_to_utf8(*bytes, detect_encoding(*bytes, fallback));
    if (!text) {
        return IO_Error { text.error(), std::string(path) };
    }
    return std::move(*text);
}

} // namespace paradox_data
