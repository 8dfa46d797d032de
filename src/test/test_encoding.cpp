#include <span>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "common/encoding.hpp"

#include "script/parsing/script_parser.hpp"
#include "script/tree/node.hpp"

#include "test/file_testing.hpp"

namespace paradox_data {
namespace {

[[nodiscard]] std::span<const char> bytes_of(std::string_view str)
{
    return { str.data(), str.size() };
}

[[nodiscard]] std::string decode(std::string_view bytes)
{
    const Result<std::string, IO_Error_Code> result
        = decode_to_utf8(bytes_of(bytes), detect_encoding(bytes_of(bytes)));
    return result ? *result : "<error>";
}

TEST(Encoding, validate_utf8)
{
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("owner = FRA"));
    EXPECT_TRUE(is_valid_utf8("W\xC3\xBCrttemberg"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("W\xFCrttemberg"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));
    // overlong encoding of '/'
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));
    // encoded surrogate
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));
}

TEST(Encoding, detect)
{
    using enum Text_Encoding;
    EXPECT_EQ(detect_encoding(bytes_of("a = 1")), utf8);
    EXPECT_EQ(detect_encoding(bytes_of("\xEF\xBB\xBF" "a = 1")), utf8_bom);
    EXPECT_EQ(detect_encoding(bytes_of(std::string_view("\xFF\xFE" "a\0", 4))), utf16_le);
    EXPECT_EQ(detect_encoding(bytes_of(std::string_view("\xFE\xFF\0a", 4))), utf16_be);
    EXPECT_EQ(detect_encoding(bytes_of("W\xFCrttemberg")), windows_1252);
    EXPECT_EQ(detect_encoding(bytes_of("W\xFCrttemberg"), utf8), utf8);
}

TEST(Encoding, decode_utf8_bom)
{
    EXPECT_EQ(decode("\xEF\xBB\xBF" "a = 1"), "a = 1");
}

TEST(Encoding, decode_windows_1252)
{
    EXPECT_EQ(decode("W\xFCrttemberg"), "W\xC3\xBCrttemberg");
    EXPECT_EQ(decode("\x80 \x9C"), "\xE2\x82\xAC \xC5\x93");
}

TEST(Encoding, decode_utf16)
{
    constexpr std::string_view little { "\xFF\xFE" "a\0=\0\xAC\x20", 8 };
    EXPECT_EQ(decode(little), "a=\xE2\x82\xAC");

    constexpr std::string_view big { "\xFE\xFF\0a\xD8\x3D\xDE\x00", 8 };
    EXPECT_EQ(decode(big), "a\xF0\x9F\x98\x80");
}

TEST(Encoding, malformed_utf16)
{
    using enum Text_Encoding;
    constexpr std::string_view odd { "\xFF\xFE" "a\0b", 5 };
    const auto odd_result = decode_to_utf8(bytes_of(odd), utf16_le);
    ASSERT_FALSE(odd_result);
    EXPECT_EQ(odd_result.error(), IO_Error_Code::decode_error);

    constexpr std::string_view lone_surrogate { "\xFF\xFE\x3D\xD8" "a\0", 6 };
    const auto surrogate_result = decode_to_utf8(bytes_of(lone_surrogate), utf16_le);
    ASSERT_FALSE(surrogate_result);
    EXPECT_EQ(surrogate_result.error(), IO_Error_Code::decode_error);
}

TEST(Encoding, append_utf8)
{
    std::string out;
    append_utf8(out, U'A');
    append_utf8(out, U'\u00FC');
    append_utf8(out, U'\u20AC');
    append_utf8(out, U'\U0001F600');
    EXPECT_EQ(out, "A\xC3\xBC\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(Encoding, parse_windows_1252_file)
{
    const Temporary_Directory dir { "encoding-1252" };
    const auto file = dir.write("province.txt", "name = \"W\xFCrttemberg\"\nowner = WUR\n");

    script::Script_Parser parser;
    const Result<script::Node, IO_Error> root = parser.parse_file(file.string());
    ASSERT_TRUE(root);
    EXPECT_EQ(root->get_value<std::string>("name"), "W\xC3\xBCrttemberg");
}

TEST(Encoding, parse_utf16_file)
{
    const Temporary_Directory dir { "encoding-utf16" };
    constexpr std::string_view contents { "\xFF\xFE" "a\0=\0" "1\0", 8 };
    const auto file = dir.write("a.txt", contents);

    script::Script_Parser parser;
    const Result<script::Node, IO_Error> root = parser.parse_file(file.string());
    ASSERT_TRUE(root);
    EXPECT_EQ(root->get_value<int>("a"), 1);
}

TEST(Encoding, undecodable_file_is_io_error)
{
    const Temporary_Directory dir { "encoding-broken" };
    constexpr std::string_view contents { "\xFE\xFF\0a\0", 5 };
    const auto file = dir.write("broken.txt", contents);

    script::Script_Parser parser;
    const Result<script::Node, IO_Error> root = parser.parse_file(file.string());
    ASSERT_FALSE(root);
    EXPECT_EQ(root.error().code, IO_Error_Code::decode_error);
}

} // namespace
} // namespace paradox_data
