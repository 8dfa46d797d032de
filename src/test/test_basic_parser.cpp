#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "script/parsing/basic_parser.hpp"
#include "script/parsing/token_cursor.hpp"

#include "test/file_testing.hpp"

namespace paradox_data::script {
namespace {

/// @brief A parser for a small settings format, built only from the helpers of `Token_Cursor`:
/// ```
/// provinces = { 1 2 3 4 }
/// tags = { FRA "ENG" }
/// weights = { FRA = 2 ENG = 3 }
/// ```
struct Settings {
    std::vector<Int> provinces;
    std::vector<std::string> tags;
    std::map<std::string, Int, std::less<>> weights;
};

struct Settings_Parser final : Basic_Parser<Settings> {
protected:
    Settings parse_tokens(Token_Cursor& cursor) final
    {
        Settings result;
        while (true) {
            cursor.skip_comments();
            if (cursor.eof()) {
                return result;
            }
            const Token* key = cursor.require(Token_Type::identifier,
                                              Diagnostic_Code::unexpected_token);
            if (key == nullptr) {
                cursor.consume();
                continue;
            }
            if (!cursor.require(Token_Type::equals, Diagnostic_Code::expected_equals)) {
                continue;
            }
            const std::string_view name = cursor.text(*key);
            if (name == "provinces") {
                result.provinces = cursor.parse_integer_list();
            }
            else if (name == "tags") {
                result.tags = cursor.parse_string_list();
            }
            else if (name == "weights") {
                result.weights = cursor.parse_string_integer_map();
            }
            else {
                cursor.warning(Diagnostic_Code::unexpected_token, *key, "Unknown setting.");
                cursor.skip_balanced_braces();
            }
        }
    }
};

TEST(Basic_Parser, helper_grammars)
{
    constexpr std::string_view source = R"(
        # settings
        provinces = { 1 2 # two
                      3 }
        tags = { FRA "ENG" }
        weights = { FRA = 2 "ENG" = 3 FRA = 4 }
    )";
    Settings_Parser parser;
    const Settings settings = parser.parse(source);

    EXPECT_FALSE(parser.has_errors());
    EXPECT_TRUE(parser.warnings().empty());
    EXPECT_EQ(settings.provinces, (std::vector<Int> { 1, 2, 3 }));
    EXPECT_EQ(settings.tags, (std::vector<std::string> { "FRA", "ENG" }));
    EXPECT_EQ(settings.weights.size(), 2);
    EXPECT_EQ(settings.weights.at("FRA"), 4);
    EXPECT_EQ(settings.weights.at("ENG"), 3);
    EXPECT_GT(parser.metrics().tokens_processed, 0);
}

TEST(Basic_Parser, helper_grammar_diagnostics)
{
    using enum Diagnostic_Code;
    constexpr std::string_view source = "provinces = { 1 x 2.5 99999999999999999999 4 }\n"
                                        "tags = FRA\n"
                                        "weights = { FRA = many ENG = 1 }\n";
    Settings_Parser parser;
    const Settings settings = parser.parse(source);

    EXPECT_EQ(settings.provinces, (std::vector<Int> { 1, 4 }));
    EXPECT_TRUE(settings.tags.empty());
    EXPECT_EQ(settings.weights.size(), 1);

    // `tags = FRA` fails to open a list, after which `FRA` is read as an unknown setting.
    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_left_brace, expected_equals },
                                  source));
    EXPECT_TRUE(diagnostics_match(parser.warnings(),
                                  { unexpected_list_item, invalid_integer, invalid_integer,
                                    invalid_integer },
                                  source));
}

TEST(Basic_Parser, unterminated_list)
{
    Settings_Parser parser;
    const Settings settings = parser.parse("provinces = { 1 2");
    EXPECT_EQ(settings.provinces, (std::vector<Int> { 1, 2 }));
    EXPECT_TRUE(diagnostics_match(parser.errors(), { Diagnostic_Code::expected_right_brace }, {}));
}

} // namespace
} // namespace paradox_data::script
