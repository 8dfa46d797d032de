#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "script/parsing/diagnostic.hpp"
#include "script/parsing/script_parser.hpp"
#include "script/tree/node.hpp"

#include "test/file_testing.hpp"

namespace paradox_data::script {
namespace {

using enum Diagnostic_Code;

TEST(Recovery, missing_equals_skips_statement)
{
    constexpr std::string_view source = "owner = FRA\nbroken FRA\ncontroller = ENG";
    Script_Parser parser;
    const Node root = parser.parse(source);

    // Recovery stops at `FRA`, which is then parsed as a statement that lacks `=` as well.
    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_equals, expected_equals }, source));
    EXPECT_EQ(root.get_value<std::string>("owner"), "FRA");
    EXPECT_EQ(root.get_value<std::string>("controller"), "ENG");
    EXPECT_FALSE(root.has_child("broken"));
}

TEST(Recovery, missing_equals_reports_position)
{
    constexpr std::string_view source = "a = 1\nb 2\n";
    Script_Parser parser;
    (void)parser.parse(source);

    ASSERT_EQ(parser.errors().size(), 1);
    const Diagnostic& error = parser.errors()[0];
    EXPECT_EQ(error.code, expected_equals);
    EXPECT_EQ(error.severity, Severity::error);
    EXPECT_EQ(error.pos.line, 1);
    EXPECT_EQ(error.pos.column, 2);
    EXPECT_EQ(error.message, "Expected '=', but got number '2'.");
}

TEST(Recovery, braced_region_is_skipped_as_unit)
{
    constexpr std::string_view source = "broken { inner = 1 nested = { x = 2 } }\nafter = yes";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_equals }, source));
    EXPECT_EQ(root.get_child_count(), 1);
    EXPECT_TRUE(root.get_value<bool>("after"));
    EXPECT_FALSE(root.has_child("inner"));
}

TEST(Recovery, malformed_statement_inside_block)
{
    constexpr std::string_view source = "a = { c = 2 b 1 e = 3 }\nd = 3";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_equals }, source));
    EXPECT_TRUE(parser.warnings().empty());
    const Node* a = root.get_child("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->get_value<int>("c"), 2);
    EXPECT_EQ(a->get_value<int>("e"), 3);
    EXPECT_FALSE(a->has_child("b"));
    EXPECT_EQ(root.get_value<int>("d"), 3);
}

TEST(Recovery, malformed_statement_at_end_of_block)
{
    constexpr std::string_view source = "a = { c = 2 b }\nd = 3";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_equals }, source));
    EXPECT_EQ(root.get_child("a")->get_value<int>("c"), 2);
    EXPECT_EQ(root.get_value<int>("d"), 3);
}

TEST(Recovery, missing_value)
{
    constexpr std::string_view source = "a = }\nb = 2";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_value }, source));
    EXPECT_TRUE(diagnostics_match(parser.warnings(), { unexpected_token }, source));
    EXPECT_FALSE(root.has_child("a"));
    EXPECT_EQ(root.get_value<int>("b"), 2);
}

TEST(Recovery, missing_value_at_end_of_file)
{
    constexpr std::string_view source = "a = 1\nb =";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_value }, source));
    EXPECT_EQ(root.get_child_count(), 1);
}

TEST(Recovery, missing_right_brace_keeps_children)
{
    constexpr std::string_view source = "a = {\n  b = 1\n  c = { d = 2 \n";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { expected_right_brace, expected_right_brace },
                                  source));
    const Node* a = root.get_child("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->get_value<int>("b"), 1);
    ASSERT_NE(a->get_child("c"), nullptr);
    EXPECT_EQ(a->get_child("c")->get_value<int>("d"), 2);
}

TEST(Recovery, stray_tokens_are_warnings)
{
    constexpr std::string_view source = "} \"text\" 5 a = 1 > =";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(parser.errors().empty());
    EXPECT_TRUE(diagnostics_match(parser.warnings(),
                                  { unexpected_token, unexpected_token, unexpected_token,
                                    unexpected_token, unexpected_token },
                                  source));
    EXPECT_EQ(root.get_value<int>("a"), 1);
}

TEST(Recovery, assignment_in_list)
{
    constexpr std::string_view source = "l = { 1 2 x = 3 4 }";
    Script_Parser parser;
    const Node root = parser.parse(source);

    EXPECT_TRUE(parser.errors().empty());
    EXPECT_TRUE(diagnostics_match(parser.warnings(), { unexpected_list_item }, source));
    EXPECT_EQ(root.get_values<int>("l"), (std::vector<int> { 1, 2, 4 }));
}

TEST(Recovery, valid_statements_survive)
{
    constexpr std::string_view source = R"(
        owner = FRA
        controller = = ENG
        base_tax = 5
        culture { french }
        religion = catholic
    )";
    Script_Parser parser;
    const Node root = parser.parse(source);

    // `= ENG` leaves `ENG` behind, which lacks `=` as a statement of its own.
    EXPECT_TRUE(diagnostics_match(parser.errors(),
                                  { expected_value, expected_equals, expected_equals }, source));
    EXPECT_EQ(root.get_value<std::string>("owner"), "FRA");
    EXPECT_EQ(root.get_value<int>("base_tax"), 5);
    EXPECT_EQ(root.get_value<std::string>("religion"), "catholic");
}

TEST(Recovery, metrics_count_diagnostics)
{
    Script_Parser parser;
    (void)parser.parse("a b = 1 } c =");
    EXPECT_EQ(parser.metrics().error_count, parser.errors().size());
    EXPECT_EQ(parser.metrics().warning_count, parser.warnings().size());
    EXPECT_EQ(parser.metrics().error_count, 2);
    EXPECT_EQ(parser.metrics().warning_count, 1);
}

TEST(Recovery, nesting_limit_skips_deeper_blocks)
{
    constexpr std::string_view source = "a = { b = { c = { d = 1 } e = 2 } f = 3 }\ng = 4";
    Script_Parser parser { { .max_nesting_depth = 2 } };
    const Node root = parser.parse(source);

    ASSERT_TRUE(diagnostics_match(parser.errors(), { nesting_too_deep }, source));
    EXPECT_EQ(parser.errors()[0].pos.line, 0);
    EXPECT_EQ(parser.errors()[0].pos.column, 16);

    const Node* a = root.get_child("a");
    ASSERT_NE(a, nullptr);
    const Node* b = a->get_child("b");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->has_child("c"));
    EXPECT_EQ(b->get_value<int>("e"), 2);
    EXPECT_EQ(a->get_value<int>("f"), 3);
    EXPECT_EQ(root.get_value<int>("g"), 4);
}

TEST(Recovery, nesting_limit_applies_to_lists)
{
    constexpr std::string_view source = "l = { { { 1 2 } } }\nx = 1";
    Script_Parser parser { { .max_nesting_depth = 1 } };
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { nesting_too_deep }, source));
    const Node* list = root.get_child("l");
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(list->is_list());
    EXPECT_EQ(list->get_item_count(), 0);
    EXPECT_EQ(root.get_value<int>("x"), 1);
}

TEST(Recovery, nesting_limit_applies_to_date_blocks)
{
    constexpr std::string_view source = "1444.11.11 = { owner = FRA }\nx = 1";
    Script_Parser parser { { .max_nesting_depth = 0 } };
    const Node root = parser.parse(source);

    EXPECT_TRUE(diagnostics_match(parser.errors(), { nesting_too_deep }, source));
    EXPECT_FALSE(root.has_child("1444.11.11"));
    EXPECT_EQ(root.get_value<int>("x"), 1);
}

TEST(Recovery, deeply_nested_input)
{
    constexpr Size levels = 20'000;
    std::string source = "a = ";
    for (Size i = 0; i < levels; ++i) {
        source += "{ b = ";
    }
    source += "1";
    for (Size i = 0; i < levels; ++i) {
        source += " }";
    }

    Script_Parser parser;
    const Node root = parser.parse(source);
    EXPECT_TRUE(diagnostics_match(parser.errors(), { nesting_too_deep }, {}));

    Size depth = 0;
    for (const Node* node = root.get_child("a"); node != nullptr; node = node->get_child("b")) {
        ++depth;
    }
    EXPECT_EQ(depth, parser.get_options().max_nesting_depth);
}

} // namespace
} // namespace paradox_data::script
