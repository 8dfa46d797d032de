#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "script/parsing/script_parser.hpp"
#include "script/tree/node.hpp"

#include "test/file_testing.hpp"

namespace paradox_data::script {
namespace {

TEST(Parse, empty_input)
{
    Script_Parser parser;
    const Node root = parser.parse("");
    EXPECT_TRUE(root.is_object());
    EXPECT_EQ(root.get_key(), "root");
    EXPECT_EQ(root.get_child_count(), 0);
    EXPECT_TRUE(parser.errors().empty());
    EXPECT_TRUE(parser.warnings().empty());
}

TEST(Parse, comments_only)
{
    Script_Parser parser;
    const Node root = parser.parse("# a comment\n\n   # another = { }\n");
    EXPECT_EQ(root.get_child_count(), 0);
    EXPECT_FALSE(parser.has_errors());
}

TEST(Parse, scalars)
{
    Script_Parser parser;
    const Node root = parser.parse(R"(
        owner = FRA
        name = "Paris \"la belle\""
        base_tax = 5
        trade_goods_size = -1.5
        hre = yes
        is_city = no
        capital_flag = true
        discovered = 1444.11.11
    )");
    ASSERT_FALSE(parser.has_errors());
    EXPECT_EQ(root.get_child_count(), 8);

    EXPECT_EQ(root.get_value<std::string>("owner"), "FRA");
    EXPECT_EQ(root.get_value<std::string>("name"), "Paris \"la belle\"");
    EXPECT_EQ(root.get_value<int>("base_tax"), 5);
    EXPECT_EQ(root.get_value<double>("trade_goods_size"), -1.5);
    EXPECT_TRUE(root.get_value<bool>("hre"));
    EXPECT_FALSE(root.get_value<bool>("is_city", true));
    EXPECT_TRUE(root.get_value<bool>("capital_flag"));
    EXPECT_EQ(root.get_value<Date>("discovered"), (Date { 1444, 11, 11 }));

    const Value* base_tax = root.get_child("base_tax")->get_scalar_value();
    ASSERT_NE(base_tax, nullptr);
    EXPECT_TRUE(std::holds_alternative<Int>(*base_tax));
    const Value* hre = root.get_child("hre")->get_scalar_value();
    ASSERT_NE(hre, nullptr);
    EXPECT_TRUE(std::holds_alternative<bool>(*hre));
    const Value* capital_flag = root.get_child("capital_flag")->get_scalar_value();
    ASSERT_NE(capital_flag, nullptr);
    EXPECT_TRUE(std::holds_alternative<bool>(*capital_flag));
}

TEST(Parse, boolean_spellings)
{
    Script_Parser parser;
    const Node root = parser.parse("a = yes b = YES c = true d = no e = false f = No");
    EXPECT_TRUE(root.get_value<bool>("a"));
    EXPECT_TRUE(root.get_value<bool>("b"));
    EXPECT_TRUE(root.get_value<bool>("c"));
    EXPECT_FALSE(root.get_value<bool>("d", true));
    EXPECT_FALSE(root.get_value<bool>("e", true));
    EXPECT_FALSE(root.get_value<bool>("f", true));
}

TEST(Parse, last_assignment_wins)
{
    Script_Parser parser;
    const Node root = parser.parse("owner = FRA\nowner = ENG\nowner = CAS");
    EXPECT_EQ(root.get_child_count(), 1);
    EXPECT_EQ(root.get_value<std::string>("owner"), "CAS");
}

TEST(Parse, accumulate_repeated_keys)
{
    Script_Parser parser { { .accumulate_repeated_keys = true } };
    const Node root = parser.parse("add_core = FRA\nadd_core = ENG\nowner = FRA");
    EXPECT_EQ(root.get_values<std::string>("add_core"),
              (std::vector<std::string> { "FRA", "ENG" }));
    EXPECT_EQ(root.get_values<std::string>("owner"), (std::vector<std::string> { "FRA" }));
}

TEST(Parse, nested_objects)
{
    Script_Parser parser;
    const Node root = parser.parse("a = { b = { c = 1 } }");
    ASSERT_FALSE(parser.has_errors());

    const Node* a = root.get_child("a");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->is_object());
    const Node* b = a->get_child("b");
    ASSERT_NE(b, nullptr);
    const Node* c = b->get_child("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->as<int>(), 1);
}

TEST(Parse, empty_block_is_object)
{
    Script_Parser parser;
    const Node root = parser.parse("modifiers = { }");
    const Node* modifiers = root.get_child("modifiers");
    ASSERT_NE(modifiers, nullptr);
    EXPECT_TRUE(modifiers->is_object());
    EXPECT_EQ(modifiers->get_child_count(), 0);
}

TEST(Parse, date_block)
{
    Script_Parser parser;
    const Node root = parser.parse("1444.11.11 = { owner = FRA controller = FRA }");
    ASSERT_FALSE(parser.has_errors());

    const Node* history = root.get_child("1444.11.11");
    ASSERT_NE(history, nullptr);
    ASSERT_TRUE(history->is_date());
    ASSERT_NE(history->get_date(), nullptr);
    EXPECT_EQ(*history->get_date(), (Date { 1444, 11, 11 }));
    EXPECT_EQ(history->get_value<std::string>("owner"), "FRA");
    EXPECT_EQ(history->get_child_count(), 2);
}

TEST(Parse, date_key_with_scalar)
{
    Script_Parser parser;
    const Node root = parser.parse("1444.11.11 = FRA");
    const Node* node = root.get_child("1444.11.11");
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->is_scalar());
    EXPECT_EQ(node->as<std::string>(), "FRA");
}

TEST(Parse, explicit_list)
{
    Script_Parser parser;
    const Node root
        = parser.parse("provinces = { 1 2 3 4 } tags = { FRA \"ENG\" # comment\n CAS }");
    ASSERT_FALSE(parser.has_errors());

    const Node* provinces = root.get_child("provinces");
    ASSERT_NE(provinces, nullptr);
    EXPECT_TRUE(provinces->is_list());
    EXPECT_EQ(root.get_values<int>("provinces"), (std::vector<int> { 1, 2, 3, 4 }));
    EXPECT_EQ(root.get_values<std::string>("tags"),
              (std::vector<std::string> { "FRA", "ENG", "CAS" }));
    for (const Node& item : provinces->get_items()) {
        EXPECT_TRUE(item.get_key().empty());
    }
}

TEST(Parse, list_of_blocks)
{
    Script_Parser parser;
    const Node root = parser.parse("units = { { type = infantry } { type = cavalry } }");
    ASSERT_FALSE(parser.has_errors());

    const Node* units = root.get_child("units");
    ASSERT_NE(units, nullptr);
    ASSERT_TRUE(units->is_list());
    ASSERT_EQ(units->get_item_count(), 2);
    EXPECT_TRUE(units->get_items()[0].is_object());
    EXPECT_EQ(units->get_items()[1].get_value<std::string>("type"), "cavalry");
}

TEST(Parse, color)
{
    Script_Parser parser;
    const Node root = parser.parse("color = { 10 20 30 }\nlist = { 10 20 30 40 }");
    ASSERT_FALSE(parser.has_errors());
    EXPECT_EQ(root.get_color("color"), (Rgb_Color { 10, 20, 30 }));
    EXPECT_TRUE(root.get_child("list")->is_list());
    EXPECT_EQ(root.get_values<int>("list"), (std::vector<int> { 10, 20, 30, 40 }));
}

TEST(Parse, number_fallbacks)
{
    Script_Parser parser;
    const Node root = parser.parse("big = 99999999999999999999 version = 1.2.3.4");

    const Value* big = root.get_child("big")->get_scalar_value();
    ASSERT_NE(big, nullptr);
    EXPECT_TRUE(std::holds_alternative<double>(*big));

    const Value* version = root.get_child("version")->get_scalar_value();
    ASSERT_NE(version, nullptr);
    ASSERT_TRUE(std::holds_alternative<std::string>(*version));
    EXPECT_EQ(std::get<std::string>(*version), "1.2.3.4");
}

TEST(Parse, try_parse)
{
    Script_Parser parser;
    EXPECT_TRUE(parser.try_parse("a = 1").has_value());
    EXPECT_FALSE(parser.try_parse("a 1").has_value());
    EXPECT_TRUE(parser.has_errors());
}

TEST(Parse, state_is_reset_between_calls)
{
    Script_Parser parser;
    (void)parser.parse("a = ");
    EXPECT_TRUE(parser.has_errors());

    const Node root = parser.parse("a = 1");
    EXPECT_FALSE(parser.has_errors());
    EXPECT_TRUE(parser.warnings().empty());
    EXPECT_EQ(parser.metrics().error_count, 0);
    EXPECT_EQ(root.get_value<int>("a"), 1);
}

TEST(Parse, province_history_file)
{
    Script_Parser parser;
    const Result<Node, IO_Error> root = parser.parse_file(fixture_path("scripts/province.txt"));
    ASSERT_TRUE(root);
    EXPECT_FALSE(parser.has_errors());

    EXPECT_EQ(root->get_value<std::string>("owner"), "FRA");
    EXPECT_EQ(root->get_value<int>("base_tax"), 10);
    EXPECT_EQ(root->get_value<std::string>("culture"), "cosmopolitan_french");
    EXPECT_TRUE(root->get_value<bool>("hre"));
    EXPECT_EQ(root->get_values<std::string>("discovered_by"),
              (std::vector<std::string> { "western", "eastern", "muslim" }));
    EXPECT_EQ(root->get_color("color"), (Rgb_Color { 120, 60, 200 }));

    const Node* history = root->get_child("1515.1.1");
    ASSERT_NE(history, nullptr);
    ASSERT_TRUE(history->is_date());
    EXPECT_EQ(history->get_value<int>("base_tax"), 12);

    const Node* modifier = history->get_child("add_permanent_province_modifier");
    ASSERT_NE(modifier, nullptr);
    EXPECT_EQ(modifier->get_value<std::string>("name"), "center_of_trade_modifier");
    EXPECT_EQ(modifier->get_value<int>("duration"), -1);
}

TEST(Parse, missing_file)
{
    Script_Parser parser;
    const Result<Node, IO_Error> root = parser.parse_file(fixture_path("scripts/missing.txt"));
    ASSERT_FALSE(root);
    EXPECT_EQ(root.error().code, IO_Error_Code::file_not_found);
    EXPECT_EQ(root.error().path, fixture_path("scripts/missing.txt"));
}

TEST(Parse, file_source_is_kept)
{
    Script_Parser parser;
    const Result<Node, IO_Error> root
        = parser.parse_file(fixture_path("scripts/include/main.txt"));
    ASSERT_TRUE(root);
    EXPECT_TRUE(root->has_child("culture"));
    // The text before include expansion, decoded once.
    EXPECT_EQ(parser.get_file_source(), load_fixture("scripts/include/main.txt"));

    const Result<Node, IO_Error> missing
        = parser.parse_file(fixture_path("scripts/missing.txt"));
    ASSERT_FALSE(missing);
    EXPECT_TRUE(parser.get_file_source().empty());
}

} // namespace
} // namespace paradox_data::script
