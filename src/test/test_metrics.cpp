#include <chrono>
#include <string_view>

#include <gtest/gtest.h>

#include "script/parsing/metrics.hpp"
#include "script/parsing/script_parser.hpp"

#include "test/file_testing.hpp"

namespace paradox_data::script {
namespace {

using namespace std::chrono_literals;

TEST(Metrics, derived_values)
{
    Parsing_Metrics metrics;
    metrics.tokenization_time = 1ms;
    metrics.parsing_time = 3ms;
    metrics.file_io_time = 2ms;
    metrics.preprocessing_time = 4ms;
    metrics.tokens_processed = 400;
    metrics.input_size_bytes = 1000;

    EXPECT_EQ(metrics.total_parsing_time(), 4ms);
    EXPECT_EQ(metrics.total_time(), 10ms);
    EXPECT_DOUBLE_EQ(metrics.tokens_per_second(), 100'000);
    EXPECT_DOUBLE_EQ(metrics.bytes_per_second(), 100'000);
}

TEST(Metrics, throughput_uses_at_least_one_millisecond)
{
    Parsing_Metrics metrics;
    metrics.tokens_processed = 5;
    metrics.input_size_bytes = 7;
    EXPECT_DOUBLE_EQ(metrics.tokens_per_second(), 5000);
    EXPECT_DOUBLE_EQ(metrics.bytes_per_second(), 7000);
}

TEST(Metrics, counters_and_custom_timings)
{
    Parsing_Metrics metrics;
    EXPECT_EQ(metrics.counter("includes_processed"), 0);
    metrics.increment_counter("includes_processed");
    metrics.increment_counter("includes_processed", 2);
    EXPECT_EQ(metrics.counter("includes_processed"), 3);

    metrics.custom_timing("include:a.txt") += 5ms;
    metrics.custom_timing("include:a.txt") += 1ms;
    EXPECT_EQ(metrics.custom_timing("include:a.txt"), 6ms);

    metrics.reset();
    EXPECT_TRUE(metrics.counters.empty());
    EXPECT_TRUE(metrics.custom_timings.empty());
}

TEST(Metrics, scoped_timer_accumulates)
{
    Duration total {};
    {
        Scoped_Timer timer { total };
        EXPECT_GE(timer.elapsed(), Duration::zero());
    }
    const Duration first = total;
    EXPECT_GE(first, Duration::zero());
    {
        Scoped_Timer timer { total };
    }
    EXPECT_GE(total, first);
}

TEST(Metrics, parse_records_counts)
{
    constexpr std::string_view source = "# comment\na = 1\nb = { c = yes }\n";
    Script_Parser parser;
    (void)parser.parse(source);

    const Parsing_Metrics& metrics = parser.metrics();
    EXPECT_EQ(metrics.input_size_bytes, source.size());
    EXPECT_EQ(metrics.lines_processed, 3);
    // comment, a, =, 1, b, =, {, c, =, yes, }
    EXPECT_EQ(metrics.tokens_processed, 11);
    EXPECT_EQ(metrics.error_count, 0);
    EXPECT_EQ(metrics.file_io_time, Duration::zero());
    EXPECT_EQ(metrics.preprocessing_time, Duration::zero());
}

TEST(Metrics, reset_between_calls)
{
    Script_Parser parser;
    (void)parser.parse("a = 1 b = 2 c = 3");
    EXPECT_EQ(parser.metrics().tokens_processed, 9);
    (void)parser.parse("a = 1");
    EXPECT_EQ(parser.metrics().tokens_processed, 3);
    EXPECT_EQ(parser.metrics().lines_processed, 1);
}

TEST(Metrics, parse_file_records_file_io)
{
    Script_Parser parser;
    const Result<Node, IO_Error> root = parser.parse_file(fixture_path("scripts/province.txt"));
    ASSERT_TRUE(root);
    EXPECT_GT(parser.metrics().input_size_bytes, 0);
    EXPECT_GT(parser.metrics().tokens_processed, 0);
    EXPECT_GE(parser.metrics().total_time(), parser.metrics().total_parsing_time());
}

} // namespace
} // namespace paradox_data::script
