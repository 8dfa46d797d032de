#include <algorithm>

#include "script/parsing/metrics.hpp"

namespace paradox_data::script {

namespace {

[[nodiscard]] double at_least_one_millisecond(Duration d) noexcept
{
    return std::max(std::chrono::duration<double>(d).count(), 0.001);
}

} // namespace

double Parsing_Metrics::tokens_per_second() const noexcept
{
    return double(tokens_processed) / at_least_one_millisecond(total_parsing_time());
}

double Parsing_Metrics::bytes_per_second() const noexcept
{
    return double(input_size_bytes) / at_least_one_millisecond(total_time());
}

Size Parsing_Metrics::counter(std::string_view name) const
{
    const auto it = counters.find(name);
    return it == counters.end() ? 0 : it->second;
}

void Parsing_Metrics::increment_counter(std::string_view name, Size amount)
{
    const auto it = counters.find(name);
    if (it == counters.end()) {
        counters.emplace(std::string(name), amount);
    }
    else {
        it->second += amount;
    }
}

Duration& Parsing_Metrics::custom_timing(std::string_view name)
{
    auto it = custom_timings.find(name);
    if (it == custom_timings.end()) {
        it = custom_timings.emplace(std::string(name), Duration {}).first;
    }
    return it->second;
}

void Parsing_Metrics::reset()
{
    *this = {};
}

} // namespace paradox_data::script
