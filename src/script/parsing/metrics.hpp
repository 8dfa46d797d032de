#ifndef PARADOX_DATA_SCRIPT_METRICS_HPP
#define PARADOX_DATA_SCRIPT_METRICS_HPP

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "common/config.hpp"

#include "script/fwd.hpp"

namespace paradox_data::script {

using Duration = std::chrono::nanoseconds;

/// @brief Counts and timings of a single parse invocation.
struct Parsing_Metrics {
    Duration tokenization_time {};
    Duration parsing_time {};
    Duration file_io_time {};
    /// @brief Time spent expanding `@include` directives.
    Duration preprocessing_time {};

    Size tokens_processed = 0;
    Size lines_processed = 0;
    Size input_size_bytes = 0;
    Size error_count = 0;
    Size warning_count = 0;

    /// @brief Named timings, such as the time spent reading one included file.
    std::map<std::string, Duration, std::less<>> custom_timings;
    /// @brief Named counters, such as `includes_processed`.
    std::map<std::string, Size, std::less<>> counters;

    /// @brief Time spent tokenizing and parsing, excluding file I/O and preprocessing.
    [[nodiscard]] Duration total_parsing_time() const noexcept
    {
        return tokenization_time + parsing_time;
    }

    [[nodiscard]] Duration total_time() const noexcept
    {
        return tokenization_time + parsing_time + file_io_time + preprocessing_time;
    }

    /// @brief Returns tokens per second of total parsing time.
    /// Durations below one millisecond count as one millisecond.
    [[nodiscard]] double tokens_per_second() const noexcept;

    /// @brief Returns input bytes per second of total time.
    /// Durations below one millisecond count as one millisecond.
    [[nodiscard]] double bytes_per_second() const noexcept;

    /// @brief Returns the value of the named counter, or zero if it was never incremented.
    [[nodiscard]] Size counter(std::string_view name) const;

    void increment_counter(std::string_view name, Size amount = 1);

    /// @brief Returns the named custom timing, creating it with zero duration if necessary.
    [[nodiscard]] Duration& custom_timing(std::string_view name);

    void reset();
};

/// @brief Measures the time between construction and destruction and adds it to a `Duration`.
struct [[nodiscard]] Scoped_Timer {
private:
    using Clock = std::chrono::steady_clock;

    Duration& m_target;
    Clock::time_point m_start;

public:
    explicit Scoped_Timer(Duration& target) noexcept
        : m_target(target)
        , m_start(Clock::now())
    {
    }

    Scoped_Timer(const Scoped_Timer&) = delete;
    Scoped_Timer& operator=(const Scoped_Timer&) = delete;

    ~Scoped_Timer()
    {
        m_target += std::chrono::duration_cast<Duration>(Clock::now() - m_start);
    }

    [[nodiscard]] Duration elapsed() const noexcept
    {
        return std::chrono::duration_cast<Duration>(Clock::now() - m_start);
    }
};

} // namespace paradox_data::script

#endif
