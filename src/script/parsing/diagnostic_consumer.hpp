#ifndef PARADOX_DATA_SCRIPT_DIAGNOSTIC_CONSUMER_HPP
#define PARADOX_DATA_SCRIPT_DIAGNOSTIC_CONSUMER_HPP

#include <vector>

#include "script/fwd.hpp"
#include "script/parsing/diagnostic.hpp"

namespace paradox_data::script {

/// @brief A consumer for diagnostics that can be used throughout preprocessing and parsing.
struct Diagnostic_Consumer {
    virtual ~Diagnostic_Consumer() = default;

    /// @brief Consumes a `Diagnostic`
    virtual void operator()(Diagnostic&&) = 0;

    /// @brief Returns the total amount of errors.
    [[nodiscard]] virtual Size error_count() const noexcept = 0;

    /// @brief Returns the total amount of warnings.
    [[nodiscard]] virtual Size warning_count() const noexcept = 0;

    /// @brief Removes all collected diagnostics from the consumer.
    ///
    /// Postcondition: `error_count()` and `warning_count()` are zero.
    virtual void clear() noexcept = 0;

    /// @brief Equivalent to: `error_count() == 0`
    [[nodiscard]] bool ok() const noexcept
    {
        return error_count() == 0;
    }
};

/// @brief Stores errors and warnings separately, in the order they were reported.
struct Diagnostic_Log final : Diagnostic_Consumer {
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;

    void operator()(Diagnostic&& diagnostic) override
    {
        (diagnostic.is_error() ? errors : warnings).push_back(std::move(diagnostic));
    }

    [[nodiscard]] Size error_count() const noexcept override
    {
        return errors.size();
    }

    [[nodiscard]] Size warning_count() const noexcept override
    {
        return warnings.size();
    }

    void clear() noexcept override
    {
        errors.clear();
        warnings.clear();
    }
};

} // namespace paradox_data::script

#endif
