#ifndef PARADOX_DATA_ASSERT_HPP
#define PARADOX_DATA_ASSERT_HPP

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace paradox_data {

enum struct Assertion_Error_Type { expression, unreachable };

/// @brief Thrown when an internal invariant of the library is violated.
/// This never signals malformed input; it signals a bug.
struct Assertion_Error {
    Assertion_Error_Type type;
    std::string_view message;
    std::source_location location;
};

#ifdef __EXCEPTIONS
#define PARADOX_DATA_RAISE_ASSERTION_ERROR(...) (throw __VA_ARGS__)
#else
#define PARADOX_DATA_RAISE_ASSERTION_ERROR(...) ::std::exit(3)
#endif

// Expects an expression.
// If this expression (after contextual conversion to `bool`) is `false`,
// throws an `Assertion_Error` of type `expression`.
#define PARADOX_DATA_ASSERT(...)                                                                   \
    ((__VA_ARGS__) ? void()                                                                        \
                   : PARADOX_DATA_RAISE_ASSERTION_ERROR(::paradox_data::Assertion_Error {          \
                         ::paradox_data::Assertion_Error_Type::expression, (#__VA_ARGS__),         \
                         ::std::source_location::current() }))

/// Expects a string literal.
/// Unconditionally throws `Assertion_Error` of type `unreachable`.
#define PARADOX_DATA_ASSERT_UNREACHABLE(...)                                                       \
    PARADOX_DATA_RAISE_ASSERTION_ERROR(::paradox_data::Assertion_Error {                           \
        ::paradox_data::Assertion_Error_Type::unreachable, ::std::string_view(__VA_ARGS__),        \
        ::std::source_location::current() })

} // namespace paradox_data

#endif
