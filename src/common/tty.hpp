#ifndef PARADOX_DATA_TTY_HPP
#define PARADOX_DATA_TTY_HPP

#include <cstdio>

namespace paradox_data {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stdout)` is `true`.
/// Diagnostics printed to `std::cout` are colored only if this is set.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace paradox_data

#endif
