#ifndef SHADE_TTY_HPP
#define SHADE_TTY_HPP

#include <cstdio>

#include "shade/fwd.hpp"

namespace shade {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]]
bool is_tty(std::FILE*) noexcept;

/// @brief `true` if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace shade

#endif
