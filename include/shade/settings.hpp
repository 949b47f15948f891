#ifndef SHADE_SETTINGS_HPP
#define SHADE_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define SHADE_DEBUG 1
#define SHADE_IF_DEBUG(...) __VA_ARGS__
#define SHADE_IF_NOT_DEBUG(...)
#else // release builds
#define SHADE_IF_DEBUG(...)
#define SHADE_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define SHADE_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define SHADE_GCC 1
#endif

#define SHADE_UNREACHABLE() __builtin_unreachable()

namespace shade {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = SHADE_IF_DEBUG(true) SHADE_IF_NOT_DEBUG(false);

/// @brief The default prefix of parameter names whose string arguments
/// are highlighted as embedded source code.
inline constexpr char8_t default_fixture_prefix[] = u8"ra_fixture";

/// @brief The default limit for how deeply embedded source code is highlighted recursively.
inline constexpr std::size_t default_max_injection_depth = 8;

} // namespace shade

#endif
