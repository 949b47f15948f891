#ifndef SHADE_ASSERT_HPP
#define SHADE_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace shade {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;
using ulight::assertion_handler;
using ulight::handle_assertion;

#define SHADE_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define SHADE_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define SHADE_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define SHADE_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace shade

#endif
