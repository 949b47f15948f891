#ifndef SHADE_CHARS_HPP
#define SHADE_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace shade {

using ulight::code_point_max;
using ulight::code_point_max_ascii;
using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::is_scalar_value;

/// @brief Returns `true` if `c` is whitespace that separates tokens.
[[nodiscard]]
constexpr bool is_rust_whitespace(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r' || c == u8'\v' || c == u8'\f';
}

/// @brief Returns `true` if `c` can begin an identifier.
/// All non-ASCII code units are accepted,
/// so that identifiers in other scripts form a single token.
[[nodiscard]]
constexpr bool is_identifier_start(char8_t c)
{
    return is_ascii_alpha(c) || c == u8'_' || !is_ascii(c);
}

[[nodiscard]]
constexpr bool is_identifier_continue(char8_t c)
{
    return is_ascii_alphanumeric(c) || c == u8'_' || !is_ascii(c);
}

} // namespace shade

#endif
