#ifndef SHADE_UNICODE_HPP
#define SHADE_UNICODE_HPP

#include <cstddef>
#include <string_view>

#include "ulight/impl/unicode.hpp"

namespace shade::utf8 {

using ulight::utf8::Code_Point_And_Length;
using ulight::utf8::Code_Units_And_Length;
using ulight::utf8::decode_and_length;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::encode8_unchecked;
using ulight::utf8::is_valid;

/// @brief Returns the amount of UTF-16 code units needed to encode `c`.
[[nodiscard]]
constexpr std::size_t utf16_length(char32_t c) noexcept
{
    return c >= 0x10000 ? 2 : 1;
}

} // namespace shade::utf8

#endif
