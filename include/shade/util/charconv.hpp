#ifndef SHADE_CHARCONV_HPP
#define SHADE_CHARCONV_HPP

#include <charconv>
#include <concepts>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "shade/util/assert.hpp"
#include "shade/util/strings.hpp"

namespace shade {

/// @brief Parses the whole of `sv` as an integer.
/// @returns The integer, or `std::nullopt` if `sv` is not entirely an integer in the given base,
/// or if it is out of range for `T`.
template <std::integral T>
[[nodiscard]]
std::optional<T> from_characters(std::u8string_view sv, int base = 10)
{
    const std::string_view chars = as_string_view(sv);
    T result {};
    const std::from_chars_result r
        = std::from_chars(chars.data(), chars.data() + chars.size(), result, base);
    if (r.ec != std::errc {} || r.ptr != chars.data() + chars.size()) {
        return std::nullopt;
    }
    return result;
}

/// @brief Appends the decimal representation of `x` to `out`.
template <std::integral T, typename String>
void append_integer(String& out, T x)
{
    char buffer[std::numeric_limits<T>::digits10 + 3];
    const std::to_chars_result r = std::to_chars(std::begin(buffer), std::end(buffer), x);
    SHADE_ASSERT(r.ec == std::errc {});
    for (const char* p = buffer; p != r.ptr; ++p) {
        out.push_back(char8_t(*p));
    }
}

} // namespace shade

#endif
