#ifndef SHADE_TOKEN_TEXT_HPP
#define SHADE_TOKEN_TEXT_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief The locations of the quotes within a quoted literal, such as `"abc"` or `r#"abc"#`.
/// The opening quote range extends from the start of the literal through the first `"`,
/// so it includes prefixes such as `r#` or `b`.
/// The closing quote range extends from the last `"` through the end of the literal,
/// so it includes any trailing `#`.
struct Quote_Offsets {
    Text_Range open;
    Text_Range close;
    Text_Range contents;

    [[nodiscard]]
    friend constexpr bool operator==(const Quote_Offsets&, const Quote_Offsets&)
        = default;

    /// @brief Returns a copy where every range is moved to the right by `offset`.
    [[nodiscard]]
    constexpr Quote_Offsets to_right(std::size_t offset) const
    {
        return { open.to_right(offset), close.to_right(offset), contents.to_right(offset) };
    }
};

/// @brief Locates the first and last `"` in `text`.
/// @returns The offsets relative to the start of `text`,
/// or `std::nullopt` if `text` contains fewer than two quotes.
[[nodiscard]]
std::optional<Quote_Offsets> quote_offsets(std::u8string_view text);

/// @brief Like `quote_offsets(token.text())`, but with ranges in document coordinates.
[[nodiscard]]
std::optional<Quote_Offsets> quote_offsets(Syntax_Element token);

/// @brief Decodes the contents of a non-raw string literal,
/// i.e. the text between the quotes.
/// @returns The decoded value, or `std::nullopt` if any escape sequence is malformed.
[[nodiscard]]
std::optional<std::pmr::u8string>
decode_escaped(std::u8string_view text, std::pmr::memory_resource* memory);

/// @brief Returns the contents of a raw string literal, which contain no escape sequences.
[[nodiscard]]
std::pmr::u8string decode_raw(std::u8string_view text, std::pmr::memory_resource* memory);

/// @brief Returns the value of a `string` or `raw_string` token.
/// @returns The value, or `std::nullopt` if `token` is another kind of token,
/// if its quotes cannot be found, or if it contains malformed escape sequences.
[[nodiscard]]
std::optional<std::pmr::u8string>
string_value(Syntax_Element token, std::pmr::memory_resource* memory);

} // namespace shade

#endif
