#ifndef SHADE_TEXT_RANGE_HPP
#define SHADE_TEXT_RANGE_HPP

#include <compare>
#include <cstddef>
#include <optional>

#include "shade/util/assert.hpp"

#include "shade/fwd.hpp"

namespace shade {

/// @brief A half-open range `[begin, begin + length)` of byte offsets in a source text.
struct Text_Range {
    /// First index in the source text that is part of the range.
    std::size_t begin;
    /// The amount of bytes in the range.
    std::size_t length;

    [[nodiscard]]
    static constexpr Text_Range from_to(std::size_t begin, std::size_t end)
    {
        SHADE_ASSERT(begin <= end);
        return { .begin = begin, .length = end - begin };
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(Text_Range, Text_Range)
        = default;

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }

    [[nodiscard]]
    constexpr bool contains(std::size_t pos) const
    {
        return pos >= begin && pos < end();
    }

    /// @brief Returns `true` if `other` lies entirely within this range.
    [[nodiscard]]
    constexpr bool contains_range(Text_Range other) const
    {
        return other.begin >= begin && other.end() <= end();
    }

    /// @brief Returns a range with the same length, shifted to the right by `offset` bytes.
    [[nodiscard]]
    constexpr Text_Range to_right(std::size_t offset) const
    {
        return { .begin = begin + offset, .length = length };
    }

    /// @brief Returns the common part of `*this` and `other`.
    /// Ranges which merely touch intersect in an empty range,
    /// so `[0, 2)` and `[2, 4)` intersect in `[2, 2)`.
    /// If the ranges are disjoint, returns `std::nullopt`.
    [[nodiscard]]
    constexpr std::optional<Text_Range> intersect(Text_Range other) const
    {
        const std::size_t first = begin > other.begin ? begin : other.begin;
        const std::size_t last = end() < other.end() ? end() : other.end();
        if (first > last) {
            return std::nullopt;
        }
        return from_to(first, last);
    }
};

} // namespace shade

#endif
