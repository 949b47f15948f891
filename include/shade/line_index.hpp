#ifndef SHADE_LINE_INDEX_HPP
#define SHADE_LINE_INDEX_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"

namespace shade {

/// @brief A zero-based line and column,
/// where the column is measured in UTF-16 code units as in the Language Server Protocol.
struct Line_Col {
    std::size_t line;
    std::size_t col_utf16;

    [[nodiscard]]
    friend constexpr auto operator<=>(const Line_Col&, const Line_Col&)
        = default;
};

/// @brief Converts between byte offsets and lines and columns in a text.
struct Line_Index {
private:
    /// @brief A character whose UTF-16 length differs from its UTF-8 length,
    /// located by UTF-8 offsets relative to the start of its line.
    struct Wide_Char {
        std::size_t begin;
        std::size_t end;

        [[nodiscard]]
        std::size_t utf8_length() const
        {
            return end - begin;
        }

        [[nodiscard]]
        std::size_t utf16_length() const
        {
            return utf8_length() == 4 ? 2 : 1;
        }
    };

    /// @brief The offsets just past each `\n`.
    std::pmr::vector<std::size_t> m_newlines;
    std::pmr::unordered_map<std::size_t, std::pmr::vector<Wide_Char>> m_wide_chars;

public:
    [[nodiscard]]
    explicit Line_Index(std::u8string_view text, std::pmr::memory_resource* memory);

    [[nodiscard]]
    Line_Col line_col(std::size_t offset) const;

    /// @brief Returns the byte offset of `pos`.
    /// The line and column shall denote a position within the text.
    [[nodiscard]]
    std::size_t offset(Line_Col pos) const;

    /// @brief Splits `range` after every line break within it and appends the non-empty pieces
    /// to `out`.
    void lines(std::pmr::vector<Text_Range>& out, Text_Range range) const;

private:
    [[nodiscard]]
    std::size_t utf8_to_utf16_col(std::size_t line, std::size_t col) const;

    [[nodiscard]]
    std::size_t utf16_to_utf8_col(std::size_t line, std::size_t col) const;
};

} // namespace shade

#endif
