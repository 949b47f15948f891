#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "shade/util/text_range.hpp"
#include "shade/util/unicode.hpp"

#include "shade/line_index.hpp"

namespace shade {

Line_Index::Line_Index(std::u8string_view text, std::pmr::memory_resource* memory)
    : m_newlines { memory }
    , m_wide_chars { memory }
{
    std::pmr::vector<Wide_Char> wide_chars { memory };
    std::size_t line = 0;
    std::size_t column = 0;
    std::size_t offset = 0;

    while (offset < text.size()) {
        if (text[offset] == u8'\n') {
            ++offset;
            m_newlines.push_back(offset);
            if (!wide_chars.empty()) {
                m_wide_chars.emplace(line, std::move(wide_chars));
                wide_chars = std::pmr::vector<Wide_Char> { memory };
            }
            ++line;
            column = 0;
            continue;
        }
        const auto [_, length] = utf8::decode_and_length_or_replacement(text.substr(offset));
        const auto char_length = std::size_t(length);
        if (char_length > 1) {
            wide_chars.push_back({ .begin = column, .end = column + char_length });
        }
        column += char_length;
        offset += char_length;
    }
    if (!wide_chars.empty()) {
        m_wide_chars.emplace(line, std::move(wide_chars));
    }
}

Line_Col Line_Index::line_col(std::size_t offset) const
{
    const auto next_line = std::ranges::upper_bound(m_newlines, offset);
    const auto line = std::size_t(next_line - m_newlines.begin());
    const std::size_t line_start = line == 0 ? 0 : m_newlines[line - 1];
    return { .line = line, .col_utf16 = utf8_to_utf16_col(line, offset - line_start) };
}

std::size_t Line_Index::offset(Line_Col pos) const
{
    const std::size_t line_start = pos.line == 0 ? 0 : m_newlines[pos.line - 1];
    return line_start + utf16_to_utf8_col(pos.line, pos.col_utf16);
}

void Line_Index::lines(std::pmr::vector<Text_Range>& out, Text_Range range) const
{
    const auto first = std::ranges::lower_bound(m_newlines, range.begin + 1);
    const auto last = std::ranges::upper_bound(m_newlines, range.end());

    std::size_t begin = range.begin;
    for (auto it = first; it != last; ++it) {
        if (*it > begin) {
            out.push_back(Text_Range::from_to(begin, *it));
        }
        begin = *it;
    }
    if (range.end() > begin) {
        out.push_back(Text_Range::from_to(begin, range.end()));
    }
}

std::size_t Line_Index::utf8_to_utf16_col(std::size_t line, std::size_t col) const
{
    const auto it = m_wide_chars.find(line);
    if (it == m_wide_chars.end()) {
        return col;
    }
    std::size_t result = col;
    for (const Wide_Char& c : it->second) {
        if (c.end > col) {
            break;
        }
        result -= c.utf8_length() - c.utf16_length();
    }
    return result;
}

std::size_t Line_Index::utf16_to_utf8_col(std::size_t line, std::size_t col) const
{
    const auto it = m_wide_chars.find(line);
    if (it == m_wide_chars.end()) {
        return col;
    }
    std::size_t result = col;
    for (const Wide_Char& c : it->second) {
        if (result <= c.begin) {
            break;
        }
        result += c.utf8_length() - c.utf16_length();
    }
    return result;
}

} // namespace shade
