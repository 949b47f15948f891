#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "shade/util/charconv.hpp"
#include "shade/util/chars.hpp"
#include "shade/util/text_range.hpp"
#include "shade/util/unicode.hpp"

#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"
#include "shade/token_text.hpp"

namespace shade {

std::optional<Quote_Offsets> quote_offsets(std::u8string_view text)
{
    const std::size_t first = text.find(u8'"');
    const std::size_t last = text.rfind(u8'"');
    if (first == std::u8string_view::npos || first == last) {
        return std::nullopt;
    }
    return Quote_Offsets {
        .open = Text_Range::from_to(0, first + 1),
        .close = Text_Range::from_to(last, text.length()),
        .contents = Text_Range::from_to(first + 1, last),
    };
}

std::optional<Quote_Offsets> quote_offsets(Syntax_Element token)
{
    const std::optional<Quote_Offsets> relative = quote_offsets(token.text());
    if (!relative) {
        return std::nullopt;
    }
    return relative->to_right(token.range().begin);
}

namespace {

/// @brief Returns `true` for the characters that a line continuation in a string literal skips.
[[nodiscard]]
constexpr bool is_continuation_whitespace(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r';
}

[[nodiscard]]
bool is_hex_digits(std::u8string_view digits)
{
    return std::ranges::all_of(digits, [](char8_t c) { return is_ascii_hex_digit(c); });
}

struct [[nodiscard]] Escape_Decoder {
private:
    const std::u8string_view m_text;
    std::size_t m_pos = 0;
    std::pmr::u8string& m_out;

public:
    Escape_Decoder(std::u8string_view text, std::pmr::u8string& out)
        : m_text { text }
        , m_out { out }
    {
    }

    [[nodiscard]]
    bool operator()()
    {
        while (m_pos < m_text.length()) {
            const std::size_t backslash = m_text.find(u8'\\', m_pos);
            if (backslash == std::u8string_view::npos) {
                m_out += m_text.substr(m_pos);
                return true;
            }
            m_out += m_text.substr(m_pos, backslash - m_pos);
            m_pos = backslash + 1;
            if (!consume_escape()) {
                return false;
            }
        }
        return true;
    }

private:
    [[nodiscard]]
    bool consume_escape()
    {
        if (m_pos >= m_text.length()) {
            return false;
        }
        const char8_t c = m_text[m_pos++];
        switch (c) {
        case u8'n': m_out += u8'\n'; return true;
        case u8'r': m_out += u8'\r'; return true;
        case u8't': m_out += u8'\t'; return true;
        case u8'\\': m_out += u8'\\'; return true;
        case u8'0': m_out += u8'\0'; return true;
        case u8'\'': m_out += u8'\''; return true;
        case u8'"': m_out += u8'"'; return true;
        case u8'x': return consume_hex_escape();
        case u8'u': return consume_unicode_escape();
        case u8'\n': {
            // Line continuation skips the newline and any leading whitespace of the next line.
            while (m_pos < m_text.length() && is_continuation_whitespace(m_text[m_pos])) {
                ++m_pos;
            }
            return true;
        }
        case u8'\r': {
            if (m_pos < m_text.length() && m_text[m_pos] == u8'\n') {
                ++m_pos;
                while (m_pos < m_text.length() && is_continuation_whitespace(m_text[m_pos])) {
                    ++m_pos;
                }
                return true;
            }
            return false;
        }
        default: return false;
        }
    }

    [[nodiscard]]
    bool consume_hex_escape()
    {
        const std::u8string_view digits = m_text.substr(m_pos, 2);
        if (digits.length() != 2 || !is_hex_digits(digits)) {
            return false;
        }
        const std::optional<std::uint8_t> value = from_characters<std::uint8_t>(digits, 16);
        if (!value || *value > 0x7f) {
            return false;
        }
        m_out += char8_t(*value);
        m_pos += 2;
        return true;
    }

    [[nodiscard]]
    bool consume_unicode_escape()
    {
        if (m_pos >= m_text.length() || m_text[m_pos] != u8'{') {
            return false;
        }
        const std::size_t close = m_text.find(u8'}', m_pos + 1);
        if (close == std::u8string_view::npos) {
            return false;
        }
        const std::u8string_view digits = m_text.substr(m_pos + 1, close - m_pos - 1);
        if (digits.empty() || digits.length() > 6 || !is_hex_digits(digits)) {
            return false;
        }
        const std::optional<std::uint32_t> value = from_characters<std::uint32_t>(digits, 16);
        if (!value || !is_scalar_value(char32_t(*value))) {
            return false;
        }
        m_pos = close + 1;
        m_out += utf8::encode8_unchecked(char32_t(*value)).as_string();
        return true;
    }
};

} // namespace

std::optional<std::pmr::u8string>
decode_escaped(std::u8string_view text, std::pmr::memory_resource* memory)
{
    std::pmr::u8string result { memory };
    result.reserve(text.length());
    if (!Escape_Decoder { text, result }()) {
        return std::nullopt;
    }
    return result;
}

std::pmr::u8string decode_raw(std::u8string_view text, std::pmr::memory_resource* memory)
{
    return std::pmr::u8string { text, memory };
}

std::optional<std::pmr::u8string>
string_value(Syntax_Element token, std::pmr::memory_resource* memory)
{
    const Syntax_Kind kind = token.kind();
    if (kind != Syntax_Kind::string && kind != Syntax_Kind::raw_string) {
        return std::nullopt;
    }
    const std::optional<Quote_Offsets> offsets = quote_offsets(token.text());
    if (!offsets) {
        return std::nullopt;
    }
    const std::u8string_view contents
        = token.text().substr(offsets->contents.begin, offsets->contents.length);
    if (kind == Syntax_Kind::raw_string) {
        return decode_raw(contents, memory);
    }
    return decode_escaped(contents, memory);
}

} // namespace shade
