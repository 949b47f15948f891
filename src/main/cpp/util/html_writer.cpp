#include <algorithm>
#include <cstddef>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/chars.hpp"
#include "shade/util/html_writer.hpp"

namespace shade {

namespace {

[[nodiscard]]
std::u8string_view html_entity_of(char8_t c)
{
    switch (c) {
    case u8'&': return u8"&amp;";
    case u8'<': return u8"&lt;";
    case u8'>': return u8"&gt;";
    case u8'\'': return u8"&apos;";
    case u8'"': return u8"&quot;";
    default: SHADE_ASSERT_UNREACHABLE(u8"We only support a handful of characters.");
    }
}

} // namespace

void append(std::pmr::vector<char8_t>& out, std::u8string_view text)
{
    out.insert(out.end(), text.data(), text.data() + text.size());
}

void append_html_escaped(
    std::pmr::vector<char8_t>& out,
    std::u8string_view text,
    std::u8string_view charset
)
{
    while (!text.empty()) {
        const std::size_t bracket_pos = text.find_first_of(charset);
        const auto snippet = text.substr(0, std::min(text.length(), bracket_pos));
        append(out, snippet);
        if (bracket_pos == std::string_view::npos) {
            break;
        }
        append(out, html_entity_of(text[bracket_pos]));
        text = text.substr(bracket_pos + 1);
    }
}

bool is_html_tag_name(std::u8string_view name)
{
    return !name.empty() && is_ascii_lower_alpha(name.front())
        && std::ranges::all_of(name, [](char8_t c) {
               return is_ascii_lower_alpha(c) || is_ascii_digit(c);
           });
}

void HTML_Writer::do_write(char_type c)
{
    m_out.push_back(c);
}

void HTML_Writer::do_write(string_view_type str)
{
    append(m_out, str);
}

void HTML_Writer::write_inner_text(string_view_type text)
{
    SHADE_ASSERT(!m_in_attributes);
    append_html_escaped(m_out, text, u8"&<>");
}

HTML_Writer& HTML_Writer::open_tag(string_view_type id)
{
    SHADE_ASSERT(!m_in_attributes);
    SHADE_ASSERT(is_html_tag_name(id));

    do_write(u8'<');
    do_write(id);
    do_write(u8'>');
    ++m_depth;

    return *this;
}

Attribute_Writer HTML_Writer::open_tag_with_attributes(string_view_type id)
{
    SHADE_ASSERT(!m_in_attributes);
    SHADE_ASSERT(is_html_tag_name(id));

    do_write(u8'<');
    do_write(id);

    return Attribute_Writer { *this };
}

HTML_Writer& HTML_Writer::close_tag(string_view_type id)
{
    SHADE_ASSERT(!m_in_attributes);
    SHADE_ASSERT(is_html_tag_name(id));
    SHADE_ASSERT(m_depth != 0);

    --m_depth;

    do_write(u8"</");
    do_write(id);
    do_write(u8'>');

    return *this;
}

HTML_Writer& HTML_Writer::write_attribute(string_view_type key, string_view_type value)
{
    SHADE_ASSERT(m_in_attributes);
    SHADE_ASSERT(!key.empty());

    do_write(u8' ');
    do_write(key);
    do_write(u8"=\"");
    append_html_escaped(m_out, value, u8"&\"");
    do_write(u8'"');

    return *this;
}

HTML_Writer& HTML_Writer::end_attributes()
{
    SHADE_ASSERT(m_in_attributes);

    do_write(u8'>');
    m_in_attributes = false;
    ++m_depth;

    return *this;
}

} // namespace shade
