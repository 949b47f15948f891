#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/charconv.hpp"
#include "shade/util/html_writer.hpp"

#include "shade/analysis.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_html.hpp"
#include "shade/highlight_tag.hpp"

namespace shade {

void write_highlighted_html(
    std::pmr::vector<char8_t>& out,
    std::u8string_view text,
    std::span<const Highlighted_Range> ranges
)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    std::pmr::u8string classes { memory };
    std::pmr::u8string hash { memory };

    HTML_Writer writer { out };
    writer.open_tag(u8"pre");
    writer.open_tag(u8"code");

    std::size_t pos = 0;
    for (const Highlighted_Range& r : ranges) {
        if (r.range.begin < pos || r.range.end() > text.size()) {
            continue;
        }
        writer.write_inner_text(text.substr(pos, r.range.begin - pos));

        classes.clear();
        append_highlight_name(classes, r.highlight, u8' ');
        Attribute_Writer attributes = writer.open_tag_with_attributes(u8"span");
        attributes.write_attribute(u8"class", classes);
        if (r.binding) {
            hash.clear();
            append_integer(hash, *r.binding);
            attributes.write_attribute(u8"data-binding-hash", hash);
        }
        attributes.end();
        writer.write_inner_text(text.substr(r.range.begin, r.range.length));
        writer.close_tag(u8"span");

        pos = r.range.end();
    }
    writer.write_inner_text(text.substr(pos));

    writer.close_tag(u8"code");
    writer.close_tag(u8"pre");
    SHADE_ASSERT(writer.is_done());
}

void highlight_as_html(
    std::pmr::vector<char8_t>& out,
    const Analysis& analysis,
    const Highlight_Options& options
)
{
    std::pmr::vector<Highlighted_Range> ranges { out.get_allocator().resource() };
    analysis.highlight(ranges, std::nullopt, options);
    write_highlighted_html(out, analysis.text(), ranges);
}

} // namespace shade
