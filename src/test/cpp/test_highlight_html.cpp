#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/text_range.hpp"

#include "shade/analysis.hpp"
#include "shade/binding_shadow.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_html.hpp"
#include "shade/highlight_tag.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

[[nodiscard]]
std::u8string_view as_view(std::span<const char8_t> span)
{
    return { span.data(), span.size() };
}

struct Highlight_HTML_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };
};

TEST_F(Highlight_HTML_Test, no_ranges)
{
    write_highlighted_html(out, u8"a < b"sv, {});
    EXPECT_EQ(as_view(out), u8"<pre><code>a &lt; b</code></pre>"sv);
}

TEST_F(Highlight_HTML_Test, overlapping_ranges_are_skipped)
{
    const Highlighted_Range ranges[] {
        { Text_Range::from_to(0, 4), Highlight_Tag::attribute, std::nullopt },
        { Text_Range::from_to(2, 3), Highlight_Tag::keyword, std::nullopt },
        { Text_Range::from_to(5, 6), Highlight { Highlight_Tag::keyword } | Highlight_Modifier::unsafe,
          std::nullopt },
    };
    write_highlighted_html(out, u8"#[a] x"sv, ranges);
    EXPECT_EQ(
        as_view(out),
        u8"<pre><code><span class=\"attribute\">#[a]</span> "
        u8"<span class=\"keyword unsafe\">x</span></code></pre>"sv
    );
}

TEST_F(Highlight_HTML_Test, document)
{
    const Analysis analysis { u8"fn f() { let mut x = 1; }"sv, &memory };
    analysis.highlight_as_html(out, {});
    const std::u8string_view expected
        = u8"<pre><code>"
          u8"<span class=\"keyword\">fn</span> "
          u8"<span class=\"function definition\">f</span>() { "
          u8"<span class=\"keyword\">let</span> "
          u8"<span class=\"keyword\">mut</span> "
          u8"<span class=\"variable definition mutable\" data-binding-hash=\"";
    const std::u8string_view actual = as_view(out);
    ASSERT_TRUE(actual.starts_with(expected));
    EXPECT_TRUE(actual.ends_with(u8"</code></pre>"sv));
}

} // namespace
} // namespace shade
