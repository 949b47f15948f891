#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/assert.hpp"
#include "shade/util/html_writer.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

[[nodiscard]]
std::u8string_view as_view(std::span<const char8_t> span)
{
    return { span.data(), span.size() };
}

struct HTML_Writer_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };
    HTML_Writer writer { out };
};

TEST_F(HTML_Writer_Test, empty)
{
    constexpr std::u8string_view expected;
    EXPECT_EQ(expected, as_view(out));
    EXPECT_TRUE(writer.is_done());
}

TEST_F(HTML_Writer_Test, inner_text)
{
    constexpr std::u8string_view expected = u8"&lt;hello&amp;&gt;\"'"sv;

    writer.write_inner_text(u8"<hello&>\"'"sv);

    EXPECT_EQ(expected, as_view(out));
}

TEST_F(HTML_Writer_Test, tag)
{
    constexpr std::u8string_view expected = u8"<pre><code>Hello, world!</code></pre>"sv;

    writer.open_tag(u8"pre"sv);
    writer.open_tag(u8"code"sv);
    EXPECT_FALSE(writer.is_done());
    writer.write_inner_text(u8"Hello, world!"sv);
    writer.close_tag(u8"code"sv);
    writer.close_tag(u8"pre"sv);

    EXPECT_EQ(expected, as_view(out));
    EXPECT_TRUE(writer.is_done());
}

TEST_F(HTML_Writer_Test, attributes)
{
    constexpr std::u8string_view expected
        = u8"<span class=\"a b\" data-x=\"&quot;&amp;'\">x</span>"sv;

    writer.open_tag_with_attributes(u8"span"sv)
        .write_attribute(u8"class"sv, u8"a b"sv)
        .write_attribute(u8"data-x"sv, u8"\"&'"sv)
        .end();
    writer.write_inner_text(u8"x"sv);
    writer.close_tag(u8"span"sv);

    EXPECT_EQ(expected, as_view(out));
}

TEST_F(HTML_Writer_Test, invalid_tag_name)
{
    EXPECT_THROW(writer.open_tag(u8"Span"sv), Assertion_Error);
}

TEST(HTML, is_html_tag_name)
{
    EXPECT_TRUE(is_html_tag_name(u8"h1"sv));
    EXPECT_TRUE(is_html_tag_name(u8"span"sv));
    EXPECT_FALSE(is_html_tag_name(u8""sv));
    EXPECT_FALSE(is_html_tag_name(u8"1h"sv));
    EXPECT_FALSE(is_html_tag_name(u8"my-tag"sv));
}

TEST(HTML, append_html_escaped)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };
    append_html_escaped(out, u8"<a href=\"x\">"sv, u8"\""sv);
    EXPECT_EQ(as_view(out), u8"<a href=&quot;x&quot;>"sv);
}

} // namespace
} // namespace shade
