#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/text_range.hpp"

#include "shade/line_index.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Line_Index_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
};

TEST_F(Line_Index_Test, ascii)
{
    const Line_Index index { u8"ab\ncd\n\nef"sv, &memory };
    EXPECT_EQ(index.line_col(0), (Line_Col { 0, 0 }));
    EXPECT_EQ(index.line_col(2), (Line_Col { 0, 2 }));
    EXPECT_EQ(index.line_col(3), (Line_Col { 1, 0 }));
    EXPECT_EQ(index.line_col(6), (Line_Col { 2, 0 }));
    EXPECT_EQ(index.line_col(8), (Line_Col { 3, 1 }));

    EXPECT_EQ(index.offset({ 1, 1 }), 4);
    EXPECT_EQ(index.offset({ 3, 2 }), 9);
}

TEST_F(Line_Index_Test, wide_characters)
{
    // U+00E9 is two bytes in UTF-8 and U+1F600 is four bytes,
    // but they are one and two UTF-16 code units respectively.
    const Line_Index index { u8"xéy\n\U0001F600z"sv, &memory };
    EXPECT_EQ(index.line_col(1), (Line_Col { 0, 1 }));
    EXPECT_EQ(index.line_col(3), (Line_Col { 0, 2 }));
    EXPECT_EQ(index.line_col(9), (Line_Col { 1, 2 }));

    EXPECT_EQ(index.offset({ 0, 2 }), 3);
    EXPECT_EQ(index.offset({ 1, 2 }), 9);
    EXPECT_EQ(index.offset({ 1, 3 }), 10);
}

TEST_F(Line_Index_Test, lines)
{
    const Line_Index index { u8"ab\ncd\n\nef"sv, &memory };
    std::pmr::vector<Text_Range> out { &memory };

    index.lines(out, Text_Range::from_to(1, 8));
    const Text_Range expected[] {
        Text_Range::from_to(1, 3),
        Text_Range::from_to(3, 6),
        Text_Range::from_to(6, 7),
        Text_Range::from_to(7, 8),
    };
    ASSERT_EQ(out.size(), std::size(expected));
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i], expected[i]);
    }

    out.clear();
    index.lines(out, Text_Range::from_to(3, 5));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out[0], Text_Range::from_to(3, 5));

    out.clear();
    index.lines(out, Text_Range::from_to(4, 4));
    EXPECT_TRUE(out.empty());
}

} // namespace
} // namespace shade
