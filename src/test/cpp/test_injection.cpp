#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/severity.hpp"
#include "shade/util/text_range.hpp"

#include "shade/analysis.hpp"
#include "shade/collecting_logger.hpp"
#include "shade/diagnostic.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_tag.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

constexpr std::u8string_view fixture_source
    = u8"fn fixture(ra_fixture: &str) {} fn main() { fixture(r\"fn foo() {}\"); }";

struct Injection_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    std::optional<Analysis> analysis;
    std::pmr::vector<Highlighted_Range> ranges { &memory };

    void run(std::u8string_view source, std::size_t max_injection_depth = 8)
    {
        analysis.emplace(source, &memory);
        ranges.clear();
        const Highlight_Options options {
            .max_injection_depth = max_injection_depth,
            .logger = &logger,
        };
        analysis->highlight(ranges, std::nullopt, options);
    }

    /// @brief Returns the listing of all ranges that begin at or after `offset`.
    [[nodiscard]]
    std::pmr::u8string listing_from(std::size_t offset)
    {
        std::pmr::u8string result { &memory };
        for (const Highlighted_Range& r : ranges) {
            if (r.range.begin < offset) {
                continue;
            }
            result += analysis->text().substr(r.range.begin, r.range.length);
            result += u8':';
            append_highlight_name(result, r.highlight);
            result += u8'\n';
        }
        return result;
    }
};

TEST_F(Injection_Test, fixture_parameter)
{
    run(fixture_source);
    const std::size_t literal_begin = fixture_source.find(u8"r\"");
    ASSERT_NE(literal_begin, std::u8string_view::npos);

    const std::u8string_view expected = u8"r\":string_literal\n"
                                        u8"fn:keyword\n"
                                        u8"foo:function.definition\n"
                                        u8"\":string_literal\n";
    EXPECT_EQ(listing_from(literal_begin), expected);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_applied));

    // Nested ranges are in the coordinates of the outer document.
    for (const Highlighted_Range& r : ranges) {
        EXPECT_LE(r.range.end(), fixture_source.size());
    }
}

TEST_F(Injection_Test, custom_prefix)
{
    analysis.emplace(fixture_source, &memory);
    const Highlight_Options options { .fixture_prefix = u8"sql_", .logger = &logger };
    analysis->highlight(ranges, std::nullopt, options);

    EXPECT_TRUE(logger.was_logged(diagnostic::injection_parameter));
    EXPECT_FALSE(logger.was_logged(diagnostic::injection_applied));
}

TEST_F(Injection_Test, other_parameter)
{
    constexpr std::u8string_view source
        = u8"fn f(text: &str) {} fn main() { f(r\"fn foo() {}\"); }";
    run(source);

    const std::size_t literal_begin = source.find(u8"r\"");
    const std::u8string_view expected = u8"r\"fn foo() {}\":string_literal\n";
    EXPECT_EQ(listing_from(literal_begin), expected);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_parameter));
}

TEST_F(Injection_Test, fixture_parameter_within_macro)
{
    constexpr std::u8string_view source
        = u8"fn fixture(ra_fixture: &str) {} fn main() { m!(fixture(r\"fn f() {}\")); }";
    run(source);
    const std::size_t literal_begin = source.find(u8"r\"");
    ASSERT_NE(literal_begin, std::u8string_view::npos);

    const std::u8string_view expected = u8"r\":string_literal\n"
                                        u8"fn:keyword\n"
                                        u8"f:function.definition\n"
                                        u8"\":string_literal\n";
    EXPECT_EQ(listing_from(literal_begin), expected);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_applied));
}

TEST_F(Injection_Test, other_parameter_within_macro)
{
    constexpr std::u8string_view source
        = u8"fn f(text: &str) {} fn main() { m!(f(r\"fn foo() {}\")); }";
    run(source);
    const std::size_t literal_begin = source.find(u8"r\"");
    ASSERT_NE(literal_begin, std::u8string_view::npos);

    const std::u8string_view expected = u8"r\"fn foo() {}\":string_literal\n";
    EXPECT_EQ(listing_from(literal_begin), expected);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_parameter));
    EXPECT_FALSE(logger.was_logged(diagnostic::injection_applied));
}

TEST_F(Injection_Test, not_an_argument)
{
    run(u8"fn main() { let s = r\"fn foo() {}\"; }"sv);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_no_call));
    EXPECT_FALSE(logger.was_logged(diagnostic::injection_applied));
}

TEST_F(Injection_Test, depth_limit)
{
    run(fixture_source, 0);
    ASSERT_TRUE(logger.was_logged(diagnostic::injection_depth));

    const std::size_t literal_begin = fixture_source.find(u8"r\"");
    const std::u8string_view expected = u8"r\"fn foo() {}\":string_literal\n";
    EXPECT_EQ(listing_from(literal_begin), expected);

    for (const Collected_Diagnostic& d : logger.diagnostics) {
        if (d.id == diagnostic::injection_depth) {
            EXPECT_EQ(d.severity, Severity::warning);
        }
    }
}

TEST_F(Injection_Test, nested_fixture)
{
    // The embedded code itself passes a fixture, so it is highlighted two levels deep.
    constexpr std::u8string_view source
        = u8"fn fixture(ra_fixture: &str) {} "
          u8"fn main() { fixture(r#\"fn g(ra_fixture: &str) {} fn h() { g(r\"1\"); }\"#); }";
    run(source);
    const std::size_t inner = source.find(u8"r\"1\"");
    ASSERT_NE(inner, std::u8string_view::npos);
    const std::u8string_view expected = u8"r\":string_literal\n"
                                        u8"1:numeric_literal\n"
                                        u8"\":string_literal\n"
                                        u8"\"#:string_literal\n";
    EXPECT_EQ(listing_from(inner), expected);

    run(source, 1);
    EXPECT_TRUE(logger.was_logged(diagnostic::injection_depth));
    const std::u8string_view limited = u8"r\"1\":string_literal\n"
                                       u8"\"#:string_literal\n";
    EXPECT_EQ(listing_from(inner), limited);
}

} // namespace
} // namespace shade
