#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/text_range.hpp"

#include "shade/diagnostic.hpp"
#include "shade/lex.hpp"
#include "shade/syntax_kind.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Text_Token {
    Syntax_Kind kind;
    std::u8string_view text;

    [[nodiscard]]
    friend bool operator==(const Text_Token&, const Text_Token&)
        = default;
};

struct Lex_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Token> tokens { &memory };
    std::pmr::vector<Text_Range> errors { &memory };

    /// @brief Lexes `source` and returns the non-whitespace tokens with their text.
    [[nodiscard]]
    std::pmr::vector<Text_Token> lex_text(std::u8string_view source)
    {
        tokens.clear();
        errors.clear();
        auto on_error = [&](std::u8string_view id, Text_Range location, std::u8string_view) {
            EXPECT_EQ(id, diagnostic::lex);
            errors.push_back(location);
        };
        const bool success = lex(tokens, source, on_error);
        EXPECT_EQ(success, errors.empty());

        std::pmr::vector<Text_Token> result { &memory };
        std::size_t expected_begin = 0;
        for (const Token& t : tokens) {
            EXPECT_EQ(t.range.begin, expected_begin);
            expected_begin = t.range.end();
            if (t.kind != Syntax_Kind::whitespace) {
                result.push_back({ t.kind, source.substr(t.range.begin, t.range.length) });
            }
        }
        EXPECT_EQ(expected_begin, source.length());
        return result;
    }
};

TEST_F(Lex_Test, empty)
{
    EXPECT_TRUE(lex_text(u8""sv).empty());
    EXPECT_TRUE(tokens.empty());
}

TEST_F(Lex_Test, keywords_and_identifiers)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual = lex_text(u8"fn main union Self self r#fn _"sv);
    const Text_Token expected[] {
        { fn_kw, u8"fn" },     { ident, u8"main" },  { ident, u8"union" }, { self_type_kw, u8"Self" },
        { self_kw, u8"self" }, { ident, u8"r#fn" }, { underscore, u8"_" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
}

TEST_F(Lex_Test, comments)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual
        = lex_text(u8"// line\n/* block /* nested */ */x"sv);
    const Text_Token expected[] {
        { comment, u8"// line" },
        { comment, u8"/* block /* nested */ */" },
        { ident, u8"x" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
}

TEST_F(Lex_Test, unterminated_block_comment)
{
    const std::pmr::vector<Text_Token> actual = lex_text(u8"/* /* */"sv);
    ASSERT_EQ(actual.size(), 1);
    EXPECT_EQ(actual[0].kind, Syntax_Kind::comment);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0], Text_Range::from_to(0, 2));
}

TEST_F(Lex_Test, numbers)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual
        = lex_text(u8"1 1_000u32 0xff 1.5 1e10 2.0f32 1f64 0..1 1.foo"sv);
    const Text_Token expected[] {
        { int_number, u8"1" },      { int_number, u8"1_000u32" }, { int_number, u8"0xff" },
        { float_number, u8"1.5" },  { float_number, u8"1e10" },   { float_number, u8"2.0f32" },
        { float_number, u8"1f64" }, { int_number, u8"0" },        { dot2, u8".." },
        { int_number, u8"1" },      { int_number, u8"1" },        { dot, u8"." },
        { ident, u8"foo" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
}

TEST_F(Lex_Test, chars_and_lifetimes)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual = lex_text(u8R"('a 'a' '\n' b'x' 'static 'ä')"sv);
    const Text_Token expected[] {
        { lifetime, u8"'a" }, { char_, u8"'a'" },       { char_, u8R"('\n')" },
        { byte, u8"b'x'" },   { lifetime, u8"'static" }, { char_, u8"'ä'" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
}

TEST_F(Lex_Test, strings)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual
        = lex_text(u8R"--("a\"b" b"c" r"d" r#"e"f"# br"g")--"sv);
    const Text_Token expected[] {
        { string, u8R"("a\"b")" },        { byte_string, u8R"(b"c")" },
        { raw_string, u8R"(r"d")" },      { raw_string, u8R"--(r#"e"f"#)--" },
        { raw_byte_string, u8R"(br"g")" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
    EXPECT_TRUE(errors.empty());
}

TEST_F(Lex_Test, unterminated_string)
{
    const std::pmr::vector<Text_Token> actual = lex_text(u8"x \"abc"sv);
    ASSERT_EQ(actual.size(), 2);
    EXPECT_EQ(actual[1], (Text_Token { Syntax_Kind::string, u8"\"abc" }));
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0], Text_Range::from_to(2, 3));
}

TEST_F(Lex_Test, unterminated_raw_string)
{
    const std::pmr::vector<Text_Token> actual = lex_text(u8R"(r#"abc")"sv);
    ASSERT_EQ(actual.size(), 1);
    EXPECT_EQ(actual[0].kind, Syntax_Kind::raw_string);
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(Lex_Test, punctuation)
{
    using enum Syntax_Kind;
    const std::pmr::vector<Text_Token> actual = lex_text(u8":: -> => == != <= >= && || ..= ... += #!"sv);
    const Text_Token expected[] {
        { colon2, u8"::" }, { thin_arrow, u8"->" }, { fat_arrow, u8"=>" }, { eq2, u8"==" },
        { neq, u8"!=" },    { lteq, u8"<=" },       { gteq, u8">=" },      { amp2, u8"&&" },
        { pipe2, u8"||" },  { dot2eq, u8"..=" },    { dot3, u8"..." },     { pluseq, u8"+=" },
        { pound, u8"#" },   { excl, u8"!" },
    };
    EXPECT_TRUE(std::ranges::equal(actual, expected));
}

TEST_F(Lex_Test, error_token)
{
    const std::pmr::vector<Text_Token> actual = lex_text(u8"a § b"sv);
    ASSERT_EQ(actual.size(), 3);
    EXPECT_EQ(actual[1].kind, Syntax_Kind::error_token);
    EXPECT_EQ(actual[1].text, u8"§"sv);
    EXPECT_EQ(errors.size(), 1);
}

} // namespace
} // namespace shade
