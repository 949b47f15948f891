#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/util/strings.hpp"
#include "shade/util/text_range.hpp"

#include "shade/diagnostic.hpp"
#include "shade/lex.hpp"
#include "shade/parse.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

#include "syntax_testing.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Parse_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Token> tokens { &memory };
    std::pmr::vector<Parse_Instruction> instructions { &memory };
    std::pmr::vector<Text_Range> errors { &memory };
    std::optional<Syntax_Tree> tree;

    /// @brief Lexes and parses `source` and builds the tree.
    /// Lexing errors fail the test, but parse errors are only collected.
    Syntax_Element parse_text(std::u8string_view source, Parse_Entry entry = Parse_Entry::source_file)
    {
        auto on_lex_error = [&](std::u8string_view, Text_Range, std::u8string_view message) {
            ADD_FAILURE() << "Unexpected lexing error: " << as_string_view(message);
        };
        lex(tokens, source, on_lex_error);

        auto on_parse_error = [&](std::u8string_view id, Text_Range location, std::u8string_view) {
            EXPECT_EQ(id, diagnostic::parse);
            errors.push_back(location);
        };
        const bool success = parse(instructions, source, tokens, entry, on_parse_error);
        EXPECT_EQ(success, errors.empty());

        tree.emplace(source, &memory);
        return build_syntax_tree(*tree, tokens, instructions);
    }

    [[nodiscard]]
    std::pmr::u8string dump(Syntax_Element root)
    {
        std::pmr::u8string result { &memory };
        debug_dump(result, root);
        return result;
    }
};

TEST_F(Parse_Test, empty_source_file)
{
    const Syntax_Element root = parse_text(u8""sv);
    ASSERT_TRUE(root);
    EXPECT_EQ(root.kind(), Syntax_Kind::source_file);
    EXPECT_FALSE(root.first_child());
    EXPECT_TRUE(errors.empty());
}

TEST_F(Parse_Test, fn_definition)
{
    const Syntax_Element root = parse_text(u8"fn f() {}"sv);
    const std::u8string_view expected = u8R"(SOURCE_FILE@0..9
  FN_DEF@0..9
    FN_KW@0..2 "fn"
    WHITESPACE@2..3 " "
    NAME@3..4
      IDENT@3..4 "f"
    PARAM_LIST@4..6
      L_PAREN@4..5 "("
      R_PAREN@5..6 ")"
    WHITESPACE@6..7 " "
    BLOCK_EXPR@7..9
      L_CURLY@7..8 "{"
      R_CURLY@8..9 "}"
)"sv;
    EXPECT_EQ(dump(root), expected);
    EXPECT_TRUE(errors.empty());
}

TEST_F(Parse_Test, tree_navigation)
{
    const Syntax_Element root = parse_text(u8"fn f() {}"sv);
    const Syntax_Element fn = root.first_child();
    ASSERT_TRUE(fn);
    EXPECT_EQ(fn.parent(), root);
    EXPECT_FALSE(root.parent());

    const Syntax_Element name = fn.child_of_kind(Syntax_Kind::name);
    ASSERT_TRUE(name);
    EXPECT_EQ(name.text(), u8"f"sv);
    EXPECT_EQ(name.prev_sibling().kind(), Syntax_Kind::whitespace);
    EXPECT_EQ(name.next_sibling().kind(), Syntax_Kind::param_list);
    EXPECT_EQ(fn.last_child().kind(), Syntax_Kind::block_expr);

    const Syntax_Element ident = name.first_child();
    EXPECT_EQ(ident.ancestor_of_kind(Syntax_Kind::fn_def), fn);
    EXPECT_EQ(ident.ancestor_of_kind(Syntax_Kind::ident), ident);
    EXPECT_FALSE(ident.ancestor_of_kind(Syntax_Kind::let_stmt));

    std::size_t ancestor_count = 0;
    for ([[maybe_unused]] const Syntax_Element e : ident.ancestors()) {
        ++ancestor_count;
    }
    EXPECT_EQ(ancestor_count, 4);
}

TEST_F(Parse_Test, let_statement)
{
    const Syntax_Element root = parse_text(u8"fn f() { let mut x: i32 = 1; }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element let = find_element(root, Syntax_Kind::let_stmt);
    ASSERT_TRUE(let);
    EXPECT_EQ(let.text(), u8"let mut x: i32 = 1;"sv);

    const Syntax_Element pattern = let.child_of_kind(Syntax_Kind::bind_pat);
    ASSERT_TRUE(pattern);
    EXPECT_TRUE(pattern.child_of_kind(Syntax_Kind::mut_kw));
    EXPECT_EQ(pattern.child_of_kind(Syntax_Kind::name).text(), u8"x"sv);
    EXPECT_TRUE(let.child_of_kind(Syntax_Kind::path_type));
    EXPECT_EQ(let.child_of_kind(Syntax_Kind::literal).text(), u8"1"sv);
}

TEST_F(Parse_Test, qualified_path)
{
    const Syntax_Element root = parse_text(u8"fn f() { a::b(); }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element call = find_element(root, Syntax_Kind::call_expr);
    ASSERT_TRUE(call);
    const Syntax_Element path = find_element(call, Syntax_Kind::path);
    ASSERT_TRUE(path);
    EXPECT_EQ(path.text(), u8"a::b"sv);
    EXPECT_EQ(path.first_child().kind(), Syntax_Kind::path);
    EXPECT_EQ(path.first_child().text(), u8"a"sv);
    EXPECT_EQ(path.last_child().kind(), Syntax_Kind::path_segment);
    EXPECT_EQ(path.last_child().text(), u8"b"sv);
    EXPECT_TRUE(call.child_of_kind(Syntax_Kind::arg_list));
}

TEST_F(Parse_Test, union_is_contextual)
{
    const Syntax_Element root = parse_text(u8"union U { x: u32 } fn f() { let union = 1; }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element def = find_element(root, Syntax_Kind::union_def);
    ASSERT_TRUE(def);
    EXPECT_EQ(def.first_child().kind(), Syntax_Kind::union_kw);
    EXPECT_TRUE(find_element(def, Syntax_Kind::record_field_def));

    const Syntax_Element binding = find_element(root, Syntax_Kind::bind_pat);
    ASSERT_TRUE(binding);
    EXPECT_EQ(binding.child_of_kind(Syntax_Kind::name).first_child().kind(), Syntax_Kind::ident);
}

TEST_F(Parse_Test, condition_is_not_record_literal)
{
    const Syntax_Element root = parse_text(u8"fn f() { if x {} }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element condition = find_element(root, Syntax_Kind::condition);
    ASSERT_TRUE(condition);
    EXPECT_EQ(condition.first_child().kind(), Syntax_Kind::path_expr);
    EXPECT_FALSE(find_element(root, Syntax_Kind::record_lit));
}

TEST_F(Parse_Test, record_literal_shorthand)
{
    const Syntax_Element root = parse_text(u8"fn f() { P { x, y: 1 }; }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element shorthand = find_element(root, Syntax_Kind::record_field);
    ASSERT_TRUE(shorthand);
    EXPECT_EQ(shorthand.first_child().kind(), Syntax_Kind::path_expr);

    const Syntax_Element explicit_field = find_element(root, Syntax_Kind::record_field, {}, 1);
    ASSERT_TRUE(explicit_field);
    EXPECT_EQ(explicit_field.first_child().kind(), Syntax_Kind::name_ref);
}

TEST_F(Parse_Test, item_macro_call)
{
    const Syntax_Element root = parse_text(u8"foo! { x }"sv);
    EXPECT_TRUE(errors.empty());

    const Syntax_Element call = root.first_child();
    ASSERT_TRUE(call);
    EXPECT_EQ(call.kind(), Syntax_Kind::macro_call);
    EXPECT_EQ(call.child_of_kind(Syntax_Kind::path).text(), u8"foo"sv);
    EXPECT_TRUE(call.child_of_kind(Syntax_Kind::excl));
    EXPECT_EQ(call.child_of_kind(Syntax_Kind::token_tree).text(), u8"{ x }"sv);
}

TEST_F(Parse_Test, macro_stmts_entry)
{
    const Syntax_Element root = parse_text(u8"a, b"sv, Parse_Entry::macro_stmts);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(root.kind(), Syntax_Kind::macro_stmts);
    EXPECT_EQ(find_element(root, Syntax_Kind::path_expr, {}, 0).text(), u8"a"sv);
    EXPECT_EQ(find_element(root, Syntax_Kind::path_expr, {}, 1).text(), u8"b"sv);
}

TEST_F(Parse_Test, unexpected_token_is_wrapped_in_error)
{
    const Syntax_Element root = parse_text(u8") fn f() {}"sv);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0], Text_Range::from_to(0, 1));

    const Syntax_Element error = root.first_child();
    ASSERT_TRUE(error);
    EXPECT_EQ(error.kind(), Syntax_Kind::error);
    EXPECT_EQ(error.text(), u8")"sv);
    EXPECT_TRUE(root.child_of_kind(Syntax_Kind::fn_def));
}

TEST_F(Parse_Test, incomplete_input_covers_all_tokens)
{
    const Syntax_Element root = parse_text(u8"fn ("sv);
    EXPECT_FALSE(errors.empty());
    EXPECT_EQ(root.range(), Text_Range::from_to(0, 4));
    EXPECT_TRUE(find_element(root, Syntax_Kind::l_paren));
}

TEST_F(Parse_Test, covering_element_and_token_at_offset)
{
    const Syntax_Element root = parse_text(u8"fn foo() {}"sv);
    EXPECT_EQ(tree->token_at_offset(4).text(), u8"foo"sv);
    EXPECT_FALSE(tree->token_at_offset(11));
    EXPECT_EQ(tree->covering_element(Text_Range::from_to(3, 6)).kind(), Syntax_Kind::ident);
    EXPECT_EQ(tree->covering_element(Text_Range::from_to(3, 8)).kind(), Syntax_Kind::fn_def);
    EXPECT_EQ(tree->covering_element(Text_Range::from_to(0, 100)), root);
}

} // namespace
} // namespace shade
