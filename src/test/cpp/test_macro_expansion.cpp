#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "shade/util/text_range.hpp"

#include "shade/analysis.hpp"
#include "shade/macro_expansion.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

#include "syntax_testing.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Macro_Expansion_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
};

TEST_F(Macro_Expansion_Test, statement_position)
{
    const Analysis analysis { u8"fn f() { foo!(a, 1); }"sv, &memory };
    const Syntax_Element call = find_element(analysis.tree().root(), Syntax_Kind::macro_call);
    ASSERT_TRUE(call);

    const Syntax_Element expansion = analysis.tree().expansion_of(call);
    ASSERT_TRUE(expansion);
    EXPECT_EQ(expansion.kind(), Syntax_Kind::macro_stmts);
    EXPECT_EQ(expansion.parent(), call);
    const Text_Range tree_range = call.child_of_kind(Syntax_Kind::token_tree).range();
    EXPECT_EQ(expansion.range(), Text_Range::from_to(tree_range.begin + 1, tree_range.end() - 1));
    EXPECT_EQ(find_element(expansion, Syntax_Kind::path_expr).text(), u8"a"sv);
    EXPECT_EQ(find_element(expansion, Syntax_Kind::literal).text(), u8"1"sv);

    // expansions are not children of the macro call
    EXPECT_FALSE(find_element(call, Syntax_Kind::macro_stmts));
}

TEST_F(Macro_Expansion_Test, item_position)
{
    const Analysis analysis { u8"foo! { fn g() {} }"sv, &memory };
    const Syntax_Element call = analysis.tree().root().first_child();
    ASSERT_EQ(call.kind(), Syntax_Kind::macro_call);

    const Syntax_Element expansion = analysis.tree().expansion_of(call);
    ASSERT_TRUE(expansion);
    EXPECT_EQ(expansion.kind(), Syntax_Kind::macro_items);
    const Syntax_Element fn = find_element(expansion, Syntax_Kind::fn_def);
    ASSERT_TRUE(fn);
    EXPECT_EQ(fn.child_of_kind(Syntax_Kind::name).text(), u8"g"sv);
}

TEST_F(Macro_Expansion_Test, macro_rules_is_not_expanded)
{
    const Analysis analysis { u8"macro_rules! m { () => {} }"sv, &memory };
    const Syntax_Element call = analysis.tree().root().first_child();
    ASSERT_EQ(call.kind(), Syntax_Kind::macro_call);
    EXPECT_FALSE(analysis.tree().expansion_of(call));
}

TEST_F(Macro_Expansion_Test, empty_token_tree_is_not_expanded)
{
    const Analysis analysis { u8"fn f() { foo!(); }"sv, &memory };
    const Syntax_Element call = find_element(analysis.tree().root(), Syntax_Kind::macro_call);
    ASSERT_TRUE(call);
    EXPECT_FALSE(analysis.tree().expansion_of(call));
}

TEST_F(Macro_Expansion_Test, descend_into_nested_macros)
{
    const Analysis analysis { u8"fn f() { foo!(bar!(x)); }"sv, &memory };
    const Syntax_Element x = find_element(analysis.tree().root(), Syntax_Kind::ident, u8"x"sv);
    ASSERT_TRUE(x);
    EXPECT_EQ(x.parent().kind(), Syntax_Kind::token_tree);

    const Syntax_Element outer = macro_call_of_token_tree_token(x);
    ASSERT_TRUE(outer);
    EXPECT_EQ(outer.child_of_kind(Syntax_Kind::path).text(), u8"foo"sv);

    const Syntax_Element expanded = descend_into_macros(x);
    ASSERT_NE(expanded, x);
    EXPECT_EQ(expanded.range(), x.range());
    EXPECT_EQ(expanded.parent().kind(), Syntax_Kind::name_ref);
    EXPECT_TRUE(expanded.ancestor_of_kind(Syntax_Kind::path_expr));

    // the innermost expansion belongs to `bar!`, which itself is within the expansion of `foo!`
    const Syntax_Element inner_call = expanded.ancestor_of_kind(Syntax_Kind::macro_call);
    ASSERT_TRUE(inner_call);
    EXPECT_EQ(inner_call.child_of_kind(Syntax_Kind::path).text(), u8"bar"sv);
    EXPECT_EQ(inner_call.ancestor_of_kind(Syntax_Kind::macro_stmts).parent(), outer);
}

TEST_F(Macro_Expansion_Test, descend_outside_of_macro)
{
    const Analysis analysis { u8"fn f() { x; }"sv, &memory };
    const Syntax_Element x = find_element(analysis.tree().root(), Syntax_Kind::ident, u8"x"sv);
    ASSERT_TRUE(x);
    EXPECT_FALSE(macro_call_of_token_tree_token(x));
    EXPECT_EQ(descend_into_macros(x), x);
    EXPECT_EQ(analysis.semantics().descend_into_macros(x), x);
}

TEST_F(Macro_Expansion_Test, delimiters_do_not_descend)
{
    const Analysis analysis { u8"fn f() { foo!(x); }"sv, &memory };
    const Syntax_Element open = find_element(analysis.tree().root(), Syntax_Kind::l_paren, {}, 1);
    ASSERT_TRUE(open);
    EXPECT_EQ(open.parent().kind(), Syntax_Kind::token_tree);
    EXPECT_EQ(descend_into_macros(open), open);
}

} // namespace
} // namespace shade
