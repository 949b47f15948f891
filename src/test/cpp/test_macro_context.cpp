#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "shade/util/assert.hpp"

#include "shade/analysis.hpp"
#include "shade/macro_context.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

#include "syntax_testing.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Macro_Context_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Analysis analysis { u8"fn f() { a!(1); b!(2); }"sv, &memory };
    Syntax_Element a = find_element(analysis.tree().root(), Syntax_Kind::macro_call, {}, 0);
    Syntax_Element b = find_element(analysis.tree().root(), Syntax_Kind::macro_call, {}, 1);
    Macro_Context context;
};

TEST_F(Macro_Context_Test, enter_and_leave)
{
    ASSERT_TRUE(a && b);
    EXPECT_FALSE(context.active());

    context.enter(a);
    EXPECT_TRUE(context.active());
    EXPECT_EQ(context.current(), a);

    context.leave(a);
    EXPECT_FALSE(context.active());

    context.enter(b);
    EXPECT_EQ(context.current(), b);
}

TEST_F(Macro_Context_Test, mismatched_leave)
{
    ASSERT_TRUE(a && b);
    context.enter(a);
    EXPECT_THROW(context.leave(b), Assertion_Error);
}

TEST_F(Macro_Context_Test, enter_while_active)
{
    ASSERT_TRUE(a && b);
    context.enter(a);
    EXPECT_THROW(context.enter(b), Assertion_Error);
    EXPECT_EQ(context.current(), a);
}

TEST_F(Macro_Context_Test, enter_non_macro)
{
    EXPECT_THROW(context.enter(analysis.tree().root()), Assertion_Error);
}

} // namespace
} // namespace shade
