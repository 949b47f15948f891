#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "shade/analysis.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

#include "syntax_testing.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Semantics_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::optional<Analysis> analysis;

    void load(std::u8string_view source)
    {
        analysis.emplace(source, &memory);
    }

    /// @brief Classifies the `n`-th `name_ref` with the given text.
    [[nodiscard]]
    std::optional<Name_Ref_Class> reference(std::u8string_view text, std::size_t n = 0)
    {
        const Syntax_Element name_ref
            = find_element(analysis->tree().root(), Syntax_Kind::name_ref, text, n);
        EXPECT_TRUE(name_ref) << "No such name_ref.";
        if (!name_ref) {
            return std::nullopt;
        }
        return analysis->semantics().classify_reference(name_ref);
    }

    /// @brief Classifies the `n`-th `name` with the given text.
    [[nodiscard]]
    std::optional<Name_Class> definition(std::u8string_view text, std::size_t n = 0)
    {
        const Syntax_Element name = find_element(analysis->tree().root(), Syntax_Kind::name, text, n);
        EXPECT_TRUE(name) << "No such name.";
        if (!name) {
            return std::nullopt;
        }
        return analysis->semantics().classify_definition(name);
    }

    /// @brief Returns call information for the first token with the given text.
    [[nodiscard]]
    std::optional<Call_Info> call_info_at(Syntax_Kind token_kind, std::u8string_view text)
    {
        const Syntax_Element token = find_element(analysis->tree().root(), token_kind, text);
        EXPECT_TRUE(token) << "No such token.";
        if (!token) {
            return std::nullopt;
        }
        return analysis->semantics().call_info(token, &memory);
    }
};

[[nodiscard]]
Name_Ref_Class item_ref(Item_Kind kind)
{
    return Definition { def::Module_Def { kind } };
}

[[nodiscard]]
Name_Class item_def(Item_Kind kind)
{
    return Definition { def::Module_Def { kind } };
}

TEST_F(Semantics_Test, function_reference)
{
    load(u8"fn foo() {} fn main() { foo(); }"sv);
    EXPECT_EQ(reference(u8"foo"sv), item_ref(Item_Kind::function));
}

TEST_F(Semantics_Test, item_definitions)
{
    load(u8"struct S; enum E { A } trait T {} type U = S; const C: i32 = 0; static X: i32 = 0;"sv);
    EXPECT_EQ(definition(u8"S"sv), item_def(Item_Kind::struct_));
    EXPECT_EQ(definition(u8"E"sv), item_def(Item_Kind::enum_));
    EXPECT_EQ(definition(u8"A"sv), item_def(Item_Kind::enum_variant));
    EXPECT_EQ(definition(u8"T"sv), item_def(Item_Kind::trait));
    EXPECT_EQ(definition(u8"U"sv), item_def(Item_Kind::type_alias));
    EXPECT_EQ(definition(u8"C"sv), item_def(Item_Kind::constant));
    EXPECT_EQ(definition(u8"X"sv), item_def(Item_Kind::static_));
}

TEST_F(Semantics_Test, local_variables)
{
    load(u8"fn main() { let x = 1; let mut y = 2; x; y; }"sv);
    EXPECT_EQ(reference(u8"x"sv), Name_Ref_Class { Definition { def::Local { .name = u8"x" } } });
    EXPECT_EQ(
        reference(u8"y"sv),
        Name_Ref_Class { Definition { def::Local { .name = u8"y", .is_mutable = true } } }
    );
    EXPECT_EQ(
        definition(u8"y"sv),
        Name_Class { Definition { def::Local { .name = u8"y", .is_mutable = true } } }
    );
}

TEST_F(Semantics_Test, mutable_reference_parameter)
{
    load(u8"fn f(a: &mut i32, b: &i32) { a; b; }"sv);
    EXPECT_EQ(
        reference(u8"a"sv),
        Name_Ref_Class { Definition {
            def::Local { .name = u8"a", .is_mutable = false, .has_mutable_reference_type = true } } }
    );
    EXPECT_EQ(reference(u8"b"sv), Name_Ref_Class { Definition { def::Local { .name = u8"b" } } });
}

TEST_F(Semantics_Test, local_is_not_visible_before_let)
{
    load(u8"fn main() { x; let x = 1; }"sv);
    EXPECT_EQ(reference(u8"x"sv), std::nullopt);
}

TEST_F(Semantics_Test, locals_of_enclosing_function_are_not_visible)
{
    load(u8"fn f() { let x = 1; fn g() { x; } }"sv);
    EXPECT_EQ(reference(u8"x"sv), std::nullopt);
}

TEST_F(Semantics_Test, builtin_type)
{
    load(u8"fn f(x: i32) {}"sv);
    EXPECT_EQ(reference(u8"i32"sv), item_ref(Item_Kind::builtin_type));
}

TEST_F(Semantics_Test, type_param)
{
    load(u8"fn f<T>(x: T) {}"sv);
    EXPECT_EQ(reference(u8"T"sv), Name_Ref_Class { Definition { def::Type_Param {} } });
    EXPECT_EQ(definition(u8"T"sv), Name_Class { Definition { def::Type_Param {} } });
}

TEST_F(Semantics_Test, field_access)
{
    load(u8"struct P { x: i32 } fn f(p: P) { p.x; }"sv);
    EXPECT_EQ(reference(u8"P"sv), item_ref(Item_Kind::struct_));
    EXPECT_EQ(reference(u8"x"sv), Name_Ref_Class { Definition { def::Field {} } });
    EXPECT_EQ(definition(u8"x"sv), Name_Class { Definition { def::Field {} } });
}

TEST_F(Semantics_Test, field_shorthand)
{
    load(u8"struct P { x: i32 } fn f() { let x = 1; P { x }; }"sv);
    EXPECT_EQ(reference(u8"x"sv), Name_Ref_Class { Field_Shorthand {} });
}

TEST_F(Semantics_Test, module_path)
{
    load(u8"mod m { pub fn g() {} } fn f() { m::g(); }"sv);
    EXPECT_EQ(reference(u8"m"sv), item_ref(Item_Kind::module));
    EXPECT_EQ(reference(u8"g"sv), item_ref(Item_Kind::function));
}

TEST_F(Semantics_Test, enum_variant_path)
{
    load(u8"enum E { A, B } fn f() { E::B; }"sv);
    EXPECT_EQ(reference(u8"E"sv), item_ref(Item_Kind::enum_));
    EXPECT_EQ(reference(u8"B"sv), item_ref(Item_Kind::enum_variant));
}

TEST_F(Semantics_Test, macro_reference)
{
    load(u8"fn f() { println!(\"x\"); }"sv);
    EXPECT_EQ(reference(u8"println"sv), Name_Ref_Class { Definition { def::Macro {} } });
}

TEST_F(Semantics_Test, unresolved)
{
    load(u8"fn f() { unknown; }"sv);
    EXPECT_EQ(reference(u8"unknown"sv), std::nullopt);
}

TEST_F(Semantics_Test, constant_pattern)
{
    load(u8"const C: i32 = 1; fn f() { let C = 2; let D = 3; }"sv);
    EXPECT_EQ(
        definition(u8"C"sv, 1),
        Name_Class { Const_Reference { def::Module_Def { Item_Kind::constant } } }
    );
    EXPECT_EQ(definition(u8"D"sv), Name_Class { Definition { def::Local { .name = u8"D" } } });
}

TEST_F(Semantics_Test, call_info_for_function)
{
    load(u8"fn fixture(a: i32, ra_fixture: &str) {} fn main() { fixture(1, r\"x\"); }"sv);
    const std::optional<Call_Info> info = call_info_at(Syntax_Kind::raw_string, u8"r\"x\""sv);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->active_parameter, 1);
    const std::u8string_view expected[] { u8"a", u8"ra_fixture" };
    EXPECT_TRUE(std::ranges::equal(info->parameter_names, expected));
}

TEST_F(Semantics_Test, call_info_for_method)
{
    load(u8"struct S; impl S { fn m(&self, v: i32) {} } "
         u8"fn main() { let s = S; s.m(1); S::m(s, 2); }"sv);

    const std::optional<Call_Info> method_call = call_info_at(Syntax_Kind::int_number, u8"1"sv);
    ASSERT_TRUE(method_call);
    EXPECT_EQ(method_call->active_parameter, 0);
    const std::u8string_view expected_method[] { u8"v" };
    EXPECT_TRUE(std::ranges::equal(method_call->parameter_names, expected_method));

    const std::optional<Call_Info> path_call = call_info_at(Syntax_Kind::int_number, u8"2"sv);
    ASSERT_TRUE(path_call);
    EXPECT_EQ(path_call->active_parameter, 1);
    const std::u8string_view expected_path[] { u8"self", u8"v" };
    EXPECT_TRUE(std::ranges::equal(path_call->parameter_names, expected_path));
}

TEST_F(Semantics_Test, call_info_outside_of_call)
{
    load(u8"fn main() { let x = 1; unknown(2); }"sv);
    EXPECT_FALSE(call_info_at(Syntax_Kind::int_number, u8"1"sv));
    EXPECT_FALSE(call_info_at(Syntax_Kind::int_number, u8"2"sv));
}

TEST_F(Semantics_Test, reference_within_macro_expansion)
{
    load(u8"fn main() { let x = 1; foo!(x); }"sv);
    const Syntax_Element token = find_element(analysis->tree().root(), Syntax_Kind::ident, u8"x"sv, 1);
    ASSERT_TRUE(token);
    const Syntax_Element expanded = analysis->semantics().descend_into_macros(token);
    ASSERT_NE(expanded, token);
    const Syntax_Element name_ref = expanded.parent();
    ASSERT_EQ(name_ref.kind(), Syntax_Kind::name_ref);
    EXPECT_EQ(
        analysis->semantics().classify_reference(name_ref),
        Name_Ref_Class { Definition { def::Local { .name = u8"x" } } }
    );
}

} // namespace
} // namespace shade
