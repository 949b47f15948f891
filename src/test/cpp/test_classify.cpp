#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>

#include <gtest/gtest.h>

#include "shade/analysis.hpp"
#include "shade/binding_shadow.hpp"
#include "shade/classify.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

#include "syntax_testing.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

/// @brief Answers every classification with a fixed result.
struct Stub_Semantics final : Semantics {
    std::optional<Name_Class> name_class;
    std::optional<Name_Ref_Class> name_ref_class;

    [[nodiscard]]
    std::optional<Name_Class> classify_definition(Syntax_Element) const final
    {
        return name_class;
    }

    [[nodiscard]]
    std::optional<Name_Ref_Class> classify_reference(Syntax_Element) const final
    {
        return name_ref_class;
    }

    [[nodiscard]]
    std::optional<Call_Info> call_info(Syntax_Element, std::pmr::memory_resource*) const final
    {
        return std::nullopt;
    }

    [[nodiscard]]
    Syntax_Element descend_into_macros(Syntax_Element token) const final
    {
        return token;
    }
};

struct Classify_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Stub_Semantics semantics;
    Binding_Shadow_Tracker tracker { &memory };
    std::optional<Analysis> analysis;

    [[nodiscard]]
    Syntax_Element load_and_find(
        std::u8string_view source,
        Syntax_Kind kind,
        std::u8string_view text = {},
        std::size_t n = 0
    )
    {
        analysis.emplace(source, &memory);
        const Syntax_Element result = find_element(analysis->tree().root(), kind, text, n);
        EXPECT_TRUE(result);
        return result;
    }

    [[nodiscard]]
    std::optional<Element_Highlight> classify(Syntax_Element element)
    {
        return highlight_element(semantics, tracker, element);
    }

    [[nodiscard]]
    std::optional<Highlight> classify_highlight(Syntax_Element element)
    {
        const std::optional<Element_Highlight> result = classify(element);
        return result ? std::optional<Highlight> { result->highlight } : std::nullopt;
    }
};

TEST(Highlight_Definition, items)
{
    EXPECT_EQ(highlight_definition(def::Macro {}), Highlight { Highlight_Tag::macro });
    EXPECT_EQ(highlight_definition(def::Field {}), Highlight { Highlight_Tag::field });
    EXPECT_EQ(highlight_definition(def::Self_Type {}), Highlight { Highlight_Tag::self_type });
    EXPECT_EQ(highlight_definition(def::Type_Param {}), Highlight { Highlight_Tag::type_param });
    EXPECT_EQ(
        highlight_definition(def::Module_Def { Item_Kind::builtin_type }),
        Highlight { Highlight_Tag::builtin_type }
    );
    EXPECT_EQ(
        highlight_definition(def::Module_Def { Item_Kind::enum_variant }),
        Highlight { Highlight_Tag::enum_variant }
    );
}

TEST(Highlight_Definition, locals)
{
    EXPECT_EQ(highlight_definition(def::Local { .name = u8"x" }), Highlight { Highlight_Tag::local });
    EXPECT_EQ(
        highlight_definition(def::Local { .name = u8"x", .is_mutable = true }),
        Highlight { Highlight_Tag::local } | Highlight_Modifier::mutable_
    );
    EXPECT_EQ(
        highlight_definition(def::Local { .name = u8"x", .has_mutable_reference_type = true }),
        Highlight { Highlight_Tag::local } | Highlight_Modifier::mutable_
    );
}

TEST_F(Classify_Test, local_definitions_advance_generation)
{
    const Syntax_Element x = load_and_find(u8"fn f() { let x = 1; }"sv, Syntax_Kind::name, u8"x"sv);
    semantics.name_class = Definition { def::Local { .name = u8"x" } };

    const Element_Highlight expected_first {
        .highlight = Highlight { Highlight_Tag::local } | Highlight_Modifier::definition,
        .binding = binding_identity(u8"x"sv, 1),
    };
    EXPECT_EQ(classify(x), expected_first);

    const std::optional<Element_Highlight> second = classify(x);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->binding, binding_identity(u8"x"sv, 2));
}

TEST_F(Classify_Test, reference_uses_current_generation)
{
    const Syntax_Element x = load_and_find(u8"fn f() { x; }"sv, Syntax_Kind::name_ref, u8"x"sv);
    semantics.name_ref_class = Definition { def::Local { .name = u8"x", .is_mutable = true } };

    // Never defined, as can happen within macro expansions.
    const std::optional<Element_Highlight> undefined = classify(x);
    ASSERT_TRUE(undefined);
    EXPECT_EQ(undefined->binding, binding_identity(u8"x"sv, 0));

    tracker.advance(u8"x"sv);
    tracker.advance(u8"x"sv);
    const Element_Highlight expected {
        .highlight = Highlight { Highlight_Tag::local } | Highlight_Modifier::mutable_,
        .binding = binding_identity(u8"x"sv, 2),
    };
    EXPECT_EQ(classify(x), expected);
}

TEST_F(Classify_Test, fn_def_resets_tracker)
{
    const Syntax_Element fn = load_and_find(u8"fn f() {}"sv, Syntax_Kind::fn_def);
    tracker.advance(u8"x"sv);
    EXPECT_EQ(classify(fn), std::nullopt);
    EXPECT_TRUE(tracker.empty());
}

TEST_F(Classify_Test, const_reference_is_not_a_definition)
{
    const Syntax_Element c = load_and_find(u8"fn f() { let C = 1; }"sv, Syntax_Kind::name, u8"C"sv);
    semantics.name_class = Const_Reference { def::Module_Def { Item_Kind::constant } };

    const Element_Highlight expected {
        .highlight = Highlight_Tag::constant,
        .binding = std::nullopt,
    };
    EXPECT_EQ(classify(c), expected);
    EXPECT_TRUE(tracker.empty());
}

TEST_F(Classify_Test, unresolved_name_falls_back_to_syntax)
{
    const Syntax_Element s = load_and_find(u8"struct S;"sv, Syntax_Kind::name, u8"S"sv);
    EXPECT_EQ(highlight_name_by_syntax(s), Highlight { Highlight_Tag::struct_ });
    EXPECT_EQ(
        classify_highlight(s), Highlight { Highlight_Tag::struct_ } | Highlight_Modifier::definition
    );
}

TEST_F(Classify_Test, unresolved_name_ref_is_not_highlighted)
{
    const Syntax_Element x = load_and_find(u8"fn f() { x; }"sv, Syntax_Kind::name_ref, u8"x"sv);
    EXPECT_EQ(classify(x), std::nullopt);
}

TEST_F(Classify_Test, field_shorthand)
{
    const Syntax_Element x
        = load_and_find(u8"fn f() { P { x }; }"sv, Syntax_Kind::name_ref, u8"x"sv);
    semantics.name_ref_class = Field_Shorthand {};
    const Element_Highlight expected { .highlight = Highlight_Tag::field, .binding = std::nullopt };
    EXPECT_EQ(classify(x), expected);
}

TEST_F(Classify_Test, keywords)
{
    const Syntax_Element fn = load_and_find(
        u8"fn f() { unsafe { if true { return; } } }"sv, Syntax_Kind::fn_kw
    );
    const Syntax_Element root = analysis->tree().root();
    EXPECT_EQ(classify_highlight(fn), Highlight { Highlight_Tag::keyword });
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::unsafe_kw)),
        Highlight { Highlight_Tag::keyword } | Highlight_Modifier::unsafe
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::if_kw)),
        Highlight { Highlight_Tag::keyword } | Highlight_Modifier::control_flow
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::return_kw)),
        Highlight { Highlight_Tag::keyword } | Highlight_Modifier::control_flow
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::true_kw)),
        Highlight { Highlight_Tag::keyword }
    );
}

TEST_F(Classify_Test, literals_and_comments)
{
    const Syntax_Element root = load_and_find(
        u8"// c\nfn f() { 1; 2.0; 'c'; b'b'; \"s\"; r\"r\"; b\"b\"; }"sv, Syntax_Kind::source_file
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::comment)),
        Highlight { Highlight_Tag::comment }
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::int_number)),
        Highlight { Highlight_Tag::numeric_literal }
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::float_number)),
        Highlight { Highlight_Tag::numeric_literal }
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::char_)),
        Highlight { Highlight_Tag::char_literal }
    );
    EXPECT_EQ(
        classify_highlight(find_element(root, Syntax_Kind::byte)),
        Highlight { Highlight_Tag::byte_literal }
    );
    for (const Syntax_Kind kind :
         { Syntax_Kind::string, Syntax_Kind::raw_string, Syntax_Kind::byte_string }) {
        EXPECT_EQ(
            classify_highlight(find_element(root, kind)), Highlight { Highlight_Tag::string_literal }
        );
    }
    EXPECT_EQ(classify_highlight(find_element(root, Syntax_Kind::whitespace)), std::nullopt);
    EXPECT_EQ(classify_highlight(find_element(root, Syntax_Kind::semicolon)), std::nullopt);
}

TEST_F(Classify_Test, lifetimes)
{
    const Syntax_Element definition
        = load_and_find(u8"fn f<'a>(x: &'a i32) {}"sv, Syntax_Kind::lifetime, u8"'a"sv, 0);
    const Syntax_Element use
        = find_element(analysis->tree().root(), Syntax_Kind::lifetime, u8"'a"sv, 1);
    EXPECT_EQ(
        classify_highlight(definition),
        Highlight { Highlight_Tag::lifetime } | Highlight_Modifier::definition
    );
    EXPECT_EQ(classify_highlight(use), Highlight { Highlight_Tag::lifetime });
}

TEST_F(Classify_Test, attribute)
{
    const Syntax_Element attr = load_and_find(u8"#[inline] fn f() {}"sv, Syntax_Kind::attr);
    EXPECT_EQ(attr.text(), u8"#[inline]"sv);
    EXPECT_EQ(classify_highlight(attr), Highlight { Highlight_Tag::attribute });
}

} // namespace
} // namespace shade
