#include <cstdint>
#include <optional>
#include <variant>

#include "shade/util/assert.hpp"

#include "shade/binding_shadow.hpp"
#include "shade/classify.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {
namespace {

[[nodiscard]]
Highlight_Tag item_highlight_tag(Item_Kind kind)
{
    switch (kind) {
    case Item_Kind::module: return Highlight_Tag::module;
    case Item_Kind::function: return Highlight_Tag::function;
    case Item_Kind::struct_: return Highlight_Tag::struct_;
    case Item_Kind::enum_: return Highlight_Tag::enum_;
    case Item_Kind::union_: return Highlight_Tag::union_;
    case Item_Kind::enum_variant: return Highlight_Tag::enum_variant;
    case Item_Kind::constant: return Highlight_Tag::constant;
    case Item_Kind::static_: return Highlight_Tag::static_;
    case Item_Kind::trait: return Highlight_Tag::trait;
    case Item_Kind::type_alias: return Highlight_Tag::type_alias;
    case Item_Kind::builtin_type: return Highlight_Tag::builtin_type;
    }
    SHADE_ASSERT_UNREACHABLE(u8"Invalid item kind.");
}

[[nodiscard]]
constexpr bool is_control_flow_keyword(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    switch (kind) {
    case break_kw:
    case continue_kw:
    case else_kw:
    case for_kw:
    case if_kw:
    case loop_kw:
    case match_kw:
    case return_kw:
    case while_kw: return true;
    default: return false;
    }
}

struct Definition_Highlighter {
    [[nodiscard]]
    Highlight operator()(def::Macro) const
    {
        return Highlight_Tag::macro;
    }

    [[nodiscard]]
    Highlight operator()(def::Field) const
    {
        return Highlight_Tag::field;
    }

    [[nodiscard]]
    Highlight operator()(def::Module_Def d) const
    {
        return item_highlight_tag(d.kind);
    }

    [[nodiscard]]
    Highlight operator()(def::Self_Type) const
    {
        return Highlight_Tag::self_type;
    }

    [[nodiscard]]
    Highlight operator()(def::Type_Param) const
    {
        return Highlight_Tag::type_param;
    }

    [[nodiscard]]
    Highlight operator()(const def::Local& local) const
    {
        Highlight result = Highlight_Tag::local;
        if (local.is_mutable || local.has_mutable_reference_type) {
            result |= Highlight_Modifier::mutable_;
        }
        return result;
    }
};

[[nodiscard]]
std::optional<Element_Highlight>
highlight_name(const Semantics& semantics, Binding_Shadow_Tracker& tracker, Syntax_Element name)
{
    const std::optional<Name_Class> name_class = semantics.classify_definition(name);
    if (!name_class) {
        return Element_Highlight {
            .highlight = highlight_name_by_syntax(name) | Highlight_Modifier::definition,
            .binding = std::nullopt,
        };
    }
    if (const auto* const reference = std::get_if<Const_Reference>(&*name_class)) {
        return Element_Highlight {
            .highlight = highlight_definition(reference->definition),
            .binding = std::nullopt,
        };
    }

    const auto& definition = std::get<Definition>(*name_class);
    std::optional<std::uint64_t> binding;
    if (const auto* const local = std::get_if<def::Local>(&definition)) {
        if (!local->name.empty()) {
            const Shadow_Generation generation = tracker.advance(local->name);
            binding = binding_identity(local->name, generation);
        }
    }
    return Element_Highlight {
        .highlight = highlight_definition(definition) | Highlight_Modifier::definition,
        .binding = binding,
    };
}

[[nodiscard]]
std::optional<Element_Highlight> highlight_name_ref(
    const Semantics& semantics,
    const Binding_Shadow_Tracker& tracker,
    Syntax_Element name_ref
)
{
    // Attributes are highlighted as a whole.
    if (name_ref.ancestor_of_kind(Syntax_Kind::attr)) {
        return std::nullopt;
    }
    const std::optional<Name_Ref_Class> name_ref_class = semantics.classify_reference(name_ref);
    if (!name_ref_class) {
        return std::nullopt;
    }
    if (std::holds_alternative<Field_Shorthand>(*name_ref_class)) {
        return Element_Highlight { .highlight = Highlight_Tag::field, .binding = std::nullopt };
    }

    const auto& definition = std::get<Definition>(*name_ref_class);
    std::optional<std::uint64_t> binding;
    if (const auto* const local = std::get_if<def::Local>(&definition)) {
        if (!local->name.empty()) {
            // A reference to a local that was not defined in this function (which can happen
            // within macro expansions) uses generation zero instead of creating a generation.
            binding = binding_identity(local->name, tracker.current(local->name).value_or(0));
        }
    }
    return Element_Highlight { .highlight = highlight_definition(definition), .binding = binding };
}

} // namespace

Highlight highlight_definition(const Definition& definition)
{
    return std::visit(Definition_Highlighter {}, definition);
}

Highlight highlight_name_by_syntax(Syntax_Element name)
{
    const Syntax_Element parent = name.parent();
    if (!parent) {
        return Highlight_Tag::function;
    }
    switch (parent.kind()) {
    case Syntax_Kind::struct_def: return Highlight_Tag::struct_;
    case Syntax_Kind::enum_def: return Highlight_Tag::enum_;
    case Syntax_Kind::union_def: return Highlight_Tag::union_;
    case Syntax_Kind::trait_def: return Highlight_Tag::trait;
    case Syntax_Kind::type_alias_def: return Highlight_Tag::type_alias;
    case Syntax_Kind::type_param: return Highlight_Tag::type_param;
    case Syntax_Kind::record_field_def: return Highlight_Tag::field;
    default: return Highlight_Tag::function;
    }
}

std::optional<Element_Highlight>
highlight_element(const Semantics& semantics, Binding_Shadow_Tracker& tracker, Syntax_Element element)
{
    using enum Syntax_Kind;
    const auto simple = [](Highlight h) -> std::optional<Element_Highlight> {
        return Element_Highlight { .highlight = h, .binding = std::nullopt };
    };

    const Syntax_Kind kind = element.kind();
    switch (kind) {
    case fn_def: {
        tracker.clear();
        return std::nullopt;
    }
    case name: return highlight_name(semantics, tracker, element);
    case name_ref: return highlight_name_ref(semantics, tracker, element);

    case comment: return simple(Highlight_Tag::comment);
    case string:
    case raw_string:
    case byte_string:
    case raw_byte_string: return simple(Highlight_Tag::string_literal);
    case attr: return simple(Highlight_Tag::attribute);
    case int_number:
    case float_number: return simple(Highlight_Tag::numeric_literal);
    case byte: return simple(Highlight_Tag::byte_literal);
    case char_: return simple(Highlight_Tag::char_literal);
    case lifetime: {
        Highlight result = Highlight_Tag::lifetime;
        const Syntax_Element parent = element.parent();
        if (parent && (parent.kind() == lifetime_param || parent.kind() == label)) {
            result |= Highlight_Modifier::definition;
        }
        return simple(result);
    }
    default: break;
    }

    if (is_keyword(kind)) {
        Highlight result = Highlight_Tag::keyword;
        if (is_control_flow_keyword(kind)) {
            result |= Highlight_Modifier::control_flow;
        }
        else if (kind == unsafe_kw) {
            result |= Highlight_Modifier::unsafe;
        }
        return simple(result);
    }
    return std::nullopt;
}

} // namespace shade
