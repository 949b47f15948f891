#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "shade/util/assert.hpp"

#include "shade/macro_expansion.hpp"
#include "shade/semantics.hpp"
#include "shade/source_semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

/// @brief Limits how deeply `use` items and inferred types are followed,
/// which bounds the work for cyclic imports such as `use a::b; use b::a;`.
constexpr int max_resolution_depth = 16;

enum struct Namespace : Default_Underlying {
    value,
    type,
    any,
};

struct Resolution {
    /// @brief The defining node, which is null for builtin types and macros.
    Syntax_Element node;
    Definition definition;
};

constexpr std::u8string_view builtin_type_names[] {
    u8"bool", u8"char", u8"str",   u8"i8",  u8"i16", u8"i32",  u8"i64", u8"i128", u8"isize",
    u8"u8",   u8"u16",  u8"u32",   u8"u64", u8"u128", u8"usize", u8"f32", u8"f64",
};

[[nodiscard]]
bool is_builtin_type_name(std::u8string_view name)
{
    for (const std::u8string_view builtin : builtin_type_names) {
        if (builtin == name) {
            return true;
        }
    }
    return false;
}

[[nodiscard]]
constexpr bool is_pattern_kind(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    switch (kind) {
    case bind_pat:
    case placeholder_pat:
    case dot_dot_pat:
    case tuple_pat:
    case tuple_struct_pat:
    case record_pat:
    case record_field_pat_list:
    case record_field_pat:
    case path_pat:
    case literal_pat:
    case ref_pat:
    case slice_pat: return true;
    default: return false;
    }
}

[[nodiscard]]
constexpr bool is_type_kind(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    switch (kind) {
    case path_type:
    case reference_type:
    case pointer_type:
    case tuple_type:
    case array_type:
    case slice_type:
    case never_type:
    case placeholder_type:
    case impl_trait_type:
    case dyn_trait_type:
    case fn_pointer_type: return true;
    default: return false;
    }
}

[[nodiscard]]
constexpr bool is_in_namespace(Syntax_Kind kind, Namespace ns)
{
    using enum Syntax_Kind;
    switch (kind) {
    case struct_def: return true;
    case fn_def:
    case const_def:
    case static_def:
    case enum_variant:
    case const_param: return ns != Namespace::type;
    case enum_def:
    case union_def:
    case trait_def:
    case type_alias_def:
    case module:
    case type_param: return ns != Namespace::value;
    default: return false;
    }
}

[[nodiscard]]
Syntax_Element name_of(Syntax_Element node)
{
    return node.child_of_kind(Syntax_Kind::name);
}

[[nodiscard]]
bool has_name(Syntax_Element node, std::u8string_view name)
{
    const Syntax_Element n = name_of(node);
    return n && n.text() == name;
}

/// @brief Returns the first child node for which `predicate` is `true`.
template <typename Predicate>
[[nodiscard]]
Syntax_Element child_node_if(Syntax_Element node, Predicate predicate)
{
    for (const Syntax_Element child : node.children()) {
        if (child.is_node() && predicate(child.kind())) {
            return child;
        }
    }
    return {};
}

[[nodiscard]]
bool has_field_list(Syntax_Element node)
{
    return node.child_of_kind(Syntax_Kind::record_field_def_list)
        || node.child_of_kind(Syntax_Kind::tuple_field_def_list);
}

/// @brief Returns `true` if the type of a binding is known to be `&mut T`,
/// either from its type annotation or from an initializer such as `&mut x`.
[[nodiscard]]
bool has_mutable_reference_type(Syntax_Element bind_pat)
{
    const Syntax_Element parent = bind_pat.parent();
    if (!parent || (parent.kind() != Syntax_Kind::param && parent.kind() != Syntax_Kind::let_stmt)) {
        return false;
    }
    const Syntax_Element reference = parent.child_of_kind(Syntax_Kind::reference_type);
    if (reference && reference.child_of_kind(Syntax_Kind::mut_kw)) {
        return true;
    }
    if (parent.kind() == Syntax_Kind::let_stmt) {
        const Syntax_Element initializer = parent.child_of_kind(Syntax_Kind::ref_expr);
        return initializer && initializer.child_of_kind(Syntax_Kind::mut_kw);
    }
    return false;
}

[[nodiscard]]
def::Local local_definition(Syntax_Element bind_pat)
{
    const Syntax_Element name = name_of(bind_pat);
    return def::Local {
        .name = name ? name.text() : std::u8string_view {},
        .is_mutable = bool(bind_pat.child_of_kind(Syntax_Kind::mut_kw)),
        .has_mutable_reference_type = has_mutable_reference_type(bind_pat),
    };
}

[[nodiscard]]
std::optional<Definition> definition_of_node(Syntax_Element node)
{
    using enum Syntax_Kind;
    switch (node.kind()) {
    case fn_def: return def::Module_Def { Item_Kind::function };
    case struct_def: return def::Module_Def { Item_Kind::struct_ };
    case enum_def: return def::Module_Def { Item_Kind::enum_ };
    case union_def: return def::Module_Def { Item_Kind::union_ };
    case enum_variant: return def::Module_Def { Item_Kind::enum_variant };
    case trait_def: return def::Module_Def { Item_Kind::trait };
    case type_alias_def: return def::Module_Def { Item_Kind::type_alias };
    case const_def:
    case const_param: return def::Module_Def { Item_Kind::constant };
    case static_def: return def::Module_Def { Item_Kind::static_ };
    case module:
    case source_file: return def::Module_Def { Item_Kind::module };
    case type_param: return def::Type_Param {};
    case record_field_def: return def::Field {};
    case bind_pat: return local_definition(node);
    default: return std::nullopt;
    }
}

[[nodiscard]]
std::optional<Resolution> resolution_of_node(Syntax_Element node)
{
    if (!node) {
        return std::nullopt;
    }
    std::optional<Definition> definition = definition_of_node(node);
    if (!definition) {
        return std::nullopt;
    }
    return Resolution { node, std::move(*definition) };
}

/// @brief Returns the text of the last segment of `path`,
/// which is either a name reference or a keyword such as `self`.
[[nodiscard]]
std::u8string_view last_segment_text(Syntax_Element path)
{
    const Syntax_Element segment = path.child_of_kind(Syntax_Kind::path_segment);
    if (!segment) {
        return {};
    }
    if (const Syntax_Element name_ref = segment.child_of_kind(Syntax_Kind::name_ref)) {
        return name_ref.text();
    }
    for (const Syntax_Element child : segment.children()) {
        if (is_keyword(child.kind())) {
            return child.text();
        }
    }
    return {};
}

/// @brief Returns the type that an `impl` block implements something for.
[[nodiscard]]
Syntax_Element impl_self_type(Syntax_Element impl_block)
{
    bool after_for = false;
    Syntax_Element first_type;
    for (const Syntax_Element child : impl_block.children()) {
        if (child.kind() == Syntax_Kind::for_kw) {
            after_for = true;
        }
        else if (is_type_kind(child.kind())) {
            if (after_for) {
                return child;
            }
            if (!first_type) {
                first_type = child;
            }
        }
    }
    return first_type;
}

/// @brief Returns the name of the type that an `impl` block implements something for,
/// such as `"Point"` for `impl<T> Trait for Point<T>`.
[[nodiscard]]
std::u8string_view impl_self_type_name(Syntax_Element impl_block)
{
    Syntax_Element type = impl_self_type(impl_block);
    while (type && type.kind() == Syntax_Kind::reference_type) {
        type = child_node_if(type, is_type_kind);
    }
    if (!type || type.kind() != Syntax_Kind::path_type) {
        return {};
    }
    const Syntax_Element path = type.child_of_kind(Syntax_Kind::path);
    return path ? last_segment_text(path) : std::u8string_view {};
}

struct [[nodiscard]] Resolver {
    const Syntax_Tree& m_tree;
    std::pmr::memory_resource* m_memory;

    // SCOPES ======================================================================================

    /// @brief Resolves a name that is not qualified by a path,
    /// by searching the scopes that enclose `from` from the inside out.
    [[nodiscard]]
    std::optional<Resolution> resolve_simple(
        Syntax_Element from,
        std::u8string_view name,
        Namespace ns,
        bool include_locals,
        int depth
    ) const
    {
        if (depth > max_resolution_depth) {
            return std::nullopt;
        }
        const std::size_t offset = from.range().begin;
        bool locals_visible = include_locals && ns != Namespace::type;
        Syntax_Element child = from;
        for (Syntax_Element scope = from.parent(); scope; child = scope, scope = scope.parent()) {
            if (locals_visible) {
                if (std::optional<Resolution> local = find_local(scope, child, offset, name, depth)) {
                    return local;
                }
            }
            if (std::optional<Resolution> item = find_item(scope, name, ns, depth)) {
                return item;
            }
            // Nested functions cannot refer to the locals of the enclosing function.
            if (scope.kind() == Syntax_Kind::fn_def) {
                locals_visible = false;
            }
        }
        if (ns != Namespace::value && is_builtin_type_name(name)) {
            return Resolution { {}, def::Module_Def { Item_Kind::builtin_type } };
        }
        return std::nullopt;
    }

    /// @brief Searches the bindings that `scope` introduces and that are visible in `child`,
    /// which is the child of `scope` containing the name being resolved.
    [[nodiscard]]
    std::optional<Resolution> find_local(
        Syntax_Element scope,
        Syntax_Element child,
        std::size_t offset,
        std::u8string_view name,
        int depth
    ) const
    {
        switch (scope.kind()) {
        case Syntax_Kind::block_expr:
        case Syntax_Kind::macro_stmts: {
            // Later statements shadow earlier ones,
            // and a let statement is only visible after it ends.
            for (Syntax_Element s = scope.last_child(); s; s = s.prev_sibling()) {
                if (s.kind() != Syntax_Kind::let_stmt || s.range().end() > offset) {
                    continue;
                }
                const Syntax_Element pattern = child_node_if(s, is_pattern_kind);
                if (std::optional<Resolution> r = find_binding(pattern, name, depth)) {
                    return r;
                }
            }
            return std::nullopt;
        }
        case Syntax_Kind::fn_def:
        case Syntax_Kind::lambda_expr: {
            const Syntax_Element params = scope.child_of_kind(Syntax_Kind::param_list);
            if (!params) {
                return std::nullopt;
            }
            for (const Syntax_Element param : params.children()) {
                if (param.kind() != Syntax_Kind::param) {
                    continue;
                }
                if (std::optional<Resolution> r
                    = find_binding(child_node_if(param, is_pattern_kind), name, depth)) {
                    return r;
                }
            }
            return std::nullopt;
        }
        case Syntax_Kind::for_expr: {
            if (child.kind() != Syntax_Kind::block_expr) {
                return std::nullopt;
            }
            return find_binding(child_node_if(scope, is_pattern_kind), name, depth);
        }
        case Syntax_Kind::match_arm: {
            if (is_pattern_kind(child.kind())) {
                return std::nullopt;
            }
            for (const Syntax_Element pattern : scope.children()) {
                if (!is_pattern_kind(pattern.kind())) {
                    continue;
                }
                if (std::optional<Resolution> r = find_binding(pattern, name, depth)) {
                    return r;
                }
            }
            return std::nullopt;
        }
        case Syntax_Kind::if_expr:
        case Syntax_Kind::while_expr: {
            // Only the first block sees the bindings of `if let`, not the `else` branch.
            if (child != scope.child_of_kind(Syntax_Kind::block_expr)) {
                return std::nullopt;
            }
            const Syntax_Element cond = scope.child_of_kind(Syntax_Kind::condition);
            if (!cond) {
                return std::nullopt;
            }
            return find_binding(child_node_if(cond, is_pattern_kind), name, depth);
        }
        default: return std::nullopt;
        }
    }

    /// @brief Searches a pattern for a binding of `name`.
    [[nodiscard]]
    std::optional<Resolution>
    find_binding(Syntax_Element pattern, std::u8string_view name, int depth) const
    {
        if (!pattern) {
            return std::nullopt;
        }
        Preorder walk { pattern };
        while (const std::optional<Walk_Event> event = walk.next()) {
            const Syntax_Element e = event->element;
            if (event->kind != Walk_Event_Kind::enter || e.kind() != Syntax_Kind::bind_pat) {
                continue;
            }
            if (has_name(e, name) && !is_const_like_binding(e, depth)) {
                return Resolution { e, local_definition(e) };
            }
        }
        return std::nullopt;
    }

    /// @brief Returns `true` if `bind_pat` does not introduce a binding,
    /// but refers to a constant-like entity,
    /// which is a unit struct, a constant, a static, or a unit enum variant.
    [[nodiscard]]
    bool is_const_like_binding(Syntax_Element bind_pat, int depth) const
    {
        return bool(const_like_target(bind_pat, depth));
    }

    [[nodiscard]]
    std::optional<Resolution> const_like_target(Syntax_Element bind_pat, int depth) const
    {
        if (bind_pat.child_of_kind(Syntax_Kind::ref_kw) || bind_pat.child_of_kind(Syntax_Kind::mut_kw)
            || bind_pat.child_of_kind(Syntax_Kind::at)) {
            return std::nullopt;
        }
        const Syntax_Element name = name_of(bind_pat);
        if (!name) {
            return std::nullopt;
        }
        std::optional<Resolution> target
            = resolve_simple(bind_pat, name.text(), Namespace::value, false, depth + 1);
        if (!target || !target->node) {
            return std::nullopt;
        }
        switch (target->node.kind()) {
        case Syntax_Kind::const_def:
        case Syntax_Kind::static_def: return target;
        case Syntax_Kind::struct_def:
        case Syntax_Kind::enum_variant:
            return has_field_list(target->node) ? std::nullopt : target;
        default: return std::nullopt;
        }
    }

    /// @brief Searches the items and type parameters that `scope` declares.
    [[nodiscard]]
    std::optional<Resolution>
    find_item(Syntax_Element scope, std::u8string_view name, Namespace ns, int depth) const
    {
        switch (scope.kind()) {
        case Syntax_Kind::item_list: {
            // Associated items are not in scope by their plain name.
            const Syntax_Element owner = scope.parent();
            if (owner
                && (owner.kind() == Syntax_Kind::impl_block
                    || owner.kind() == Syntax_Kind::trait_def)) {
                return std::nullopt;
            }
            return find_item_in_list(scope, name, ns, depth);
        }
        case Syntax_Kind::source_file:
        case Syntax_Kind::block_expr:
        case Syntax_Kind::macro_items:
        case Syntax_Kind::macro_stmts: return find_item_in_list(scope, name, ns, depth);
        case Syntax_Kind::fn_def:
        case Syntax_Kind::struct_def:
        case Syntax_Kind::enum_def:
        case Syntax_Kind::union_def:
        case Syntax_Kind::trait_def:
        case Syntax_Kind::impl_block:
        case Syntax_Kind::type_alias_def: return find_generic_param(scope, name, ns);
        default: return std::nullopt;
        }
    }

    [[nodiscard]]
    std::optional<Resolution>
    find_generic_param(Syntax_Element owner, std::u8string_view name, Namespace ns) const
    {
        const Syntax_Element params = owner.child_of_kind(Syntax_Kind::type_param_list);
        if (!params) {
            return std::nullopt;
        }
        for (const Syntax_Element param : params.children()) {
            if (is_in_namespace(param.kind(), ns) && has_name(param, name)) {
                return resolution_of_node(param);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]]
    std::optional<Resolution>
    find_item_in_list(Syntax_Element list, std::u8string_view name, Namespace ns, int depth) const
    {
        if (depth > max_resolution_depth) {
            return std::nullopt;
        }
        for (const Syntax_Element item : list.children()) {
            if (is_in_namespace(item.kind(), ns) && has_name(item, name)) {
                return resolution_of_node(item);
            }
            if (item.kind() == Syntax_Kind::use_item) {
                if (std::optional<Resolution> r = find_in_use_item(item, name, ns, depth + 1)) {
                    return r;
                }
            }
            if (item.kind() == Syntax_Kind::macro_call) {
                const Syntax_Element expansion = m_tree.expansion_of(item);
                if (expansion && expansion.kind() == Syntax_Kind::macro_items) {
                    if (std::optional<Resolution> r
                        = find_item_in_list(expansion, name, ns, depth + 1)) {
                        return r;
                    }
                }
            }
        }
        return std::nullopt;
    }

    // USE ITEMS ===================================================================================

    [[nodiscard]]
    std::optional<Resolution> find_in_use_item(
        Syntax_Element use_item,
        std::u8string_view name,
        Namespace ns,
        int depth
    ) const
    {
        const Syntax_Element tree = use_item.child_of_kind(Syntax_Kind::use_tree);
        if (!tree) {
            return std::nullopt;
        }
        return find_in_use_tree(tree, std::nullopt, false, name, ns, depth);
    }

    /// @brief Searches a use tree for an import of `name`.
    /// @param prefix The resolution of the path of enclosing use trees, if any.
    /// @param has_prefix `true` if this tree is nested within another tree with a path.
    [[nodiscard]]
    std::optional<Resolution> find_in_use_tree(
        Syntax_Element tree,
        const std::optional<Resolution>& prefix,
        bool has_prefix,
        std::u8string_view name,
        Namespace ns,
        int depth
    ) const
    {
        if (depth > max_resolution_depth) {
            return std::nullopt;
        }
        const Syntax_Element path = tree.child_of_kind(Syntax_Kind::path);
        const Syntax_Element list = tree.child_of_kind(Syntax_Kind::use_tree_list);
        const bool is_glob = bool(tree.child_of_kind(Syntax_Kind::star));

        if (list || is_glob) {
            std::optional<Resolution> owner = prefix;
            if (path) {
                owner = resolve_use_path(path, prefix, has_prefix, depth + 1);
                if (!owner) {
                    return std::nullopt;
                }
            }
            if (is_glob) {
                return owner && owner->node ? find_member(owner->node, name, ns, depth + 1)
                                            : std::nullopt;
            }
            for (const Syntax_Element nested : list.children()) {
                if (nested.kind() != Syntax_Kind::use_tree) {
                    continue;
                }
                if (std::optional<Resolution> r = find_in_use_tree(
                        nested, owner, has_prefix || bool(path), name, ns, depth + 1
                    )) {
                    return r;
                }
            }
            return std::nullopt;
        }

        if (!path) {
            return std::nullopt;
        }
        const Syntax_Element alias = tree.child_of_kind(Syntax_Kind::alias);
        const Syntax_Element alias_name = alias ? name_of(alias) : Syntax_Element {};
        const std::u8string_view imported = alias_name ? alias_name.text() : last_segment_text(path);
        if (imported != name) {
            return std::nullopt;
        }
        return resolve_use_path(path, prefix, has_prefix, depth + 1);
    }

    [[nodiscard]]
    std::optional<Resolution> resolve_use_path(
        Syntax_Element path,
        const std::optional<Resolution>& prefix,
        bool has_prefix,
        int depth
    ) const
    {
        if (depth > max_resolution_depth) {
            return std::nullopt;
        }
        const Syntax_Element segment = path.child_of_kind(Syntax_Kind::path_segment);
        if (!segment) {
            return std::nullopt;
        }
        if (const Syntax_Element qualifier = path.child_of_kind(Syntax_Kind::path)) {
            const std::optional<Resolution> owner
                = resolve_use_path(qualifier, prefix, has_prefix, depth + 1);
            if (!owner || !owner->node) {
                return std::nullopt;
            }
            return find_member(owner->node, last_segment_text(path), Namespace::any, depth + 1);
        }
        if (has_prefix) {
            if (!prefix || !prefix->node) {
                return std::nullopt;
            }
            if (segment.child_of_kind(Syntax_Kind::self_kw)) {
                return prefix;
            }
            return find_member(prefix->node, last_segment_text(path), Namespace::any, depth + 1);
        }
        return resolve_first_segment(segment, Namespace::any, false, depth + 1);
    }

    // PATHS =======================================================================================

    /// @brief Resolves the first segment of a path, which may be a keyword such as `crate`.
    [[nodiscard]]
    std::optional<Resolution> resolve_first_segment(
        Syntax_Element segment,
        Namespace ns,
        bool include_locals,
        int depth
    ) const
    {
        if (const Syntax_Element name_ref = segment.child_of_kind(Syntax_Kind::name_ref)) {
            return resolve_simple(segment, name_ref.text(), ns, include_locals, depth);
        }
        if (segment.child_of_kind(Syntax_Kind::crate_kw)) {
            return resolution_of_node(m_tree.root());
        }
        if (segment.child_of_kind(Syntax_Kind::self_kw)) {
            return resolution_of_node(enclosing_module(segment));
        }
        if (segment.child_of_kind(Syntax_Kind::super_kw)) {
            const Syntax_Element current = enclosing_module(segment);
            return current ? resolution_of_node(enclosing_module(current)) : std::nullopt;
        }
        if (segment.child_of_kind(Syntax_Kind::self_type_kw)) {
            const Syntax_Element self_type = self_type_def(segment, depth + 1);
            return resolution_of_node(self_type);
        }
        return std::nullopt;
    }

    /// @brief Returns the closest module (or the source file) strictly enclosing `e`.
    [[nodiscard]]
    Syntax_Element enclosing_module(Syntax_Element e) const
    {
        for (Syntax_Element a = e.parent(); a; a = a.parent()) {
            if (a.kind() == Syntax_Kind::module || a.kind() == Syntax_Kind::source_file) {
                return a;
            }
        }
        return {};
    }

    [[nodiscard]]
    std::optional<Resolution> resolve_path(Syntax_Element path, Namespace ns, int depth) const
    {
        if (depth > max_resolution_depth) {
            return std::nullopt;
        }
        const Syntax_Element segment = path.child_of_kind(Syntax_Kind::path_segment);
        if (!segment) {
            return std::nullopt;
        }
        const Syntax_Element qualifier = path.child_of_kind(Syntax_Kind::path);
        if (!qualifier) {
            return resolve_first_segment(segment, ns, true, depth + 1);
        }
        const std::optional<Resolution> owner = resolve_path(qualifier, Namespace::type, depth + 1);
        if (!owner || !owner->node) {
            return std::nullopt;
        }
        return find_member(owner->node, last_segment_text(path), ns, depth + 1);
    }

    /// @brief Searches the members of a module, enum, or type,
    /// including associated items in `impl` blocks.
    [[nodiscard]]
    std::optional<Resolution>
    find_member(Syntax_Element owner, std::u8string_view name, Namespace ns, int depth) const
    {
        if (depth > max_resolution_depth || name.empty()) {
            return std::nullopt;
        }
        switch (owner.kind()) {
        case Syntax_Kind::source_file: return find_item_in_list(owner, name, ns, depth + 1);
        case Syntax_Kind::module: {
            const Syntax_Element items = owner.child_of_kind(Syntax_Kind::item_list);
            return items ? find_item_in_list(items, name, ns, depth + 1) : std::nullopt;
        }
        case Syntax_Kind::enum_def: {
            if (const Syntax_Element variants
                = owner.child_of_kind(Syntax_Kind::enum_variant_list)) {
                for (const Syntax_Element variant : variants.children()) {
                    if (variant.kind() == Syntax_Kind::enum_variant && has_name(variant, name)) {
                        return resolution_of_node(variant);
                    }
                }
            }
            return find_associated(owner, name);
        }
        case Syntax_Kind::struct_def:
        case Syntax_Kind::union_def:
        case Syntax_Kind::trait_def:
        case Syntax_Kind::type_alias_def: return find_associated(owner, name);
        default: return std::nullopt;
        }
    }

    /// @brief Searches the associated items of a type or trait,
    /// which are the items within `impl` blocks for the type and within the trait itself.
    [[nodiscard]]
    std::optional<Resolution> find_associated(Syntax_Element type_def, std::u8string_view name) const
    {
        const auto find_in_items = [&](Syntax_Element items) -> std::optional<Resolution> {
            for (const Syntax_Element item : items.children()) {
                switch (item.kind()) {
                case Syntax_Kind::fn_def:
                case Syntax_Kind::const_def:
                case Syntax_Kind::type_alias_def:
                    if (has_name(item, name)) {
                        return resolution_of_node(item);
                    }
                    break;
                default: break;
                }
            }
            return std::nullopt;
        };

        if (type_def.kind() == Syntax_Kind::trait_def) {
            if (const Syntax_Element items = type_def.child_of_kind(Syntax_Kind::item_list)) {
                if (std::optional<Resolution> r = find_in_items(items)) {
                    return r;
                }
            }
        }
        const Syntax_Element type_name = name_of(type_def);
        if (!type_name) {
            return std::nullopt;
        }
        Preorder walk { m_tree.root() };
        while (const std::optional<Walk_Event> event = walk.next()) {
            const Syntax_Element e = event->element;
            if (event->kind != Walk_Event_Kind::enter || e.kind() != Syntax_Kind::impl_block) {
                continue;
            }
            if (impl_self_type_name(e) != type_name.text()) {
                continue;
            }
            if (const Syntax_Element items = e.child_of_kind(Syntax_Kind::item_list)) {
                if (std::optional<Resolution> r = find_in_items(items)) {
                    return r;
                }
            }
        }
        return std::nullopt;
    }

    /// @brief Returns the first definition of the given kind and name anywhere in the document,
    /// which is used when the owner of a field or method cannot be determined.
    [[nodiscard]]
    Syntax_Element find_anywhere(Syntax_Kind kind, std::u8string_view name) const
    {
        Preorder walk { m_tree.root() };
        while (const std::optional<Walk_Event> event = walk.next()) {
            const Syntax_Element e = event->element;
            if (event->kind == Walk_Event_Kind::enter && e.kind() == kind && has_name(e, name)) {
                return e;
            }
        }
        return {};
    }

    // TYPES =======================================================================================

    /// @brief Returns the struct, enum, or union definition that `type` names, if any.
    [[nodiscard]]
    Syntax_Element type_def_of_type(Syntax_Element type, int depth) const
    {
        if (!type || depth > max_resolution_depth) {
            return {};
        }
        switch (type.kind()) {
        case Syntax_Kind::reference_type:
        case Syntax_Kind::pointer_type:
            return type_def_of_type(child_node_if(type, is_type_kind), depth + 1);
        case Syntax_Kind::path_type: {
            const Syntax_Element path = type.child_of_kind(Syntax_Kind::path);
            if (!path) {
                return {};
            }
            const std::optional<Resolution> r = resolve_path(path, Namespace::type, depth + 1);
            return r ? as_type_def(r->node) : Syntax_Element {};
        }
        default: return {};
        }
    }

    [[nodiscard]]
    static Syntax_Element as_type_def(Syntax_Element node)
    {
        if (!node) {
            return {};
        }
        switch (node.kind()) {
        case Syntax_Kind::struct_def:
        case Syntax_Kind::enum_def:
        case Syntax_Kind::union_def: return node;
        default: return {};
        }
    }

    /// @brief Returns the type definition that `Self` or `self` refers to at `e`.
    [[nodiscard]]
    Syntax_Element self_type_def(Syntax_Element e, int depth) const
    {
        for (Syntax_Element a = e.parent(); a; a = a.parent()) {
            if (a.kind() == Syntax_Kind::impl_block) {
                return type_def_of_type(impl_self_type(a), depth + 1);
            }
            if (a.kind() == Syntax_Kind::trait_def) {
                return a;
            }
        }
        return {};
    }

    /// @brief Infers the struct, enum, or union definition that `expr` evaluates to.
    [[nodiscard]]
    Syntax_Element type_def_of_expr(Syntax_Element expr, int depth) const
    {
        if (!expr || depth > max_resolution_depth) {
            return {};
        }
        switch (expr.kind()) {
        case Syntax_Kind::paren_expr:
        case Syntax_Kind::ref_expr:
        case Syntax_Kind::try_expr:
        case Syntax_Kind::await_expr:
            return type_def_of_expr(child_node_if(expr, [](Syntax_Kind) { return true; }), depth + 1);
        case Syntax_Kind::path_expr: {
            const Syntax_Element path = expr.child_of_kind(Syntax_Kind::path);
            if (!path) {
                return {};
            }
            const Syntax_Element segment = path.child_of_kind(Syntax_Kind::path_segment);
            if (!path.child_of_kind(Syntax_Kind::path) && segment
                && segment.child_of_kind(Syntax_Kind::self_kw)) {
                return as_type_def(self_type_def(expr, depth + 1));
            }
            const std::optional<Resolution> r = resolve_path(path, Namespace::value, depth + 1);
            if (!r || !r->node) {
                return {};
            }
            if (r->node.kind() == Syntax_Kind::bind_pat) {
                return type_def_of_binding(r->node, depth + 1);
            }
            return as_type_def(r->node);
        }
        case Syntax_Kind::record_lit: {
            const Syntax_Element path = expr.child_of_kind(Syntax_Kind::path);
            const std::optional<Resolution> r
                = path ? resolve_path(path, Namespace::type, depth + 1) : std::nullopt;
            return r ? as_type_def(r->node) : Syntax_Element {};
        }
        case Syntax_Kind::call_expr: {
            // `Point::new(..)` is assumed to produce a `Point`,
            // and `Wrapper(..)` a `Wrapper`.
            const Syntax_Element callee = expr.child_of_kind(Syntax_Kind::path_expr);
            const Syntax_Element path = callee ? callee.child_of_kind(Syntax_Kind::path) : Syntax_Element {};
            if (!path) {
                return {};
            }
            if (const Syntax_Element qualifier = path.child_of_kind(Syntax_Kind::path)) {
                const std::optional<Resolution> r
                    = resolve_path(qualifier, Namespace::type, depth + 1);
                return r ? as_type_def(r->node) : Syntax_Element {};
            }
            const std::optional<Resolution> r = resolve_path(path, Namespace::value, depth + 1);
            return r ? as_type_def(r->node) : Syntax_Element {};
        }
        case Syntax_Kind::field_expr: {
            const Syntax_Element field = field_of_field_expr(expr, depth + 1);
            return field ? type_def_of_type(child_node_if(field, is_type_kind), depth + 1)
                         : Syntax_Element {};
        }
        default: return {};
        }
    }

    [[nodiscard]]
    Syntax_Element type_def_of_binding(Syntax_Element bind_pat, int depth) const
    {
        const Syntax_Element parent = bind_pat.parent();
        if (!parent) {
            return {};
        }
        if (parent.kind() == Syntax_Kind::param) {
            return type_def_of_type(child_node_if(parent, is_type_kind), depth + 1);
        }
        if (parent.kind() == Syntax_Kind::let_stmt) {
            if (const Syntax_Element annotation = child_node_if(parent, is_type_kind)) {
                return type_def_of_type(annotation, depth + 1);
            }
            bool after_eq = false;
            for (const Syntax_Element child : parent.children()) {
                if (child.kind() == Syntax_Kind::eq) {
                    after_eq = true;
                }
                else if (after_eq && child.is_node()) {
                    return type_def_of_expr(child, depth + 1);
                }
            }
        }
        return {};
    }

    [[nodiscard]]
    static Syntax_Element find_field(Syntax_Element type_def, std::u8string_view name)
    {
        const Syntax_Element fields = type_def.child_of_kind(Syntax_Kind::record_field_def_list);
        if (!fields) {
            return {};
        }
        for (const Syntax_Element field : fields.children()) {
            if (field.kind() == Syntax_Kind::record_field_def && has_name(field, name)) {
                return field;
            }
        }
        return {};
    }

    /// @brief Returns the field definition that a field access such as `p.x` refers to.
    [[nodiscard]]
    Syntax_Element field_of_field_expr(Syntax_Element field_expr, int depth) const
    {
        const Syntax_Element name_ref = field_expr.child_of_kind(Syntax_Kind::name_ref);
        if (!name_ref) {
            return {};
        }
        const Syntax_Element receiver = child_node_if(field_expr, [](Syntax_Kind k) {
            return k != Syntax_Kind::name_ref;
        });
        if (const Syntax_Element owner = type_def_of_expr(receiver, depth + 1)) {
            return find_field(owner, name_ref.text());
        }
        return {};
    }

    // NAME REFERENCES =============================================================================

    [[nodiscard]]
    std::optional<Resolution> resolve_name_ref(Syntax_Element name_ref) const
    {
        const Syntax_Element parent = name_ref.parent();
        if (!parent) {
            return std::nullopt;
        }
        const std::u8string_view name = name_ref.text();
        switch (parent.kind()) {
        case Syntax_Kind::path_segment: return resolve_path_segment(parent);
        case Syntax_Kind::field_expr: {
            if (const Syntax_Element field = field_of_field_expr(parent, 0)) {
                return resolution_of_node(field);
            }
            return resolution_of_node(find_anywhere(Syntax_Kind::record_field_def, name));
        }
        case Syntax_Kind::method_call_expr: return resolution_of_node(method_of_call(parent));
        case Syntax_Kind::record_field:
        case Syntax_Kind::record_field_pat: {
            const Syntax_Element owner = record_owner(parent);
            const Syntax_Element field = owner ? find_field(owner, name) : Syntax_Element {};
            return Resolution { field, def::Field {} };
        }
        default: return std::nullopt;
        }
    }

    [[nodiscard]]
    std::optional<Resolution> resolve_path_segment(Syntax_Element segment) const
    {
        const Syntax_Element path = segment.parent();
        if (!path || path.kind() != Syntax_Kind::path) {
            return std::nullopt;
        }
        Syntax_Element outer = path;
        while (outer.parent() && outer.parent().kind() == Syntax_Kind::path) {
            outer = outer.parent();
        }
        const Syntax_Element context = outer.parent();
        const bool is_last = path == outer;
        if (!context) {
            return std::nullopt;
        }
        if (context.kind() == Syntax_Kind::macro_call) {
            if (is_last) {
                return Resolution { {}, def::Macro {} };
            }
            return resolve_path(path, Namespace::type, 0);
        }
        if (context.kind() == Syntax_Kind::use_tree) {
            const auto [prefix, has_prefix] = use_tree_prefix(context);
            return resolve_use_path(path, prefix, has_prefix, 0);
        }
        Namespace ns = Namespace::type;
        if (is_last) {
            switch (context.kind()) {
            case Syntax_Kind::path_expr: ns = Namespace::value; break;
            case Syntax_Kind::path_pat:
            case Syntax_Kind::tuple_struct_pat:
            case Syntax_Kind::record_pat:
            case Syntax_Kind::record_lit: ns = Namespace::any; break;
            default: break;
            }
        }
        return resolve_path(path, ns, 0);
    }

    struct Use_Prefix {
        std::optional<Resolution> prefix;
        bool has_prefix;
    };

    /// @brief Resolves the paths of the use trees that enclose `tree`,
    /// such as `a::b` for `c` in `use a::b::{c}`.
    [[nodiscard]]
    Use_Prefix use_tree_prefix(Syntax_Element tree) const
    {
        const Syntax_Element list = tree.parent();
        if (!list || list.kind() != Syntax_Kind::use_tree_list) {
            return { std::nullopt, false };
        }
        const Syntax_Element outer = list.parent();
        if (!outer || outer.kind() != Syntax_Kind::use_tree) {
            return { std::nullopt, false };
        }
        const auto [outer_prefix, outer_has_prefix] = use_tree_prefix(outer);
        const Syntax_Element path = outer.child_of_kind(Syntax_Kind::path);
        if (!path) {
            return { outer_prefix, outer_has_prefix };
        }
        return { resolve_use_path(path, outer_prefix, outer_has_prefix, 0), true };
    }

    /// @brief Returns the struct or variant definition that a record literal or record pattern
    /// containing `field` constructs or destructures.
    [[nodiscard]]
    Syntax_Element record_owner(Syntax_Element field) const
    {
        Syntax_Element record = field.parent();
        while (record && record.kind() != Syntax_Kind::record_lit
               && record.kind() != Syntax_Kind::record_pat) {
            if (record.kind() != Syntax_Kind::record_field_list
                && record.kind() != Syntax_Kind::record_field_pat_list) {
                return {};
            }
            record = record.parent();
        }
        if (!record) {
            return {};
        }
        const Syntax_Element path = record.child_of_kind(Syntax_Kind::path);
        const std::optional<Resolution> r
            = path ? resolve_path(path, Namespace::any, 0) : std::nullopt;
        if (!r || !r->node) {
            return {};
        }
        const Syntax_Kind kind = r->node.kind();
        return kind == Syntax_Kind::struct_def || kind == Syntax_Kind::union_def
                || kind == Syntax_Kind::enum_variant
            ? r->node
            : Syntax_Element {};
    }

    /// @brief Returns the function that a method call such as `p.len()` calls.
    /// If the type of the receiver is unknown,
    /// any method with the same name within an `impl` block or trait is assumed.
    [[nodiscard]]
    Syntax_Element method_of_call(Syntax_Element method_call) const
    {
        const Syntax_Element name_ref = method_call.child_of_kind(Syntax_Kind::name_ref);
        if (!name_ref) {
            return {};
        }
        const Syntax_Element receiver = method_call.first_child();
        if (receiver && receiver.is_node()) {
            if (const Syntax_Element owner = type_def_of_expr(receiver, 0)) {
                const std::optional<Resolution> r = find_associated(owner, name_ref.text());
                if (r && r->node && r->node.kind() == Syntax_Kind::fn_def) {
                    return r->node;
                }
            }
        }
        Preorder walk { m_tree.root() };
        while (const std::optional<Walk_Event> event = walk.next()) {
            const Syntax_Element e = event->element;
            if (event->kind != Walk_Event_Kind::enter || e.kind() != Syntax_Kind::fn_def
                || !has_name(e, name_ref.text())) {
                continue;
            }
            const Syntax_Element items = e.parent();
            const Syntax_Element owner = items ? items.parent() : Syntax_Element {};
            if (owner
                && (owner.kind() == Syntax_Kind::impl_block
                    || owner.kind() == Syntax_Kind::trait_def)) {
                return e;
            }
        }
        return {};
    }

    /// @brief Returns the function that a call expression calls, if it can be resolved.
    [[nodiscard]]
    Syntax_Element callee_of_call(Syntax_Element call) const
    {
        if (call.kind() == Syntax_Kind::method_call_expr) {
            return method_of_call(call);
        }
        const Syntax_Element callee = call.first_child();
        if (!callee || callee.kind() != Syntax_Kind::path_expr) {
            return {};
        }
        const Syntax_Element path = callee.child_of_kind(Syntax_Kind::path);
        const std::optional<Resolution> r
            = path ? resolve_path(path, Namespace::value, 0) : std::nullopt;
        return r && r->node && r->node.kind() == Syntax_Kind::fn_def ? r->node : Syntax_Element {};
    }
};

} // namespace

std::optional<Name_Class> Source_Semantics::classify_definition(Syntax_Element name) const
{
    SHADE_ASSERT(name.kind() == Syntax_Kind::name);
    const Syntax_Element parent = name.parent();
    if (!parent) {
        return std::nullopt;
    }
    const Resolver resolver { m_tree, m_memory };
    switch (parent.kind()) {
    case Syntax_Kind::bind_pat: {
        if (std::optional<Resolution> target = resolver.const_like_target(parent, 0)) {
            return Const_Reference { std::move(target->definition) };
        }
        return Definition { local_definition(parent) };
    }
    case Syntax_Kind::alias: {
        // `use a::b as c` defines `c` as another name for `b`.
        const Syntax_Element tree = parent.parent();
        if (!tree || tree.kind() != Syntax_Kind::use_tree) {
            return std::nullopt;
        }
        const Syntax_Element path = tree.child_of_kind(Syntax_Kind::path);
        if (!path) {
            return std::nullopt;
        }
        const auto [prefix, has_prefix] = resolver.use_tree_prefix(tree);
        std::optional<Resolution> target = resolver.resolve_use_path(path, prefix, has_prefix, 0);
        if (!target) {
            return std::nullopt;
        }
        return std::move(target->definition);
    }
    default: break;
    }
    std::optional<Definition> definition = definition_of_node(parent);
    if (!definition) {
        return std::nullopt;
    }
    return std::move(*definition);
}

std::optional<Name_Ref_Class> Source_Semantics::classify_reference(Syntax_Element name_ref) const
{
    SHADE_ASSERT(name_ref.kind() == Syntax_Kind::name_ref);
    // `x` in `Point { x }` refers to both the field and the local.
    const Syntax_Element segment = name_ref.parent();
    const Syntax_Element path = segment ? segment.parent() : Syntax_Element {};
    const Syntax_Element path_expr = path ? path.parent() : Syntax_Element {};
    const Syntax_Element field = path_expr ? path_expr.parent() : Syntax_Element {};
    if (segment && segment.kind() == Syntax_Kind::path_segment && path_expr
        && path_expr.kind() == Syntax_Kind::path_expr && field
        && field.kind() == Syntax_Kind::record_field && !field.child_of_kind(Syntax_Kind::colon)) {
        return Field_Shorthand {};
    }

    const Resolver resolver { m_tree, m_memory };
    std::optional<Resolution> resolution = resolver.resolve_name_ref(name_ref);
    if (!resolution) {
        return std::nullopt;
    }
    return std::move(resolution->definition);
}

std::optional<Call_Info>
Source_Semantics::call_info(Syntax_Element token, std::pmr::memory_resource* memory) const
{
    const Syntax_Element parent = token.parent();
    const Syntax_Element arg_list
        = parent ? parent.ancestor_of_kind(Syntax_Kind::arg_list) : Syntax_Element {};
    if (!arg_list) {
        return std::nullopt;
    }
    const Syntax_Element call = arg_list.parent();
    if (!call) {
        return std::nullopt;
    }
    const Resolver resolver { m_tree, m_memory };
    const Syntax_Element callee = resolver.callee_of_call(call);
    if (!callee) {
        return std::nullopt;
    }

    Call_Info result {
        .active_parameter = std::nullopt,
        .parameter_names = std::pmr::vector<std::u8string_view>(memory),
    };
    const Syntax_Element params = callee.child_of_kind(Syntax_Kind::param_list);
    if (!params) {
        return std::nullopt;
    }
    // A method that is called like `Type::method(receiver, ..)` receives `self` explicitly.
    if (call.kind() == Syntax_Kind::call_expr && params.child_of_kind(Syntax_Kind::self_param)) {
        result.parameter_names.push_back(u8"self"sv);
    }
    for (const Syntax_Element param : params.children()) {
        if (param.kind() != Syntax_Kind::param) {
            continue;
        }
        const Syntax_Element pattern = param.first_child();
        const Syntax_Element name = pattern && pattern.kind() == Syntax_Kind::bind_pat
            ? name_of(pattern)
            : Syntax_Element {};
        result.parameter_names.push_back(name ? name.text() : u8"_"sv);
    }

    std::size_t index = 0;
    for (const Syntax_Element child : arg_list.children()) {
        if (child.kind() == Syntax_Kind::comma && child.range().begin < token.range().begin) {
            ++index;
        }
    }
    result.active_parameter = index;
    return result;
}

Syntax_Element Source_Semantics::descend_into_macros(Syntax_Element token) const
{
    return shade::descend_into_macros(token);
}

} // namespace shade
