#ifndef SHADE_SEMANTICS_HPP
#define SHADE_SEMANTICS_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "shade/fwd.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief The kind of an item that is defined at module level or in a block.
enum struct Item_Kind : Default_Underlying {
    module,
    function,
    struct_,
    enum_,
    union_,
    enum_variant,
    constant,
    static_,
    trait,
    type_alias,
    builtin_type,
};

namespace def {

struct Macro {
    [[nodiscard]]
    friend constexpr bool operator==(Macro, Macro)
        = default;
};

/// @brief A field of a struct, union, or enum variant.
struct Field {
    [[nodiscard]]
    friend constexpr bool operator==(Field, Field)
        = default;
};

struct Module_Def {
    Item_Kind kind;

    [[nodiscard]]
    friend constexpr bool operator==(Module_Def, Module_Def)
        = default;
};

/// @brief `Self` within an `impl` block or trait.
struct Self_Type {
    [[nodiscard]]
    friend constexpr bool operator==(Self_Type, Self_Type)
        = default;
};

struct Type_Param {
    [[nodiscard]]
    friend constexpr bool operator==(Type_Param, Type_Param)
        = default;
};

/// @brief A local variable, which includes function and closure parameters.
struct Local {
    /// @brief The name of the binding, which is used to track shadowing.
    std::u8string_view name;
    /// @brief `true` if the binding is declared `mut`.
    bool is_mutable = false;
    /// @brief `true` if the type of the binding is known to be `&mut T`.
    bool has_mutable_reference_type = false;

    [[nodiscard]]
    friend constexpr bool operator==(const Local&, const Local&)
        = default;
};

} // namespace def

using Definition = std::variant< //
    def::Macro,
    def::Field,
    def::Module_Def,
    def::Self_Type,
    def::Type_Param,
    def::Local>;

/// @brief A name in definition position that does not define anything,
/// but refers to an existing constant-like entity.
/// For example, `None` in `let None = x;` refers to an enum variant.
struct Const_Reference {
    Definition definition;

    [[nodiscard]]
    friend constexpr bool operator==(const Const_Reference&, const Const_Reference&)
        = default;
};

/// @brief The name in a record literal field such as `x` in `Point { x }`,
/// which is both a reference to a field and to a local variable.
struct Field_Shorthand {
    [[nodiscard]]
    friend constexpr bool operator==(Field_Shorthand, Field_Shorthand)
        = default;
};

/// @brief The classification of a `name` node.
using Name_Class = std::variant<Definition, Const_Reference>;

/// @brief The classification of a `name_ref` node.
using Name_Ref_Class = std::variant<Definition, Field_Shorthand>;

/// @brief Information about the call whose arguments contain a token.
struct Call_Info {
    /// @brief The index of the parameter which corresponds to the argument containing the token,
    /// or `std::nullopt` if it cannot be determined.
    std::optional<std::size_t> active_parameter;
    /// @brief The names of the parameters of the callee in order.
    /// `self` is only included if a method is called like `Type::method(receiver)`.
    std::pmr::vector<std::u8string_view> parameter_names;
};

/// @brief The name resolution oracle that highlighting is based on.
/// Implementations answer questions about one document and the expansions of its macros.
struct Semantics {
    [[nodiscard]]
    constexpr Semantics() noexcept
        = default;

    constexpr virtual ~Semantics() = default;

    /// @brief Classifies a `name` node, i.e. a name in definition position.
    /// @returns `std::nullopt` if nothing is known about the name.
    [[nodiscard]]
    virtual std::optional<Name_Class> classify_definition(Syntax_Element name) const = 0;

    /// @brief Classifies a `name_ref` node.
    /// @returns `std::nullopt` if the name cannot be resolved.
    [[nodiscard]]
    virtual std::optional<Name_Ref_Class> classify_reference(Syntax_Element name_ref) const = 0;

    /// @brief Finds the innermost call whose argument list contains `token`.
    [[nodiscard]]
    virtual std::optional<Call_Info>
    call_info(Syntax_Element token, std::pmr::memory_resource* memory) const
        = 0;

    /// @brief Maps a token within the token tree of a macro call onto the corresponding token
    /// in the expansion of the macro.
    /// @returns The expanded token, or `token` if there is no such token.
    [[nodiscard]]
    virtual Syntax_Element descend_into_macros(Syntax_Element token) const = 0;
};

} // namespace shade

#endif
