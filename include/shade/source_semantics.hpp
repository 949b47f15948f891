#ifndef SHADE_SOURCE_SEMANTICS_HPP
#define SHADE_SOURCE_SEMANTICS_HPP

#include <memory_resource>
#include <optional>

#include "shade/fwd.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief Resolves names within a single document and the expansions of its macros.
/// Resolution is approximate:
/// items are visible throughout the enclosing item lists and blocks (and their ancestors),
/// locals are visible after their `let` statement or within the body of the construct
/// that binds them,
/// and types of expressions are only inferred from annotations, record literals,
/// `Type::function()` calls, and `self`.
struct Source_Semantics final : Semantics {
private:
    const Syntax_Tree& m_tree;
    std::pmr::memory_resource* m_memory;

public:
    /// @brief Constructs semantics for `tree`,
    /// which must already contain the expansions of its macros.
    [[nodiscard]]
    explicit Source_Semantics(const Syntax_Tree& tree, std::pmr::memory_resource* memory)
        : m_tree { tree }
        , m_memory { memory }
    {
    }

    [[nodiscard]]
    std::optional<Name_Class> classify_definition(Syntax_Element name) const final;

    [[nodiscard]]
    std::optional<Name_Ref_Class> classify_reference(Syntax_Element name_ref) const final;

    [[nodiscard]]
    std::optional<Call_Info>
    call_info(Syntax_Element token, std::pmr::memory_resource* memory) const final;

    [[nodiscard]]
    Syntax_Element descend_into_macros(Syntax_Element token) const final;
};

} // namespace shade

#endif
