#ifndef SHADE_CLASSIFY_HPP
#define SHADE_CLASSIFY_HPP

#include <cstdint>
#include <optional>

#include "shade/binding_shadow.hpp"
#include "shade/fwd.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

struct Element_Highlight {
    Highlight highlight;
    /// @brief The identity of the local binding, if the element is the name of a local.
    std::optional<std::uint64_t> binding;

    [[nodiscard]]
    friend constexpr bool operator==(const Element_Highlight&, const Element_Highlight&)
        = default;
};

/// @brief Returns the highlight that any name referring to `definition` receives,
/// not including the `definition` modifier.
[[nodiscard]]
Highlight highlight_definition(const Definition& definition);

/// @brief Returns the highlight for a name which cannot be classified semantically,
/// based only on the kind of its parent node.
[[nodiscard]]
Highlight highlight_name_by_syntax(Syntax_Element name);

/// @brief Determines the highlight of a single node or token.
/// Entering a function definition resets `tracker`,
/// and every local variable definition advances it.
/// @returns The highlight, or `std::nullopt` if the element is not highlighted.
[[nodiscard]]
std::optional<Element_Highlight>
highlight_element(const Semantics& semantics, Binding_Shadow_Tracker& tracker, Syntax_Element element);

} // namespace shade

#endif
