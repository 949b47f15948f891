#ifndef SHADE_TEST_SYNTAX_TESTING_HPP
#define SHADE_TEST_SYNTAX_TESTING_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief Returns the `n`-th element (in preorder) within the subtree at `root`
/// which is of the given kind and, if `text` is not empty, has the given text.
/// Macro expansions are not searched.
/// @returns The element, or a null element if there is none.
[[nodiscard]]
inline Syntax_Element
find_element(Syntax_Element root, Syntax_Kind kind, std::u8string_view text = {}, std::size_t n = 0)
{
    Preorder walk { root };
    while (const std::optional<Walk_Event> event = walk.next()) {
        if (event->kind != Walk_Event_Kind::enter) {
            continue;
        }
        const Syntax_Element e = event->element;
        if (e.kind() == kind && (text.empty() || e.text() == text) && n-- == 0) {
            return e;
        }
    }
    return {};
}

} // namespace shade

#endif
