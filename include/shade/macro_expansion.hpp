#ifndef SHADE_MACRO_EXPANSION_HPP
#define SHADE_MACRO_EXPANSION_HPP

#include <memory_resource>
#include <span>

#include "shade/fwd.hpp"
#include "shade/lex.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief Expands every macro call in the subtree at `root`,
/// including macro calls within the expansions.
/// Expansion has identity semantics:
/// the tokens within the token tree of each call are parsed again as items
/// (for macro calls in item position) or as statements (otherwise),
/// and the result is added to `tree` as the expansion of the call.
/// The elements of an expansion share the ranges of the original tokens.
/// `macro_rules!` definitions are not expanded.
/// @param tokens The tokens of the whole document, including whitespace and comments.
/// @param memory Used for temporary allocations only.
void expand_macros(
    Syntax_Tree& tree,
    std::span<const Token> tokens,
    Syntax_Element root,
    std::pmr::memory_resource* memory
);

/// @brief Returns the macro call whose token tree contains `token`,
/// or a null element if there is none.
[[nodiscard]]
Syntax_Element macro_call_of_token_tree_token(Syntax_Element token);

/// @brief Maps a token within the token tree of a macro call onto the token at the same offset
/// in the expansion of that macro, repeatedly if the expanded token is itself within a macro call.
/// @returns The expanded token, or `token` if it is not within a token tree,
/// or if there is no corresponding token.
[[nodiscard]]
Syntax_Element descend_into_macros(Syntax_Element token);

} // namespace shade

#endif
