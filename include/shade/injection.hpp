#ifndef SHADE_INJECTION_HPP
#define SHADE_INJECTION_HPP

#include <cstddef>
#include <vector>

#include "shade/fwd.hpp"
#include "shade/highlight.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief Highlights the value of a raw string literal as source code,
/// if the literal is passed to a fixture parameter,
/// i.e. a parameter whose name starts with `options.fixture_prefix`.
///
/// On success, the opening quote, the ranges of the embedded source code
/// (in the coordinates of the document containing `literal`),
/// and the closing quote are appended to `out`.
/// On failure, nothing is appended.
/// @param literal The `raw_string` token in the document.
/// @param expanded The token that `literal` corresponds to in a macro expansion,
/// or `literal` itself if it is not within a macro call.
/// @param depth The nesting depth of the document containing `literal`.
/// @returns `true` if the literal was highlighted.
bool highlight_injection(
    std::pmr::vector<Highlighted_Range>& out,
    const Semantics& semantics,
    Syntax_Element literal,
    Syntax_Element expanded,
    const Highlight_Options& options,
    std::size_t depth
);

} // namespace shade

#endif
