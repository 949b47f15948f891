#ifndef SHADE_HIGHLIGHT_HPP
#define SHADE_HIGHLIGHT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/settings.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/semantics.hpp"
#include "shade/services.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

struct Highlighted_Range {
    Text_Range range;
    Highlight highlight;
    /// @brief The identity of the local binding that the range refers to or defines.
    /// This is only present for names of local variables.
    std::optional<std::uint64_t> binding;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlighted_Range&, const Highlighted_Range&)
        = default;
};

struct Highlight_Options {
    /// @brief Raw string literals passed to a parameter whose name starts with this prefix
    /// are highlighted as embedded source code.
    std::u8string_view fixture_prefix = default_fixture_prefix;
    /// @brief The maximum nesting depth of embedded source code.
    /// Zero disables highlighting of embedded source code.
    std::size_t max_injection_depth = default_max_injection_depth;
    /// @brief Receives diagnostics about the highlighting pass. Never null.
    Logger* logger = &ignorant_logger;
};

/// @brief Appends the highlighted ranges of `tree` to `out`,
/// in the order in which the elements they belong to are first visited in preorder.
/// Ranges may overlap, such as the range of an attribute and ranges within it,
/// or the range of a raw string literal and the ranges of the source code embedded within.
/// @param range If provided, only elements whose range intersects this range are highlighted.
/// Ranges which merely touch are considered to intersect.
/// @param depth The nesting depth of embedded source code that `tree` represents,
/// which is zero for the outermost document.
void highlight(
    std::pmr::vector<Highlighted_Range>& out,
    const Syntax_Tree& tree,
    const Semantics& semantics,
    std::optional<Text_Range> range,
    const Highlight_Options& options,
    std::size_t depth = 0
);

/// @brief Returns the range of the name of a macro call,
/// which extends from the last segment of its path through the `!`,
/// and through the following identifier for `macro_rules! name`.
[[nodiscard]]
std::optional<Text_Range> macro_call_range(Syntax_Element macro_call);

} // namespace shade

#endif
