#ifndef SHADE_HIGHLIGHT_HTML_HPP
#define SHADE_HIGHLIGHT_HTML_HPP

#include <span>
#include <string_view>
#include <vector>

#include "shade/fwd.hpp"
#include "shade/highlight.hpp"

namespace shade {

/// @brief Writes `text` as a `<pre><code>` block to `out`,
/// where every highlighted range is wrapped in a `<span>` whose classes are the name of the tag
/// and the names of the modifiers, such as `<span class="variable definition mutable">`.
/// Ranges with a binding identity also get a `data-binding-hash` attribute.
///
/// `ranges` shall be sorted by their beginning, as produced by `highlight`.
/// Since HTML elements cannot overlap, any range that begins before the end of the previously
/// written range is skipped.
void write_highlighted_html(
    std::pmr::vector<char8_t>& out,
    std::u8string_view text,
    std::span<const Highlighted_Range> ranges
);

/// @brief Highlights the whole document of `analysis` and writes it with `write_highlighted_html`.
void highlight_as_html(
    std::pmr::vector<char8_t>& out,
    const Analysis& analysis,
    const Highlight_Options& options
);

} // namespace shade

#endif
