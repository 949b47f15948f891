#ifndef SHADE_ANALYSIS_HPP
#define SHADE_ANALYSIS_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/highlight.hpp"
#include "shade/lex.hpp"
#include "shade/services.hpp"
#include "shade/source_semantics.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief A single document with its tokens, its syntax tree (including macro expansions),
/// and the semantics used to resolve its names.
/// This is also used to highlight source code embedded in string literals,
/// where the document exists only in memory.
struct Analysis {
private:
    std::pmr::u8string m_text;
    std::pmr::vector<Token> m_tokens;
    Syntax_Tree m_tree;
    Source_Semantics m_semantics;

public:
    /// @brief Lexes, parses, and expands the macros of a copy of `text`.
    /// @param logger Receives lexing and parsing errors.
    [[nodiscard]]
    explicit Analysis(
        std::u8string_view text,
        std::pmr::memory_resource* memory,
        Logger& logger = ignorant_logger
    );

    // The tree refers to the text, so the analysis cannot be moved.
    Analysis(const Analysis&) = delete;
    Analysis& operator=(const Analysis&) = delete;

    [[nodiscard]]
    std::u8string_view text() const
    {
        return m_text;
    }

    [[nodiscard]]
    std::span<const Token> tokens() const
    {
        return m_tokens;
    }

    [[nodiscard]]
    const Syntax_Tree& tree() const
    {
        return m_tree;
    }

    [[nodiscard]]
    const Source_Semantics& semantics() const
    {
        return m_semantics;
    }

    /// @brief Equivalent to `shade::highlight(out, tree(), semantics(), range, options, depth)`.
    void highlight(
        std::pmr::vector<Highlighted_Range>& out,
        std::optional<Text_Range> range,
        const Highlight_Options& options,
        std::size_t depth = 0
    ) const;

    /// @brief Highlights the whole document and writes it as HTML to `out`.
    /// @see shade::highlight_as_html
    void highlight_as_html(std::pmr::vector<char8_t>& out, const Highlight_Options& options) const;
};

} // namespace shade

#endif
