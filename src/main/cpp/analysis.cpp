#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include "shade/util/severity.hpp"
#include "shade/util/text_range.hpp"

#include "shade/analysis.hpp"
#include "shade/diagnostic.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_html.hpp"
#include "shade/lex.hpp"
#include "shade/macro_expansion.hpp"
#include "shade/parse.hpp"
#include "shade/services.hpp"

namespace shade {

Analysis::Analysis(std::u8string_view text, std::pmr::memory_resource* memory, Logger& logger)
    : m_text { text, memory }
    , m_tokens { memory }
    , m_tree { m_text, memory }
    , m_semantics { m_tree, memory }
{
    auto log_error
        = [&](std::u8string_view id, Text_Range location, std::u8string_view message) {
              logger.log(Severity::error, id, location, message);
          };

    lex(m_tokens, m_text, log_error);

    std::pmr::vector<Parse_Instruction> instructions { memory };
    parse(instructions, m_text, m_tokens, Parse_Entry::source_file, log_error);
    const Syntax_Element root = build_syntax_tree(m_tree, m_tokens, instructions);
    expand_macros(m_tree, m_tokens, root, memory);
}

void Analysis::highlight(
    std::pmr::vector<Highlighted_Range>& out,
    std::optional<Text_Range> range,
    const Highlight_Options& options,
    std::size_t depth
) const
{
    shade::highlight(out, m_tree, m_semantics, range, options, depth);
}

void Analysis::highlight_as_html(std::pmr::vector<char8_t>& out, const Highlight_Options& options)
    const
{
    shade::highlight_as_html(out, *this, options);
}

} // namespace shade
