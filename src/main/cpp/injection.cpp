#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/severity.hpp"

#include "shade/analysis.hpp"
#include "shade/diagnostic.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/injection.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/token_text.hpp"

using namespace std::string_view_literals;

namespace shade {

bool highlight_injection(
    std::pmr::vector<Highlighted_Range>& out,
    const Semantics& semantics,
    Syntax_Element literal,
    Syntax_Element expanded,
    const Highlight_Options& options,
    std::size_t depth
)
{
    SHADE_ASSERT(literal.kind() == Syntax_Kind::raw_string);
    SHADE_ASSERT(options.logger);
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    Logger& logger = *options.logger;

    const std::optional<Call_Info> call = semantics.call_info(expanded, memory);
    if (!call || !call->active_parameter) {
        logger.log(
            Severity::debug, diagnostic::injection_no_call, literal.range(),
            u8"The literal is not an argument of a call with a known signature."sv
        );
        return false;
    }
    const std::size_t index = *call->active_parameter;
    if (index >= call->parameter_names.size()
        || !call->parameter_names[index].starts_with(options.fixture_prefix)) {
        logger.log(
            Severity::debug, diagnostic::injection_parameter, literal.range(),
            u8"The literal is not passed to a fixture parameter."sv
        );
        return false;
    }

    const std::optional<std::pmr::u8string> value = string_value(literal, memory);
    const std::optional<Quote_Offsets> quotes = quote_offsets(literal);
    if (!value || !quotes) {
        logger.log(
            Severity::debug, diagnostic::injection_undecodable, literal.range(),
            u8"The value of the literal could not be decoded."sv
        );
        return false;
    }
    if (depth >= options.max_injection_depth) {
        logger.log(
            Severity::warning, diagnostic::injection_depth, literal.range(),
            u8"Embedded source code was not highlighted because it is nested too deeply."sv
        );
        return false;
    }

    const Analysis nested { *value, memory };
    std::pmr::vector<Highlighted_Range> nested_ranges { memory };
    nested.highlight(nested_ranges, std::nullopt, options, depth + 1);

    out.push_back({ quotes->open, Highlight_Tag::string_literal, std::nullopt });
    for (Highlighted_Range& r : nested_ranges) {
        r.range = r.range.to_right(quotes->contents.begin);
        SHADE_ASSERT(quotes->contents.contains_range(r.range));
        out.push_back(r);
    }
    out.push_back({ quotes->close, Highlight_Tag::string_literal, std::nullopt });

    logger.log(
        Severity::trace, diagnostic::injection_applied, literal.range(),
        u8"Highlighted embedded source code."sv
    );
    return true;
}

} // namespace shade
