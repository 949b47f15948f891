#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/charconv.hpp"
#include "shade/util/severity.hpp"
#include "shade/util/text_range.hpp"

#include "shade/binding_shadow.hpp"
#include "shade/classify.hpp"
#include "shade/diagnostic.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/injection.hpp"
#include "shade/macro_context.hpp"
#include "shade/semantics.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {
namespace {

/// @brief Returns `true` if the ranges share at least one position,
/// where the end of a range counts as part of the range.
[[nodiscard]]
constexpr bool touches(Text_Range a, Text_Range b)
{
    return a.begin <= b.end() && b.begin <= a.end();
}

/// @brief The state of a single highlighting pass over one tree.
struct Highlight_Context {
    std::pmr::vector<Highlighted_Range>& out;
    const Semantics& semantics;
    const Highlight_Options& options;
    std::size_t depth;
    Binding_Shadow_Tracker bindings;
    Macro_Context macro;

    void emit(Text_Range range, Highlight h, std::optional<std::uint64_t> binding = {})
    {
        out.push_back({ range, h, binding });
    }

    void process(Walk_Event event);

private:
    /// @brief Returns the element to classify instead of `token`, which is within a macro call,
    /// or a null element if the token should be skipped.
    [[nodiscard]]
    Syntax_Element element_in_expansion(Syntax_Element token) const;
};

void Highlight_Context::process(Walk_Event event)
{
    const Syntax_Element element = event.element;

    if (element.kind() == Syntax_Kind::macro_call) {
        if (event.kind == Walk_Event_Kind::enter) {
            if (const std::optional<Text_Range> name = macro_call_range(element)) {
                emit(*name, Highlight_Tag::macro);
            }
            macro.enter(element);
        }
        else {
            macro.leave(element);
        }
        return;
    }
    if (event.kind == Walk_Event_Kind::leave) {
        return;
    }

    Syntax_Element target = element;
    if (macro.active()) {
        target = element_in_expansion(element);
        if (!target) {
            return;
        }
    }

    if (element.kind() == Syntax_Kind::raw_string) {
        const Syntax_Element expanded = target.is_token() ? target : element;
        if (highlight_injection(out, semantics, element, expanded, options, depth)) {
            return;
        }
    }

    if (const std::optional<Element_Highlight> h
        = highlight_element(semantics, bindings, target)) {
        emit(element.range(), h->highlight, h->binding);
    }
}

Syntax_Element Highlight_Context::element_in_expansion(Syntax_Element token) const
{
    if (!token.is_token()) {
        return {};
    }
    const Syntax_Element parent = token.parent();
    if (!parent || parent.kind() != Syntax_Kind::token_tree) {
        return {};
    }
    const Syntax_Element expanded = semantics.descend_into_macros(token);
    if (expanded.kind() == Syntax_Kind::ident) {
        const Syntax_Element expanded_parent = expanded.parent();
        if (expanded_parent
            && (expanded_parent.kind() == Syntax_Kind::name
                || expanded_parent.kind() == Syntax_Kind::name_ref)) {
            return expanded_parent;
        }
    }
    return expanded;
}

} // namespace

std::optional<Text_Range> macro_call_range(Syntax_Element macro_call)
{
    const Syntax_Element path = macro_call.child_of_kind(Syntax_Kind::path);
    const Syntax_Element segment
        = path ? path.child_of_kind(Syntax_Kind::path_segment) : Syntax_Element {};
    const Syntax_Element name_ref
        = segment ? segment.child_of_kind(Syntax_Kind::name_ref) : Syntax_Element {};
    if (!name_ref) {
        return std::nullopt;
    }
    const std::size_t begin = name_ref.range().begin;
    std::size_t end = name_ref.range().end();
    for (Syntax_Element sibling = path.next_sibling(); sibling; sibling = sibling.next_sibling()) {
        if (sibling.kind() == Syntax_Kind::excl || sibling.kind() == Syntax_Kind::ident) {
            end = sibling.range().end();
        }
    }
    return Text_Range::from_to(begin, end);
}

void highlight(
    std::pmr::vector<Highlighted_Range>& out,
    const Syntax_Tree& tree,
    const Semantics& semantics,
    std::optional<Text_Range> range,
    const Highlight_Options& options,
    std::size_t depth
)
{
    SHADE_ASSERT(options.logger);
    const Syntax_Element root_node = tree.root();
    if (!root_node) {
        return;
    }
    const Text_Range viewport = range.value_or(root_node.range());

    Syntax_Element root = root_node;
    if (range) {
        root = tree.covering_element(*range);
        if (root.is_token()) {
            root = root.parent();
        }
    }

    const std::size_t initial_size = out.size();
    Highlight_Context context {
        .out = out,
        .semantics = semantics,
        .options = options,
        .depth = depth,
        .bindings = Binding_Shadow_Tracker { out.get_allocator().resource() },
        .macro = {},
    };

    Preorder walk { root };
    while (const std::optional<Walk_Event> event = walk.next()) {
        if (!touches(event->element.range(), viewport)) {
            continue;
        }
        context.process(*event);
    }

    Logger& logger = *options.logger;
    if (logger.can_log(Severity::trace)) {
        std::pmr::u8string message { out.get_allocator().resource() };
        message += u8"Highlighted ";
        append_integer(message, out.size() - initial_size);
        message += u8" ranges.";
        logger(Diagnostic {
            .severity = Severity::trace,
            .id = diagnostic::highlight_pass,
            .location = viewport,
            .message = message,
        });
    }
}

} // namespace shade
