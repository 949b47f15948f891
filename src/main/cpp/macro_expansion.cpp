#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "shade/util/text_range.hpp"

#include "shade/lex.hpp"
#include "shade/macro_expansion.hpp"
#include "shade/parse.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

[[nodiscard]]
bool is_closing_delimiter(Syntax_Kind kind)
{
    return kind == Syntax_Kind::r_paren || kind == Syntax_Kind::r_brack
        || kind == Syntax_Kind::r_curly;
}

[[nodiscard]]
bool is_macro_rules(Syntax_Element macro_call)
{
    const Syntax_Element path = macro_call.child_of_kind(Syntax_Kind::path);
    return path && path.text() == u8"macro_rules"sv;
}

[[nodiscard]]
bool is_in_item_position(Syntax_Element macro_call)
{
    const Syntax_Element parent = macro_call.parent();
    if (!parent) {
        return false;
    }
    switch (parent.kind()) {
    case Syntax_Kind::source_file:
    case Syntax_Kind::item_list:
    case Syntax_Kind::macro_items: return true;
    default: return false;
    }
}

/// @brief Returns the range between the delimiters of a token tree.
/// If the closing delimiter is missing, the range extends to the end of the token tree.
[[nodiscard]]
std::optional<Text_Range> token_tree_contents(Syntax_Element token_tree)
{
    const Syntax_Element open = token_tree.first_child();
    if (!open || !open.is_token()) {
        return std::nullopt;
    }
    const Syntax_Element close = token_tree.last_child();
    const std::size_t end = close != open && is_closing_delimiter(close.kind())
        ? close.range().begin
        : token_tree.range().end();
    return Text_Range::from_to(open.range().end(), end);
}

/// @brief Returns the tokens which begin within `range`.
[[nodiscard]]
std::span<const Token> tokens_in(std::span<const Token> tokens, Text_Range range)
{
    const auto begins_before = [](const Token& t, std::size_t offset) {
        return t.range.begin < offset;
    };
    const auto first = std::lower_bound(tokens.begin(), tokens.end(), range.begin, begins_before);
    const auto last = std::lower_bound(first, tokens.end(), range.end(), begins_before);
    return { first, last };
}

void expand_macro_call(
    Syntax_Tree& tree,
    std::span<const Token> tokens,
    Syntax_Element macro_call,
    std::pmr::memory_resource* memory
)
{
    if (tree.expansion_of(macro_call) || is_macro_rules(macro_call)) {
        return;
    }
    const Syntax_Element token_tree = macro_call.child_of_kind(Syntax_Kind::token_tree);
    if (!token_tree) {
        return;
    }
    const std::optional<Text_Range> contents = token_tree_contents(token_tree);
    if (!contents) {
        return;
    }
    const std::span<const Token> inner_tokens = tokens_in(tokens, *contents);
    if (inner_tokens.empty()) {
        return;
    }

    const Parse_Entry entry
        = is_in_item_position(macro_call) ? Parse_Entry::macro_items : Parse_Entry::macro_stmts;
    // Errors in expansions are not reported because macro arguments need not be valid syntax.
    auto ignore_errors = [](std::u8string_view, Text_Range, std::u8string_view) { };

    std::pmr::vector<Parse_Instruction> instructions { memory };
    parse(instructions, tree.source(), inner_tokens, entry, ignore_errors);
    const Syntax_Element expansion
        = build_syntax_tree(tree, inner_tokens, instructions, macro_call);
    expand_macros(tree, tokens, expansion, memory);
}

/// @brief Returns the token in the subtree at `root` which begins at `offset`,
/// or a null element.
[[nodiscard]]
Syntax_Element token_starting_at(Syntax_Element root, std::size_t offset)
{
    Syntax_Element current = root;
    while (current && current.is_node()) {
        Syntax_Element next;
        for (const Syntax_Element child : current.children()) {
            const Text_Range r = child.range();
            if (r.begin == offset && child.is_token()) {
                return child;
            }
            if (r.contains(offset)) {
                next = child;
                break;
            }
        }
        current = next;
    }
    return {};
}

} // namespace

void expand_macros(
    Syntax_Tree& tree,
    std::span<const Token> tokens,
    Syntax_Element root,
    std::pmr::memory_resource* memory
)
{
    // Expanding appends to the tree, so the calls are collected first.
    std::pmr::vector<Element_Id> calls { memory };
    Preorder walk { root };
    while (const std::optional<Walk_Event> event = walk.next()) {
        if (event->kind == Walk_Event_Kind::enter
            && event->element.kind() == Syntax_Kind::macro_call) {
            calls.push_back(event->element.id());
        }
    }
    for (const Element_Id id : calls) {
        expand_macro_call(tree, tokens, Syntax_Element { tree, id }, memory);
    }
}

Syntax_Element macro_call_of_token_tree_token(Syntax_Element token)
{
    if (!token || !token.is_token()) {
        return {};
    }
    Syntax_Element parent = token.parent();
    if (!parent || parent.kind() != Syntax_Kind::token_tree) {
        return {};
    }
    while (parent && parent.kind() == Syntax_Kind::token_tree) {
        parent = parent.parent();
    }
    return parent && parent.kind() == Syntax_Kind::macro_call ? parent : Syntax_Element {};
}

Syntax_Element descend_into_macros(Syntax_Element token)
{
    Syntax_Element result = token;
    while (const Syntax_Element macro_call = macro_call_of_token_tree_token(result)) {
        const Syntax_Element expansion = result.tree().expansion_of(macro_call);
        if (!expansion) {
            break;
        }
        const Syntax_Element expanded = token_starting_at(expansion, result.range().begin);
        if (!expanded) {
            break;
        }
        result = expanded;
    }
    return result;
}

} // namespace shade
