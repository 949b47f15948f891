#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "shade/util/assert.hpp"
#include "shade/util/charconv.hpp"
#include "shade/util/text_range.hpp"

#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

Syntax_Kind Syntax_Element::kind() const
{
    SHADE_DEBUG_ASSERT(*this);
    return m_tree->m_elements[m_id].kind;
}

Text_Range Syntax_Element::range() const
{
    SHADE_DEBUG_ASSERT(*this);
    return m_tree->m_elements[m_id].range;
}

std::u8string_view Syntax_Element::text() const
{
    const Text_Range r = range();
    return m_tree->m_source.substr(r.begin, r.length);
}

namespace {

[[nodiscard]]
Syntax_Element element_or_null(const Syntax_Tree& tree, Element_Id id)
{
    return id == no_element ? Syntax_Element {} : Syntax_Element { tree, id };
}

} // namespace

Syntax_Element Syntax_Element::parent() const
{
    return element_or_null(*m_tree, m_tree->m_elements[m_id].parent);
}

Syntax_Element Syntax_Element::first_child() const
{
    return element_or_null(*m_tree, m_tree->m_elements[m_id].first_child);
}

Syntax_Element Syntax_Element::last_child() const
{
    return element_or_null(*m_tree, m_tree->m_elements[m_id].last_child);
}

Syntax_Element Syntax_Element::next_sibling() const
{
    return element_or_null(*m_tree, m_tree->m_elements[m_id].next_sibling);
}

Syntax_Element Syntax_Element::prev_sibling() const
{
    return element_or_null(*m_tree, m_tree->m_elements[m_id].prev_sibling);
}

Syntax_Element Syntax_Element::next_non_trivia_sibling() const
{
    Syntax_Element result = next_sibling();
    while (result && is_trivia(result.kind())) {
        result = result.next_sibling();
    }
    return result;
}

Syntax_Element Syntax_Element::child_of_kind(Syntax_Kind kind) const
{
    for (const Syntax_Element child : children()) {
        if (child.kind() == kind) {
            return child;
        }
    }
    return {};
}

Syntax_Element Syntax_Element::ancestor_of_kind(Syntax_Kind kind) const
{
    for (const Syntax_Element a : ancestors()) {
        if (a.kind() == kind) {
            return a;
        }
    }
    return {};
}

auto Syntax_Element::children() const -> Children
{
    return { first_child() };
}

auto Syntax_Element::ancestors() const -> Ancestors
{
    return { *this };
}

std::optional<Walk_Event> Preorder::next()
{
    const std::optional<Walk_Event> result = m_next;
    if (!result) {
        return result;
    }
    const Syntax_Element e = result->element;
    switch (result->kind) {
    case Walk_Event_Kind::enter: {
        if (const Syntax_Element child = e.first_child()) {
            m_next = Walk_Event { Walk_Event_Kind::enter, child };
        }
        else {
            m_next = Walk_Event { Walk_Event_Kind::leave, e };
        }
        break;
    }
    case Walk_Event_Kind::leave: {
        if (e == m_start) {
            m_next.reset();
        }
        else if (const Syntax_Element sibling = e.next_sibling()) {
            m_next = Walk_Event { Walk_Event_Kind::enter, sibling };
        }
        else {
            m_next = Walk_Event { Walk_Event_Kind::leave, e.parent() };
        }
        break;
    }
    }
    return result;
}

Syntax_Element Syntax_Tree::expansion_of(Syntax_Element macro_call) const
{
    SHADE_ASSERT(&macro_call.tree() == this);
    const auto it = m_expansions.find(macro_call.id());
    return it == m_expansions.end() ? Syntax_Element {} : Syntax_Element { *this, it->second };
}

Syntax_Element Syntax_Tree::covering_element(Text_Range range) const
{
    Syntax_Element result = root();
    if (!result || !result.range().contains_range(range)) {
        return result;
    }
    while (result.is_node()) {
        Syntax_Element next;
        for (const Syntax_Element child : result.children()) {
            const Text_Range child_range = child.range();
            if (!child_range.empty() && child_range.contains_range(range)) {
                next = child;
                break;
            }
        }
        if (!next) {
            break;
        }
        result = next;
    }
    return result;
}

Syntax_Element Syntax_Tree::token_at_offset(std::size_t offset) const
{
    Syntax_Element result = root();
    if (!result || !result.range().contains(offset)) {
        return {};
    }
    while (result.is_node()) {
        Syntax_Element next;
        for (const Syntax_Element child : result.children()) {
            if (child.range().contains(offset)) {
                next = child;
                break;
            }
        }
        if (!next) {
            return {};
        }
        result = next;
    }
    return result;
}

void debug_dump(std::pmr::u8string& out, Syntax_Element root)
{
    std::size_t depth = 0;
    Preorder walk { root };
    while (const std::optional<Walk_Event> event = walk.next()) {
        if (event->kind == Walk_Event_Kind::leave) {
            if (event->element.is_node()) {
                --depth;
            }
            continue;
        }
        const Syntax_Element e = event->element;
        out.append(depth * 2, u8' ');
        out += syntax_kind_name(e.kind());
        out += u8'@';
        append_integer(out, e.range().begin);
        out += u8"..";
        append_integer(out, e.range().end());
        if (e.is_token()) {
            out += u8" \"";
            for (const char8_t c : e.text()) {
                switch (c) {
                case u8'\n': out += u8"\\n"; break;
                case u8'\t': out += u8"\\t"; break;
                case u8'"': out += u8"\\\""; break;
                case u8'\\': out += u8"\\\\"; break;
                default: out += c;
                }
            }
            out += u8'"';
        }
        else {
            ++depth;
        }
        out += u8'\n';
    }
}

} // namespace shade
