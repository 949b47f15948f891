#include <cstddef>
#include <memory_resource>
#include <span>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/text_range.hpp"

#include "shade/lex.hpp"
#include "shade/parse.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

struct [[nodiscard]] Syntax_Tree_Builder {
private:
    Syntax_Tree& m_tree;
    const std::span<const Token> m_tokens;
    std::pmr::vector<Element_Id> m_stack;
    std::size_t m_next_token = 0;
    std::size_t m_offset;

public:
    Syntax_Tree_Builder(Syntax_Tree& tree, std::span<const Token> tokens)
        : m_tree { tree }
        , m_tokens { tokens }
        , m_stack { tree.m_elements.get_allocator().resource() }
        , m_offset { tokens.empty() ? 0 : tokens.front().range.begin }
    {
    }

    Element_Id operator()(std::span<const Parse_Instruction> instructions, Element_Id parent)
    {
        Element_Id result = no_element;
        for (const Parse_Instruction& instruction : instructions) {
            switch (instruction.type) {
            case Parse_Instruction_Type::start_node: {
                if (!m_stack.empty()) {
                    attach_trivia();
                }
                const Element_Id id = push_element(instruction.kind, { m_offset, 0 });
                if (m_stack.empty()) {
                    result = id;
                    m_tree.m_elements[id].parent = parent;
                }
                m_stack.push_back(id);
                break;
            }
            case Parse_Instruction_Type::finish_node: {
                SHADE_ASSERT(!m_stack.empty());
                if (m_stack.size() == 1) {
                    attach_trivia();
                }
                const Element_Id id = m_stack.back();
                auto& data = m_tree.m_elements[id];
                data.range = Text_Range::from_to(data.range.begin, m_offset);
                m_stack.pop_back();
                break;
            }
            case Parse_Instruction_Type::token: {
                attach_trivia();
                SHADE_ASSERT(m_next_token < m_tokens.size());
                const Token& token = m_tokens[m_next_token++];
                push_element(instruction.kind, token.range);
                m_offset = token.range.end();
                break;
            }
            }
        }
        SHADE_ASSERT(m_stack.empty());
        SHADE_ASSERT(m_next_token == m_tokens.size());
        SHADE_ASSERT(result != no_element);
        if (parent == no_element) {
            m_tree.m_root = result;
        }
        else {
            SHADE_ASSERT(m_tree.m_elements[parent].kind == Syntax_Kind::macro_call);
            m_tree.m_expansions.emplace(parent, result);
        }
        return result;
    }

private:
    /// @brief Adds all whitespace and comments up to the next significant token
    /// to the current node.
    void attach_trivia()
    {
        SHADE_ASSERT(!m_stack.empty());
        while (m_next_token < m_tokens.size() && is_trivia(m_tokens[m_next_token].kind)) {
            const Token& token = m_tokens[m_next_token++];
            push_element(token.kind, token.range);
            m_offset = token.range.end();
        }
    }

    Element_Id push_element(Syntax_Kind kind, Text_Range range)
    {
        const auto id = Element_Id(m_tree.m_elements.size());
        m_tree.m_elements.push_back({ .kind = kind, .range = range });
        if (m_stack.empty()) {
            return id;
        }
        const Element_Id parent = m_stack.back();
        auto& data = m_tree.m_elements[id];
        data.parent = parent;
        auto& parent_data = m_tree.m_elements[parent];
        if (parent_data.last_child == no_element) {
            parent_data.first_child = id;
        }
        else {
            m_tree.m_elements[parent_data.last_child].next_sibling = id;
            data.prev_sibling = parent_data.last_child;
        }
        parent_data.last_child = id;
        return id;
    }
};

Syntax_Element build_syntax_tree(
    Syntax_Tree& tree,
    std::span<const Token> tokens,
    std::span<const Parse_Instruction> instructions,
    Syntax_Element parent
)
{
    const Element_Id parent_id = parent ? parent.id() : no_element;
    const Element_Id id = Syntax_Tree_Builder { tree, tokens }(instructions, parent_id);
    return { tree, id };
}

} // namespace shade
