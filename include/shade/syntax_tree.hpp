#ifndef SHADE_SYNTAX_TREE_HPP
#define SHADE_SYNTAX_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/lex.hpp"
#include "shade/syntax_kind.hpp"

namespace shade {

/// @brief The index of an element within a `Syntax_Tree`.
using Element_Id = std::uint32_t;

inline constexpr Element_Id no_element = Element_Id(-1);

/// @brief A lightweight handle to a node or token in a `Syntax_Tree`.
/// A default-constructed element is null, and all operations other than `operator bool`
/// and comparisons require a non-null element.
/// Navigating to an element that does not exist (such as the parent of the root)
/// results in a null element.
struct Syntax_Element {
private:
    const Syntax_Tree* m_tree = nullptr;
    Element_Id m_id = no_element;

public:
    struct Sibling_Iterator;
    struct Ancestor_Iterator;
    struct Children;
    struct Ancestors;

    [[nodiscard]]
    constexpr Syntax_Element() noexcept
        = default;

    [[nodiscard]]
    constexpr Syntax_Element(const Syntax_Tree& tree, Element_Id id) noexcept
        : m_tree { &tree }
        , m_id { id }
    {
    }

    [[nodiscard]]
    friend constexpr bool operator==(Syntax_Element, Syntax_Element)
        = default;

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_tree != nullptr && m_id != no_element;
    }

    [[nodiscard]]
    constexpr const Syntax_Tree& tree() const noexcept
    {
        return *m_tree;
    }

    [[nodiscard]]
    constexpr Element_Id id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]]
    Syntax_Kind kind() const;

    [[nodiscard]]
    Text_Range range() const;

    [[nodiscard]]
    std::u8string_view text() const;

    [[nodiscard]]
    bool is_node() const
    {
        return shade::is_node(kind());
    }

    [[nodiscard]]
    bool is_token() const
    {
        return shade::is_token(kind());
    }

    /// @brief Returns the parent node.
    /// For the root of a macro expansion, this is the macro call,
    /// even though the expansion is not one of the children of the macro call.
    [[nodiscard]]
    Syntax_Element parent() const;

    [[nodiscard]]
    Syntax_Element first_child() const;

    [[nodiscard]]
    Syntax_Element last_child() const;

    [[nodiscard]]
    Syntax_Element next_sibling() const;

    [[nodiscard]]
    Syntax_Element prev_sibling() const;

    /// @brief Returns the next sibling which is not whitespace or a comment.
    [[nodiscard]]
    Syntax_Element next_non_trivia_sibling() const;

    /// @brief Returns the first child (node or token) of the given kind.
    [[nodiscard]]
    Syntax_Element child_of_kind(Syntax_Kind kind) const;

    /// @brief Returns the closest ancestor (including `*this`) of the given kind.
    [[nodiscard]]
    Syntax_Element ancestor_of_kind(Syntax_Kind kind) const;

    /// @brief Returns the direct children, including tokens.
    [[nodiscard]]
    Children children() const;

    /// @brief Returns `*this`, followed by its parent, the parent of its parent, etc.
    [[nodiscard]]
    Ancestors ancestors() const;
};

struct Syntax_Element::Sibling_Iterator {
    using value_type = Syntax_Element;
    using difference_type = std::ptrdiff_t;

    Syntax_Element current;

    [[nodiscard]]
    Syntax_Element operator*() const
    {
        return current;
    }

    Sibling_Iterator& operator++()
    {
        current = current.next_sibling();
        return *this;
    }

    Sibling_Iterator operator++(int)
    {
        Sibling_Iterator copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]]
    friend bool operator==(const Sibling_Iterator&, const Sibling_Iterator&)
        = default;
};

struct Syntax_Element::Ancestor_Iterator {
    using value_type = Syntax_Element;
    using difference_type = std::ptrdiff_t;

    Syntax_Element current;

    [[nodiscard]]
    Syntax_Element operator*() const
    {
        return current;
    }

    Ancestor_Iterator& operator++()
    {
        current = current.parent();
        return *this;
    }

    Ancestor_Iterator operator++(int)
    {
        Ancestor_Iterator copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]]
    friend bool operator==(const Ancestor_Iterator&, const Ancestor_Iterator&)
        = default;
};

struct Syntax_Element::Children {
    Syntax_Element first;

    [[nodiscard]]
    Sibling_Iterator begin() const
    {
        return { first };
    }

    [[nodiscard]]
    Sibling_Iterator end() const
    {
        return { Syntax_Element {} };
    }
};

struct Syntax_Element::Ancestors {
    Syntax_Element first;

    [[nodiscard]]
    Ancestor_Iterator begin() const
    {
        return { first };
    }

    [[nodiscard]]
    Ancestor_Iterator end() const
    {
        return { Syntax_Element {} };
    }
};

enum struct Walk_Event_Kind : Default_Underlying {
    enter,
    leave,
};

struct Walk_Event {
    Walk_Event_Kind kind;
    Syntax_Element element;
};

/// @brief A preorder traversal over a subtree, including tokens,
/// which produces an `enter` event when an element is first visited,
/// and a `leave` event once all of its children have been visited.
/// Macro expansions are not visited because they are not children of the macro call.
struct [[nodiscard]] Preorder {
private:
    Syntax_Element m_start;
    std::optional<Walk_Event> m_next;

public:
    explicit Preorder(Syntax_Element start)
        : m_start { start }
        , m_next { Walk_Event { Walk_Event_Kind::enter, start } }
    {
    }

    /// @brief Returns the next event, or `std::nullopt` if the traversal is complete.
    std::optional<Walk_Event> next();
};

/// @brief An arena of nodes and tokens that make up a document and the expansions of its macros.
/// Elements are referred to by index, and never removed.
struct Syntax_Tree {
private:
    friend struct Syntax_Element;
    friend struct Syntax_Tree_Builder;

    struct Element_Data {
        Syntax_Kind kind;
        Text_Range range;
        Element_Id parent = no_element;
        Element_Id first_child = no_element;
        Element_Id last_child = no_element;
        Element_Id next_sibling = no_element;
        Element_Id prev_sibling = no_element;
    };

    std::u8string_view m_source;
    std::pmr::vector<Element_Data> m_elements;
    std::pmr::unordered_map<Element_Id, Element_Id> m_expansions;
    Element_Id m_root = no_element;

public:
    /// @brief Constructs an empty tree over `source`.
    /// `source` has to outlive the tree.
    [[nodiscard]]
    explicit Syntax_Tree(std::u8string_view source, std::pmr::memory_resource* memory)
        : m_source { source }
        , m_elements { memory }
        , m_expansions { memory }
    {
    }

    Syntax_Tree(const Syntax_Tree&) = delete;
    Syntax_Tree& operator=(const Syntax_Tree&) = delete;

    [[nodiscard]]
    std::u8string_view source() const
    {
        return m_source;
    }

    [[nodiscard]]
    std::size_t size() const
    {
        return m_elements.size();
    }

    /// @brief Returns the root node, which is null if the tree has not been built yet.
    [[nodiscard]]
    Syntax_Element root() const
    {
        return m_root == no_element ? Syntax_Element {} : Syntax_Element { *this, m_root };
    }

    /// @brief Returns the root of the expansion of `macro_call`,
    /// or a null element if the macro has no expansion.
    [[nodiscard]]
    Syntax_Element expansion_of(Syntax_Element macro_call) const;

    /// @brief Returns the smallest element in the document (not in any expansion)
    /// which fully contains `range`.
    /// If `range` is not within the document, returns the root.
    [[nodiscard]]
    Syntax_Element covering_element(Text_Range range) const;

    /// @brief Returns the document token which contains the byte at `offset`,
    /// or a null element if `offset` is past the end.
    [[nodiscard]]
    Syntax_Element token_at_offset(std::size_t offset) const;
};

/// @brief Appends a textual representation of the subtree at `root` to `out`,
/// with one line per element, such as `NAME@3..4` or `IDENT@3..4 "f"`.
void debug_dump(std::pmr::u8string& out, Syntax_Element root);

} // namespace shade

#endif
