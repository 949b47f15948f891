#ifndef SHADE_MACRO_CONTEXT_HPP
#define SHADE_MACRO_CONTEXT_HPP

#include "shade/util/assert.hpp"

#include "shade/fwd.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

/// @brief Tracks whether a highlighting pass is currently within a macro call.
/// Only a single level is tracked:
/// macro calls cannot be nested within the token tree of another call in the original tree,
/// so entering another call before leaving the current one indicates a bug.
struct Macro_Context {
private:
    Syntax_Element m_current;

public:
    [[nodiscard]]
    bool active() const
    {
        return bool(m_current);
    }

    [[nodiscard]]
    Syntax_Element current() const
    {
        return m_current;
    }

    void enter(Syntax_Element macro_call)
    {
        SHADE_ASSERT(macro_call.kind() == Syntax_Kind::macro_call);
        SHADE_ASSERT(!active());
        m_current = macro_call;
    }

    void leave(Syntax_Element macro_call)
    {
        SHADE_ASSERT(m_current == macro_call);
        m_current = {};
    }
};

} // namespace shade

#endif
