#include <memory_resource>
#include <string>

#include "shade/highlight_tag.hpp"

namespace shade {

void append_highlight_name(std::pmr::u8string& out, Highlight h, char8_t separator)
{
    out += highlight_tag_name(h.tag);
    constexpr Highlight_Modifier all_modifiers[] {
#define SHADE_HIGHLIGHT_MODIFIER_ITEM(id, name) Highlight_Modifier::id,
        SHADE_HIGHLIGHT_MODIFIER_ENUM_DATA(SHADE_HIGHLIGHT_MODIFIER_ITEM)
#undef SHADE_HIGHLIGHT_MODIFIER_ITEM
    };
    for (const Highlight_Modifier m : all_modifiers) {
        if (h.has(m)) {
            out += separator;
            out += highlight_modifier_name(m);
        }
    }
}

} // namespace shade
