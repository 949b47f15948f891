#ifndef SHADE_HIGHLIGHT_TAG_HPP
#define SHADE_HIGHLIGHT_TAG_HPP

#include <string>
#include <string_view>

#include "shade/fwd.hpp"

namespace shade {

#define SHADE_HIGHLIGHT_TAG_ENUM_DATA(F)                                                           \
    F(attribute, "attribute")                                                                      \
    F(builtin_type, "builtin_type")                                                                \
    F(byte_literal, "byte_literal")                                                                \
    F(char_literal, "char_literal")                                                                \
    F(comment, "comment")                                                                          \
    F(constant, "constant")                                                                        \
    F(enum_, "enum")                                                                               \
    F(enum_variant, "enum_variant")                                                                \
    F(field, "field")                                                                              \
    F(function, "function")                                                                        \
    F(keyword, "keyword")                                                                          \
    F(lifetime, "lifetime")                                                                        \
    F(macro, "macro")                                                                              \
    F(module, "module")                                                                            \
    F(numeric_literal, "numeric_literal")                                                          \
    F(self_type, "self_type")                                                                      \
    F(static_, "static")                                                                           \
    F(string_literal, "string_literal")                                                            \
    F(struct_, "struct")                                                                           \
    F(trait, "trait")                                                                              \
    F(type_alias, "type_alias")                                                                    \
    F(type_param, "type_param")                                                                    \
    F(union_, "union")                                                                             \
    F(local, "variable")

#define SHADE_HIGHLIGHT_MODIFIER_ENUM_DATA(F)                                                      \
    F(control_flow, "control")                                                                     \
    F(definition, "definition")                                                                    \
    F(mutable_, "mutable")                                                                         \
    F(unsafe, "unsafe")

#define SHADE_HIGHLIGHT_ENUMERATOR(id, name) id,

/// @brief The semantic role of a highlighted range.
/// This never determines a color; mapping tags to colors is up to the client.
enum struct Highlight_Tag : Default_Underlying {
    SHADE_HIGHLIGHT_TAG_ENUM_DATA(SHADE_HIGHLIGHT_ENUMERATOR)
};

enum struct Highlight_Modifier : Default_Underlying {
    SHADE_HIGHLIGHT_MODIFIER_ENUM_DATA(SHADE_HIGHLIGHT_ENUMERATOR)
};

#undef SHADE_HIGHLIGHT_ENUMERATOR

/// @brief Returns the lowercase name of the tag, such as `"enum_variant"`.
/// This name is also used as a CSS class name by `highlight_as_html`.
[[nodiscard]]
constexpr std::u8string_view highlight_tag_name(Highlight_Tag tag)
{
#define SHADE_HIGHLIGHT_NAME_CASE(id, name)                                                        \
    case Highlight_Tag::id: return u8##name;
    switch (tag) {
        SHADE_HIGHLIGHT_TAG_ENUM_DATA(SHADE_HIGHLIGHT_NAME_CASE)
    }
#undef SHADE_HIGHLIGHT_NAME_CASE
    return u8"???";
}

[[nodiscard]]
constexpr std::u8string_view highlight_modifier_name(Highlight_Modifier modifier)
{
#define SHADE_HIGHLIGHT_NAME_CASE(id, name)                                                        \
    case Highlight_Modifier::id: return u8##name;
    switch (modifier) {
        SHADE_HIGHLIGHT_MODIFIER_ENUM_DATA(SHADE_HIGHLIGHT_NAME_CASE)
    }
#undef SHADE_HIGHLIGHT_NAME_CASE
    return u8"???";
}

/// @brief A set of `Highlight_Modifier`s.
struct Highlight_Modifiers {
    unsigned char bits = 0;

    [[nodiscard]]
    static constexpr unsigned char bit(Highlight_Modifier m) noexcept
    {
        return static_cast<unsigned char>(1u << Default_Underlying(m));
    }

    [[nodiscard]]
    constexpr bool contains(Highlight_Modifier m) const noexcept
    {
        return (bits & bit(m)) != 0;
    }

    [[nodiscard]]
    constexpr bool empty() const noexcept
    {
        return bits == 0;
    }

    constexpr Highlight_Modifiers& operator|=(Highlight_Modifier m) noexcept
    {
        bits |= bit(m);
        return *this;
    }

    [[nodiscard]]
    friend constexpr bool operator==(Highlight_Modifiers, Highlight_Modifiers) noexcept
        = default;
};

struct Highlight {
    Highlight_Tag tag;
    Highlight_Modifiers modifiers {};

    [[nodiscard]]
    constexpr Highlight(Highlight_Tag tag) noexcept
        : tag { tag }
    {
    }

    [[nodiscard]]
    constexpr Highlight(Highlight_Tag tag, Highlight_Modifiers modifiers) noexcept
        : tag { tag }
        , modifiers { modifiers }
    {
    }

    [[nodiscard]]
    constexpr bool has(Highlight_Modifier m) const noexcept
    {
        return modifiers.contains(m);
    }

    constexpr Highlight& operator|=(Highlight_Modifier m) noexcept
    {
        modifiers |= m;
        return *this;
    }

    [[nodiscard]]
    friend constexpr Highlight operator|(Highlight h, Highlight_Modifier m) noexcept
    {
        h |= m;
        return h;
    }

    [[nodiscard]]
    friend constexpr bool operator==(Highlight, Highlight) noexcept
        = default;
};

/// @brief Appends the name of the tag, followed by `.modifier` for every modifier in
/// declaration order, such as `"keyword.control"` or `"variable.definition.mutable"`.
/// If `separator` is given, it is used instead of `.`.
void append_highlight_name(std::pmr::u8string& out, Highlight h, char8_t separator = u8'.');

} // namespace shade

#endif
