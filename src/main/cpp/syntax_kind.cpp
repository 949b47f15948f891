#include <optional>
#include <string_view>

#include "shade/syntax_kind.hpp"

namespace shade {

namespace {

#define SHADE_TOKEN_NAME_CASE(id, name, text)                                                      \
    case Syntax_Kind::id: return u8##name;
#define SHADE_TOKEN_TEXT_CASE(id, name, text)                                                      \
    case Syntax_Kind::id: return u8##text;
#define SHADE_NODE_NAME_CASE(id, name)                                                             \
    case Syntax_Kind::id: return u8##name;

#define SHADE_KEYWORD_TABLE_ENTRY(id, name, text) { u8##text, Syntax_Kind::id },

struct Keyword_Entry {
    std::u8string_view text;
    Syntax_Kind kind;
};

constexpr Keyword_Entry keyword_table[] {
    SHADE_KEYWORD_ENUM_DATA(SHADE_KEYWORD_TABLE_ENTRY)
};

} // namespace

std::u8string_view syntax_kind_name(Syntax_Kind kind)
{
    switch (kind) {
        SHADE_TOKEN_KIND_ENUM_DATA(SHADE_TOKEN_NAME_CASE)
        SHADE_KEYWORD_ENUM_DATA(SHADE_TOKEN_NAME_CASE)
        SHADE_NODE_KIND_ENUM_DATA(SHADE_NODE_NAME_CASE)
    }
    return u8"???";
}

std::u8string_view syntax_kind_text(Syntax_Kind kind)
{
    switch (kind) {
        SHADE_TOKEN_KIND_ENUM_DATA(SHADE_TOKEN_TEXT_CASE)
        SHADE_KEYWORD_ENUM_DATA(SHADE_TOKEN_TEXT_CASE)
    default: break;
    }
    return {};
}

std::optional<Syntax_Kind> keyword_by_text(std::u8string_view text)
{
    for (const auto& [keyword, kind] : keyword_table) {
        if (kind > Syntax_Kind::SHADE_STRICT_KEYWORD_LAST) {
            break;
        }
        if (keyword == text) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace shade
