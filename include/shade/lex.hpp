#ifndef SHADE_LEX_HPP
#define SHADE_LEX_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "shade/util/function_ref.hpp"
#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/syntax_kind.hpp"

namespace shade {

struct Token {
    Syntax_Kind kind;
    Text_Range range;

    [[nodiscard]]
    friend constexpr bool operator==(const Token&, const Token&)
        = default;
};

using Lex_Error_Consumer
    = Function_Ref<void(std::u8string_view id, Text_Range location, std::u8string_view message)>;

/// @brief Splits `source` into tokens which are appended to `out`.
/// The ranges of the tokens are contiguous and cover all of `source`,
/// including whitespace and comments.
/// Malformed input such as unterminated literals is reported to `on_error`,
/// but tokens are produced for it regardless.
/// @returns `true` if no errors were reported.
bool lex(
    std::pmr::vector<Token>& out, //
    std::u8string_view source,
    Lex_Error_Consumer on_error
);

} // namespace shade

#endif
