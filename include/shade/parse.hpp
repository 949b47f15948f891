#ifndef SHADE_PARSE_HPP
#define SHADE_PARSE_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "shade/util/function_ref.hpp"
#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"
#include "shade/lex.hpp"
#include "shade/syntax_kind.hpp"
#include "shade/syntax_tree.hpp"

namespace shade {

enum struct Parse_Instruction_Type : Default_Underlying {
    /// @brief Begins a node of the given kind as a child of the current node.
    /// Whitespace and comments preceding the next token are attached to the current node
    /// before the new node is started.
    start_node,
    /// @brief Ends the current node.
    finish_node,
    /// @brief Adds the next token which is not whitespace or a comment to the current node,
    /// with the given kind.
    /// The kind usually matches the lexed kind,
    /// except for contextual keywords such as `union`.
    token,
};

struct Parse_Instruction {
    Parse_Instruction_Type type;
    Syntax_Kind kind;

    [[nodiscard]]
    friend constexpr bool operator==(const Parse_Instruction&, const Parse_Instruction&)
        = default;
};

/// @brief The syntactical construct that a sequence of tokens is parsed as.
enum struct Parse_Entry : Default_Underlying {
    /// @brief A whole document, producing a `source_file` node.
    source_file,
    /// @brief The items produced by a macro in item position, producing a `macro_items` node.
    macro_items,
    /// @brief The statements and expressions produced by a macro in expression or
    /// statement position, producing a `macro_stmts` node.
    /// Within these, commas separate expressions the same way that semicolons do.
    macro_stmts,
};

using Parse_Error_Consumer
    = Function_Ref<void(std::u8string_view id, Text_Range location, std::u8string_view message)>;

/// @brief Parses `tokens` and appends the instructions for building a syntax tree to `out`.
/// Parsing never fails; unexpected tokens are wrapped in `error` nodes,
/// and every token in `tokens` is consumed.
/// @param source The text that `tokens` refer to.
/// @param tokens The tokens, including whitespace and comments.
/// @returns `true` if no errors were reported.
bool parse(
    std::pmr::vector<Parse_Instruction>& out,
    std::u8string_view source,
    std::span<const Token> tokens,
    Parse_Entry entry,
    Parse_Error_Consumer on_error
);

/// @brief Builds the elements described by `instructions` into `tree`.
/// If `parent` is null, the resulting node becomes the root of `tree`.
/// Otherwise, `parent` shall be a macro call in `tree`,
/// and the resulting node becomes its expansion.
/// @param tokens The same tokens that were passed to `parse`.
/// @returns The node that was built.
Syntax_Element build_syntax_tree(
    Syntax_Tree& tree,
    std::span<const Token> tokens,
    std::span<const Parse_Instruction> instructions,
    Syntax_Element parent = {}
);

} // namespace shade

#endif
