#ifndef SHADE_SYNTAX_KIND_HPP
#define SHADE_SYNTAX_KIND_HPP

#include <optional>
#include <string_view>

#include "shade/fwd.hpp"

namespace shade {

// Tokens with variable text have an empty string as their text.
#define SHADE_TOKEN_KIND_ENUM_DATA(F)                                                              \
    F(whitespace, "WHITESPACE", "")                                                                \
    F(comment, "COMMENT", "")                                                                      \
    F(error_token, "ERROR_TOKEN", "")                                                              \
    F(ident, "IDENT", "")                                                                          \
    F(lifetime, "LIFETIME", "")                                                                    \
    F(int_number, "INT_NUMBER", "")                                                                \
    F(float_number, "FLOAT_NUMBER", "")                                                            \
    F(char_, "CHAR", "")                                                                           \
    F(byte, "BYTE", "")                                                                            \
    F(string, "STRING", "")                                                                        \
    F(raw_string, "RAW_STRING", "")                                                                \
    F(byte_string, "BYTE_STRING", "")                                                              \
    F(raw_byte_string, "RAW_BYTE_STRING", "")                                                      \
    F(semicolon, "SEMICOLON", ";")                                                                 \
    F(comma, "COMMA", ",")                                                                         \
    F(l_paren, "L_PAREN", "(")                                                                     \
    F(r_paren, "R_PAREN", ")")                                                                     \
    F(l_curly, "L_CURLY", "{")                                                                     \
    F(r_curly, "R_CURLY", "}")                                                                     \
    F(l_brack, "L_BRACK", "[")                                                                     \
    F(r_brack, "R_BRACK", "]")                                                                     \
    F(l_angle, "L_ANGLE", "<")                                                                     \
    F(r_angle, "R_ANGLE", ">")                                                                     \
    F(at, "AT", "@")                                                                               \
    F(pound, "POUND", "#")                                                                         \
    F(tilde, "TILDE", "~")                                                                         \
    F(question, "QUESTION", "?")                                                                   \
    F(dollar, "DOLLAR", "$")                                                                       \
    F(amp, "AMP", "&")                                                                             \
    F(pipe, "PIPE", "|")                                                                           \
    F(plus, "PLUS", "+")                                                                           \
    F(star, "STAR", "*")                                                                           \
    F(slash, "SLASH", "/")                                                                         \
    F(caret, "CARET", "^")                                                                         \
    F(percent, "PERCENT", "%")                                                                     \
    F(underscore, "UNDERSCORE", "_")                                                               \
    F(dot, "DOT", ".")                                                                             \
    F(dot2, "DOT2", "..")                                                                          \
    F(dot3, "DOT3", "...")                                                                         \
    F(dot2eq, "DOT2EQ", "..=")                                                                     \
    F(colon, "COLON", ":")                                                                         \
    F(colon2, "COLON2", "::")                                                                      \
    F(eq, "EQ", "=")                                                                               \
    F(eq2, "EQ2", "==")                                                                            \
    F(fat_arrow, "FAT_ARROW", "=>")                                                                \
    F(excl, "EXCL", "!")                                                                           \
    F(neq, "NEQ", "!=")                                                                            \
    F(minus, "MINUS", "-")                                                                         \
    F(thin_arrow, "THIN_ARROW", "->")                                                              \
    F(lteq, "LTEQ", "<=")                                                                          \
    F(gteq, "GTEQ", ">=")                                                                          \
    F(pluseq, "PLUSEQ", "+=")                                                                      \
    F(minuseq, "MINUSEQ", "-=")                                                                    \
    F(pipeeq, "PIPEEQ", "|=")                                                                      \
    F(ampeq, "AMPEQ", "&=")                                                                        \
    F(careteq, "CARETEQ", "^=")                                                                    \
    F(slasheq, "SLASHEQ", "/=")                                                                    \
    F(stareq, "STAREQ", "*=")                                                                      \
    F(percenteq, "PERCENTEQ", "%=")                                                                \
    F(amp2, "AMP2", "&&")                                                                          \
    F(pipe2, "PIPE2", "||")

#define SHADE_KEYWORD_ENUM_DATA(F)                                                                 \
    F(as_kw, "AS_KW", "as")                                                                        \
    F(async_kw, "ASYNC_KW", "async")                                                               \
    F(await_kw, "AWAIT_KW", "await")                                                               \
    F(break_kw, "BREAK_KW", "break")                                                               \
    F(const_kw, "CONST_KW", "const")                                                               \
    F(continue_kw, "CONTINUE_KW", "continue")                                                      \
    F(crate_kw, "CRATE_KW", "crate")                                                               \
    F(dyn_kw, "DYN_KW", "dyn")                                                                     \
    F(else_kw, "ELSE_KW", "else")                                                                  \
    F(enum_kw, "ENUM_KW", "enum")                                                                  \
    F(extern_kw, "EXTERN_KW", "extern")                                                            \
    F(false_kw, "FALSE_KW", "false")                                                               \
    F(fn_kw, "FN_KW", "fn")                                                                        \
    F(for_kw, "FOR_KW", "for")                                                                     \
    F(if_kw, "IF_KW", "if")                                                                        \
    F(impl_kw, "IMPL_KW", "impl")                                                                  \
    F(in_kw, "IN_KW", "in")                                                                        \
    F(let_kw, "LET_KW", "let")                                                                     \
    F(loop_kw, "LOOP_KW", "loop")                                                                  \
    F(match_kw, "MATCH_KW", "match")                                                               \
    F(mod_kw, "MOD_KW", "mod")                                                                     \
    F(move_kw, "MOVE_KW", "move")                                                                  \
    F(mut_kw, "MUT_KW", "mut")                                                                     \
    F(pub_kw, "PUB_KW", "pub")                                                                     \
    F(ref_kw, "REF_KW", "ref")                                                                     \
    F(return_kw, "RETURN_KW", "return")                                                            \
    F(self_kw, "SELF_KW", "self")                                                                  \
    F(self_type_kw, "SELF_TYPE_KW", "Self")                                                        \
    F(static_kw, "STATIC_KW", "static")                                                            \
    F(struct_kw, "STRUCT_KW", "struct")                                                            \
    F(super_kw, "SUPER_KW", "super")                                                               \
    F(trait_kw, "TRAIT_KW", "trait")                                                               \
    F(true_kw, "TRUE_KW", "true")                                                                  \
    F(type_kw, "TYPE_KW", "type")                                                                  \
    F(unsafe_kw, "UNSAFE_KW", "unsafe")                                                            \
    F(use_kw, "USE_KW", "use")                                                                     \
    F(where_kw, "WHERE_KW", "where")                                                               \
    F(while_kw, "WHILE_KW", "while")                                                               \
    F(union_kw, "UNION_KW", "union")

// `union` is a contextual keyword:
// it is lexed as an identifier and only becomes `union_kw` in the position of a union item.
#define SHADE_STRICT_KEYWORD_LAST while_kw

#define SHADE_NODE_KIND_ENUM_DATA(F)                                                               \
    F(source_file, "SOURCE_FILE")                                                                  \
    F(error, "ERROR")                                                                              \
    F(attr, "ATTR")                                                                                \
    F(visibility, "VISIBILITY")                                                                    \
    F(name, "NAME")                                                                                \
    F(name_ref, "NAME_REF")                                                                        \
    F(fn_def, "FN_DEF")                                                                            \
    F(type_param_list, "TYPE_PARAM_LIST")                                                          \
    F(type_param, "TYPE_PARAM")                                                                    \
    F(lifetime_param, "LIFETIME_PARAM")                                                            \
    F(const_param, "CONST_PARAM")                                                                  \
    F(type_bound_list, "TYPE_BOUND_LIST")                                                          \
    F(type_bound, "TYPE_BOUND")                                                                    \
    F(where_clause, "WHERE_CLAUSE")                                                                \
    F(where_pred, "WHERE_PRED")                                                                    \
    F(param_list, "PARAM_LIST")                                                                    \
    F(param, "PARAM")                                                                              \
    F(self_param, "SELF_PARAM")                                                                    \
    F(ret_type, "RET_TYPE")                                                                        \
    F(struct_def, "STRUCT_DEF")                                                                    \
    F(union_def, "UNION_DEF")                                                                      \
    F(record_field_def_list, "RECORD_FIELD_DEF_LIST")                                              \
    F(record_field_def, "RECORD_FIELD_DEF")                                                        \
    F(tuple_field_def_list, "TUPLE_FIELD_DEF_LIST")                                                \
    F(tuple_field_def, "TUPLE_FIELD_DEF")                                                          \
    F(enum_def, "ENUM_DEF")                                                                        \
    F(enum_variant_list, "ENUM_VARIANT_LIST")                                                      \
    F(enum_variant, "ENUM_VARIANT")                                                                \
    F(trait_def, "TRAIT_DEF")                                                                      \
    F(impl_block, "IMPL_BLOCK")                                                                    \
    F(item_list, "ITEM_LIST")                                                                      \
    F(type_alias_def, "TYPE_ALIAS_DEF")                                                            \
    F(const_def, "CONST_DEF")                                                                      \
    F(static_def, "STATIC_DEF")                                                                    \
    F(module, "MODULE")                                                                            \
    F(use_item, "USE_ITEM")                                                                        \
    F(use_tree, "USE_TREE")                                                                        \
    F(use_tree_list, "USE_TREE_LIST")                                                              \
    F(alias, "ALIAS")                                                                              \
    F(extern_crate_item, "EXTERN_CRATE_ITEM")                                                      \
    F(macro_call, "MACRO_CALL")                                                                    \
    F(token_tree, "TOKEN_TREE")                                                                    \
    F(macro_items, "MACRO_ITEMS")                                                                  \
    F(macro_stmts, "MACRO_STMTS")                                                                  \
    F(let_stmt, "LET_STMT")                                                                        \
    F(expr_stmt, "EXPR_STMT")                                                                      \
    F(literal, "LITERAL")                                                                          \
    F(path_expr, "PATH_EXPR")                                                                      \
    F(path, "PATH")                                                                                \
    F(path_segment, "PATH_SEGMENT")                                                                \
    F(type_arg_list, "TYPE_ARG_LIST")                                                              \
    F(type_arg, "TYPE_ARG")                                                                        \
    F(lifetime_arg, "LIFETIME_ARG")                                                                \
    F(call_expr, "CALL_EXPR")                                                                      \
    F(arg_list, "ARG_LIST")                                                                        \
    F(method_call_expr, "METHOD_CALL_EXPR")                                                        \
    F(field_expr, "FIELD_EXPR")                                                                    \
    F(await_expr, "AWAIT_EXPR")                                                                    \
    F(bin_expr, "BIN_EXPR")                                                                        \
    F(prefix_expr, "PREFIX_EXPR")                                                                  \
    F(ref_expr, "REF_EXPR")                                                                        \
    F(paren_expr, "PAREN_EXPR")                                                                    \
    F(tuple_expr, "TUPLE_EXPR")                                                                    \
    F(array_expr, "ARRAY_EXPR")                                                                    \
    F(index_expr, "INDEX_EXPR")                                                                    \
    F(cast_expr, "CAST_EXPR")                                                                      \
    F(try_expr, "TRY_EXPR")                                                                        \
    F(range_expr, "RANGE_EXPR")                                                                    \
    F(block_expr, "BLOCK_EXPR")                                                                    \
    F(if_expr, "IF_EXPR")                                                                          \
    F(condition, "CONDITION")                                                                      \
    F(while_expr, "WHILE_EXPR")                                                                    \
    F(loop_expr, "LOOP_EXPR")                                                                      \
    F(for_expr, "FOR_EXPR")                                                                        \
    F(match_expr, "MATCH_EXPR")                                                                    \
    F(match_arm_list, "MATCH_ARM_LIST")                                                            \
    F(match_arm, "MATCH_ARM")                                                                      \
    F(match_guard, "MATCH_GUARD")                                                                  \
    F(return_expr, "RETURN_EXPR")                                                                  \
    F(break_expr, "BREAK_EXPR")                                                                    \
    F(continue_expr, "CONTINUE_EXPR")                                                              \
    F(label, "LABEL")                                                                              \
    F(record_lit, "RECORD_LIT")                                                                    \
    F(record_field_list, "RECORD_FIELD_LIST")                                                      \
    F(record_field, "RECORD_FIELD")                                                                \
    F(lambda_expr, "LAMBDA_EXPR")                                                                  \
    F(bind_pat, "BIND_PAT")                                                                        \
    F(placeholder_pat, "PLACEHOLDER_PAT")                                                          \
    F(dot_dot_pat, "DOT_DOT_PAT")                                                                  \
    F(tuple_pat, "TUPLE_PAT")                                                                      \
    F(tuple_struct_pat, "TUPLE_STRUCT_PAT")                                                        \
    F(record_pat, "RECORD_PAT")                                                                    \
    F(record_field_pat_list, "RECORD_FIELD_PAT_LIST")                                              \
    F(record_field_pat, "RECORD_FIELD_PAT")                                                        \
    F(path_pat, "PATH_PAT")                                                                        \
    F(literal_pat, "LITERAL_PAT")                                                                  \
    F(ref_pat, "REF_PAT")                                                                          \
    F(slice_pat, "SLICE_PAT")                                                                      \
    F(path_type, "PATH_TYPE")                                                                      \
    F(reference_type, "REFERENCE_TYPE")                                                            \
    F(pointer_type, "POINTER_TYPE")                                                                \
    F(tuple_type, "TUPLE_TYPE")                                                                    \
    F(array_type, "ARRAY_TYPE")                                                                    \
    F(slice_type, "SLICE_TYPE")                                                                    \
    F(never_type, "NEVER_TYPE")                                                                    \
    F(placeholder_type, "PLACEHOLDER_TYPE")                                                        \
    F(impl_trait_type, "IMPL_TRAIT_TYPE")                                                          \
    F(dyn_trait_type, "DYN_TRAIT_TYPE")                                                            \
    F(fn_pointer_type, "FN_POINTER_TYPE")

#define SHADE_SYNTAX_KIND_ENUMERATOR(id, ...) id,

enum struct Syntax_Kind : unsigned short {
    SHADE_TOKEN_KIND_ENUM_DATA(SHADE_SYNTAX_KIND_ENUMERATOR)
    SHADE_KEYWORD_ENUM_DATA(SHADE_SYNTAX_KIND_ENUMERATOR)
    SHADE_NODE_KIND_ENUM_DATA(SHADE_SYNTAX_KIND_ENUMERATOR)
};

inline constexpr Syntax_Kind first_keyword_kind = Syntax_Kind::as_kw;
inline constexpr Syntax_Kind last_keyword_kind = Syntax_Kind::union_kw;
inline constexpr Syntax_Kind first_node_kind = Syntax_Kind::source_file;

/// @brief Returns the upper-case name of the kind, such as `"FN_DEF"`.
[[nodiscard]]
std::u8string_view syntax_kind_name(Syntax_Kind kind);

/// @brief Returns the fixed source text of tokens of this kind,
/// such as `"::"` for `colon2` or `"fn"` for `fn_kw`.
/// For kinds without fixed text (including all nodes), returns an empty string.
[[nodiscard]]
std::u8string_view syntax_kind_text(Syntax_Kind kind);

/// @brief Returns the strict keyword with the given text, if any.
/// Contextual keywords such as `union` are not matched.
[[nodiscard]]
std::optional<Syntax_Kind> keyword_by_text(std::u8string_view text);

[[nodiscard]]
constexpr bool is_node(Syntax_Kind kind)
{
    return kind >= first_node_kind;
}

[[nodiscard]]
constexpr bool is_token(Syntax_Kind kind)
{
    return kind < first_node_kind;
}

[[nodiscard]]
constexpr bool is_keyword(Syntax_Kind kind)
{
    return kind >= first_keyword_kind && kind <= last_keyword_kind;
}

/// @brief Returns `true` for tokens which carry no syntactical meaning,
/// which are whitespace and comments.
[[nodiscard]]
constexpr bool is_trivia(Syntax_Kind kind)
{
    return kind == Syntax_Kind::whitespace || kind == Syntax_Kind::comment;
}

[[nodiscard]]
constexpr bool is_literal_token(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    switch (kind) {
    case int_number:
    case float_number:
    case char_:
    case byte:
    case string:
    case raw_string:
    case byte_string:
    case raw_byte_string:
    case true_kw:
    case false_kw: return true;
    default: return false;
    }
}

} // namespace shade

#endif
