#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"

#include "shade/diagnostic.hpp"
#include "shade/fwd.hpp"
#include "shade/lex.hpp"
#include "shade/parse.hpp"
#include "shade/syntax_kind.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

// Whitespace is never significant, so it can stand for the end of input.
constexpr Syntax_Kind eof = Syntax_Kind::whitespace;

struct Restrictions {
    /// @brief If `true`, `Path {` is not parsed as a record literal.
    /// This is needed in conditions of `if`, `while`, etc.,
    /// where the brace opens the body instead.
    bool forbid_record = false;
};

[[nodiscard]]
constexpr bool is_block_like(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    switch (kind) {
    case block_expr:
    case if_expr:
    case while_expr:
    case loop_expr:
    case for_expr:
    case match_expr: return true;
    default: return false;
    }
}

[[nodiscard]]
constexpr bool is_path_start(Syntax_Kind kind)
{
    using enum Syntax_Kind;
    return kind == ident || kind == colon2 || kind == self_kw || kind == super_kw
        || kind == crate_kw || kind == self_type_kw;
}

struct Binary_Operator {
    int precedence;
    std::size_t token_count;
    bool right_associative;
    Syntax_Kind node;
};

enum struct Path_Context : Default_Underlying {
    /// @brief Generic arguments require a turbofish, as in `Vec::<T>::new`.
    expr,
    /// @brief Generic arguments directly follow a segment, as in `Vec<T>`.
    type,
    /// @brief Paths in `use` items, which stop before `::{` and `::*`.
    use,
};

struct [[nodiscard]] Parser {
private:
    std::pmr::vector<Parse_Instruction>& m_out;
    const std::u8string_view m_source;
    std::pmr::vector<Token> m_tokens;
    const Parse_Error_Consumer m_on_error;

    std::size_t m_pos = 0;
    bool m_success = true;

public:
    [[nodiscard]]
    Parser(
        std::pmr::vector<Parse_Instruction>& out,
        std::u8string_view source,
        std::span<const Token> tokens,
        Parse_Error_Consumer on_error
    )
        : m_out { out }
        , m_source { source }
        , m_tokens { out.get_allocator().resource() }
        , m_on_error { on_error }
    {
        for (const Token& t : tokens) {
            if (!is_trivia(t.kind)) {
                m_tokens.push_back(t);
            }
        }
    }

    bool operator()(Parse_Entry entry)
    {
        switch (entry) {
        case Parse_Entry::source_file: {
            start(Syntax_Kind::source_file);
            consume_items_until(eof);
            finish();
            break;
        }
        case Parse_Entry::macro_items: {
            start(Syntax_Kind::macro_items);
            consume_items_until(eof);
            finish();
            break;
        }
        case Parse_Entry::macro_stmts: {
            start(Syntax_Kind::macro_stmts);
            consume_statements_until(eof, true);
            finish();
            break;
        }
        }
        return m_success;
    }

private:
    // BASIC OPERATIONS ============================================================================

    [[nodiscard]]
    Syntax_Kind nth(std::size_t n) const
    {
        return m_pos + n < m_tokens.size() ? m_tokens[m_pos + n].kind : eof;
    }

    [[nodiscard]]
    Syntax_Kind current() const
    {
        return nth(0);
    }

    [[nodiscard]]
    bool is_at(Syntax_Kind kind) const
    {
        return current() == kind;
    }

    [[nodiscard]]
    bool at_eof() const
    {
        return m_pos >= m_tokens.size();
    }

    [[nodiscard]]
    std::u8string_view nth_text(std::size_t n) const
    {
        if (m_pos + n >= m_tokens.size()) {
            return {};
        }
        const Text_Range r = m_tokens[m_pos + n].range;
        return m_source.substr(r.begin, r.length);
    }

    /// @brief Returns `true` if the current token is an identifier with the given text.
    [[nodiscard]]
    bool at_contextual(std::u8string_view text) const
    {
        return is_at(Syntax_Kind::ident) && nth_text(0) == text;
    }

    /// @brief Returns `true` if the `n`-th and the `n + 1`-th token are directly adjacent,
    /// without whitespace or comments in between.
    [[nodiscard]]
    bool adjacent(std::size_t n) const
    {
        if (m_pos + n + 1 >= m_tokens.size()) {
            return false;
        }
        return m_tokens[m_pos + n].range.end() == m_tokens[m_pos + n + 1].range.begin;
    }

    [[nodiscard]]
    Text_Range current_range() const
    {
        if (m_pos < m_tokens.size()) {
            return m_tokens[m_pos].range;
        }
        if (m_tokens.empty()) {
            return {};
        }
        return { m_tokens.back().range.end(), 0 };
    }

    void start(Syntax_Kind kind)
    {
        m_out.push_back({ Parse_Instruction_Type::start_node, kind });
    }

    void finish()
    {
        m_out.push_back({ Parse_Instruction_Type::finish_node, Syntax_Kind::error });
    }

    [[nodiscard]]
    std::size_t checkpoint() const
    {
        return m_out.size();
    }

    /// @brief Starts a node at a previous checkpoint,
    /// so that everything that was parsed since then becomes a child of the new node.
    void start_at(std::size_t checkpoint, Syntax_Kind kind)
    {
        SHADE_ASSERT(checkpoint <= m_out.size());
        m_out.insert(
            m_out.begin() + std::ptrdiff_t(checkpoint),
            { Parse_Instruction_Type::start_node, kind }
        );
    }

    void bump()
    {
        bump_as(current());
    }

    void bump_as(Syntax_Kind kind)
    {
        SHADE_ASSERT(!at_eof());
        m_out.push_back({ Parse_Instruction_Type::token, kind });
        ++m_pos;
    }

    bool eat(Syntax_Kind kind)
    {
        if (!is_at(kind)) {
            return false;
        }
        bump();
        return true;
    }

    void expect(Syntax_Kind kind)
    {
        if (eat(kind)) {
            return;
        }
        std::pmr::u8string message { m_out.get_allocator().resource() };
        message += u8"Expected '";
        message += syntax_kind_text(kind).empty() ? syntax_kind_name(kind) : syntax_kind_text(kind);
        message += u8"'.";
        report_error(message);
    }

    void report_error(std::u8string_view message)
    {
        if (m_on_error) {
            m_on_error(diagnostic::parse, current_range(), message);
        }
        m_success = false;
    }

    /// @brief Reports an error and wraps the current token in an `error` node,
    /// which guarantees progress.
    void error_and_bump(std::u8string_view message)
    {
        report_error(message);
        if (at_eof()) {
            return;
        }
        start(Syntax_Kind::error);
        if (is_at(Syntax_Kind::l_curly) || is_at(Syntax_Kind::l_paren) || is_at(Syntax_Kind::l_brack)) {
            consume_delimited_tokens();
        }
        else {
            bump();
        }
        finish();
    }

    // ITEMS =======================================================================================

    void consume_items_until(Syntax_Kind end)
    {
        while (!at_eof() && !is_at(end)) {
            const std::size_t initial_pos = m_pos;
            if (!expect_item(false)) {
                error_and_bump(u8"Expected an item."sv);
            }
            SHADE_ASSERT(m_pos > initial_pos);
        }
    }

    void consume_outer_attributes()
    {
        while (is_at(Syntax_Kind::pound)
               && (nth(1) == Syntax_Kind::l_brack
                   || (nth(1) == Syntax_Kind::excl && nth(2) == Syntax_Kind::l_brack))) {
            start(Syntax_Kind::attr);
            bump();
            eat(Syntax_Kind::excl);
            consume_delimited_tokens();
            finish();
        }
    }

    /// @brief Consumes a balanced sequence of tokens starting with an opening delimiter,
    /// without creating any nodes.
    void consume_delimited_tokens()
    {
        std::size_t depth = 0;
        do {
            switch (current()) {
            case Syntax_Kind::l_paren:
            case Syntax_Kind::l_brack:
            case Syntax_Kind::l_curly: ++depth; break;
            case Syntax_Kind::r_paren:
            case Syntax_Kind::r_brack:
            case Syntax_Kind::r_curly: --depth; break;
            default: break;
            }
            bump();
        } while (depth != 0 && !at_eof());
    }

    void consume_visibility()
    {
        if (!is_at(Syntax_Kind::pub_kw) && !is_at(Syntax_Kind::crate_kw)) {
            return;
        }
        if (is_at(Syntax_Kind::crate_kw) && nth(1) == Syntax_Kind::colon2) {
            return;
        }
        start(Syntax_Kind::visibility);
        bump();
        if (is_at(Syntax_Kind::l_paren)
            && (nth(1) == Syntax_Kind::crate_kw || nth(1) == Syntax_Kind::super_kw
                || nth(1) == Syntax_Kind::self_kw || nth(1) == Syntax_Kind::in_kw)) {
            consume_delimited_tokens();
        }
        finish();
    }

    /// @brief Returns the kind of item that the upcoming tokens form,
    /// skipping over qualifiers such as `unsafe` or `extern "C"`.
    [[nodiscard]]
    std::optional<Syntax_Kind> peek_item_kind() const
    {
        using enum Syntax_Kind;
        std::size_t n = 0;
        while (true) {
            const Syntax_Kind k = nth(n);
            if (k == const_kw && (nth(n + 1) == fn_kw || nth(n + 1) == unsafe_kw
                                  || nth(n + 1) == async_kw || nth(n + 1) == extern_kw)) {
                ++n;
                continue;
            }
            if (k == async_kw && nth(n + 1) != l_curly && nth(n + 1) != move_kw) {
                ++n;
                continue;
            }
            if (k == unsafe_kw && nth(n + 1) != l_curly) {
                ++n;
                continue;
            }
            if (k == extern_kw && nth(n + 1) == string) {
                n += 2;
                continue;
            }
            break;
        }
        switch (nth(n)) {
        case fn_kw: return fn_def;
        case struct_kw: return struct_def;
        case enum_kw: return enum_def;
        case trait_kw: return trait_def;
        case impl_kw: return impl_block;
        case type_kw: return type_alias_def;
        case static_kw: return static_def;
        case mod_kw: return module;
        case use_kw: return use_item;
        case const_kw:
            return nth(n + 1) == ident || nth(n + 1) == underscore ? std::optional { const_def }
                                                                     : std::nullopt;
        case extern_kw: return nth(n + 1) == crate_kw ? std::optional { extern_crate_item } : std::nullopt;
        case ident: {
            if (n == 0 && nth_text(0) == u8"union"sv && nth(1) == ident) {
                return union_def;
            }
            if (n == 0 && nth_text(0) == u8"macro_rules"sv && nth(1) == excl) {
                return macro_call;
            }
            return std::nullopt;
        }
        default: return std::nullopt;
        }
    }

    /// @brief Parses an item, if the upcoming tokens form one.
    /// In blocks, macro calls other than `macro_rules!` are left to expression parsing.
    [[nodiscard]]
    bool expect_item(bool in_block)
    {
        const std::size_t initial_pos = m_pos;
        const std::size_t cp = checkpoint();
        consume_outer_attributes();
        consume_visibility();

        std::optional<Syntax_Kind> kind = peek_item_kind();
        if (!kind && !in_block && is_path_start(current())) {
            kind = Syntax_Kind::macro_call;
        }
        if (!kind) {
            if (m_pos == initial_pos) {
                return false;
            }
            // Attributes or a visibility without an item.
            if (!in_block) {
                report_error(u8"Expected an item."sv);
            }
            return true;
        }
        start_at(cp, *kind);
        consume_item_qualifiers();
        switch (*kind) {
        case Syntax_Kind::fn_def: consume_fn(); break;
        case Syntax_Kind::struct_def: consume_struct(); break;
        case Syntax_Kind::union_def: consume_union(); break;
        case Syntax_Kind::enum_def: consume_enum(); break;
        case Syntax_Kind::trait_def: consume_trait(); break;
        case Syntax_Kind::impl_block: consume_impl(); break;
        case Syntax_Kind::type_alias_def: consume_type_alias(); break;
        case Syntax_Kind::const_def:
        case Syntax_Kind::static_def: consume_const_or_static(); break;
        case Syntax_Kind::module: consume_module(); break;
        case Syntax_Kind::use_item: consume_use(); break;
        case Syntax_Kind::extern_crate_item: consume_extern_crate(); break;
        case Syntax_Kind::macro_call: consume_item_macro_call(); break;
        default: SHADE_ASSERT_UNREACHABLE(u8"Unexpected item kind.");
        }
        finish();
        return true;
    }

    void consume_item_qualifiers()
    {
        using enum Syntax_Kind;
        while (true) {
            if ((is_at(const_kw) && nth(1) != ident && nth(1) != underscore) || is_at(async_kw)
                || is_at(unsafe_kw)) {
                bump();
            }
            else if (is_at(extern_kw) && nth(1) == string) {
                bump();
                bump();
            }
            else {
                break;
            }
        }
    }

    void consume_name()
    {
        if (is_at(Syntax_Kind::ident)) {
            start(Syntax_Kind::name);
            bump();
            finish();
        }
        else {
            report_error(u8"Expected a name."sv);
        }
    }

    void consume_name_ref()
    {
        if (is_at(Syntax_Kind::ident)) {
            start(Syntax_Kind::name_ref);
            bump();
            finish();
        }
        else {
            report_error(u8"Expected a name."sv);
        }
    }

    void consume_fn()
    {
        expect(Syntax_Kind::fn_kw);
        consume_name();
        consume_optional_type_params();
        if (is_at(Syntax_Kind::l_paren)) {
            consume_param_list();
        }
        else {
            report_error(u8"Expected a parameter list."sv);
        }
        consume_optional_ret_type();
        consume_optional_where_clause();
        if (!eat(Syntax_Kind::semicolon)) {
            consume_block_expr();
        }
    }

    void consume_optional_type_params()
    {
        using enum Syntax_Kind;
        if (!is_at(l_angle)) {
            return;
        }
        start(type_param_list);
        bump();
        while (!at_eof() && !is_at(r_angle)) {
            const std::size_t initial_pos = m_pos;
            consume_outer_attributes();
            if (is_at(lifetime)) {
                start(lifetime_param);
                bump();
                if (eat(colon)) {
                    while (is_at(lifetime) || is_at(plus)) {
                        bump();
                    }
                }
                finish();
            }
            else if (is_at(const_kw)) {
                start(const_param);
                bump();
                consume_name();
                expect(colon);
                consume_type();
                finish();
            }
            else if (is_at(ident)) {
                start(type_param);
                consume_name();
                if (eat(colon)) {
                    consume_type_bounds();
                }
                if (eat(eq)) {
                    consume_type();
                }
                finish();
            }
            else {
                error_and_bump(u8"Expected a generic parameter."sv);
            }
            if (!eat(comma) && !is_at(r_angle) && m_pos == initial_pos) {
                error_and_bump(u8"Expected ',' or '>'."sv);
            }
        }
        expect(r_angle);
        finish();
    }

    void consume_type_bounds()
    {
        using enum Syntax_Kind;
        start(type_bound_list);
        while (true) {
            if (is_at(lifetime)) {
                start(type_bound);
                bump();
                finish();
            }
            else if (is_at(question) || is_path_start(current()) || is_at(l_paren)) {
                start(type_bound);
                eat(question);
                if (is_at(l_paren)) {
                    bump();
                    consume_type();
                    expect(r_paren);
                }
                else {
                    consume_path(Path_Context::type);
                }
                finish();
            }
            else {
                break;
            }
            if (!eat(plus)) {
                break;
            }
        }
        finish();
    }

    void consume_optional_where_clause()
    {
        using enum Syntax_Kind;
        if (!is_at(where_kw)) {
            return;
        }
        start(where_clause);
        bump();
        while (is_at(lifetime) || is_path_start(current()) || is_at(l_paren) || is_at(amp)) {
            start(where_pred);
            if (is_at(lifetime)) {
                bump();
            }
            else {
                consume_type();
            }
            if (eat(colon)) {
                if (is_at(lifetime)) {
                    while (is_at(lifetime) || is_at(plus)) {
                        bump();
                    }
                }
                else {
                    consume_type_bounds();
                }
            }
            finish();
            if (!eat(comma)) {
                break;
            }
        }
        finish();
    }

    void consume_optional_ret_type()
    {
        if (!is_at(Syntax_Kind::thin_arrow)) {
            return;
        }
        start(Syntax_Kind::ret_type);
        bump();
        consume_type();
        finish();
    }

    [[nodiscard]]
    bool at_self_param() const
    {
        using enum Syntax_Kind;
        if (is_at(self_kw)) {
            return true;
        }
        if (is_at(mut_kw)) {
            return nth(1) == self_kw;
        }
        if (is_at(amp)) {
            std::size_t n = 1;
            if (nth(n) == lifetime) {
                ++n;
            }
            if (nth(n) == mut_kw) {
                ++n;
            }
            return nth(n) == self_kw;
        }
        return false;
    }

    void consume_param_list()
    {
        using enum Syntax_Kind;
        start(param_list);
        bump();
        if (at_self_param()) {
            start(self_param);
            eat(amp);
            eat(lifetime);
            eat(mut_kw);
            expect(self_kw);
            if (eat(colon)) {
                consume_type();
            }
            finish();
            if (!eat(comma)) {
                expect(r_paren);
                finish();
                return;
            }
        }
        while (!at_eof() && !is_at(r_paren)) {
            const std::size_t initial_pos = m_pos;
            consume_outer_attributes();
            start(param);
            consume_pattern();
            if (eat(colon)) {
                consume_type();
            }
            else {
                report_error(u8"Expected ':' followed by the parameter type."sv);
            }
            finish();
            if (!eat(comma) && !is_at(r_paren)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a parameter."sv);
                }
                else {
                    report_error(u8"Expected ',' or ')'."sv);
                    break;
                }
            }
        }
        expect(r_paren);
        finish();
    }

    void consume_struct()
    {
        using enum Syntax_Kind;
        expect(struct_kw);
        consume_name();
        consume_optional_type_params();
        consume_optional_where_clause();
        if (is_at(l_curly)) {
            consume_record_field_defs();
        }
        else if (is_at(l_paren)) {
            consume_tuple_field_defs();
            consume_optional_where_clause();
            expect(semicolon);
        }
        else {
            expect(semicolon);
        }
    }

    void consume_union()
    {
        SHADE_ASSERT(at_contextual(u8"union"sv));
        bump_as(Syntax_Kind::union_kw);
        consume_name();
        consume_optional_type_params();
        consume_optional_where_clause();
        if (is_at(Syntax_Kind::l_curly)) {
            consume_record_field_defs();
        }
        else {
            report_error(u8"Expected the fields of a union."sv);
        }
    }

    void consume_record_field_defs()
    {
        using enum Syntax_Kind;
        start(record_field_def_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            start(record_field_def);
            consume_outer_attributes();
            consume_visibility();
            consume_name();
            expect(colon);
            consume_type();
            finish();
            if (!eat(comma) && !is_at(r_curly)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a field."sv);
                }
                else {
                    report_error(u8"Expected ',' or '}'."sv);
                    break;
                }
            }
        }
        expect(r_curly);
        finish();
    }

    void consume_tuple_field_defs()
    {
        using enum Syntax_Kind;
        start(tuple_field_def_list);
        bump();
        while (!at_eof() && !is_at(r_paren)) {
            const std::size_t initial_pos = m_pos;
            start(tuple_field_def);
            consume_outer_attributes();
            consume_visibility();
            consume_type();
            finish();
            if (!eat(comma) && !is_at(r_paren)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a field type."sv);
                }
                else {
                    report_error(u8"Expected ',' or ')'."sv);
                    break;
                }
            }
        }
        expect(r_paren);
        finish();
    }

    void consume_enum()
    {
        using enum Syntax_Kind;
        expect(enum_kw);
        consume_name();
        consume_optional_type_params();
        consume_optional_where_clause();
        if (!is_at(l_curly)) {
            report_error(u8"Expected the variants of an enum."sv);
            return;
        }
        start(enum_variant_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            start(enum_variant);
            consume_outer_attributes();
            consume_visibility();
            consume_name();
            if (is_at(l_curly)) {
                consume_record_field_defs();
            }
            else if (is_at(l_paren)) {
                consume_tuple_field_defs();
            }
            if (eat(eq)) {
                consume_expr();
            }
            finish();
            if (!eat(comma) && !is_at(r_curly)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a variant."sv);
                }
                else {
                    report_error(u8"Expected ',' or '}'."sv);
                    break;
                }
            }
        }
        expect(r_curly);
        finish();
    }

    void consume_trait()
    {
        using enum Syntax_Kind;
        expect(trait_kw);
        consume_name();
        consume_optional_type_params();
        if (eat(colon)) {
            consume_type_bounds();
        }
        consume_optional_where_clause();
        consume_item_list();
    }

    void consume_impl()
    {
        using enum Syntax_Kind;
        expect(impl_kw);
        consume_optional_type_params();
        eat(excl);
        consume_type();
        if (eat(for_kw)) {
            consume_type();
        }
        consume_optional_where_clause();
        consume_item_list();
    }

    void consume_item_list()
    {
        using enum Syntax_Kind;
        if (!is_at(l_curly)) {
            report_error(u8"Expected '{'."sv);
            return;
        }
        start(item_list);
        bump();
        consume_items_until(r_curly);
        expect(r_curly);
        finish();
    }

    void consume_type_alias()
    {
        using enum Syntax_Kind;
        expect(type_kw);
        consume_name();
        consume_optional_type_params();
        if (eat(colon)) {
            consume_type_bounds();
        }
        consume_optional_where_clause();
        if (eat(eq)) {
            consume_type();
        }
        expect(semicolon);
    }

    void consume_const_or_static()
    {
        using enum Syntax_Kind;
        if (!eat(const_kw)) {
            expect(static_kw);
            eat(mut_kw);
        }
        if (!eat(underscore)) {
            consume_name();
        }
        expect(colon);
        consume_type();
        if (eat(eq)) {
            consume_expr();
        }
        expect(semicolon);
    }

    void consume_module()
    {
        expect(Syntax_Kind::mod_kw);
        consume_name();
        if (!eat(Syntax_Kind::semicolon)) {
            consume_item_list();
        }
    }

    void consume_use()
    {
        expect(Syntax_Kind::use_kw);
        consume_use_tree();
        expect(Syntax_Kind::semicolon);
    }

    void consume_use_tree()
    {
        using enum Syntax_Kind;
        start(use_tree);
        if (is_at(star)) {
            bump();
        }
        else if (is_at(l_curly)) {
            consume_use_tree_list();
        }
        else if (is_at(colon2) && (nth(1) == star || nth(1) == l_curly)) {
            bump();
            if (!eat(star)) {
                consume_use_tree_list();
            }
        }
        else if (is_path_start(current())) {
            consume_path(Path_Context::use);
            if (eat(colon2)) {
                if (!eat(star)) {
                    consume_use_tree_list();
                }
            }
            else if (is_at(as_kw)) {
                start(alias);
                bump();
                if (!eat(underscore)) {
                    consume_name();
                }
                finish();
            }
        }
        else {
            report_error(u8"Expected a use tree."sv);
        }
        finish();
    }

    void consume_use_tree_list()
    {
        using enum Syntax_Kind;
        if (!is_at(l_curly)) {
            report_error(u8"Expected '{'."sv);
            return;
        }
        start(use_tree_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            consume_use_tree();
            if (!eat(comma) && !is_at(r_curly)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a use tree."sv);
                }
                else {
                    break;
                }
            }
        }
        expect(r_curly);
        finish();
    }

    void consume_extern_crate()
    {
        using enum Syntax_Kind;
        expect(extern_kw);
        expect(crate_kw);
        if (is_at(self_kw)) {
            bump();
        }
        else {
            consume_name_ref();
        }
        if (is_at(as_kw)) {
            start(alias);
            bump();
            consume_name();
            finish();
        }
        expect(semicolon);
    }

    /// @brief Parses the remainder of a macro call in item position,
    /// such as `macro_rules! name { ... }` or `thread_local! { ... }`.
    /// The `macro_call` node has already been started.
    void consume_item_macro_call()
    {
        using enum Syntax_Kind;
        consume_path(Path_Context::expr);
        expect(excl);
        if (is_at(ident)) {
            bump();
        }
        const bool braced = is_at(l_curly);
        consume_token_tree();
        if (!braced) {
            expect(semicolon);
        }
        else {
            eat(semicolon);
        }
    }

    void consume_token_tree()
    {
        using enum Syntax_Kind;
        const Syntax_Kind open = current();
        const Syntax_Kind close = open == l_paren ? r_paren
            : open == l_brack                     ? r_brack
            : open == l_curly                     ? r_curly
                                                  : eof;
        if (close == eof) {
            report_error(u8"Expected '(', '[', or '{'."sv);
            return;
        }
        start(token_tree);
        bump();
        while (!at_eof() && !is_at(close)) {
            if (is_at(l_paren) || is_at(l_brack) || is_at(l_curly)) {
                consume_token_tree();
            }
            else {
                bump();
            }
        }
        expect(close);
        finish();
    }

    // STATEMENTS ==================================================================================

    void consume_block_expr()
    {
        using enum Syntax_Kind;
        start(block_expr);
        while (is_at(unsafe_kw) || is_at(async_kw) || is_at(move_kw)) {
            bump();
        }
        if (!is_at(l_curly)) {
            report_error(u8"Expected a block."sv);
            finish();
            return;
        }
        bump();
        consume_statements_until(r_curly, false);
        expect(r_curly);
        finish();
    }

    void consume_statements_until(Syntax_Kind end, bool commas_separate)
    {
        using enum Syntax_Kind;
        while (!at_eof() && !is_at(end)) {
            const std::size_t initial_pos = m_pos;
            if (eat(semicolon) || (commas_separate && eat(comma))) {
                continue;
            }
            if (is_at(let_kw)) {
                consume_let();
            }
            else if (!expect_item(true)) {
                consume_expr_stmt(end, commas_separate);
            }
            if (m_pos == initial_pos) {
                error_and_bump(u8"Expected a statement."sv);
            }
        }
    }

    void consume_let()
    {
        using enum Syntax_Kind;
        start(let_stmt);
        bump();
        consume_pattern();
        if (eat(colon)) {
            consume_type();
        }
        if (eat(eq)) {
            consume_expr();
        }
        if (is_at(else_kw)) {
            bump();
            consume_block_expr();
        }
        expect(semicolon);
        finish();
    }

    void consume_expr_stmt(Syntax_Kind end, bool commas_separate)
    {
        using enum Syntax_Kind;
        const std::size_t cp = checkpoint();
        const std::optional<Syntax_Kind> kind = expect_expr({}, 0);
        if (!kind) {
            return;
        }
        if (is_at(semicolon)) {
            start_at(cp, expr_stmt);
            bump();
            finish();
            return;
        }
        if (is_at(end) || at_eof() || (commas_separate && is_at(comma))) {
            return;
        }
        start_at(cp, expr_stmt);
        finish();
        if (!is_block_like(*kind) && *kind != macro_call) {
            report_error(u8"Expected ';'."sv);
        }
    }

    // EXPRESSIONS =================================================================================

    void consume_expr(Restrictions restrictions = {})
    {
        if (!expect_expr(restrictions, 0)) {
            report_error(u8"Expected an expression."sv);
        }
    }

    [[nodiscard]]
    bool at_expr_start() const
    {
        using enum Syntax_Kind;
        switch (current()) {
        case semicolon:
        case comma:
        case r_paren:
        case r_curly:
        case r_brack:
        case fat_arrow:
        case eq:
        case else_kw:
        case whitespace: return false;
        default: return true;
        }
    }

    [[nodiscard]]
    std::optional<Binary_Operator> peek_binary_operator() const
    {
        using enum Syntax_Kind;
        switch (current()) {
        case eq:
        case pluseq:
        case minuseq:
        case stareq:
        case slasheq:
        case percenteq:
        case ampeq:
        case pipeeq:
        case careteq: return Binary_Operator { 1, 1, true, bin_expr };
        case dot2:
        case dot2eq: return Binary_Operator { 2, 1, false, range_expr };
        case pipe2: return Binary_Operator { 3, 1, false, bin_expr };
        case amp2: return Binary_Operator { 4, 1, false, bin_expr };
        case eq2:
        case neq:
        case lteq:
        case gteq: return Binary_Operator { 5, 1, false, bin_expr };
        case l_angle:
            return nth(1) == l_angle && adjacent(0) ? Binary_Operator { 9, 2, false, bin_expr }
                                                    : Binary_Operator { 5, 1, false, bin_expr };
        case r_angle:
            return nth(1) == r_angle && adjacent(0) ? Binary_Operator { 9, 2, false, bin_expr }
                                                    : Binary_Operator { 5, 1, false, bin_expr };
        case pipe: return Binary_Operator { 6, 1, false, bin_expr };
        case caret: return Binary_Operator { 7, 1, false, bin_expr };
        case amp: return Binary_Operator { 8, 1, false, bin_expr };
        case plus:
        case minus: return Binary_Operator { 10, 1, false, bin_expr };
        case star:
        case slash:
        case percent: return Binary_Operator { 11, 1, false, bin_expr };
        default: return std::nullopt;
        }
    }

    /// @brief Parses an expression whose binary operators have at least the precedence
    /// `min_precedence`.
    /// @returns The kind of the outermost node, or `std::nullopt` if nothing was parsed.
    std::optional<Syntax_Kind> expect_expr(Restrictions restrictions, int min_precedence)
    {
        const std::size_t cp = checkpoint();
        std::optional<Syntax_Kind> lhs;
        if (is_at(Syntax_Kind::dot2) || is_at(Syntax_Kind::dot2eq)) {
            start(Syntax_Kind::range_expr);
            bump();
            if (at_expr_start() && !(restrictions.forbid_record && is_at(Syntax_Kind::l_curly))) {
                expect_expr(restrictions, 3);
            }
            finish();
            lhs = Syntax_Kind::range_expr;
        }
        else {
            lhs = expect_unary_expr(restrictions);
        }
        if (!lhs) {
            return std::nullopt;
        }
        // Block-like expressions at the start of a statement are not continued by operators,
        // as in `if c {} -1`.
        while (const std::optional<Binary_Operator> op = peek_binary_operator()) {
            if (op->precedence < min_precedence) {
                break;
            }
            start_at(cp, op->node);
            for (std::size_t i = 0; i < op->token_count; ++i) {
                bump();
            }
            const int rhs_precedence = op->right_associative ? op->precedence : op->precedence + 1;
            if (op->node == Syntax_Kind::range_expr) {
                if (at_expr_start() && !(restrictions.forbid_record && is_at(Syntax_Kind::l_curly))) {
                    expect_expr(restrictions, rhs_precedence);
                }
            }
            else if (!expect_expr(restrictions, rhs_precedence)) {
                report_error(u8"Expected an expression after the operator."sv);
            }
            finish();
            lhs = op->node;
        }
        return lhs;
    }

    std::optional<Syntax_Kind> expect_unary_expr(Restrictions restrictions)
    {
        using enum Syntax_Kind;
        if (is_at(minus) || is_at(excl) || is_at(star)) {
            start(prefix_expr);
            bump();
            if (!expect_unary_expr(restrictions)) {
                report_error(u8"Expected an expression."sv);
            }
            finish();
            return prefix_expr;
        }
        if (is_at(amp) || is_at(amp2)) {
            start(ref_expr);
            bump();
            eat(mut_kw);
            if (!expect_unary_expr(restrictions)) {
                report_error(u8"Expected an expression."sv);
            }
            finish();
            return ref_expr;
        }
        const std::size_t cp = checkpoint();
        std::optional<Syntax_Kind> kind = expect_atom(restrictions);
        if (!kind) {
            return std::nullopt;
        }
        return consume_postfix(cp, *kind);
    }

    Syntax_Kind consume_postfix(std::size_t cp, Syntax_Kind kind)
    {
        using enum Syntax_Kind;
        while (true) {
            if (is_at(l_paren)) {
                start_at(cp, call_expr);
                consume_arg_list();
                finish();
                kind = call_expr;
            }
            else if (is_at(l_brack)) {
                start_at(cp, index_expr);
                bump();
                consume_expr();
                expect(r_brack);
                finish();
                kind = index_expr;
            }
            else if (is_at(question)) {
                start_at(cp, try_expr);
                bump();
                finish();
                kind = try_expr;
            }
            else if (is_at(as_kw)) {
                start_at(cp, cast_expr);
                bump();
                consume_type();
                finish();
                kind = cast_expr;
            }
            else if (is_at(dot) && nth(1) == await_kw) {
                start_at(cp, await_expr);
                bump();
                bump();
                finish();
                kind = await_expr;
            }
            else if (is_at(dot) && nth(1) == ident
                     && (nth(2) == l_paren || (nth(2) == colon2 && nth(3) == l_angle))) {
                start_at(cp, method_call_expr);
                bump();
                consume_name_ref();
                if (is_at(colon2)) {
                    bump();
                    consume_type_args();
                }
                consume_arg_list();
                finish();
                kind = method_call_expr;
            }
            else if (is_at(dot) && (nth(1) == ident || nth(1) == int_number)) {
                start_at(cp, field_expr);
                bump();
                if (is_at(ident)) {
                    consume_name_ref();
                }
                else {
                    bump();
                }
                finish();
                kind = field_expr;
            }
            else {
                return kind;
            }
        }
    }

    void consume_arg_list()
    {
        using enum Syntax_Kind;
        start(arg_list);
        bump();
        consume_comma_separated_exprs(r_paren);
        expect(r_paren);
        finish();
    }

    void consume_comma_separated_exprs(Syntax_Kind end)
    {
        using enum Syntax_Kind;
        while (!at_eof() && !is_at(end)) {
            const std::size_t initial_pos = m_pos;
            consume_outer_attributes();
            if (!expect_expr({}, 0)) {
                error_and_bump(u8"Expected an expression."sv);
            }
            if (!eat(comma) && !is_at(end)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected an expression."sv);
                }
                else {
                    report_error(u8"Expected ','."sv);
                    break;
                }
            }
        }
    }

    std::optional<Syntax_Kind> expect_atom(Restrictions restrictions)
    {
        using enum Syntax_Kind;
        const Syntax_Kind k = current();
        if (is_literal_token(k)) {
            start(literal);
            bump();
            finish();
            return literal;
        }
        if (k == lifetime && nth(1) == colon) {
            const std::size_t cp = checkpoint();
            start(label);
            bump();
            bump();
            finish();
            const std::optional<Syntax_Kind> labeled = expect_atom(restrictions);
            if (!labeled) {
                report_error(u8"Expected a loop or block after a label."sv);
                return std::nullopt;
            }
            // The label belongs to the labeled expression.
            const std::size_t inner = cp + 4;
            SHADE_ASSERT(m_out[inner].type == Parse_Instruction_Type::start_node);
            const Parse_Instruction start_of_labeled = m_out[inner];
            m_out.erase(m_out.begin() + std::ptrdiff_t(inner));
            m_out.insert(m_out.begin() + std::ptrdiff_t(cp), start_of_labeled);
            return labeled;
        }
        switch (k) {
        case l_paren: return consume_paren_or_tuple();
        case l_brack: return consume_array();
        case l_curly: consume_block_expr(); return block_expr;
        case unsafe_kw:
            if (nth(1) == l_curly) {
                consume_block_expr();
                return block_expr;
            }
            break;
        case async_kw:
            if (nth(1) == l_curly || (nth(1) == move_kw && nth(2) == l_curly)) {
                consume_block_expr();
                return block_expr;
            }
            if (nth(1) == move_kw || nth(1) == pipe || nth(1) == pipe2) {
                return consume_lambda();
            }
            break;
        case if_kw: return consume_if();
        case while_kw: return consume_while();
        case loop_kw: {
            start(loop_expr);
            bump();
            consume_block_expr();
            finish();
            return loop_expr;
        }
        case for_kw: return consume_for();
        case match_kw: return consume_match();
        case return_kw: {
            start(return_expr);
            bump();
            if (at_expr_start()) {
                expect_expr(restrictions, 0);
            }
            finish();
            return return_expr;
        }
        case break_kw: {
            start(break_expr);
            bump();
            eat(lifetime);
            if (at_expr_start() && !(restrictions.forbid_record && is_at(l_curly))) {
                expect_expr(restrictions, 0);
            }
            finish();
            return break_expr;
        }
        case continue_kw: {
            start(continue_expr);
            bump();
            eat(lifetime);
            finish();
            return continue_expr;
        }
        case pipe:
        case pipe2:
        case move_kw: return consume_lambda();
        default: break;
        }
        if (is_path_start(k) || k == l_angle) {
            return consume_path_expr(restrictions);
        }
        return std::nullopt;
    }

    Syntax_Kind consume_paren_or_tuple()
    {
        using enum Syntax_Kind;
        const std::size_t cp = checkpoint();
        start(paren_expr);
        bump();
        std::size_t count = 0;
        bool trailing_comma = false;
        while (!at_eof() && !is_at(r_paren)) {
            const std::size_t initial_pos = m_pos;
            if (!expect_expr({}, 0)) {
                error_and_bump(u8"Expected an expression."sv);
            }
            ++count;
            trailing_comma = eat(comma);
            if (!trailing_comma && !is_at(r_paren)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected an expression."sv);
                }
                else {
                    report_error(u8"Expected ',' or ')'."sv);
                    break;
                }
            }
        }
        expect(r_paren);
        finish();
        if (count == 1 && !trailing_comma) {
            return paren_expr;
        }
        m_out[cp].kind = tuple_expr;
        return tuple_expr;
    }

    Syntax_Kind consume_array()
    {
        using enum Syntax_Kind;
        start(array_expr);
        bump();
        if (!is_at(r_brack)) {
            if (!expect_expr({}, 0)) {
                error_and_bump(u8"Expected an expression."sv);
            }
            if (eat(semicolon)) {
                consume_expr();
            }
            else if (eat(comma)) {
                consume_comma_separated_exprs(r_brack);
            }
        }
        expect(r_brack);
        finish();
        return array_expr;
    }

    void consume_condition()
    {
        using enum Syntax_Kind;
        start(condition);
        if (eat(let_kw)) {
            consume_pattern();
            expect(eq);
        }
        consume_expr({ .forbid_record = true });
        finish();
    }

    Syntax_Kind consume_if()
    {
        using enum Syntax_Kind;
        start(if_expr);
        bump();
        consume_condition();
        consume_block_expr();
        if (eat(else_kw)) {
            if (is_at(if_kw)) {
                consume_if();
            }
            else {
                consume_block_expr();
            }
        }
        finish();
        return if_expr;
    }

    Syntax_Kind consume_while()
    {
        using enum Syntax_Kind;
        start(while_expr);
        bump();
        consume_condition();
        consume_block_expr();
        finish();
        return while_expr;
    }

    Syntax_Kind consume_for()
    {
        using enum Syntax_Kind;
        start(for_expr);
        bump();
        consume_pattern();
        expect(in_kw);
        consume_expr({ .forbid_record = true });
        consume_block_expr();
        finish();
        return for_expr;
    }

    Syntax_Kind consume_match()
    {
        using enum Syntax_Kind;
        start(match_expr);
        bump();
        consume_expr({ .forbid_record = true });
        if (!is_at(l_curly)) {
            report_error(u8"Expected '{'."sv);
            finish();
            return match_expr;
        }
        start(match_arm_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            start(match_arm);
            consume_outer_attributes();
            eat(pipe);
            consume_pattern();
            if (is_at(if_kw)) {
                start(match_guard);
                bump();
                consume_expr();
                finish();
            }
            expect(fat_arrow);
            const std::optional<Syntax_Kind> arm = expect_expr({}, 0);
            if (!arm) {
                report_error(u8"Expected an expression."sv);
            }
            const bool has_comma = eat(comma);
            finish();
            if (!has_comma && !is_at(r_curly) && !(arm && is_block_like(*arm))) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a match arm."sv);
                }
                else {
                    report_error(u8"Expected ','."sv);
                }
            }
            if (m_pos == initial_pos) {
                error_and_bump(u8"Expected a match arm."sv);
            }
        }
        expect(r_curly);
        finish();
        finish();
        return match_expr;
    }

    Syntax_Kind consume_lambda()
    {
        using enum Syntax_Kind;
        start(lambda_expr);
        eat(async_kw);
        eat(move_kw);
        start(param_list);
        if (eat(pipe2)) {
            finish();
        }
        else {
            expect(pipe);
            while (!at_eof() && !is_at(pipe)) {
                const std::size_t initial_pos = m_pos;
                start(param);
                consume_pattern(false);
                if (eat(colon)) {
                    consume_type();
                }
                finish();
                if (!eat(comma) && !is_at(pipe)) {
                    if (m_pos == initial_pos) {
                        error_and_bump(u8"Expected a closure parameter."sv);
                    }
                    else {
                        report_error(u8"Expected ',' or '|'."sv);
                        break;
                    }
                }
            }
            expect(pipe);
            finish();
        }
        if (is_at(thin_arrow)) {
            consume_optional_ret_type();
            consume_block_expr();
        }
        else {
            consume_expr();
        }
        finish();
        return lambda_expr;
    }

    std::optional<Syntax_Kind> consume_path_expr(Restrictions restrictions)
    {
        using enum Syntax_Kind;
        const std::size_t cp = checkpoint();
        consume_path(Path_Context::expr);
        if (is_at(excl) && (nth(1) == l_paren || nth(1) == l_brack || nth(1) == l_curly)) {
            start_at(cp, macro_call);
            bump();
            consume_token_tree();
            finish();
            return macro_call;
        }
        if (is_at(l_curly) && !restrictions.forbid_record) {
            start_at(cp, record_lit);
            consume_record_fields();
            finish();
            return record_lit;
        }
        start_at(cp, path_expr);
        finish();
        return path_expr;
    }

    void consume_record_fields()
    {
        using enum Syntax_Kind;
        start(record_field_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            if (eat(dot2)) {
                consume_expr();
                break;
            }
            start(record_field);
            consume_outer_attributes();
            if ((is_at(ident) || is_at(int_number)) && nth(1) == colon) {
                if (is_at(ident)) {
                    consume_name_ref();
                }
                else {
                    bump();
                }
                bump();
                consume_expr();
            }
            else if (is_at(ident)) {
                // shorthand, as in `Point { x, y }`
                start(path_expr);
                start(path);
                start(path_segment);
                consume_name_ref();
                finish();
                finish();
                finish();
            }
            else {
                report_error(u8"Expected a field."sv);
            }
            finish();
            if (!eat(comma) && !is_at(r_curly)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a field."sv);
                }
                else {
                    report_error(u8"Expected ',' or '}'."sv);
                    break;
                }
            }
        }
        expect(r_curly);
        finish();
    }

    // PATHS =======================================================================================

    void consume_path(Path_Context context)
    {
        using enum Syntax_Kind;
        const std::size_t cp = checkpoint();
        start(path);
        consume_path_segment(context);
        finish();
        while (is_at(colon2) && nth(1) != l_curly && nth(1) != star && nth(1) != l_angle) {
            start_at(cp, path);
            bump();
            consume_path_segment(context);
            finish();
        }
    }

    void consume_path_segment(Path_Context context)
    {
        using enum Syntax_Kind;
        start(path_segment);
        eat(colon2);
        if (is_at(l_angle) && context != Path_Context::use) {
            // qualified path, as in `<T as Trait>`
            bump();
            consume_type();
            if (eat(as_kw)) {
                consume_path(Path_Context::type);
            }
            expect(r_angle);
        }
        else if (is_at(self_kw) || is_at(super_kw) || is_at(crate_kw) || is_at(self_type_kw)) {
            bump();
        }
        else {
            consume_name_ref();
        }
        if (context == Path_Context::type) {
            if (is_at(l_angle) || (is_at(colon2) && nth(1) == l_angle)) {
                eat(colon2);
                consume_type_args();
            }
            else if (is_at(l_paren)) {
                // Fn(A, B) -> C
                start(param_list);
                bump();
                while (!at_eof() && !is_at(r_paren)) {
                    const std::size_t initial_pos = m_pos;
                    start(param);
                    consume_type();
                    finish();
                    if (!eat(comma) && !is_at(r_paren) && m_pos == initial_pos) {
                        error_and_bump(u8"Expected a type."sv);
                    }
                    if (m_pos == initial_pos) {
                        break;
                    }
                }
                expect(r_paren);
                finish();
                consume_optional_ret_type();
            }
        }
        else if (context == Path_Context::expr && is_at(colon2) && nth(1) == l_angle) {
            bump();
            consume_type_args();
        }
        finish();
    }

    void consume_type_args()
    {
        using enum Syntax_Kind;
        start(type_arg_list);
        expect(l_angle);
        while (!at_eof() && !is_at(r_angle)) {
            const std::size_t initial_pos = m_pos;
            if (is_at(lifetime)) {
                start(lifetime_arg);
                bump();
                finish();
            }
            else if (is_at(ident) && nth(1) == eq) {
                start(type_arg);
                consume_name_ref();
                bump();
                consume_type();
                finish();
            }
            else if (is_at(l_curly) || is_literal_token(current()) || is_at(minus)) {
                start(type_arg);
                expect_unary_expr({});
                finish();
            }
            else {
                start(type_arg);
                consume_type();
                finish();
            }
            if (!eat(comma) && !is_at(r_angle)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a generic argument."sv);
                }
                else {
                    report_error(u8"Expected ',' or '>'."sv);
                    break;
                }
            }
        }
        expect(r_angle);
        finish();
    }

    // TYPES =======================================================================================

    void consume_type()
    {
        using enum Syntax_Kind;
        switch (current()) {
        case l_paren: {
            start(tuple_type);
            bump();
            while (!at_eof() && !is_at(r_paren)) {
                const std::size_t initial_pos = m_pos;
                consume_type();
                if (!eat(comma) && !is_at(r_paren)) {
                    if (m_pos == initial_pos) {
                        error_and_bump(u8"Expected a type."sv);
                    }
                    else {
                        report_error(u8"Expected ',' or ')'."sv);
                        break;
                    }
                }
            }
            expect(r_paren);
            finish();
            return;
        }
        case excl: {
            start(never_type);
            bump();
            finish();
            return;
        }
        case star: {
            start(pointer_type);
            bump();
            if (!eat(const_kw)) {
                expect(mut_kw);
            }
            consume_type();
            finish();
            return;
        }
        case l_brack: {
            const std::size_t cp = checkpoint();
            start(slice_type);
            bump();
            consume_type();
            if (eat(semicolon)) {
                m_out[cp].kind = array_type;
                consume_expr();
            }
            expect(r_brack);
            finish();
            return;
        }
        case amp:
        case amp2: {
            start(reference_type);
            bump();
            eat(lifetime);
            eat(mut_kw);
            consume_type();
            finish();
            return;
        }
        case underscore: {
            start(placeholder_type);
            bump();
            finish();
            return;
        }
        case impl_kw:
        case dyn_kw: {
            start(is_at(impl_kw) ? impl_trait_type : dyn_trait_type);
            bump();
            consume_type_bounds();
            finish();
            return;
        }
        case fn_kw:
        case unsafe_kw:
        case extern_kw: {
            start(fn_pointer_type);
            consume_item_qualifiers();
            expect(fn_kw);
            if (is_at(l_paren)) {
                start(param_list);
                bump();
                while (!at_eof() && !is_at(r_paren)) {
                    const std::size_t initial_pos = m_pos;
                    start(param);
                    if ((is_at(ident) || is_at(underscore)) && nth(1) == colon) {
                        bump();
                        bump();
                    }
                    consume_type();
                    finish();
                    if (!eat(comma) && !is_at(r_paren)) {
                        if (m_pos == initial_pos) {
                            error_and_bump(u8"Expected a type."sv);
                        }
                        else {
                            break;
                        }
                    }
                }
                expect(r_paren);
                finish();
            }
            consume_optional_ret_type();
            finish();
            return;
        }
        default: break;
        }
        if (is_path_start(current()) || is_at(l_angle)) {
            start(path_type);
            consume_path(Path_Context::type);
            finish();
            return;
        }
        error_and_bump(u8"Expected a type."sv);
    }

    // PATTERNS ====================================================================================

    /// @brief Parses a pattern, including alternatives such as `A | B`
    /// unless `allow_alternatives` is `false`, which is needed for closure parameters.
    void consume_pattern(bool allow_alternatives = true)
    {
        consume_single_pattern();
        while (allow_alternatives && is_at(Syntax_Kind::pipe)) {
            bump();
            consume_single_pattern();
        }
    }

    void consume_single_pattern()
    {
        using enum Syntax_Kind;
        const Syntax_Kind k = current();
        if (k == underscore) {
            start(placeholder_pat);
            bump();
            finish();
            return;
        }
        if (k == dot2) {
            start(dot_dot_pat);
            bump();
            finish();
            return;
        }
        if (k == amp || k == amp2) {
            start(ref_pat);
            bump();
            eat(mut_kw);
            consume_single_pattern();
            finish();
            return;
        }
        if (k == l_paren || k == l_brack) {
            const Syntax_Kind close = k == l_paren ? r_paren : r_brack;
            start(k == l_paren ? tuple_pat : slice_pat);
            bump();
            consume_pattern_list(close);
            expect(close);
            finish();
            return;
        }
        if (is_literal_token(k) || (k == minus && (nth(1) == int_number || nth(1) == float_number))) {
            start(literal_pat);
            consume_literal_with_sign();
            if (is_at(dot2eq) || is_at(dot3) || is_at(dot2)) {
                bump();
                if (is_literal_token(current()) || is_at(minus)) {
                    consume_literal_with_sign();
                }
            }
            finish();
            return;
        }
        const bool is_binding = (k == ref_kw || k == mut_kw)
            || (k == ident && nth(1) != colon2 && nth(1) != l_paren && nth(1) != l_curly
                && nth(1) != excl);
        if (is_binding) {
            start(bind_pat);
            eat(ref_kw);
            eat(mut_kw);
            consume_name();
            if (eat(at)) {
                consume_single_pattern();
            }
            finish();
            return;
        }
        if (is_path_start(k) || k == l_angle) {
            const std::size_t cp = checkpoint();
            consume_path(Path_Context::expr);
            if (is_at(l_paren)) {
                start_at(cp, tuple_struct_pat);
                bump();
                consume_pattern_list(r_paren);
                expect(r_paren);
                finish();
            }
            else if (is_at(l_curly)) {
                start_at(cp, record_pat);
                consume_record_field_patterns();
                finish();
            }
            else if (is_at(excl) && (nth(1) == l_paren || nth(1) == l_brack || nth(1) == l_curly)) {
                start_at(cp, macro_call);
                bump();
                consume_token_tree();
                finish();
            }
            else {
                start_at(cp, path_pat);
                finish();
            }
            return;
        }
        error_and_bump(u8"Expected a pattern."sv);
    }

    void consume_literal_with_sign()
    {
        start(Syntax_Kind::literal);
        eat(Syntax_Kind::minus);
        if (is_literal_token(current())) {
            bump();
        }
        else {
            report_error(u8"Expected a literal."sv);
        }
        finish();
    }

    void consume_pattern_list(Syntax_Kind close)
    {
        using enum Syntax_Kind;
        while (!at_eof() && !is_at(close)) {
            const std::size_t initial_pos = m_pos;
            consume_pattern();
            if (!eat(comma) && !is_at(close)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a pattern."sv);
                }
                else {
                    report_error(u8"Expected ','."sv);
                    break;
                }
            }
        }
    }

    void consume_record_field_patterns()
    {
        using enum Syntax_Kind;
        start(record_field_pat_list);
        bump();
        while (!at_eof() && !is_at(r_curly)) {
            const std::size_t initial_pos = m_pos;
            if ((is_at(ident) || is_at(int_number)) && nth(1) == colon) {
                start(record_field_pat);
                if (is_at(ident)) {
                    consume_name_ref();
                }
                else {
                    bump();
                }
                bump();
                consume_pattern();
                finish();
            }
            else if (is_at(dot2)) {
                start(dot_dot_pat);
                bump();
                finish();
            }
            else {
                consume_single_pattern();
            }
            if (!eat(comma) && !is_at(r_curly)) {
                if (m_pos == initial_pos) {
                    error_and_bump(u8"Expected a field pattern."sv);
                }
                else {
                    report_error(u8"Expected ',' or '}'."sv);
                    break;
                }
            }
        }
        expect(r_curly);
        finish();
    }
};

} // namespace

bool parse(
    std::pmr::vector<Parse_Instruction>& out,
    std::u8string_view source,
    std::span<const Token> tokens,
    Parse_Entry entry,
    Parse_Error_Consumer on_error
)
{
    return Parser { out, source, tokens, on_error }(entry);
}

} // namespace shade
