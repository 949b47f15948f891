#include <cstddef>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"
#include "shade/util/chars.hpp"
#include "shade/util/unicode.hpp"

#include "shade/diagnostic.hpp"
#include "shade/fwd.hpp"
#include "shade/lex.hpp"
#include "shade/syntax_kind.hpp"

using namespace std::string_view_literals;

namespace shade {
namespace {

struct Punctuation {
    std::u8string_view text;
    Syntax_Kind kind;
};

// Longer punctuation has to come first so that the longest match wins.
constexpr Punctuation punctuation_table[] {
    { u8"...", Syntax_Kind::dot3 },    { u8"..=", Syntax_Kind::dot2eq },
    { u8"..", Syntax_Kind::dot2 },     { u8"::", Syntax_Kind::colon2 },
    { u8"->", Syntax_Kind::thin_arrow }, { u8"=>", Syntax_Kind::fat_arrow },
    { u8"==", Syntax_Kind::eq2 },      { u8"!=", Syntax_Kind::neq },
    { u8"<=", Syntax_Kind::lteq },     { u8">=", Syntax_Kind::gteq },
    { u8"+=", Syntax_Kind::pluseq },   { u8"-=", Syntax_Kind::minuseq },
    { u8"|=", Syntax_Kind::pipeeq },   { u8"&=", Syntax_Kind::ampeq },
    { u8"^=", Syntax_Kind::careteq },  { u8"/=", Syntax_Kind::slasheq },
    { u8"*=", Syntax_Kind::stareq },   { u8"%=", Syntax_Kind::percenteq },
    { u8"&&", Syntax_Kind::amp2 },     { u8"||", Syntax_Kind::pipe2 },
    { u8";", Syntax_Kind::semicolon }, { u8",", Syntax_Kind::comma },
    { u8"(", Syntax_Kind::l_paren },   { u8")", Syntax_Kind::r_paren },
    { u8"{", Syntax_Kind::l_curly },   { u8"}", Syntax_Kind::r_curly },
    { u8"[", Syntax_Kind::l_brack },   { u8"]", Syntax_Kind::r_brack },
    { u8"<", Syntax_Kind::l_angle },   { u8">", Syntax_Kind::r_angle },
    { u8"@", Syntax_Kind::at },        { u8"#", Syntax_Kind::pound },
    { u8"~", Syntax_Kind::tilde },     { u8"?", Syntax_Kind::question },
    { u8"$", Syntax_Kind::dollar },    { u8"&", Syntax_Kind::amp },
    { u8"|", Syntax_Kind::pipe },      { u8"+", Syntax_Kind::plus },
    { u8"*", Syntax_Kind::star },      { u8"/", Syntax_Kind::slash },
    { u8"^", Syntax_Kind::caret },     { u8"%", Syntax_Kind::percent },
    { u8".", Syntax_Kind::dot },       { u8":", Syntax_Kind::colon },
    { u8"=", Syntax_Kind::eq },        { u8"!", Syntax_Kind::excl },
    { u8"-", Syntax_Kind::minus },
};

[[nodiscard]]
std::size_t match_identifier(std::u8string_view str)
{
    if (str.empty() || !is_identifier_start(str[0])) {
        return 0;
    }
    std::size_t length = 1;
    while (length < str.length() && is_identifier_continue(str[length])) {
        ++length;
    }
    return length;
}

struct [[nodiscard]] Lexer {
private:
    std::pmr::vector<Token>& m_out;
    const std::u8string_view m_source;
    const Lex_Error_Consumer m_on_error;

    std::size_t m_pos = 0;
    bool m_success = true;

public:
    [[nodiscard]]
    Lexer(std::pmr::vector<Token>& out, std::u8string_view source, Lex_Error_Consumer on_error)
        : m_out { out }
        , m_source { source }
        , m_on_error { on_error }
    {
    }

    bool operator()()
    {
        while (!eof()) {
            consume_token();
        }
        return m_success;
    }

private:
    void emit(const Syntax_Kind kind, const std::size_t length)
    {
        SHADE_DEBUG_ASSERT(is_token(kind));
        SHADE_DEBUG_ASSERT(length != 0);
        SHADE_DEBUG_ASSERT(m_pos + length <= m_source.length());
        m_out.push_back({ kind, Text_Range { m_pos, length } });
        m_pos += length;
    }

    void error(Text_Range location, std::u8string_view message)
    {
        if (m_on_error) {
            m_on_error(diagnostic::lex, location, message);
        }
        m_success = false;
    }

    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        SHADE_DEBUG_ASSERT(m_pos <= m_source.size());
        return m_source.substr(m_pos);
    }

    [[nodiscard]]
    char8_t peek(std::size_t offset = 0) const
    {
        return m_pos + offset < m_source.length() ? m_source[m_pos + offset] : u8'\0';
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos == m_source.length();
    }

    void consume_token()
    {
        const bool matched = expect_whitespace() //
            || expect_comment() //
            || expect_raw_string() //
            || expect_prefixed_literal() //
            || expect_identifier() //
            || expect_number() //
            || expect_char_or_lifetime() //
            || expect_string(Syntax_Kind::string, 0) //
            || expect_punctuation();
        if (!matched) {
            consume_error();
        }
    }

    [[nodiscard]]
    bool expect_whitespace()
    {
        const std::u8string_view remainder = peek_all();
        std::size_t length = 0;
        while (length < remainder.length() && is_rust_whitespace(remainder[length])) {
            ++length;
        }
        if (length == 0) {
            return false;
        }
        emit(Syntax_Kind::whitespace, length);
        return true;
    }

    [[nodiscard]]
    bool expect_comment()
    {
        const std::u8string_view remainder = peek_all();
        if (remainder.starts_with(u8"//"sv)) {
            const std::size_t length = std::min(remainder.find(u8'\n'), remainder.length());
            emit(Syntax_Kind::comment, length);
            return true;
        }
        if (!remainder.starts_with(u8"/*"sv)) {
            return false;
        }
        std::size_t depth = 1;
        std::size_t length = 2;
        while (length < remainder.length() && depth != 0) {
            const std::u8string_view rest = remainder.substr(length);
            if (rest.starts_with(u8"/*"sv)) {
                ++depth;
                length += 2;
            }
            else if (rest.starts_with(u8"*/"sv)) {
                --depth;
                length += 2;
            }
            else {
                ++length;
            }
        }
        if (depth != 0) {
            error({ m_pos, 2 }, u8"Unterminated block comment.");
        }
        emit(Syntax_Kind::comment, length);
        return true;
    }

    /// @brief Matches `r"..."`, `r#"..."#`, `br"..."`, and so forth.
    [[nodiscard]]
    bool expect_raw_string()
    {
        std::size_t prefix = 0;
        if (peek() == u8'b' && peek(1) == u8'r') {
            prefix = 2;
        }
        else if (peek() == u8'r') {
            prefix = 1;
        }
        else {
            return false;
        }
        std::size_t hashes = 0;
        while (peek(prefix + hashes) == u8'#') {
            ++hashes;
        }
        if (peek(prefix + hashes) != u8'"') {
            return false;
        }
        const Syntax_Kind kind = prefix == 2 ? Syntax_Kind::raw_byte_string : Syntax_Kind::raw_string;

        const std::u8string_view remainder = peek_all();
        std::size_t length = prefix + hashes + 1;
        while (length < remainder.length()) {
            if (remainder[length] == u8'"') {
                std::size_t closing = 0;
                while (closing < hashes && length + 1 + closing < remainder.length()
                       && remainder[length + 1 + closing] == u8'#') {
                    ++closing;
                }
                if (closing == hashes) {
                    emit(kind, length + 1 + hashes);
                    return true;
                }
            }
            ++length;
        }
        error({ m_pos, prefix + hashes + 1 }, u8"Unterminated raw string literal.");
        emit(kind, remainder.length());
        return true;
    }

    /// @brief Matches `b'x'` and `b"..."`.
    [[nodiscard]]
    bool expect_prefixed_literal()
    {
        if (peek() != u8'b') {
            return false;
        }
        if (peek(1) == u8'\'') {
            return expect_quoted(Syntax_Kind::byte, u8'\'', 1);
        }
        if (peek(1) == u8'"') {
            return expect_string(Syntax_Kind::byte_string, 1);
        }
        return false;
    }

    [[nodiscard]]
    bool expect_identifier()
    {
        const std::u8string_view remainder = peek_all();
        if (remainder.starts_with(u8"r#"sv)) {
            if (const std::size_t length = match_identifier(remainder.substr(2))) {
                emit(Syntax_Kind::ident, length + 2);
                return true;
            }
        }
        const std::size_t length = match_identifier(remainder);
        if (length == 0) {
            return false;
        }
        const std::u8string_view text = remainder.substr(0, length);
        if (text == u8"_"sv) {
            emit(Syntax_Kind::underscore, 1);
            return true;
        }
        emit(keyword_by_text(text).value_or(Syntax_Kind::ident), length);
        return true;
    }

    [[nodiscard]]
    bool expect_number()
    {
        const std::u8string_view remainder = peek_all();
        if (remainder.empty() || !is_ascii_digit(remainder[0])) {
            return false;
        }
        std::size_t length = 0;
        bool is_float = false;

        const auto skip_digits = [&](bool hex) {
            while (length < remainder.length()
                   && (remainder[length] == u8'_'
                       || (hex ? is_ascii_hex_digit(remainder[length])
                               : is_ascii_digit(remainder[length])))) {
                ++length;
            }
        };

        if (remainder.starts_with(u8"0x"sv) || remainder.starts_with(u8"0o"sv)
            || remainder.starts_with(u8"0b"sv)) {
            length = 2;
            skip_digits(remainder[1] == u8'x');
        }
        else {
            skip_digits(false);
            const char8_t after_dot = length + 1 < remainder.length() ? remainder[length + 1] : 0;
            if (length < remainder.length() && remainder[length] == u8'.' && after_dot != u8'.'
                && !is_identifier_start(after_dot)) {
                is_float = true;
                ++length;
                skip_digits(false);
            }
            if (length < remainder.length()
                && (remainder[length] == u8'e' || remainder[length] == u8'E')) {
                std::size_t exponent = length + 1;
                if (exponent < remainder.length()
                    && (remainder[exponent] == u8'+' || remainder[exponent] == u8'-')) {
                    ++exponent;
                }
                if (exponent < remainder.length() && is_ascii_digit(remainder[exponent])) {
                    is_float = true;
                    length = exponent;
                    skip_digits(false);
                }
            }
        }
        const std::size_t suffix = match_identifier(remainder.substr(length));
        if (suffix != 0 && remainder[length] == u8'f') {
            is_float = true;
        }
        length += suffix;
        emit(is_float ? Syntax_Kind::float_number : Syntax_Kind::int_number, length);
        return true;
    }

    [[nodiscard]]
    bool expect_char_or_lifetime()
    {
        if (peek() != u8'\'') {
            return false;
        }
        if (is_identifier_start(peek(1)) && peek(2) != u8'\'') {
            const std::size_t length = match_identifier(peek_all().substr(1));
            // Multi-byte characters such as 'ä' are not lifetimes.
            const bool is_char = m_pos + 1 + length < m_source.length()
                && m_source[m_pos + 1 + length] == u8'\'';
            if (!is_char) {
                emit(Syntax_Kind::lifetime, length + 1);
                return true;
            }
        }
        return expect_quoted(Syntax_Kind::char_, u8'\'', 0);
    }

    [[nodiscard]]
    bool expect_string(Syntax_Kind kind, std::size_t prefix)
    {
        if (peek(prefix) != u8'"') {
            return false;
        }
        return expect_quoted(kind, u8'"', prefix);
    }

    /// @brief Matches a literal which is delimited by `quote` and which can contain escape
    /// sequences, optionally preceded by a prefix of `prefix` bytes.
    [[nodiscard]]
    bool expect_quoted(Syntax_Kind kind, char8_t quote, std::size_t prefix)
    {
        const std::u8string_view remainder = peek_all();
        SHADE_DEBUG_ASSERT(remainder.length() > prefix && remainder[prefix] == quote);
        std::size_t length = prefix + 1;
        while (length < remainder.length()) {
            const char8_t c = remainder[length];
            if (c == u8'\\') {
                length = std::min(length + 2, remainder.length());
                continue;
            }
            if (c == quote) {
                emit(kind, length + 1);
                return true;
            }
            // Character literals cannot span multiple lines,
            // so an unterminated one should not swallow the rest of the file.
            if (quote == u8'\'' && c == u8'\n') {
                break;
            }
            ++length;
        }
        error(
            { m_pos, prefix + 1 },
            quote == u8'"' ? u8"Unterminated string literal."sv
                           : u8"Unterminated character literal."sv
        );
        emit(kind, length);
        return true;
    }

    [[nodiscard]]
    bool expect_punctuation()
    {
        const std::u8string_view remainder = peek_all();
        for (const auto& [text, kind] : punctuation_table) {
            if (remainder.starts_with(text)) {
                emit(kind, text.length());
                return true;
            }
        }
        return false;
    }

    void consume_error()
    {
        const auto [_, length] = utf8::decode_and_length_or_replacement(peek_all());
        const auto error_length = std::size_t(length);
        error({ m_pos, error_length }, u8"Unexpected character.");
        emit(Syntax_Kind::error_token, error_length);
    }
};

} // namespace

bool lex(std::pmr::vector<Token>& out, std::u8string_view source, Lex_Error_Consumer on_error)
{
    return Lexer { out, source, on_error }();
}

} // namespace shade
