#ifndef SHADE_DIAGNOSTIC_HPP
#define SHADE_DIAGNOSTIC_HPP

#include <string_view>

#include "shade/util/severity.hpp"
#include "shade/util/text_range.hpp"

#include "shade/fwd.hpp"

namespace shade {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The range of source text that is responsible for this diagnostic.
    Text_Range location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// LEXING AND PARSING ==============================================================================

/// @brief A token could not be lexed properly,
/// such as an unterminated string literal or block comment.
inline constexpr std::u8string_view lex = u8"lex";

/// @brief The parser encountered an unexpected token and wrapped it in an error node.
inline constexpr std::u8string_view parse = u8"parse";

// HIGHLIGHTING ====================================================================================

/// @brief Summary of a completed highlighting pass.
inline constexpr std::u8string_view highlight_pass = u8"highlight.pass";

/// @brief Embedded source code was highlighted.
inline constexpr std::u8string_view injection_applied = u8"injection.applied";

/// @brief A raw string literal was not an argument of any call with a known signature.
inline constexpr std::u8string_view injection_no_call = u8"injection.no-call";

/// @brief The parameter that a raw string literal is passed to is not a fixture parameter.
inline constexpr std::u8string_view injection_parameter = u8"injection.parameter";

/// @brief The value of a literal could not be decoded.
inline constexpr std::u8string_view injection_undecodable = u8"injection.undecodable";

/// @brief Embedded source code was not highlighted
/// because it is nested too deeply in other embedded source code.
inline constexpr std::u8string_view injection_depth = u8"injection.depth";

// COMMAND-LINE ====================================================================================

/// @brief The input file could not be read.
inline constexpr std::u8string_view io = u8"io";

} // namespace diagnostic

} // namespace shade

#endif
