#ifndef SHADE_SEVERITY_HPP
#define SHADE_SEVERITY_HPP

#include <compare>
#include <optional>
#include <string_view>
#include <utility>

#include "shade/fwd.hpp"

namespace shade {

enum struct Severity : Default_Underlying {
    min = 0,
    trace = 10,
    debug = 20,
    info = 30,
    soft_warning = 40,
    warning = 50,
    error = 70,
    fatal = 90,
    max = 90,
    none = 100,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case min: return u8"MIN";
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

/// @brief Parses the lowercase name of a severity, such as `"warning"`.
[[nodiscard]]
constexpr std::optional<Severity> severity_by_name(std::u8string_view name)
{
    using enum Severity;
    static constexpr std::pair<std::u8string_view, Severity> names[] {
        { u8"min", min },         { u8"trace", trace },
        { u8"debug", debug },     { u8"info", info },
        { u8"soft_warning", soft_warning },
        { u8"warning", warning }, { u8"error", error },
        { u8"fatal", fatal },     { u8"none", none },
    };
    for (const auto& [n, s] : names) {
        if (n == name) {
            return s;
        }
    }
    return std::nullopt;
}

} // namespace shade

#endif
