#ifndef SHADE_SERVICES_HPP
#define SHADE_SERVICES_HPP

#include "shade/util/assert.hpp"
#include "shade/util/severity.hpp"

#include "shade/diagnostic.hpp"
#include "shade/fwd.hpp"

namespace shade {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        SHADE_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Forwards to `operator()` if `can_log(severity)` is `true`.
    void log(Severity severity, std::u8string_view id, Text_Range location, std::u8string_view message)
    {
        if (can_log(severity)) {
            (*this)({ .severity = severity, .id = id, .location = location, .message = message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace shade

#endif
