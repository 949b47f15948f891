#ifndef SHADE_COLLECTING_LOGGER_HPP
#define SHADE_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "shade/util/severity.hpp"

#include "shade/diagnostic.hpp"
#include "shade/services.hpp"

namespace shade {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::u8string id;
    Text_Range location;
    std::pmr::u8string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* const memory)
        : severity { d.severity }
        , id { d.id, memory }
        , location { d.location }
        , message { d.message, memory }
    {
    }
};

struct Collecting_Logger final : Logger {
    std::pmr::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(std::pmr::memory_resource* const memory)
        : Logger { Severity::min }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        std::pmr::memory_resource* const memory = diagnostics.get_allocator().resource();
        diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }
};

} // namespace shade

#endif
