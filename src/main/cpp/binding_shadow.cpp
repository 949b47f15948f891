#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "shade/binding_shadow.hpp"

namespace shade {

std::uint64_t binding_identity(std::u8string_view name, Shadow_Generation generation) noexcept
{
    // FNV-1a
    constexpr std::uint64_t offset_basis = 0xcbf29ce484222325;
    constexpr std::uint64_t prime = 0x100000001b3;

    std::uint64_t result = offset_basis;
    const auto feed = [&](std::uint8_t byte) {
        result ^= byte;
        result *= prime;
    };
    for (const char8_t c : name) {
        feed(std::uint8_t(c));
    }
    for (std::size_t i = 0; i < sizeof(generation); ++i) {
        feed(std::uint8_t(generation >> (i * 8)));
    }
    return result;
}

Shadow_Generation Binding_Shadow_Tracker::advance(std::u8string_view name)
{
    const auto it = m_generations.find(name);
    if (it != m_generations.end()) {
        return ++it->second;
    }
    std::pmr::u8string key { name, m_generations.get_allocator().resource() };
    m_generations.emplace(std::move(key), 1);
    return 1;
}

std::optional<Shadow_Generation> Binding_Shadow_Tracker::current(std::u8string_view name) const
{
    const auto it = m_generations.find(name);
    if (it == m_generations.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace shade
