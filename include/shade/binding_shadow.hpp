#ifndef SHADE_BINDING_SHADOW_HPP
#define SHADE_BINDING_SHADOW_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "shade/fwd.hpp"

namespace shade {

/// @brief The amount of times a local name has been defined so far in the current function.
/// Zero means that the name has not been defined.
using Shadow_Generation = std::uint32_t;

/// @brief Returns a hash of `name` and `generation` which identifies one binding of a local
/// variable and all references to it.
/// The hash is stable across runs and platforms,
/// but has no meaning outside of a single highlighting pass.
[[nodiscard]]
std::uint64_t binding_identity(std::u8string_view name, Shadow_Generation generation) noexcept;

/// @brief Counts how often each local name has been shadowed.
/// Lexical scoping is approximated at the granularity of functions:
/// the tracker is cleared whenever a function definition is entered,
/// not when a block is left.
struct Binding_Shadow_Tracker {
private:
    struct String_Hash {
        using is_transparent = void;

        [[nodiscard]]
        std::size_t operator()(std::u8string_view s) const noexcept
        {
            return std::hash<std::u8string_view> {}(s);
        }
    };

    std::pmr::unordered_map<std::pmr::u8string, Shadow_Generation, String_Hash, std::equal_to<>>
        m_generations;

public:
    [[nodiscard]]
    explicit Binding_Shadow_Tracker(std::pmr::memory_resource* memory)
        : m_generations { memory }
    {
    }

    /// @brief Records a new definition of `name`.
    /// @returns The generation of that definition, which is `1` for the first definition.
    Shadow_Generation advance(std::u8string_view name);

    /// @brief Returns the generation of the most recent definition of `name`,
    /// or `std::nullopt` if `name` has not been defined since the last `clear()`.
    [[nodiscard]]
    std::optional<Shadow_Generation> current(std::u8string_view name) const;

    void clear() noexcept
    {
        m_generations.clear();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_generations.empty();
    }
};

} // namespace shade

#endif
