#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace parcel {

/// Opaque handle of one record in an entity store.
struct Entity {
    std::uint32_t index = 0;
    std::uint32_t generation = 0;

    [[nodiscard]] constexpr auto to_bits() const noexcept -> std::uint64_t {
        return (static_cast<std::uint64_t>(generation) << 32U) | index;
    }

    [[nodiscard]] static constexpr auto from_bits(std::uint64_t bits) noexcept -> Entity {
        return Entity{.index = static_cast<std::uint32_t>(bits & 0xFFFFFFFFU),
                      .generation = static_cast<std::uint32_t>(bits >> 32U)};
    }

    /// "<index>v<generation>", e.g. "3v0".
    [[nodiscard]] auto to_string() const -> std::string {
        return std::to_string(index) + "v" + std::to_string(generation);
    }

    auto operator<=>(const Entity&) const = default;
};

}  // namespace parcel

template <>
struct std::hash<parcel::Entity> {
    auto operator()(const parcel::Entity& entity) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(entity.to_bits());
    }
};
