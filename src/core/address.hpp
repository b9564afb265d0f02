#pragma once

#include <compare>
#include <cstdint>

namespace core {

// Routing triple of a lighting-control packet.
struct Address {
    std::uint16_t net{0};
    std::uint16_t subnet{0};
    std::uint16_t universe{0};

    friend constexpr bool operator==(const Address&, const Address&) noexcept = default;
    friend constexpr auto operator<=>(const Address&, const Address&) noexcept = default;
};

inline constexpr std::uint16_t universes_per_subnet = 16;

// Logical universe u maps to subnet u/16, local universe u%16. The net is
// always 0, so logical universes above 255 alias subnets beyond the 4-bit
// range; callers validate that range at configuration time.
[[nodiscard]] constexpr Address map_universe(std::uint32_t logical) noexcept {
    return Address{0,
                   static_cast<std::uint16_t>(logical / universes_per_subnet),
                   static_cast<std::uint16_t>(logical % universes_per_subnet)};
}

[[nodiscard]] constexpr std::uint32_t logical_universe(const Address& a) noexcept {
    return static_cast<std::uint32_t>(a.subnet) * universes_per_subnet + a.universe;
}

} // namespace core
