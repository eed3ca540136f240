#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Color precision tiers. The underlying value is the weight (bits of color),
// so the built in comparison operators give the total order.
enum class Depth : uint8_t
{
    // 3-bit color, bright codes fall back to the base 8.
    Tty = 3,

    // 4-bit color.
    Low = 4,

    // 8-bit (256) color.
    Medium = 8,

    // 24-bit color (true color).
    High = 24
};

constexpr uint8_t depth_weight(Depth depth)
{
    return static_cast<uint8_t>(depth);
}

std::optional<Depth> depth_from_weight(uint32_t weight);

// Accepts a weight ("3", "24") or a name ("tty", "High"), case insensitive.
std::optional<Depth> depth_from_string(std::string_view text);

std::string depth_to_string(Depth depth);
