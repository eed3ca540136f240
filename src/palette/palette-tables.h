#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

#include "depth.h"

// Every code the markup grammar can produce. The pattern compiler and the
// tables below must agree on these sets.
constexpr std::string_view COLOR_CODES = "0123456789abcdef";
constexpr std::string_view ATTRIBUTE_CODES = "hijklmno";

constexpr size_t NUM_COLOR_CODES = 16;
constexpr size_t NUM_RESET_CODES = 12;

constexpr std::array<std::string_view, NUM_RESET_CODES> RESET_CODES {
    "R",
    "rf",
    "rb",
    "rc",
    "rh",
    "ri",
    "rj",
    "rk",
    "rl",
    "rm",
    "rn",
    "ro"
};

struct RGB
{
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const RGB & other) const
    {
        return ((r == other.r) && (g == other.g) && (b == other.b));
    }
};

// SGR parameter below High, RGB triple at High.
using ColorValue = std::variant<uint8_t, RGB>;

std::optional<ColorValue> color_lookup(Depth depth, char code);

std::optional<uint8_t> attribute_lookup(char code);

// Reset codes map to one or two parameters, each applied as its own sequence.
std::optional<std::span<const uint8_t>> reset_lookup(std::string_view code);
