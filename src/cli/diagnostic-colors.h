#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "depth.h"

enum class PrintStyle : uint8_t
{
    // For expected values.
    Expected,

    // Option names and other tool vocabulary.
    Keyword,

    // The offending value (i.e a bad depth or marker).
    BadValue
};

// Wrap input in the style's colors, converted at the given depth.
// std::nullopt gives back the input unchanged.
std::string styled_string(std::string input,
                          PrintStyle style,
                          std::optional<Depth> depth);
