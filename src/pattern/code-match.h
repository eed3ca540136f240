#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <boost/regex.hpp>

#include "palette-tables.h"

template<typename T>
inline constexpr bool always_false{false};

// Attribute letter, one of ATTRIBUTE_CODES.
struct FormatterCode
{
    char code;
};

// "R" or "r" followed by f, b, c or an attribute letter.
struct ResetCode
{
    std::string code;
};

// Palette letter, one of COLOR_CODES.
struct ColorCode
{
    bool background;
    char code;
};

// Explicit literal, already expanded to bytes.
struct HexCode
{
    bool background;
    RGB rgb;
};

using CodeMatch = std::variant<FormatterCode, ResetCode, ColorCode, HexCode>;

// Parse 3 or 6 hex digits. Three digit values repeat each nibble (f -> ff).
std::optional<RGB> parse_hex_color(std::string_view digits);

// Turn one match of a CodePattern regex into a CodeMatch.
//
// Throws std::logic_error if the match did not come from a CodePattern,
// a correct pattern always fills exactly one of the code groups.
CodeMatch classify_match(const boost::smatch & match);
