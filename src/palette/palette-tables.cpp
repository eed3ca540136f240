#include "palette-tables.h"

// Color choices:
//
// The tables are indexed by the position of the code in COLOR_CODES.
//
// - Tty only has the base 8 colors, so 8-f repeat 0-7
// - Low uses the bright 90-97 range for 8-f
// - Medium picks the closest xterm 256 entry to each High color
// - High follows the classic 16 color palette (55/aa/ff steps)

constexpr std::array<uint8_t, NUM_COLOR_CODES> COLORS_TTY {
    30, 34, 32, 36, 31, 35, 33, 37,
    30, 34, 32, 34, 31, 35, 33, 37
};

constexpr std::array<uint8_t, NUM_COLOR_CODES> COLORS_LOW {
    30, 34, 32, 36, 31, 35, 33, 37,
    90, 94, 92, 96, 91, 95, 93, 97
};

constexpr std::array<uint8_t, NUM_COLOR_CODES> COLORS_MEDIUM {
    0, 19, 34, 37, 124, 127, 214, 248,
    240, 147, 83, 87, 203, 207, 227, 15
};

constexpr std::array<RGB, NUM_COLOR_CODES> COLORS_HIGH {{
    {0, 0, 0},
    {0, 0, 170},
    {0, 170, 0},
    {0, 170, 170},
    {170, 0, 0},
    {170, 0, 170},
    {255, 170, 0},
    {170, 170, 170},
    {85, 85, 85},
    {85, 85, 255},
    {85, 255, 85},
    {85, 255, 255},
    {255, 85, 85},
    {255, 85, 255},
    {255, 255, 85},
    {255, 255, 255}
}};

// Indexed by the position of the code in ATTRIBUTE_CODES.
constexpr std::array<uint8_t, ATTRIBUTE_CODES.size()> ATTRIBUTE_PARAMETERS = []
{
    std::array<uint8_t, ATTRIBUTE_CODES.size()> a{};

    a[ATTRIBUTE_CODES.find('h')] = 8; // hidden
    a[ATTRIBUTE_CODES.find('i')] = 7; // inverse
    a[ATTRIBUTE_CODES.find('j')] = 2; // dim
    a[ATTRIBUTE_CODES.find('k')] = 5; // blink
    a[ATTRIBUTE_CODES.find('l')] = 1; // bold
    a[ATTRIBUTE_CODES.find('m')] = 9; // strikethrough
    a[ATTRIBUTE_CODES.find('n')] = 4; // underline
    a[ATTRIBUTE_CODES.find('o')] = 3; // italic

    return a;
}();

struct ResetEntry
{
    std::array<uint8_t, 2> parameters;
    size_t count;
};

// Indexed by the position of the code in RESET_CODES.
constexpr std::array<ResetEntry, NUM_RESET_CODES> RESET_PARAMETERS {{
    {{0, 0}, 1},   // R, full reset
    {{39, 0}, 1},  // rf, foreground
    {{49, 0}, 1},  // rb, background
    {{39, 49}, 2}, // rc, both colors
    {{28, 0}, 1},  // rh
    {{27, 0}, 1},  // ri
    {{22, 0}, 1},  // rj
    {{25, 0}, 1},  // rk
    {{22, 0}, 1},  // rl, shares 22 with dim
    {{29, 0}, 1},  // rm
    {{24, 0}, 1},  // rn
    {{23, 0}, 1}   // ro
}};

std::optional<ColorValue> color_lookup(Depth depth, char code)
{
    size_t index = COLOR_CODES.find(code);

    if (index == std::string_view::npos)
    {
        return std::nullopt;
    }

    switch (depth)
    {
        case Depth::Tty:
        {
            return ColorValue{COLORS_TTY[index]};
        }
        case Depth::Low:
        {
            return ColorValue{COLORS_LOW[index]};
        }
        case Depth::Medium:
        {
            return ColorValue{COLORS_MEDIUM[index]};
        }
        case Depth::High:
        {
            return ColorValue{COLORS_HIGH[index]};
        }
    }

    return std::nullopt;
}

std::optional<uint8_t> attribute_lookup(char code)
{
    size_t index = ATTRIBUTE_CODES.find(code);

    if (index == std::string_view::npos)
    {
        return std::nullopt;
    }

    return ATTRIBUTE_PARAMETERS[index];
}

std::optional<std::span<const uint8_t>> reset_lookup(std::string_view code)
{
    for (size_t i = 0; i < RESET_CODES.size(); i++)
    {
        if (RESET_CODES[i] != code)
        {
            continue;
        }

        const ResetEntry & entry = RESET_PARAMETERS[i];

        return std::span<const uint8_t>(entry.parameters.data(), entry.count);
    }

    return std::nullopt;
}
