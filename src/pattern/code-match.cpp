#include "code-match.h"

#include <stdexcept>

inline std::optional<uint8_t> hex_nibble(char c)
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<uint8_t>(c - '0');
    }

    if (c >= 'a' && c <= 'f')
    {
        return static_cast<uint8_t>(c - 'a' + 10);
    }

    if (c >= 'A' && c <= 'F')
    {
        return static_cast<uint8_t>(c - 'A' + 10);
    }

    return std::nullopt;
}

std::optional<RGB> parse_hex_color(std::string_view digits)
{
    if (digits.size() != 3 && digits.size() != 6)
    {
        return std::nullopt;
    }

    std::array<uint8_t, 6> nibbles{};

    for (size_t i = 0; i < digits.size(); i++)
    {
        auto nibble = hex_nibble(digits[i]);

        if (!nibble)
        {
            return std::nullopt;
        }

        // #abc is the same as #aabbcc.
        if (digits.size() == 3)
        {
            nibbles[i * 2] = *nibble;
            nibbles[i * 2 + 1] = *nibble;
        }
        else
        {
            nibbles[i] = *nibble;
        }
    }

    RGB rgb;
    rgb.r = static_cast<uint8_t>((nibbles[0] << 4) | nibbles[1]);
    rgb.g = static_cast<uint8_t>((nibbles[2] << 4) | nibbles[3]);
    rgb.b = static_cast<uint8_t>((nibbles[4] << 4) | nibbles[5]);

    return rgb;
}

CodeMatch classify_match(const boost::smatch & match)
{
    const auto & fmt = match["fmt"];

    if (fmt.matched)
    {
        std::string code = fmt.str();

        if (code.size() == 1 && code != "R")
        {
            return FormatterCode{code[0]};
        }

        return ResetCode{std::move(code)};
    }

    bool background = match["bg"].matched;

    const auto & color = match["color"];

    if (color.matched)
    {
        return ColorCode{background, color.str()[0]};
    }

    const auto & hex = match["hex"];

    if (hex.matched)
    {
        std::optional<RGB> rgb = parse_hex_color(hex.str());

        if (!rgb)
        {
            throw std::logic_error("Hex code "
                                   + match.str()
                                   + " passed the pattern but could not be parsed");
        }

        return HexCode{background, *rgb};
    }

    throw std::logic_error("Match "
                           + match.str()
                           + " did not capture any code group");
}
