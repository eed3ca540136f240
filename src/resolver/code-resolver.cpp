#include "code-resolver.h"

#include <stdexcept>
#include <type_traits>

constexpr std::string_view CSI = "\x1b[";
constexpr char SGR_END = 'm';

namespace CodeResolver
{
    std::string sgr(uint32_t parameter)
    {
        std::string out;
        out.reserve(8);

        out.append(CSI);
        out.append(std::to_string(parameter));
        out.push_back(SGR_END);

        return out;
    }

    std::string palette_256(uint8_t index, bool background)
    {
        std::string out;
        out.reserve(16);

        out.append(CSI);
        out.append(background ? "48;5;" : "38;5;");
        out.append(std::to_string(index));
        out.push_back(SGR_END);

        return out;
    }

    std::string true_color(RGB rgb, bool background)
    {
        std::string out;
        out.reserve(24);

        out.append(CSI);
        out.append(background ? "48;2;" : "38;2;");
        out.append(std::to_string(rgb.r));
        out.push_back(';');
        out.append(std::to_string(rgb.g));
        out.push_back(';');
        out.append(std::to_string(rgb.b));
        out.push_back(SGR_END);

        return out;
    }

    std::string resolve_color(const ColorCode & color, Depth depth)
    {
        std::optional<ColorValue> value = color_lookup(depth, color.code);

        if (!value)
        {
            throw std::logic_error(std::string("Color code ")
                                   + color.code
                                   + " has no entry at depth "
                                   + depth_to_string(depth));
        }

        // Only High stores triples.
        if (depth == Depth::High)
        {
            return true_color(std::get<RGB>(*value), color.background);
        }

        uint8_t parameter = std::get<uint8_t>(*value);

        if (depth == Depth::Medium)
        {
            return palette_256(parameter, color.background);
        }

        // Tty and Low.
        if (color.background)
        {
            return sgr(parameter + BACKGROUND_OFFSET);
        }

        return sgr(parameter);
    }

    std::string resolve(const CodeMatch & match, Depth depth)
    {
        return std::visit([depth](const auto & code) -> std::string
        {
            using T = std::decay_t<decltype(code)>;

            if constexpr (std::is_same_v<T, FormatterCode>)
            {
                std::optional<uint8_t> parameter = attribute_lookup(code.code);

                if (!parameter)
                {
                    throw std::logic_error(std::string("Formatter code ")
                                           + code.code
                                           + " has no table entry");
                }

                return sgr(*parameter);
            }
            else if constexpr (std::is_same_v<T, ResetCode>)
            {
                auto parameters = reset_lookup(code.code);

                if (!parameters)
                {
                    throw std::logic_error("Reset code "
                                           + code.code
                                           + " has no table entry");
                }

                // rc resets both colors with two separate sequences.
                std::string out;
                for (uint8_t parameter : *parameters)
                {
                    out.append(sgr(parameter));
                }

                return out;
            }
            else if constexpr (std::is_same_v<T, ColorCode>)
            {
                return resolve_color(code, depth);
            }
            // Literals skip the palette and ignore depth.
            else if constexpr (std::is_same_v<T, HexCode>)
            {
                return true_color(code.rgb, code.background);
            }
            else
            {
                static_assert(always_false<T>,
                              "resolve() not implemented for this code type");
            }
        }, match);
    }
}
