#include "depth.h"

#include <cctype>

std::optional<Depth> depth_from_weight(uint32_t weight)
{
    switch (weight)
    {
        case 3:
        {
            return Depth::Tty;
        }
        case 4:
        {
            return Depth::Low;
        }
        case 8:
        {
            return Depth::Medium;
        }
        case 24:
        {
            return Depth::High;
        }
        default:
        {
            return std::nullopt;
        }
    }
}

std::optional<Depth> depth_from_string(std::string_view text)
{
    std::string lowered;
    lowered.reserve(text.size());

    for (char c : text)
    {
        lowered.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "3" || lowered == "tty")
    {
        return Depth::Tty;
    }

    if (lowered == "4" || lowered == "low")
    {
        return Depth::Low;
    }

    if (lowered == "8" || lowered == "medium")
    {
        return Depth::Medium;
    }

    if (lowered == "24" || lowered == "high")
    {
        return Depth::High;
    }

    return std::nullopt;
}

std::string depth_to_string(Depth depth)
{
    switch (depth)
    {
        case Depth::Tty:
        {
            return "tty";
        }
        case Depth::Low:
        {
            return "low";
        }
        case Depth::Medium:
        {
            return "medium";
        }
        case Depth::High:
        {
            return "high";
        }
        default:
        {
            return "";
        }
    }
}
