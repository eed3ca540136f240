#include "depth-inference.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

std::optional<std::string> process_env(const std::string & name)
{
    const char* value = std::getenv(name.c_str());

    if (!value)
    {
        return std::nullopt;
    }

    return std::string(value);
}

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });

    return text;
}

std::optional<Depth> infer_depth(const EnvLookup & lookup)
{
    // NO_COLOR=1 or NO_COLOR=true disables color entirely.
    std::optional<std::string> no_color = lookup("NO_COLOR");

    if (no_color)
    {
        std::string value = to_lower(*no_color);

        if (value == "1" || value == "true")
        {
            return std::nullopt;
        }
    }

    std::optional<std::string> colorterm = lookup("COLORTERM");

    if (colorterm && (*colorterm == "24bit" || *colorterm == "truecolor"))
    {
        return Depth::High;
    }

    std::optional<std::string> term = lookup("TERM");

    // Unknown terminals get the 16 color set.
    if (!term)
    {
        return Depth::Low;
    }

    if (*term == "dumb")
    {
        return std::nullopt;
    }

    if (term->find("24bit") != std::string::npos
        || *term == "terminator"
        || *term == "mosh")
    {
        return Depth::High;
    }

    if (term->find("256") != std::string::npos)
    {
        return Depth::Medium;
    }

    return Depth::Low;
}
