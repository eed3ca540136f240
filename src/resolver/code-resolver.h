#pragma once

#include <cstdint>
#include <string>

#include "code-match.h"
#include "depth.h"

// CodeResolver turns a classified code into the ANSI text that replaces it.
namespace CodeResolver
{
    // Tty and Low place background colors 10 above the foreground ones.
    constexpr uint32_t BACKGROUND_OFFSET = 10;

    // \x1b[{n}m
    std::string sgr(uint32_t parameter);

    // \x1b[38;5;{n}m or \x1b[48;5;{n}m
    std::string palette_256(uint8_t index, bool background);

    // \x1b[38;2;{r};{g};{b}m or \x1b[48;2;{r};{g};{b}m
    std::string true_color(RGB rgb, bool background);

    // Throws std::logic_error if the code has no table entry, which means
    // the grammar and the tables disagree.
    std::string resolve(const CodeMatch & match, Depth depth);
}
