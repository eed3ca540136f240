#include "diagnostic-colors.h"

#include "converter.h"

// Color choices:
//
// Written as markup so they follow the user's depth like everything else.
//
// - Expected values should be green
// - Keywords should be bold versions of standard text
// - Bad values should be bright red

constexpr std::string_view PALETTE_EXPECTED = "&2";
constexpr std::string_view PALETTE_KEYWORD = "&l";
constexpr std::string_view PALETTE_BAD_VALUE = "&c";

std::string apply_palette(std::string input,
                          std::string_view palette,
                          Depth depth)
{
    ConverterOptions options;
    options.depth = depth;
    options.auto_reset = true;

    Converter converter(options);

    // User text may contain '&', keep it literal.
    std::string escaped = converter.escape(std::move(input));

    std::string markup;
    markup.reserve(palette.size() + escaped.size());

    markup.append(palette);
    markup.append(escaped);

    return converter.convert(std::move(markup));
}

std::string styled_string(std::string input,
                          PrintStyle style,
                          std::optional<Depth> depth)
{
    if (!depth)
    {
        return input;
    }

    switch (style)
    {
        case PrintStyle::Expected:
        {
            return apply_palette(std::move(input), PALETTE_EXPECTED, *depth);
        }
        // Bold but not colored for context clues
        case PrintStyle::Keyword:
        {
            return apply_palette(std::move(input), PALETTE_KEYWORD, *depth);
        }
        // Bright red to show error
        case PrintStyle::BadValue:
        {
            return apply_palette(std::move(input), PALETTE_BAD_VALUE, *depth);
        }
    }

    return input;
}
