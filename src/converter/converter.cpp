#include "converter.h"

#include "code-resolver.h"
#include "logger.h"
#include "palette-tables.h"

// Replace every occurrence of from with to, left to right.
std::string replace_all(std::string text,
                        std::string_view from,
                        std::string_view to)
{
    size_t pos = text.find(from);

    if (pos == std::string::npos)
    {
        return text;
    }

    std::string out;
    out.reserve(text.size());

    size_t last = 0;
    while (pos != std::string::npos)
    {
        out.append(text, last, pos - last);
        out.append(to);

        last = pos + from.size();
        pos = text.find(from, last);
    }

    out.append(text, last, std::string::npos);

    return out;
}

Converter::Converter(ConverterOptions options)
:options_(std::move(options)),
pattern_(options_.marker)
{
}

std::string Converter::convert(std::string text) const
{
    if (!options_.depth)
    {
        return clean(std::move(text));
    }

    Depth depth = *options_.depth;

    std::string converted = substitute(std::move(text),
                                       [depth](const CodeMatch & match)
    {
        return CodeResolver::resolve(match, depth);
    });

    return finalize(std::move(converted), true);
}

std::string Converter::clean(std::string text) const
{
    std::string cleaned = substitute(std::move(text),
                                     [](const CodeMatch &)
    {
        return std::string();
    });

    return finalize(std::move(cleaned), false);
}

std::string Converter::escape(std::string text) const
{
    return replace_all(std::move(text),
                       pattern_.marker(),
                       pattern_.escape_token());
}

std::string Converter::reset_sequence() const
{
    return convert(pattern_.marker() + "R");
}

std::string Converter::showcase() const
{
    const std::string & m = pattern_.marker();

    std::string markup;

    // &00&11...&ff
    for (char code : COLOR_CODES)
    {
        markup.append(m);
        markup.push_back(code);
        markup.push_back(code);
    }

    // &R&hh&R&ii...&R&oo
    for (char code : ATTRIBUTE_CODES)
    {
        markup.append(m);
        markup.push_back('R');
        markup.append(m);
        markup.push_back(code);
        markup.push_back(code);
    }

    return convert(std::move(markup));
}

void Converter::set_marker(std::string marker)
{
    // Build first so a bad marker leaves the current pattern in place.
    CodePattern pattern(std::move(marker));

    pattern_ = std::move(pattern);
    options_.marker = pattern_.marker();

    Logger::debug("Compiled code pattern for marker " + options_.marker);
}

void Converter::set_depth(std::optional<Depth> depth)
{
    options_.depth = depth;
}

void Converter::set_auto_reset(bool auto_reset)
{
    options_.auto_reset = auto_reset;
}

std::string Converter::finalize(std::string text, bool apply_reset) const
{
    if (apply_reset
        && options_.auto_reset
        && !text.ends_with(FULL_RESET))
    {
        text.append(FULL_RESET);
    }

    // Runs after substitution so an escape token is never read as a code.
    return replace_all(std::move(text),
                       pattern_.escape_token(),
                       pattern_.marker());
}
