#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "code-match.h"
#include "code-pattern.h"
#include "depth.h"

struct ConverterOptions
{
    // std::nullopt means no color, convert() behaves like clean().
    std::optional<Depth> depth{Depth::High};

    // Append a full reset to converted text that does not end with one.
    bool auto_reset{true};

    std::string marker{DEFAULT_MARKER};
};

// Converts marker codes ("&4", "&~#f0f;", "&R") into ANSI sequences.
//
// Text is taken by value. When nothing in it needs to change the same
// buffer is handed back, so callers who move their string in pay for no
// allocation.
//
// const members may be called concurrently, the setters may not.
class Converter
{
public:
    static constexpr std::string_view FULL_RESET = "\x1b[0m";

public:
    // Throws std::invalid_argument if options.marker is not one character.
    explicit Converter(ConverterOptions options = {});

    std::string convert(std::string text) const;

    // Removes codes without emitting any ANSI. Never appends a reset.
    std::string clean(std::string text) const;

    // Double every literal marker into an escape token so that convert()
    // and clean() give back the original text.
    std::string escape(std::string text) const;

    // The converted full reset code, empty when there is no color.
    std::string reset_sequence() const;

    // Every color code followed by every attribute, converted.
    std::string showcase() const;

    // Rebuilds the pattern. Throws std::invalid_argument on a bad marker
    // and leaves the converter unchanged.
    void set_marker(std::string marker);

    void set_depth(std::optional<Depth> depth);

    void set_auto_reset(bool auto_reset);

    std::optional<Depth> depth() const
    {
        return options_.depth;
    }

    bool auto_reset() const
    {
        return options_.auto_reset;
    }

    const std::string & marker() const
    {
        return pattern_.marker();
    }

private:
    template <typename Replacer>
    std::string substitute(std::string text, Replacer && replacer) const;

    // Optional trailing reset, then every escape token becomes one marker.
    std::string finalize(std::string text, bool apply_reset) const;

private:
    ConverterOptions options_;
    CodePattern pattern_;
};

template <typename Replacer>
std::string Converter::substitute(std::string text, Replacer && replacer) const
{
    boost::sregex_iterator it(text.cbegin(), text.cend(), pattern_.regex());
    boost::sregex_iterator end;

    // Nothing to replace, hand the buffer back.
    if (it == end)
    {
        return text;
    }

    std::string out;
    out.reserve(text.size());

    auto last = text.cbegin();

    for (; it != end; ++it)
    {
        const boost::smatch & match = *it;

        out.append(last, match[0].first);
        out.append(replacer(classify_match(match)));

        last = match[0].second;
    }

    out.append(last, text.cend());

    return out;
}
