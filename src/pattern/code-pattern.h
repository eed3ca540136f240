#pragma once

#include <string>
#include <string_view>

#include <boost/regex.hpp>

constexpr std::string_view DEFAULT_MARKER = "&";

constexpr char BACKGROUND_FLAG = '~';
constexpr char ESCAPE_SUFFIX = '_';

// Everything after the marker. Named groups:
//
//   bg    - background flag
//   color - single palette code
//   hex   - 3 or 6 digit literal, terminated by ';'
//   fmt   - attribute or reset code
//
// The attribute letters (h-o) never overlap the palette letters (a-f).
constexpr std::string_view CODE_GRAMMAR =
    "(?:(?<bg>~)?(?:(?<color>[0-9a-f])|#(?<hex>[0-9a-f]{3}|[0-9a-f]{6});)"
    "|(?<fmt>[h-oR]|r[bcfh-o]))";

// A marker is a single character: one ASCII byte or one complete
// UTF-8 sequence.
bool is_valid_marker(std::string_view marker);

// Backslash the marker if the regex grammar would treat it as syntax.
std::string escape_regex_literal(std::string_view marker);

// Compiled matcher for one marker. Immutable once built, a new marker
// needs a new CodePattern.
class CodePattern
{
public:
    // Throws std::invalid_argument if the marker is not a single character.
    explicit CodePattern(std::string marker);

    const boost::regex & regex() const
    {
        return regex_;
    }

    const std::string & marker() const
    {
        return marker_;
    }

    // marker + '_', a literal marker in the final output.
    const std::string & escape_token() const
    {
        return escape_token_;
    }

private:
    std::string marker_;
    std::string escape_token_;
    boost::regex regex_;
};
