#include "code-pattern.h"

#include <stdexcept>

// Characters with meaning in perl syntax outside of a set.
constexpr std::string_view REGEX_METACHARACTERS = ".^$|()[]{}*+?\\";

// Number of bytes in the UTF-8 sequence started by lead, 0 if lead
// cannot start one.
inline size_t utf8_sequence_length(unsigned char lead)
{
    if (lead < 0x80)
    {
        return 1;
    }

    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2)
    {
        return 2;
    }

    if ((lead & 0xF0) == 0xE0)
    {
        return 3;
    }

    if ((lead & 0xF8) == 0xF0 && lead <= 0xF4)
    {
        return 4;
    }

    return 0;
}

struct ByteRange
{
    unsigned char low;
    unsigned char high;
};

// Allowed second byte. Narrower than a plain continuation byte after
// E0 and F0 (overlong forms), ED (surrogates) and F4 (above U+10FFFF).
inline ByteRange utf8_second_byte_range(unsigned char lead)
{
    switch (lead)
    {
        case 0xE0:
        {
            return {0xA0, 0xBF};
        }
        case 0xED:
        {
            return {0x80, 0x9F};
        }
        case 0xF0:
        {
            return {0x90, 0xBF};
        }
        case 0xF4:
        {
            return {0x80, 0x8F};
        }
        default:
        {
            return {0x80, 0xBF};
        }
    }
}

bool is_valid_marker(std::string_view marker)
{
    if (marker.empty())
    {
        return false;
    }

    size_t expected_size = utf8_sequence_length(
                               static_cast<unsigned char>(marker[0]));

    if (expected_size == 0 || marker.size() != expected_size)
    {
        return false;
    }

    if (expected_size > 1)
    {
        ByteRange second = utf8_second_byte_range(
                               static_cast<unsigned char>(marker[0]));
        unsigned char byte = static_cast<unsigned char>(marker[1]);

        if (byte < second.low || byte > second.high)
        {
            return false;
        }
    }

    // Every byte after the lead must be a continuation byte.
    for (size_t i = 1; i < marker.size(); i++)
    {
        if ((static_cast<unsigned char>(marker[i]) & 0xC0) != 0x80)
        {
            return false;
        }
    }

    return true;
}

std::string escape_regex_literal(std::string_view marker)
{
    std::string escaped;
    escaped.reserve(marker.size() * 2);

    for (char c : marker)
    {
        if (REGEX_METACHARACTERS.find(c) != std::string_view::npos)
        {
            escaped.push_back('\\');
        }

        escaped.push_back(c);
    }

    return escaped;
}

// Validate before building, the member initializers below rely on it.
std::string checked_marker(std::string marker)
{
    if (!is_valid_marker(marker))
    {
        throw std::invalid_argument("Marker \""
                                    + marker
                                    + "\" must be exactly one character");
    }

    return marker;
}

CodePattern::CodePattern(std::string marker)
:marker_(checked_marker(std::move(marker))),
escape_token_(marker_ + ESCAPE_SUFFIX),
regex_(escape_regex_literal(marker_) + std::string(CODE_GRAMMAR),
       boost::regex::perl)
{
}
