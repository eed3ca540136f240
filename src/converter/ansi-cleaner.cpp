#include "ansi-cleaner.h"

#include <boost/regex.hpp>

// ESC, or U+009B encoded as UTF-8.
const std::string ANSI_INTRODUCER = "(?:\x1b|\xc2\x9b)";

// OSC style sequences end in BEL, CSI style sequences end in a final byte.
const std::string ANSI_BODY =
    R"([\[\]()#;?]*)"
    R"((?:(?:(?:(?:;[-a-zA-Z\d\/#&.:=?%@~_]+)*)"
    R"(|[a-zA-Z\d]+(?:;[-a-zA-Z\d\/#&.:=?%@~_]*)*)?\x07))"
    R"(|(?:(?:\d{1,4}(?:;\d{0,4})*)?[\dA-PR-TZcf-nq-uy=><~])))";

const boost::regex & ansi_regex()
{
    static const boost::regex regex(ANSI_INTRODUCER + ANSI_BODY,
                                    boost::regex::perl);
    return regex;
}

std::string clean_ansi(std::string text)
{
    // No escape character at all, nothing to strip.
    if (text.find('\x1b') == std::string::npos
        && text.find("\xc2\x9b") == std::string::npos)
    {
        return text;
    }

    return boost::regex_replace(text, ansi_regex(), std::string());
}
