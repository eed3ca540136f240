#pragma once

#include <iostream>
#include <string>
#include <vector>

struct CLIOptions
{
    // Words to convert, joined by spaces. Empty means read stdin.
    std::vector<std::string> text;

    // tty, low, medium, high, 3, 4, 8, 24, none or auto.
    std::string depth{"auto"};
    std::string marker{"&"};

    bool no_reset{false};
    bool clean{false};
    bool clean_ansi{false};
    bool showcase{false};
    bool verbose{false};
};

struct CLIParseResult
{
    enum class ParseStatus
    {
        Ok = 0,
        Help,
        Error
    };

    CLIOptions options;
    ParseStatus status{ParseStatus::Ok};

    bool good_parse() const
    {
        return (status == ParseStatus::Ok);
    }

    // If the operation exited, why?
    int status_code() const
    {
        switch (status)
        {
            case ParseStatus::Error:
            {
                return 1;
            }
            default:
            {
                return 0;
            }
        }
    }
};

// Usage goes to out, parse errors to err.
CLIParseResult parse_cli(int argc,
                         const char* const* argv,
                         std::ostream & out = std::cout,
                         std::ostream & err = std::cerr);
