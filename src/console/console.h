#pragma once

#include <expected>
#include <iostream>
#include <string>

#include "converter.h"

// Stream helpers that convert before writing.
namespace Console
{
    void print(const Converter & converter,
               std::string text,
               std::ostream & out = std::cout);

    void println(const Converter & converter,
                 std::string text,
                 std::ostream & out = std::cout);

    // Write the converted full reset.
    void reset(const Converter & converter, std::ostream & out = std::cout);

    // Write the converted prompt, then read one line without its line ending.
    //
    // Write failures, read failures and end of input before any character
    // come back as the error string.
    std::expected<std::string, std::string> prompt(const Converter & converter,
                                                   std::string prompt_text,
                                                   std::istream & in = std::cin,
                                                   std::ostream & out = std::cout);
}
