#pragma once

#include <expected>
#include <iostream>
#include <string>

#include "cli-parsing.h"
#include "converter.h"
#include "depth-inference.h"

class CLI
{
public:
    explicit CLI(CLIOptions ops, EnvLookup env = process_env);

    int run(std::istream & in = std::cin, std::ostream & out = std::cout);

    // Turn the command line options into converter options.
    std::expected<ConverterOptions, std::string> converter_options() const;

private:
    std::string process(const Converter & converter, std::string text) const;

    // Used to style our own diagnostics.
    std::optional<Depth> diagnostic_depth() const;

private:
    const CLIOptions cli_ops_;

    const EnvLookup env_;
};
