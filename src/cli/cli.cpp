#include "cli.h"

#include "ansi-cleaner.h"
#include "diagnostic-colors.h"
#include "logger.h"

//
// Helpers
//

// Positional words come back split on whitespace, put them back together.
std::string join_words(const std::vector<std::string> & words)
{
    std::string joined;

    for (size_t i = 0; i < words.size(); i++)
    {
        if (i > 0)
        {
            joined.push_back(' ');
        }

        joined.append(words[i]);
    }

    return joined;
}

//
// Class functions.
//

CLI::CLI(CLIOptions ops, EnvLookup env)
:cli_ops_(std::move(ops)),
env_(std::move(env))
{
}

int CLI::run(std::istream & in, std::ostream & out)
{
    auto options = converter_options();

    if (!options)
    {
        Logger::error(options.error());
        return 1;
    }

    try
    {
        Converter converter(std::move(*options));

        if (cli_ops_.showcase)
        {
            out << converter.showcase() << "\n";
            return 0;
        }

        // Text on the command line, one conversion.
        if (!cli_ops_.text.empty())
        {
            out << process(converter, join_words(cli_ops_.text)) << "\n";
            return 0;
        }

        // Otherwise act as a filter over stdin.
        std::string line;
        while (std::getline(in, line))
        {
            out << process(converter, line) << "\n";
        }

        if (in.bad())
        {
            Logger::error("Failed to read from standard input");
            return 1;
        }
    }
    catch (const std::exception & error)
    {
        std::string e_msg = "Caught exception while converting: "
                            + std::string(error.what());
        Logger::error(std::move(e_msg));

        return 1;
    }

    return 0;
}

std::expected<ConverterOptions, std::string> CLI::converter_options() const
{
    std::optional<Depth> styling = diagnostic_depth();

    if (cli_ops_.clean && cli_ops_.clean_ansi)
    {
        return std::unexpected(styled_string("--clean", PrintStyle::Keyword, styling)
                               + " and "
                               + styled_string("--clean-ansi", PrintStyle::Keyword, styling)
                               + " cannot be used together");
    }

    // The showcase only exists to show converted output.
    if (cli_ops_.showcase && (cli_ops_.clean || cli_ops_.clean_ansi))
    {
        std::string clean_flag = cli_ops_.clean ? "--clean" : "--clean-ansi";

        return std::unexpected(styled_string("--showcase", PrintStyle::Keyword, styling)
                               + " and "
                               + styled_string(clean_flag, PrintStyle::Keyword, styling)
                               + " cannot be used together");
    }

    ConverterOptions options;
    options.auto_reset = !cli_ops_.no_reset;

    if (!is_valid_marker(cli_ops_.marker))
    {
        return std::unexpected("Marker "
                               + styled_string(cli_ops_.marker, PrintStyle::BadValue, styling)
                               + " must be "
                               + styled_string("exactly one character", PrintStyle::Expected, styling));
    }

    options.marker = cli_ops_.marker;

    if (cli_ops_.depth == "auto")
    {
        options.depth = infer_depth(env_);

        Logger::debug("Inferred depth "
                      + (options.depth ? depth_to_string(*options.depth) : "none"));
    }
    else if (cli_ops_.depth == "none")
    {
        options.depth = std::nullopt;
    }
    else
    {
        std::optional<Depth> depth = depth_from_string(cli_ops_.depth);

        if (!depth)
        {
            return std::unexpected("Unrecognized depth "
                                   + styled_string(cli_ops_.depth, PrintStyle::BadValue, styling)
                                   + " (expected "
                                   + styled_string("tty, low, medium, high, 3, 4, 8, 24, none or auto",
                                                   PrintStyle::Expected,
                                                   styling)
                                   + ")");
        }

        options.depth = depth;
    }

    return options;
}

std::string CLI::process(const Converter & converter, std::string text) const
{
    if (cli_ops_.clean_ansi)
    {
        return clean_ansi(std::move(text));
    }

    if (cli_ops_.clean)
    {
        return converter.clean(std::move(text));
    }

    return converter.convert(std::move(text));
}

std::optional<Depth> CLI::diagnostic_depth() const
{
    return infer_depth(env_);
}
