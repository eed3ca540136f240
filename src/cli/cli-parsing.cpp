#include "cli-parsing.h"

#include <boost/program_options.hpp>

namespace po = boost::program_options;

CLIParseResult parse_cli(int argc,
                         const char* const* argv,
                         std::ostream & out,
                         std::ostream & err)
{
    CLIParseResult res;
    CLIOptions & cli_ops = res.options;

    po::options_description op_desc("Options");
    op_desc.add_options()
        ("help,h",
         "Show options.")
        ("text,t",
         po::value<std::vector<std::string>>(&cli_ops.text),
         "Text to convert. Reads stdin line by line when omitted.")
        ("depth,d",
         po::value<std::string>(&cli_ops.depth)->default_value("auto"),
         "Color depth: tty, low, medium, high, 3, 4, 8, 24, none or auto.")
        ("marker,m",
         po::value<std::string>(&cli_ops.marker)->default_value("&"),
         "Character that starts a code.")
        ("no-reset",
         po::bool_switch(&cli_ops.no_reset)->default_value(false),
         "Do not append a reset to converted text.")
        ("clean,c",
         po::bool_switch(&cli_ops.clean)->default_value(false),
         "Remove codes instead of converting them.")
        ("clean-ansi,a",
         po::bool_switch(&cli_ops.clean_ansi)->default_value(false),
         "Remove ANSI escape sequences from the text.")
        ("showcase",
         po::bool_switch(&cli_ops.showcase)->default_value(false),
         "Print every code at the selected depth.")
        ("verbose,v",
         po::bool_switch(&cli_ops.verbose)->default_value(false),
         "Enable debug logging.");

    po::positional_options_description pos_desc;
    pos_desc.add("text", -1);

    po::variables_map var_map;
    try
    {
        po::store(po::command_line_parser(argc, argv)
                        .options(op_desc)
                        .positional(pos_desc)
                        .run(),
                  var_map);

        po::notify(var_map);

        if (var_map.count("help"))
        {
            out << "\nUsage: "
                << "dahlia"
                << " [options] [text...]\n\n"
                << op_desc
                << "\n";

            res.status = CLIParseResult::ParseStatus::Help;
            return res;
        }
    }
    catch (const po::error & p_err)
    {
        err << "Error: " << p_err.what() << "\n";
        res.status = CLIParseResult::ParseStatus::Error;
        return res;
    }

    return res;
}
