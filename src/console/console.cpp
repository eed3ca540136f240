#include "console.h"

namespace Console
{
    void print(const Converter & converter,
               std::string text,
               std::ostream & out)
    {
        out << converter.convert(std::move(text));
    }

    void println(const Converter & converter,
                 std::string text,
                 std::ostream & out)
    {
        out << converter.convert(std::move(text)) << "\n";
    }

    void reset(const Converter & converter, std::ostream & out)
    {
        out << converter.reset_sequence();
    }

    std::expected<std::string, std::string> prompt(const Converter & converter,
                                                   std::string prompt_text,
                                                   std::istream & in,
                                                   std::ostream & out)
    {
        out << converter.convert(std::move(prompt_text));
        out.flush();

        if (!out)
        {
            return std::unexpected("Failed to write the prompt");
        }

        std::string line;

        // getline only sets failbit when it extracted nothing.
        if (!std::getline(in, line))
        {
            if (in.eof())
            {
                return std::unexpected("Reached end of input before a line was read");
            }

            return std::unexpected("Failed to read from input");
        }

        // Windows line endings.
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }

        return line;
    }
}
