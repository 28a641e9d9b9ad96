#ifndef CSSCOLORS_COMMAND_LINE_PARSERS_HPP
#define CSSCOLORS_COMMAND_LINE_PARSERS_HPP

#include <cstdio>
#include <string_view>
#include "csscolors.hpp"

namespace CssColors
{
    /*
     * Turns argv into an ApplicationDirector. Help, font listing and
     * invalid input end the program from inside `process`.
     */
    class CommandLineParser
    {
    public:
        CommandLineParser( int ac, char **av);

        [[nodiscard]] ApplicationDirector process();

        static void helpMe( std::string_view program, FILE *destination);

    private:
        int argc;
        char **argv;
    };

    // Font used for labels when none is given. A program may override it.
    std::string_view getDefaultFont();
}

#endif //CSSCOLORS_COMMAND_LINE_PARSERS_HPP
