#ifndef CSSCOLORS_RULE_PARSER_HPP
#define CSSCOLORS_RULE_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "models/color_variant.hpp"
#include "pipeline/color_pipeline.hpp"

namespace CssColors
{
    /*
     * Text front end of the library.
     *
     * Colors are written `MODEL(c1, c2, c3[, c4])` with plain decimal
     * channels: bytes for rgb and alpha, degrees and percentages for hsl.
     * Operations are a whitespace separated chain such as
     * `saturate(20) spin(-30) mix(rgb(0, 0, 255), 25) greyscale`.
     *
     * Both parsers report the first problem on stderr and return nothing.
     */
    class RuleParser
    {
    public:
        static std::optional<ColorVariant> parseColor( std::string_view rule);

        static std::optional<std::vector<Operation>> parseOperations( std::string_view rule);

    private:
        static std::optional<Operation> parseOperation( std::string_view name, std::string_view arguments,
                                                        bool has_arguments);

        static std::optional<long> parseInteger( std::string_view given, long lower, long upper);

        // Splits on commas that are not nested inside parentheses.
        static std::vector<std::string> splitArguments( std::string_view arguments);
    };
}

#endif //CSSCOLORS_RULE_PARSER_HPP
