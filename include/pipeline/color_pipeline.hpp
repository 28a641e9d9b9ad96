#ifndef CSSCOLORS_COLOR_PIPELINE_HPP
#define CSSCOLORS_COLOR_PIPELINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "models/color_variant.hpp"

namespace CssColors
{
    struct Operation
    {
        enum class Kind : uint8_t
        {
            Saturate,
            Desaturate,
            Lighten,
            Darken,
            FadeIn,
            FadeOut,
            Fade,
            Spin,
            Mix,
            Tint,
            Shade,
            Greyscale,
            ToRgb,
            ToRgba,
            ToHsl,
            ToHsla
        };

        Kind                        kind;
        int16_t                     amount{};   // Magnitude, degrees for spin, weight for mix/tint/shade.
        std::optional<ColorVariant> operand;    // The other color of a mix.
        std::string                 text;       // As written by the user.
    };

    class ColorPipeline
    {
    public:
        static ColorVariant apply( const ColorVariant& color, const Operation& operation);

        /*
         * Applies `operations` in order. The result starts with `start` and
         * holds the color after every step.
         */
        static std::vector<ColorVariant> run( const ColorVariant& start, const std::vector<Operation>& operations);
    };
}

#endif //CSSCOLORS_COLOR_PIPELINE_HPP
