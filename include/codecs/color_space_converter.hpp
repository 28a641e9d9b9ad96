#ifndef CSSCOLORS_COLOR_SPACE_CONVERTER_HPP
#define CSSCOLORS_COLOR_SPACE_CONVERTER_HPP

#include <cstdint>

namespace CssColors
{
    struct RGB;
    struct RGBA;
    struct HSL;

    class ColorSpaceConverter
    {
    public:
        static HSL rgbToHsl( const RGB& rgb);

        static RGB hslToRgb( const HSL& hsl);

        /*
         * Sass/Less blend of two colors. `weight` is the percentage of `left`.
         */
        static RGBA mix( const RGBA& left, const RGBA& right, uint8_t weight);

    private:
        static float hueToSpace( uint16_t degrees, float temp1, float temp2);
    };
}

#endif //CSSCOLORS_COLOR_SPACE_CONVERTER_HPP
