#ifndef CSSCOLORS_CSS_CODEC_HPP
#define CSSCOLORS_CSS_CODEC_HPP

#include <cstdint>
#include <string>

namespace CssColors
{
    struct RGB;
    struct RGBA;
    struct HSL;
    struct HSLA;

    /*
     * Text forms of the color models.
     *
     * toCss gives the canonical CSS notation: byte channels for rgb, whole
     * degrees and percentages for hsl, alpha as a fraction with two decimals.
     * describe dumps the raw storage, which is what the tests and the
     * verbose log want to see when two colors disagree.
     */
    class CssCodec
    {
    public:
        static std::string toCss( const RGB& color);

        static std::string toCss( const RGBA& color);

        static std::string toCss( const HSL& color);

        static std::string toCss( const HSLA& color);

        static std::string describe( const RGB& color);

        static std::string describe( const RGBA& color);

        static std::string describe( const HSL& color);

        static std::string describe( const HSLA& color);

    private:
        static std::string alphaFraction( uint8_t alpha);
    };
}

#endif //CSSCOLORS_CSS_CODEC_HPP
