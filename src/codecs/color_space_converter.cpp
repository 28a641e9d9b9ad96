#include <cstdint>
#include <cmath>
#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/color_space_converter.hpp"

namespace CssColors
{
    HSL ColorSpaceConverter::rgbToHsl( const RGB& rgb)
    {
        // Greys carry neither hue nor saturation, and would divide by zero below.
        if( rgb.r == rgb.g && rgb.g == rgb.b)
            return { Angle( 0), Ratio::fromPercentage( 0), rgb.r};

        float red   = rgb.r.asFloat(),
              green = rgb.g.asFloat(),
              blue  = rgb.b.asFloat();

        float c_max = red > green && red > blue ? red : green > blue ? green : blue,
              c_min = red < green && red < blue ? red : green < blue ? green : blue,
              delta = c_max - c_min;

        float lum = ( c_max + c_min) / 2.f,
              sat = ZERO( delta) ? 0.f
                                 : lum < .5f ? delta / ( c_max + c_min)
                                             : delta / ( 2.f - ( c_max + c_min));
        float hue;
        if( c_max == red)
            hue = ( green - blue) / delta;
        else if( c_max == green)
            hue = 120.f / 60.f + ( blue - red) / delta;
        else
            hue = 240.f / 60.f + ( red - green) / delta;

        hue *= 60.f;
        if( hue <= 0.f)
            hue += FLOAT_CAST( DEG_MAX);

        return { Angle( static_cast<uint16_t>( std::round( hue))), Ratio::fromFloat( sat), Ratio::fromFloat( lum)};
    }

    RGB ColorSpaceConverter::hslToRgb( const HSL& hsl)
    {
        float s = hsl.s.asFloat(),
              l = hsl.l.asFloat();
        if( ZERO( s))
            return { hsl.l, hsl.l, hsl.l};

        float temp1 = l < .5f ? l * ( 1 + s) : l + s - l * s;
        float temp2 = 2 * l - temp1;

        // Red sits a third of a turn ahead of the hue, blue a third behind.
        Angle third( DEG_MAX / 3);
        return { Ratio::fromFloat( hueToSpace(( hsl.h + third).degrees(), temp1, temp2)),
                 Ratio::fromFloat( hueToSpace( hsl.h.degrees(), temp1, temp2)),
                 Ratio::fromFloat( hueToSpace(( hsl.h - third).degrees(), temp1, temp2))};
    }

    RGBA ColorSpaceConverter::mix( const RGBA& left, const RGBA& right, uint8_t weight)
    {
        /*
         * References:
         *  + https://sass-lang.com/documentation/modules/color#mix
         *
         * The user weight w and the alpha difference a both live in [-1, 1].
         * (w + a) / (1 + w * a) combines them into the weight of `left`:
         * either one at -1 or 1 wins outright, a zero leaves the other as is.
         */
        auto weight_ratio = Ratio::fromPercentage( weight);

        float w = weight_ratio.asFloat() * 2.f - 1.f,
              a = left.a.asFloat() - right.a.asFloat(),
              product = w * a;

        float combined = product == -1.f ? w : ( w + a) / ( 1.f + product);
        combined = ( combined + 1.f) / 2.f;

        auto rgb_left    = Ratio::fromFloat( combined),
             rgb_right   = Ratio::fromFloat( 1.f) - rgb_left,
             alpha_left  = weight_ratio,
             alpha_right = Ratio::fromFloat( 1.f) - alpha_left;

        return { left.r * rgb_left + right.r * rgb_right,
                 left.g * rgb_left + right.g * rgb_right,
                 left.b * rgb_left + right.b * rgb_right,
                 left.a * alpha_left + right.a * alpha_right};
    }

    float ColorSpaceConverter::hueToSpace( uint16_t degrees, float temp1, float temp2)
    {
        float t = FLOAT_CAST( degrees) / FLOAT_CAST( DEG_MAX);
        if( t > 2.f / 3.f)
            return temp2;
        if( t > 1.f / 2.f)
            return temp2 + ( temp1 - temp2) * ( 2.f / 3.f - t) * 6.f;
        if( t > 1.f / 6.f)
            return temp1;

        return temp2 + ( temp1 - temp2) * t * 6.f;
    }
}
