#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/css_codec.hpp"

namespace CssColors
{
    RGB::RGB( uint8_t red, uint8_t green, uint8_t blue)
    : r( Ratio::fromByte( red)), g( Ratio::fromByte( green)), b( Ratio::fromByte( blue))
    {
    }

    RGB::RGB( Ratio red, Ratio green, Ratio blue)
    : r( red), g( green), b( blue)
    {
    }

    std::string RGB::toCss() const
    {
        return CssCodec::toCss( *this);
    }

    RGB RGB::toRgb() const
    {
        return *this;
    }

    RGBA RGB::toRgba() const
    {
        return { r, g, b, Ratio::fromByte( RGB_SCALE)};
    }

    HSL RGB::toHsl() const
    {
        return ColorSpaceConverter::rgbToHsl( *this);
    }

    HSLA RGB::toHsla() const
    {
        return toHsl().toHsla();
    }

    RGB RGB::saturate( uint8_t amount) const
    {
        return toHsl().saturate( amount).toRgb();
    }

    RGB RGB::desaturate( uint8_t amount) const
    {
        return toHsl().desaturate( amount).toRgb();
    }

    RGB RGB::lighten( uint8_t amount) const
    {
        return toHsl().lighten( amount).toRgb();
    }

    RGB RGB::darken( uint8_t amount) const
    {
        return toHsl().darken( amount).toRgb();
    }

    RGB RGB::fadein( uint8_t) const
    {
        return *this;
    }

    RGB RGB::fadeout( uint8_t) const
    {
        return *this;
    }

    RGBA RGB::fade( uint8_t amount) const
    {
        return { r, g, b, Ratio::fromByte( amount)};
    }

    RGB RGB::spin( int16_t amount) const
    {
        return toHsl().spin( amount);
    }

    RGBA RGB::tint( uint8_t weight) const
    {
        return toRgba().tint( weight);
    }

    RGBA RGB::shade( uint8_t weight) const
    {
        return toRgba().shade( weight);
    }

    RGB RGB::greyscale() const
    {
        return toHsl().greyscale().toRgb();
    }

    bool RGB::operator==( const RGB& right) const
    {
        return r == right.r && g == right.g && b == right.b;
    }

    bool RGB::operator!=( const RGB& right) const
    {
        return !( *this == right);
    }

    std::ostream& operator<<( std::ostream& out, const RGB& color)
    {
        return out << color.toCss();
    }
}
