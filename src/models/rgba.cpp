#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/css_codec.hpp"

namespace CssColors
{
    RGBA::RGBA( uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha)
    : r( Ratio::fromByte( red)), g( Ratio::fromByte( green)), b( Ratio::fromByte( blue)), a( Ratio::fromByte( alpha))
    {
    }

    RGBA::RGBA( Ratio red, Ratio green, Ratio blue, Ratio alpha)
    : r( red), g( green), b( blue), a( alpha)
    {
    }

    std::string RGBA::toCss() const
    {
        return CssCodec::toCss( *this);
    }

    RGB RGBA::toRgb() const
    {
        return { r, g, b};
    }

    RGBA RGBA::toRgba() const
    {
        return *this;
    }

    HSL RGBA::toHsl() const
    {
        return toRgb().toHsl();
    }

    HSLA RGBA::toHsla() const
    {
        auto hsl = toHsl();
        return HSLA( hsl.h.degrees(), hsl.s.asPercentage(), hsl.l.asPercentage(), a.asByte());
    }

    RGBA RGBA::saturate( uint8_t amount) const
    {
        return toHsla().saturate( amount).toRgba();
    }

    RGBA RGBA::desaturate( uint8_t amount) const
    {
        return toHsla().desaturate( amount).toRgba();
    }

    RGBA RGBA::lighten( uint8_t amount) const
    {
        return toHsla().lighten( amount).toRgba();
    }

    RGBA RGBA::darken( uint8_t amount) const
    {
        return toHsla().darken( amount).toRgba();
    }

    RGBA RGBA::fadein( uint8_t amount) const
    {
        return { r, g, b, a + Ratio::fromByte( amount)};
    }

    RGBA RGBA::fadeout( uint8_t amount) const
    {
        return { r, g, b, a - Ratio::fromByte( amount)};
    }

    RGBA RGBA::fade( uint8_t amount) const
    {
        return { r, g, b, Ratio::fromByte( amount)};
    }

    RGB RGBA::spin( int16_t amount) const
    {
        return toHsl().spin( amount);
    }

    RGBA RGBA::tint( uint8_t weight) const
    {
        return mix( RGBA( RGB_SCALE, RGB_SCALE, RGB_SCALE, RGB_SCALE), weight);
    }

    RGBA RGBA::shade( uint8_t weight) const
    {
        return mix( RGBA( 0, 0, 0, RGB_SCALE), weight);
    }

    RGBA RGBA::greyscale() const
    {
        return toHsl().greyscale().toRgba();
    }

    bool RGBA::operator==( const RGBA& right) const
    {
        return r == right.r && g == right.g && b == right.b && a == right.a;
    }

    bool RGBA::operator!=( const RGBA& right) const
    {
        return !( *this == right);
    }

    std::ostream& operator<<( std::ostream& out, const RGBA& color)
    {
        return out << color.toCss();
    }
}
