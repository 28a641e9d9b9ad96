#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/css_codec.hpp"

namespace CssColors
{
    HSLA::HSLA( uint16_t hue, uint8_t saturation, uint8_t lightness, uint8_t alpha)
    : h( hue), s( Ratio::fromPercentage( saturation)), l( Ratio::fromPercentage( lightness)),
      a( Ratio::fromByte( alpha))
    {
    }

    HSLA::HSLA( Angle hue, Ratio saturation, Ratio lightness, Ratio alpha)
    : h( hue), s( saturation), l( lightness), a( alpha)
    {
    }

    std::string HSLA::toCss() const
    {
        return CssCodec::toCss( *this);
    }

    RGB HSLA::toRgb() const
    {
        return toHsl().toRgb();
    }

    RGBA HSLA::toRgba() const
    {
        auto rgb = toRgb();
        return { rgb.r, rgb.g, rgb.b, a};
    }

    HSL HSLA::toHsl() const
    {
        return { h, s, l};
    }

    HSLA HSLA::toHsla() const
    {
        return *this;
    }

    HSLA HSLA::saturate( uint8_t amount) const
    {
        return { h, s + Ratio::fromPercentage( amount), l, a};
    }

    HSLA HSLA::desaturate( uint8_t amount) const
    {
        return { h, s - Ratio::fromPercentage( amount), l, a};
    }

    HSLA HSLA::lighten( uint8_t amount) const
    {
        return { h, s, l + Ratio::fromPercentage( amount), a};
    }

    HSLA HSLA::darken( uint8_t amount) const
    {
        return { h, s, l - Ratio::fromPercentage( amount), a};
    }

    HSLA HSLA::fadein( uint8_t amount) const
    {
        return { h, s, l, a + Ratio::fromByte( amount)};
    }

    HSLA HSLA::fadeout( uint8_t amount) const
    {
        return { h, s, l, a - Ratio::fromByte( amount)};
    }

    HSLA HSLA::fade( uint8_t amount) const
    {
        return { h, s, l, Ratio::fromByte( amount)};
    }

    RGB HSLA::spin( int16_t amount) const
    {
        return toHsl().spin( amount);
    }

    RGBA HSLA::tint( uint8_t weight) const
    {
        return toRgba().tint( weight);
    }

    RGBA HSLA::shade( uint8_t weight) const
    {
        return toRgba().shade( weight);
    }

    HSLA HSLA::greyscale() const
    {
        return toHsl().greyscale().toHsla();
    }

    bool HSLA::operator==( const HSLA& right) const
    {
        return h == right.h && s == right.s && l == right.l && a == right.a;
    }

    bool HSLA::operator!=( const HSLA& right) const
    {
        return !( *this == right);
    }

    std::ostream& operator<<( std::ostream& out, const HSLA& color)
    {
        return out << color.toCss();
    }
}
