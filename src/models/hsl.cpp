#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/css_codec.hpp"
#include "utils/utils.hpp"

namespace CssColors
{
    HSL::HSL( uint16_t hue, uint8_t saturation, uint8_t lightness)
    : h( hue), s( Ratio::fromPercentage( saturation)), l( Ratio::fromPercentage( lightness))
    {
    }

    HSL::HSL( Angle hue, Ratio saturation, Ratio lightness)
    : h( hue), s( saturation), l( lightness)
    {
    }

    std::string HSL::toCss() const
    {
        return CssCodec::toCss( *this);
    }

    RGB HSL::toRgb() const
    {
        return ColorSpaceConverter::hslToRgb( *this);
    }

    RGBA HSL::toRgba() const
    {
        return toRgb().toRgba();
    }

    HSL HSL::toHsl() const
    {
        return *this;
    }

    HSLA HSL::toHsla() const
    {
        // Saturation and lightness land on whole percents, as written in CSS.
        return HSLA( h.degrees(), s.asPercentage(), l.asPercentage(), RGB_SCALE);
    }

    HSL HSL::saturate( uint8_t amount) const
    {
        return { h, s + Ratio::fromPercentage( amount), l};
    }

    HSL HSL::desaturate( uint8_t amount) const
    {
        return { h, s - Ratio::fromPercentage( amount), l};
    }

    HSL HSL::lighten( uint8_t amount) const
    {
        return { h, s, l + Ratio::fromPercentage( amount)};
    }

    HSL HSL::darken( uint8_t amount) const
    {
        return { h, s, l - Ratio::fromPercentage( amount)};
    }

    HSL HSL::fadein( uint8_t) const
    {
        return *this;
    }

    HSL HSL::fadeout( uint8_t) const
    {
        return *this;
    }

    HSLA HSL::fade( uint8_t amount) const
    {
        return { h, s, l, Ratio::fromByte( amount)};
    }

    RGB HSL::spin( int16_t amount) const
    {
        if( amount >= DEG_MAX)
            Util::fatalError( "Invalid spin amount");

        // Only positive amounts are bounded; a negative amount keeps its magnitude modulo 360.
        auto hue = amount < 0 ? h - Angle( static_cast<uint16_t>( -INT_CAST( amount)))
                              : h + Angle( static_cast<uint16_t>( amount));

        return HSL( hue, s, l).toRgb();
    }

    RGBA HSL::tint( uint8_t weight) const
    {
        return toRgba().tint( weight);
    }

    RGBA HSL::shade( uint8_t weight) const
    {
        return toRgba().shade( weight);
    }

    HSL HSL::greyscale() const
    {
        return { h, Ratio::fromPercentage( 0), l};
    }

    bool HSL::operator==( const HSL& right) const
    {
        return h == right.h && s == right.s && l == right.l;
    }

    bool HSL::operator!=( const HSL& right) const
    {
        return !( *this == right);
    }

    std::ostream& operator<<( std::ostream& out, const HSL& color)
    {
        return out << color.toCss();
    }
}
