#include <cmath>
#include <algorithm>
#include "csscolors.hpp"
#include "models/ratio.hpp"

namespace CssColors
{
    Ratio::Ratio( uint8_t numerator)
    : numerator_( numerator)
    {
    }

    Ratio Ratio::fromByte( uint8_t value)
    {
        return Ratio( value);
    }

    Ratio Ratio::fromPercentage( uint8_t percentage)
    {
        return fromFloat( FLOAT_CAST( percentage) / FLOAT_CAST( PERCENT_SCALE));
    }

    Ratio Ratio::fromFloat( float value)
    {
        float scaled = std::round( value * FLOAT_CAST( RGB_SCALE));
        // Written so that NaN falls into the first branch.
        if( !( scaled > 0.f))
            return Ratio( 0);
        if( scaled >= FLOAT_CAST( RGB_SCALE))
            return Ratio( RGB_SCALE);

        return Ratio( static_cast<uint8_t>( scaled));
    }

    uint8_t Ratio::asByte() const
    {
        return numerator_;
    }

    uint8_t Ratio::asPercentage() const
    {
        return static_cast<uint8_t>( std::round( asFloat() * FLOAT_CAST( PERCENT_SCALE)));
    }

    float Ratio::asFloat() const
    {
        return FLOAT_CAST( numerator_) / FLOAT_CAST( RGB_SCALE);
    }

    Ratio Ratio::operator+( Ratio right) const
    {
        auto sum = static_cast<uint16_t>( numerator_) + right.numerator_;
        return Ratio( static_cast<uint8_t>( std::min( sum, RGB_SCALE)));
    }

    Ratio Ratio::operator-( Ratio right) const
    {
        return Ratio( numerator_ > right.numerator_ ? numerator_ - right.numerator_ : 0);
    }

    Ratio Ratio::operator*( Ratio right) const
    {
        return fromFloat( asFloat() * right.asFloat());
    }

    bool Ratio::operator==( Ratio right) const
    {
        return numerator_ == right.numerator_;
    }

    bool Ratio::operator!=( Ratio right) const
    {
        return !( *this == right);
    }

    bool Ratio::operator<( Ratio right) const
    {
        return numerator_ < right.numerator_;
    }

    std::ostream& operator<<( std::ostream& out, Ratio ratio)
    {
        return out << INT_CAST( ratio.asPercentage()) << '%';
    }
}
