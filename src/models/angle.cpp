#include "csscolors.hpp"
#include "models/angle.hpp"

namespace CssColors
{
    Angle::Angle( uint16_t degrees)
    : degrees_( degrees % DEG_MAX)
    {
    }

    uint16_t Angle::degrees() const
    {
        return degrees_;
    }

    Angle Angle::operator+( Angle right) const
    {
        // Both sides are below 360, so one modulo brings the sum back.
        return Angle( degrees_ + right.degrees_);
    }

    Angle Angle::operator-( Angle right) const
    {
        return Angle( degrees_ + DEG_MAX - right.degrees_);
    }

    bool Angle::operator==( Angle right) const
    {
        return degrees_ == right.degrees_;
    }

    bool Angle::operator!=( Angle right) const
    {
        return !( *this == right);
    }

    bool Angle::operator<( Angle right) const
    {
        return degrees_ < right.degrees_;
    }

    std::ostream& operator<<( std::ostream& out, Angle angle)
    {
        return out << angle.degrees();
    }
}
