#ifndef CSSCOLORS_ANGLE_HPP
#define CSSCOLORS_ANGLE_HPP

#include <cstdint>
#include <ostream>

namespace CssColors
{
    /*
     * A position on the color wheel, always kept in [0, 360).
     */
    class Angle
    {
    public:
        explicit Angle( uint16_t degrees = 0);

        [[nodiscard]] uint16_t degrees() const;

        Angle operator+( Angle right) const;

        Angle operator-( Angle right) const;

        bool operator==( Angle right) const;

        bool operator!=( Angle right) const;

        bool operator<( Angle right) const;

    private:
        uint16_t degrees_;
    };

    std::ostream& operator<<( std::ostream& out, Angle angle);
}

#endif //CSSCOLORS_ANGLE_HPP
