#ifndef CSSCOLORS_RATIO_HPP
#define CSSCOLORS_RATIO_HPP

#include <cstdint>
#include <ostream>

namespace CssColors
{
    /*
     * A fraction in [0, 1] stored as an 8-bit numerator over 255.
     * Addition and subtraction saturate at both ends; multiplication goes
     * through floating point and is re-quantized, so it may lose up to one unit.
     */
    class Ratio
    {
    public:
        Ratio() = default;

        static Ratio fromByte( uint8_t value);

        /*
         * `percentage` is expected in 0-100. Larger values are not rejected,
         * they simply saturate to 255.
         */
        static Ratio fromPercentage( uint8_t percentage);

        /*
         * Scales by 255 and rounds. Anything outside [0, 1] (NaN included)
         * saturates to 0 or 255.
         */
        static Ratio fromFloat( float value);

        [[nodiscard]] uint8_t asByte() const;

        [[nodiscard]] uint8_t asPercentage() const;

        [[nodiscard]] float asFloat() const;

        Ratio operator+( Ratio right) const;

        Ratio operator-( Ratio right) const;

        Ratio operator*( Ratio right) const;

        bool operator==( Ratio right) const;

        bool operator!=( Ratio right) const;

        bool operator<( Ratio right) const;

    private:
        explicit Ratio( uint8_t numerator);

        uint8_t numerator_{};
    };

    std::ostream& operator<<( std::ostream& out, Ratio ratio);
}

#endif //CSSCOLORS_RATIO_HPP
