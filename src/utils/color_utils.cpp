#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "utils/color_utils.hpp"

namespace ColorUtil
{
    uint32_t pack( const CssColors::RGBA& color)
    {
        return PACK_RGBA( color.r.asByte(), color.g.asByte(), color.b.asByte(), color.a.asByte());
    }

    CssColors::RGBA unpack( uint32_t color)
    {
        return { RED( color), GREEN( color), BLUE( color), ALPHA( color)};
    }

    uint8_t colorClamp( float color)
    {
        return color < 0.f ? 0 : ( color > FLOAT_CAST( RGB_SCALE)) ? RGB_SCALE : static_cast<uint8_t>( std::lround( color));
    }

    uint32_t colorLerp( uint32_t lcolor, uint32_t rcolor, float progress)
    {
        auto r = colorClamp( RED( lcolor)   * ( 1.f - progress) + RED( rcolor)   * progress),
             g = colorClamp( GREEN( lcolor) * ( 1.f - progress) + GREEN( rcolor) * progress),
             b = colorClamp( BLUE( lcolor)  * ( 1.f - progress) + BLUE( rcolor)  * progress),
             a = colorClamp( ALPHA( lcolor) * ( 1.f - progress) + ALPHA( rcolor) * progress);

        return PACK_RGBA( r, g, b, a);
    }

    uint32_t sourceOver( uint32_t top, uint32_t base)
    {
        auto alpha = ALPHA( top);
        if( alpha == RGB_SCALE)
            return top;
        if( alpha == 0)
            return base | 0xFFu;

        return colorLerp( base | 0xFFu, top | 0xFFu, FLOAT_CAST( alpha) / FLOAT_CAST( RGB_SCALE));
    }
}
