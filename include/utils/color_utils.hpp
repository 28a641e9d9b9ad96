#ifndef CSSCOLORS_COLOR_UTILS_HPP
#define CSSCOLORS_COLOR_UTILS_HPP

#include <cstdint>

namespace CssColors
{
    struct RGBA;
}

namespace ColorUtil
{
    // 0xRRGGBBAA
    uint32_t pack( const CssColors::RGBA& color);

    CssColors::RGBA unpack( uint32_t color);

    uint8_t colorClamp( float color);

    uint32_t colorLerp( uint32_t lcolor, uint32_t rcolor, float progress);

    /*
     * Composites `top` over the opaque `base`; the result is opaque.
     */
    uint32_t sourceOver( uint32_t top, uint32_t base);
}

#endif //CSSCOLORS_COLOR_UTILS_HPP
