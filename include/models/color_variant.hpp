#ifndef CSSCOLORS_COLOR_VARIANT_HPP
#define CSSCOLORS_COLOR_VARIANT_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include "models/color_models.hpp"

namespace CssColors
{
    /*
     * A color whose model is only known at run time. Operations such as fade,
     * spin or mix change the model of their result, so a chain of them is
     * carried in this form.
     */
    using ColorVariant = std::variant<RGB, RGBA, HSL, HSLA>;

    std::string toCss( const ColorVariant& color);

    RGBA toRgba( const ColorVariant& color);

    std::string describe( const ColorVariant& color);

    // "rgb", "rgba", "hsl" or "hsla".
    std::string_view modelName( const ColorVariant& color);

    std::ostream& operator<<( std::ostream& out, const ColorVariant& color);
}

#endif //CSSCOLORS_COLOR_VARIANT_HPP
