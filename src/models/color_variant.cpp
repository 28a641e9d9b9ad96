#include "csscolors.hpp"
#include "models/color_variant.hpp"
#include "codecs/css_codec.hpp"

namespace CssColors
{
    std::string toCss( const ColorVariant& color)
    {
        return std::visit( []( const auto& model) { return model.toCss(); }, color);
    }

    RGBA toRgba( const ColorVariant& color)
    {
        return std::visit( []( const auto& model) { return model.toRgba(); }, color);
    }

    std::string describe( const ColorVariant& color)
    {
        return std::visit( []( const auto& model) { return CssCodec::describe( model); }, color);
    }

    std::string_view modelName( const ColorVariant& color)
    {
        static constexpr std::string_view names[] = { "rgb", "rgba", "hsl", "hsla"};
        return names[ color.index()];
    }

    std::ostream& operator<<( std::ostream& out, const ColorVariant& color)
    {
        return out << toCss( color);
    }
}
