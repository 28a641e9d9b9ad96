#include <iomanip>
#include <sstream>
#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "codecs/css_codec.hpp"

namespace CssColors
{
    std::string CssCodec::toCss( const RGB& color)
    {
        std::stringstream out;
        out << "rgb(" << INT_CAST( color.r.asByte()) << ", "
                      << INT_CAST( color.g.asByte()) << ", "
                      << INT_CAST( color.b.asByte()) << ')';
        return out.str();
    }

    std::string CssCodec::toCss( const RGBA& color)
    {
        std::stringstream out;
        out << "rgba(" << INT_CAST( color.r.asByte()) << ", "
                       << INT_CAST( color.g.asByte()) << ", "
                       << INT_CAST( color.b.asByte()) << ", "
                       << alphaFraction( color.a.asByte()) << ')';
        return out.str();
    }

    std::string CssCodec::toCss( const HSL& color)
    {
        std::stringstream out;
        out << "hsl(" << color.h.degrees() << ", "
                      << INT_CAST( color.s.asPercentage()) << "%, "
                      << INT_CAST( color.l.asPercentage()) << "%)";
        return out.str();
    }

    std::string CssCodec::toCss( const HSLA& color)
    {
        std::stringstream out;
        out << "hsla(" << color.h.degrees() << ", "
                       << INT_CAST( color.s.asPercentage()) << "%, "
                       << INT_CAST( color.l.asPercentage()) << "%, "
                       << alphaFraction( color.a.asByte()) << ')';
        return out.str();
    }

    std::string CssCodec::describe( const RGB& color)
    {
        std::stringstream out;
        out << "RGB { r: " << INT_CAST( color.r.asByte())
            << ", g: "     << INT_CAST( color.g.asByte())
            << ", b: "     << INT_CAST( color.b.asByte()) << " }";
        return out.str();
    }

    std::string CssCodec::describe( const RGBA& color)
    {
        std::stringstream out;
        out << "RGBA { r: " << INT_CAST( color.r.asByte())
            << ", g: "      << INT_CAST( color.g.asByte())
            << ", b: "      << INT_CAST( color.b.asByte())
            << ", a: "      << INT_CAST( color.a.asByte()) << " }";
        return out.str();
    }

    std::string CssCodec::describe( const HSL& color)
    {
        std::stringstream out;
        out << "HSL { h: " << color.h.degrees()
            << ", s: "     << INT_CAST( color.s.asByte())
            << ", l: "     << INT_CAST( color.l.asByte()) << " }";
        return out.str();
    }

    std::string CssCodec::describe( const HSLA& color)
    {
        std::stringstream out;
        out << "HSLA { h: " << color.h.degrees()
            << ", s: "      << INT_CAST( color.s.asByte())
            << ", l: "      << INT_CAST( color.l.asByte())
            << ", a: "      << INT_CAST( color.a.asByte()) << " }";
        return out.str();
    }

    std::string CssCodec::alphaFraction( uint8_t alpha)
    {
        std::stringstream out;
        out << std::fixed << std::setprecision( 2) << FLOAT_CAST( alpha) / FLOAT_CAST( RGB_SCALE);
        return out.str();
    }
}
