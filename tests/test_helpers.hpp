#ifndef CSSCOLORS_TEST_HELPERS_HPP
#define CSSCOLORS_TEST_HELPERS_HPP

#include <algorithm>
#include <cstdlib>
#include <string>
#include "CppUTest/SimpleString.h"
#include "csscolors.hpp"
#include "models/color_models.hpp"
#include "models/color_variant.hpp"
#include "codecs/css_codec.hpp"

inline SimpleString StringFrom( const CssColors::RGB& color)
{
    return SimpleString( CssColors::CssCodec::describe( color).c_str());
}

inline SimpleString StringFrom( const CssColors::RGBA& color)
{
    return SimpleString( CssColors::CssCodec::describe( color).c_str());
}

inline SimpleString StringFrom( const CssColors::HSL& color)
{
    return SimpleString( CssColors::CssCodec::describe( color).c_str());
}

inline SimpleString StringFrom( const CssColors::HSLA& color)
{
    return SimpleString( CssColors::CssCodec::describe( color).c_str());
}

inline SimpleString StringFrom( const CssColors::Ratio& ratio)
{
    return StringFrom( INT_CAST( ratio.asByte()));
}

inline SimpleString StringFrom( const CssColors::Angle& angle)
{
    return StringFrom( INT_CAST( angle.degrees()));
}

/*
 * Colors that went through a float round trip may be off by one unit:
 * one byte on rgb channels, one degree or one percent on hsl ones.
 * Alpha is never touched by a conversion and must match exactly.
 */
namespace TestHelpers
{
    inline bool near( int left, int right)
    {
        return std::abs( left - right) <= 1;
    }

    inline bool nearHue( const CssColors::Angle& left, const CssColors::Angle& right)
    {
        auto distance = std::abs( INT_CAST( left.degrees()) - INT_CAST( right.degrees()));
        return std::min( distance, DEG_MAX - distance) <= 1;
    }

    inline bool approximately( const CssColors::RGB& expected, const CssColors::RGB& actual)
    {
        return near( expected.r.asByte(), actual.r.asByte())
            && near( expected.g.asByte(), actual.g.asByte())
            && near( expected.b.asByte(), actual.b.asByte());
    }

    inline bool approximately( const CssColors::RGBA& expected, const CssColors::RGBA& actual)
    {
        return approximately( expected.toRgb(), actual.toRgb()) && expected.a == actual.a;
    }

    inline bool approximately( const CssColors::HSL& expected, const CssColors::HSL& actual)
    {
        return nearHue( expected.h, actual.h)
            && near( expected.s.asPercentage(), actual.s.asPercentage())
            && near( expected.l.asPercentage(), actual.l.asPercentage());
    }

    inline bool approximately( const CssColors::HSLA& expected, const CssColors::HSLA& actual)
    {
        return approximately( expected.toHsl(), actual.toHsl()) && expected.a == actual.a;
    }

    template <typename Color>
    std::string mismatch( const Color& expected, const Color& actual)
    {
        return "expected " + CssColors::CssCodec::describe( expected)
               + " got " + CssColors::CssCodec::describe( actual);
    }
}

#define CHECK_APPROX_COLOR( expected, actual) \
    CHECK_TEXT( TestHelpers::approximately(( expected), ( actual)), \
                TestHelpers::mismatch(( expected), ( actual)).c_str())

#endif //CSSCOLORS_TEST_HELPERS_HPP
