#include <sstream>
#include "test_helpers.hpp"
#include "CppUTest/TestHarness.h"

using namespace CssColors;

TEST_GROUP( CssCodecTests)
{
};

TEST( CssCodecTests, RgbNotation)
{
    STRCMP_EQUAL( "rgb(5, 10, 255)", RGB( 5, 10, 255).toCss().c_str());
    STRCMP_EQUAL( "rgb(0, 0, 0)", CssCodec::toCss( RGB( 0, 0, 0)).c_str());
}

TEST( CssCodecTests, RgbaNotationPrintsAlphaAsFraction)
{
    STRCMP_EQUAL( "rgba(5, 10, 255, 0.50)", RGBA( 5, 10, 255, 128).toCss().c_str());
    STRCMP_EQUAL( "rgba(5, 10, 255, 0.75)", RGBA( 5, 10, 255, 190).toCss().c_str());
    STRCMP_EQUAL( "rgba(5, 10, 255, 0.25)", RGBA( 5, 10, 255, 64).toCss().c_str());
    STRCMP_EQUAL( "rgba(5, 10, 255, 0.00)", RGBA( 5, 10, 255, 0).toCss().c_str());
    STRCMP_EQUAL( "rgba(5, 10, 255, 1.00)", RGBA( 5, 10, 255, 255).toCss().c_str());
}

TEST( CssCodecTests, HslNotationUsesPercentages)
{
    STRCMP_EQUAL( "hsl(6, 93%, 71%)", HSL( 6, 93, 71).toCss().c_str());
    STRCMP_EQUAL( "hsl(0, 0%, 100%)", HSL( 0, 0, 100).toCss().c_str());
    STRCMP_EQUAL( "hsl(359, 100%, 0%)", HSL( 359, 100, 0).toCss().c_str());
}

TEST( CssCodecTests, HslaNotation)
{
    STRCMP_EQUAL( "hsla(6, 93%, 71%, 0.50)", HSLA( 6, 93, 71, 128).toCss().c_str());
    STRCMP_EQUAL( "hsla(6, 93%, 71%, 1.00)", HSL( 6, 93, 71).toHsla().toCss().c_str());
}

TEST( CssCodecTests, HueIsPrintedModuloTurn)
{
    STRCMP_EQUAL( "hsl(10, 50%, 50%)", HSL( 370, 50, 50).toCss().c_str());
}

TEST( CssCodecTests, DescribeDumpsRawStorage)
{
    STRCMP_EQUAL( "RGB { r: 5, g: 10, b: 15 }", CssCodec::describe( RGB( 5, 10, 15)).c_str());
    STRCMP_EQUAL( "RGBA { r: 5, g: 10, b: 15, a: 20 }", CssCodec::describe( RGBA( 5, 10, 15, 20)).c_str());
    STRCMP_EQUAL( "HSL { h: 6, s: 237, l: 181 }", CssCodec::describe( HSL( 6, 93, 71)).c_str());
    STRCMP_EQUAL( "HSLA { h: 6, s: 237, l: 181, a: 7 }", CssCodec::describe( HSLA( 6, 93, 71, 7)).c_str());
}

TEST( CssCodecTests, StreamsWriteCss)
{
    std::stringstream out;
    out << RGB( 1, 2, 3) << ' ' << HSLA( 6, 93, 71, 0);
    STRCMP_EQUAL( "rgb(1, 2, 3) hsla(6, 93%, 71%, 0.00)", out.str().c_str());
}

TEST( CssCodecTests, StreamsWriteScalars)
{
    std::stringstream out;
    out << Ratio::fromPercentage( 40) << ' ' << Angle( 400);
    STRCMP_EQUAL( "40% 40", out.str().c_str());
}

TEST_GROUP( ColorVariantTests)
{
};

TEST( ColorVariantTests, DispatchesToTheHeldModel)
{
    ColorVariant color = HSL( 6, 93, 71);
    STRCMP_EQUAL( "hsl(6, 93%, 71%)", toCss( color).c_str());
    STRCMP_EQUAL( "HSL { h: 6, s: 237, l: 181 }", describe( color).c_str());
    CHECK_EQUAL( HSL( 6, 93, 71).toRgba(), toRgba( color));

    color = RGBA( 1, 2, 3, 4);
    STRCMP_EQUAL( "rgba(1, 2, 3, 0.02)", toCss( color).c_str());
    CHECK_EQUAL( RGBA( 1, 2, 3, 4), toRgba( color));
}

TEST( ColorVariantTests, NamesTheModel)
{
    STRCMP_EQUAL( "rgb", std::string( modelName( RGB( 0, 0, 0))).c_str());
    STRCMP_EQUAL( "rgba", std::string( modelName( RGBA( 0, 0, 0, 0))).c_str());
    STRCMP_EQUAL( "hsl", std::string( modelName( HSL( 0, 0, 0))).c_str());
    STRCMP_EQUAL( "hsla", std::string( modelName( HSLA( 0, 0, 0, 0))).c_str());
}

TEST( ColorVariantTests, StreamsWriteCss)
{
    std::stringstream out;
    out << ColorVariant( RGB( 9, 8, 7));
    STRCMP_EQUAL( "rgb(9, 8, 7)", out.str().c_str());
}
