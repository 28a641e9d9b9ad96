#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include "test_helpers.hpp"
#include "plugins/image_manager.hpp"
#include "plugins/plugin_manager.hpp"
#include "renderers/swatch_renderer.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"
#if PNG_SUPPORTED
    #include <png++/png.hpp>
#endif
#include "CppUTest/TestHarness.h"

using namespace CssColors;

TEST_GROUP( PixelTests)
{
};

TEST( PixelTests, PacksAsRgba)
{
    LONGS_EQUAL( 0x0A141E28u, ColorUtil::pack( RGBA( 10, 20, 30, 40)));
    CHECK_EQUAL( RGBA( 10, 20, 30, 40), ColorUtil::unpack( 0x0A141E28u));
    LONGS_EQUAL( 0xFFFFFFFFu, ColorUtil::pack( RGB( 255, 255, 255).toRgba()));
}

TEST( PixelTests, ClampsToByteRange)
{
    LONGS_EQUAL( 0, ColorUtil::colorClamp( -3.f));
    LONGS_EQUAL( 255, ColorUtil::colorClamp( 300.f));
    LONGS_EQUAL( 128, ColorUtil::colorClamp( 127.6f));
}

TEST( PixelTests, SourceOverKeepsOpaqueTopAndHidesTransparentTop)
{
    LONGS_EQUAL( 0x123456FFu, ColorUtil::sourceOver( 0x123456FFu, CHECKER_DARK));
    LONGS_EQUAL( CHECKER_DARK, ColorUtil::sourceOver( 0x12345600u, CHECKER_DARK));
}

TEST( PixelTests, SourceOverBlendsOnAlpha)
{
    LONGS_EQUAL( 0x7F7FFFFFu, ColorUtil::sourceOver( 0x0000FF80u, CHECKER_LIGHT));
    LONGS_EQUAL( 0x6666E6FFu, ColorUtil::sourceOver( 0x0000FF80u, CHECKER_DARK));
}

TEST( PixelTests, CheckerboardAlternatesEveryEightPixels)
{
    LONGS_EQUAL( CHECKER_LIGHT, SwatchRenderer::checkerAt( 0, 0));
    LONGS_EQUAL( CHECKER_LIGHT, SwatchRenderer::checkerAt( 7, 7));
    LONGS_EQUAL( CHECKER_DARK, SwatchRenderer::checkerAt( 8, 0));
    LONGS_EQUAL( CHECKER_DARK, SwatchRenderer::checkerAt( 0, 8));
    LONGS_EQUAL( CHECKER_LIGHT, SwatchRenderer::checkerAt( 8, 8));
}

TEST_GROUP( SwatchRendererTests)
{
    ApplicationDirector director;
    std::unique_ptr<SwatchRenderer> renderer;

    void setup() override
    {
        director.tile_size = 16;
        director.labels    = false;
        renderer = std::make_unique<SwatchRenderer>( director);
    }

    FrameBuffer<uint32_t> redAndTranslucentBlue()
    {
        return renderer->render({ RGB( 255, 0, 0), RGBA( 0, 0, 255, 128)});
    }

    static uint32_t at( const FrameBuffer<uint32_t>& frame, int32_t x, int32_t y)
    {
        return frame.buffer.get()[ y * frame.width + x];
    }
};

TEST( SwatchRendererTests, OneTilePerColor)
{
    auto frame = redAndTranslucentBlue();
    CHECK_FALSE( renderer->hasLabels());
    LONGS_EQUAL( 32, frame.width);
    LONGS_EQUAL( 16, frame.height);
    LONGS_EQUAL( 4, frame.n_channel);
}

TEST( SwatchRendererTests, OpaqueTileIsFlat)
{
    auto frame = redAndTranslucentBlue();
    LONGS_EQUAL( 0xFF0000FFu, at( frame, 0, 0));
    LONGS_EQUAL( 0xFF0000FFu, at( frame, 8, 0));
    LONGS_EQUAL( 0xFF0000FFu, at( frame, 15, 15));
}

TEST( SwatchRendererTests, TranslucentTileShowsTheCheckerboard)
{
    auto frame = redAndTranslucentBlue();
    LONGS_EQUAL( 0x7F7FFFFFu, at( frame, 16, 0));
    LONGS_EQUAL( 0x6666E6FFu, at( frame, 24, 0));
    LONGS_EQUAL( 0x6666E6FFu, at( frame, 16, 8));
    LONGS_EQUAL( 0x7F7FFFFFu, at( frame, 31, 15));
}

TEST( SwatchRendererTests, LabelStripHasAMinimumHeight)
{
    LONGS_EQUAL( 16, renderer->labelHeight());
    director.tile_size = 128;
    LONGS_EQUAL( 32, renderer->labelHeight());
}

TEST( SwatchRendererTests, PreviewWritesTrueColorCells)
{
    auto frame = redAndTranslucentBlue();
    auto *file = tmpfile();
    CHECK( file != nullptr);
    Util::preview( frame, file, 1);
    rewind( file);

    std::string output;
    char chunk[ 256];
    size_t read;
    while(( read = fread( chunk, 1, sizeof( chunk), file)) > 0)
        output.append( chunk, read);
    fclose( file);

    CHECK( output.find( "\x1B[38;2;255;0;0m\x1B[48;2;255;0;0m") == 0);
    CHECK( output.find( "\x1B[38;2;127;127;255m") != std::string::npos);
    LONGS_EQUAL( 8, std::count( output.cbegin(), output.cend(), '\n'));
}

TEST( SwatchRendererTests, ImageManagerNeedsADestination)
{
    auto frame = redAndTranslucentBlue();
    ImageManager manager( director);
    CHECK_FALSE( manager.writeImage( frame));
}

#if PNG_SUPPORTED
TEST( SwatchRendererTests, PngKeepsEveryPixel)
{
    auto frame = redAndTranslucentBlue();
    const std::string filename = "csscolors_swatch_test.png";
    CHECK( ImageManager::writePNG( filename, frame));

    png::image<png::rgba_pixel> image( filename);
    std::remove( filename.c_str());
    LONGS_EQUAL( 32, image.get_width());
    LONGS_EQUAL( 16, image.get_height());

    auto red = image.get_pixel( 0, 0);
    LONGS_EQUAL( 255, red.red);
    LONGS_EQUAL( 0, red.green);
    LONGS_EQUAL( 255, red.alpha);

    auto blended = image.get_pixel( 24, 0);
    LONGS_EQUAL( 0x66, blended.red);
    LONGS_EQUAL( 0xE6, blended.blue);
}
#endif

TEST_GROUP( PluginManagerTests)
{
    ApplicationDirector director;

    void setup() override
    {
        director.labels = false;
    }

    void teardown() override
    {
        PluginManager::instance()->uninstall( SWATCH_RENDERER);
        PluginManager::instance()->uninstall( IMAGE_MANAGER);
    }
};

TEST( PluginManagerTests, FindsPluginsByName)
{
    auto *manager = PluginManager::instance();
    manager->install( std::make_unique<SwatchRenderer>( director));
    manager->install( std::make_unique<ImageManager>( director));

    CHECK( manager->get<SwatchRenderer>( SWATCH_RENDERER) != nullptr);
    CHECK( manager->get<ImageManager>( IMAGE_MANAGER) != nullptr);
    CHECK( manager->get<ImageManager>( SWATCH_RENDERER) == nullptr);
    CHECK( manager->get( "Missing") == nullptr);
}

TEST( PluginManagerTests, InstallReplacesAndUninstallRemoves)
{
    auto *manager = PluginManager::instance();
    manager->install( std::make_unique<SwatchRenderer>( director));
    manager->install( std::make_unique<SwatchRenderer>( director));
    CHECK( manager->get( SWATCH_RENDERER) != nullptr);
    STRCMP_EQUAL( SWATCH_RENDERER, std::string( manager->get( SWATCH_RENDERER)->getName()).c_str());

    manager->uninstall( SWATCH_RENDERER);
    CHECK( manager->get( SWATCH_RENDERER) == nullptr);
}
