#include <algorithm>
#include "csscolors.hpp"
#include "renderers/swatch_renderer.hpp"
#include "utils/color_utils.hpp"
#include "utils/utils.hpp"

namespace CssColors
{
    SwatchRenderer::SwatchRenderer( ApplicationDirector& manager)
    : Plugin( SWATCH_RENDERER), app_manager_( manager)
    {
        if( app_manager_.labels)
            labels_ = loadFont();
    }

    bool SwatchRenderer::loadFont()
    {
        #if FONT_SUPPORTED
        if( FT_Init_FreeType( &library_) != 0)
        {
            fprintf( stderr, "Unable to start FreeType, labels disabled\n");
            library_ = nullptr;
            return false;
        }

        auto file = Util::getFontFile( app_manager_.font_profile);
        if( file.empty() || FT_New_Face( library_, file.c_str(), 0, &face_) != 0)
        {
            fprintf( stderr, "Unable to load font `%s`, labels disabled\n", app_manager_.font_profile.c_str());
            face_ = nullptr;
            return false;
        }

        return FT_Set_Pixel_Sizes( face_, 0, labelHeight() / 2) == 0;
        #else
        fprintf( stderr, "This build has no font support, labels disabled\n");
        return false;
        #endif
    }

    bool SwatchRenderer::hasLabels() const
    {
        return labels_;
    }

    int32_t SwatchRenderer::labelHeight() const
    {
        return std::max( INT_CAST( app_manager_.tile_size) / 4, 16);
    }

    uint32_t SwatchRenderer::checkerAt( int32_t x, int32_t y)
    {
        return ( x / CHECKER_SIZE + y / CHECKER_SIZE) % 2 ? CHECKER_DARK : CHECKER_LIGHT;
    }

    FrameBuffer<uint32_t> SwatchRenderer::render( const std::vector<ColorVariant>& colors)
    {
        auto tile   = INT_CAST( app_manager_.tile_size);
        auto width  = tile * INT_CAST( colors.size()),
             height = tile + ( labels_ ? labelHeight() : 0);
        std::shared_ptr<uint32_t> pixel(( uint32_t *)malloc( sizeof( uint32_t) * width * height),
                                        []( auto *p){ free( p);});
        std::fill_n( pixel.get(), width * height, LABEL_BACKGROUND);
        FrameBuffer<uint32_t> frame{ pixel, width, height, 4};

        auto *buffer = frame.buffer.get();
        for( size_t k = 0; k < colors.size(); ++k)
        {
            auto color = ColorUtil::pack( toRgba( colors[ k]));
            auto left  = INT_CAST( k) * tile;
            for( int32_t j = 0; j < tile; ++j)
                for( int32_t i = 0; i < tile; ++i)
                    buffer[ j * width + left + i] = ColorUtil::sourceOver( color, checkerAt( i, j));

            if( labels_)
                drawLabel( frame, toCss( colors[ k]), left, tile);
        }

        return frame;
    }

    void SwatchRenderer::drawLabel( FrameBuffer<uint32_t>& frame, std::string_view text, int32_t left, int32_t top)
    {
        #if FONT_SUPPORTED
        auto tile     = INT_CAST( app_manager_.tile_size);
        auto baseline = top + labelHeight() * 2 / 3;
        auto *buffer  = frame.buffer.get();

        // Shrink long labels to fit their tile.
        FT_Pos advance = 0;
        for( auto c : text)
            if( FT_Load_Char( face_, c, FT_LOAD_DEFAULT) == 0)
                advance += face_->glyph->advance.x;
        auto text_width = INT_CAST( From26Dot6( advance));
        auto pixel_size = labelHeight() / 2;
        if( text_width > tile - 4 && text_width > 0)
            pixel_size = std::max( pixel_size * ( tile - 4) / text_width, 6);
        if( FT_Set_Pixel_Sizes( face_, 0, pixel_size) != 0)
            return;

        int32_t pen = left + 2;
        for( auto c : text)
        {
            if( FT_Load_Char( face_, c, FT_LOAD_RENDER) != 0)
                continue;

            auto slot = face_->glyph;
            auto& bitmap = slot->bitmap;
            for( int32_t row = 0; row < INT_CAST( bitmap.rows); ++row)
            {
                auto y = baseline - slot->bitmap_top + row;
                if( y < top || y >= frame.height)
                    continue;
                for( int32_t col = 0; col < INT_CAST( bitmap.width); ++col)
                {
                    auto x = pen + slot->bitmap_left + col;
                    if( x < left || x >= left + tile)
                        continue;
                    auto coverage = bitmap.buffer[ row * bitmap.pitch + col];
                    auto& target  = buffer[ y * frame.width + x];
                    target = ColorUtil::colorLerp( target, LABEL_FOREGROUND, FLOAT_CAST( coverage) / RGB_SCALE);
                }
            }
            pen += INT_CAST( From26Dot6( slot->advance.x));
        }

        FT_Set_Pixel_Sizes( face_, 0, labelHeight() / 2);
        #else
        ( void)frame, ( void)text, ( void)left, ( void)top;
        #endif
    }

    SwatchRenderer::~SwatchRenderer()
    {
        #if FONT_SUPPORTED
        if( face_)
            FT_Done_Face( face_);
        if( library_)
            FT_Done_FreeType( library_);
        #endif
    }
}
