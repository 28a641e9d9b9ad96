#ifndef CSSCOLORS_SWATCH_RENDERER_HPP
#define CSSCOLORS_SWATCH_RENDERER_HPP

#include <string_view>
#include <vector>
#include "csscolors.hpp"
#include "models/color_variant.hpp"
#include "plugins/plugin.hpp"
#if FONT_SUPPORTED
    #include <ft2build.h>
    #include FT_FREETYPE_H
#endif

#define SWATCH_RENDERER                "SwatchRenderer"
#define CHECKER_SIZE                   8
#define CHECKER_DARK                   0xCCCCCCFFu
#define CHECKER_LIGHT                  0xFFFFFFFFu
#define LABEL_BACKGROUND               0xFFFFFFFFu
#define LABEL_FOREGROUND               0x000000FFu

namespace CssColors
{
    /*
     * Paints one square tile per color, left to right. Translucent colors
     * are composited over a checkerboard so their alpha stays visible.
     * With labels on, a white strip under the tiles carries each color's
     * CSS text.
     */
    class SwatchRenderer : public Plugin
    {
    public:
        explicit SwatchRenderer( ApplicationDirector& manager);

        SwatchRenderer( const SwatchRenderer&) = delete;

        SwatchRenderer& operator=( const SwatchRenderer&) = delete;

        FrameBuffer<uint32_t> render( const std::vector<ColorVariant>& colors);

        // True once a font has been loaded and labels were requested.
        [[nodiscard]] bool hasLabels() const;

        [[nodiscard]] int32_t labelHeight() const;

        static uint32_t checkerAt( int32_t x, int32_t y);

        ~SwatchRenderer() override;

    private:
        bool loadFont();

        void drawLabel( FrameBuffer<uint32_t>& frame, std::string_view text, int32_t left, int32_t top);

        ApplicationDirector& app_manager_;
        bool labels_{ false};
        #if FONT_SUPPORTED
        FT_Library library_{};
        FT_Face face_{};
        #endif
    };
}

#endif //CSSCOLORS_SWATCH_RENDERER_HPP
