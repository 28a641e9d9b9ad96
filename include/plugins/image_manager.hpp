#ifndef CSSCOLORS_IMAGE_MANAGER_HPP
#define CSSCOLORS_IMAGE_MANAGER_HPP

#include <string>
#include <string_view>
#include "csscolors.hpp"
#include "plugins/plugin.hpp"

namespace CssColors
{
    /*
     * Writes rendered swatches to the file named on the command line, as
     * PNG or JPEG depending on its extension.
     */
    class ImageManager : public Plugin
    {
    public:
        explicit ImageManager( ApplicationDirector& manager);

        bool writeImage( FrameBuffer<uint32_t>& frame) const;

        static bool isJPEG( std::string_view filename);

        static bool isPNG( std::string_view filename);

        static bool writeJPEG( const std::string& filename, FrameBuffer<uint32_t> &frame, int quality);

        static bool writePNG( const std::string& filename, FrameBuffer<uint32_t> &frame);

    private:
        ApplicationDirector& app_manager_;
    };
}

#endif //CSSCOLORS_IMAGE_MANAGER_HPP
