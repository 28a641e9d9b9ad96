#include <regex>
#include "csscolors.hpp"
#include "plugins/image_manager.hpp"
#if PNG_SUPPORTED
    #include <png++/png.hpp>
#endif
#if JPG_SUPPORTED
    #include <jpeglib.h>
#endif

namespace CssColors
{
    namespace
    {
        bool hasExtension( std::string_view filename, const char *pattern)
        {
            auto position = filename.rfind( '.');
            if( position == std::string_view::npos || position + 1 == filename.size())
                return false;

            std::regex rule( pattern, std::regex_constants::icase);
            auto *extension = filename.data() + position + 1;
            return std::regex_match( extension, filename.data() + filename.size(), rule);
        }
    }

    ImageManager::ImageManager( ApplicationDirector& manager)
    : Plugin( IMAGE_MANAGER), app_manager_( manager)
    {
    }

    bool ImageManager::writeImage( FrameBuffer<uint32_t>& frame) const
    {
        if( !ACCESSIBLE( app_manager_.src_filename))
            return false;

        if( app_manager_.out_format == OutputFormat::PNG)
        {
            #if PNG_SUPPORTED
            return writePNG( app_manager_.src_filename, frame);
            #endif
        }
        else
        {
            #if JPG_SUPPORTED
            return writeJPEG( app_manager_.src_filename, frame, app_manager_.image_quality);
            #endif
        }

        fprintf( stderr, "This build cannot write `%s`\n", app_manager_.src_filename);
        return false;
    }

    bool ImageManager::isJPEG( std::string_view filename)
    {
        return hasExtension( filename, R"(^jpe?g$)");
    }

    bool ImageManager::isPNG( std::string_view filename)
    {
        return hasExtension( filename, R"(^png$)");
    }

    bool ImageManager::writeJPEG( const std::string& filename, FrameBuffer<uint32_t> &frame, int quality)
    {
        #if JPG_SUPPORTED
        auto *handle = fopen( filename.data(), "wb");
        if( handle == nullptr)
        {
            fprintf( stderr, "Unable to open `%s` for writing\n", filename.c_str());
            return false;
        }
        PropertyManager<FILE *> f_manager( handle, []( auto *p){ fclose( p);});
        jpeg_compress_struct compressor{};
        jpeg_error_mgr error_mgr{};
        compressor.err = jpeg_std_error( &error_mgr);

        jpeg_create_compress( &compressor);
        PropertyManager<jpeg_compress_struct *> manager( &compressor, jpeg_destroy_compress);
        jpeg_stdio_dest( &compressor, handle);

        compressor.image_width = frame.width;
        compressor.image_height = frame.height;
        compressor.input_components = 3;
        compressor.in_color_space = JCS_RGB;

        jpeg_set_defaults( &compressor);
        compressor.dct_method  = JDCT_FLOAT;
        jpeg_set_quality( &compressor, quality, TRUE);

        const auto row_stride = compressor.image_width * 3;
        jpeg_start_compress( &compressor, TRUE);
        auto *buffer = frame.buffer.get();
        PropertyManager<uint8_t *> row_manager( new uint8_t[ row_stride], []( auto *p) { delete[] p;});
        auto *row_buffer = row_manager.get();
        for( int32_t j = 0; j < frame.height; ++j)
        {
            for( int32_t i = 0; i < frame.width; ++i)
            {
                auto pixel = buffer[ j * frame.width + i];
                row_buffer[ i * 3 + 0] = RED( pixel);
                row_buffer[ i * 3 + 1] = GREEN( pixel);
                row_buffer[ i * 3 + 2] = BLUE( pixel);
            }
            jpeg_write_scanlines( &compressor, &row_buffer, 1);
        }

        jpeg_finish_compress( &compressor);
        return true;
        #else
        ( void)filename, ( void)frame, ( void)quality;
        return false;
        #endif
    }

    bool ImageManager::writePNG( const std::string& filename, FrameBuffer<uint32_t> &frame)
    {
        #if PNG_SUPPORTED
        png::image<png::rgba_pixel> image( frame.width, frame.height);
        auto *buffer = frame.buffer.get();
        for( int32_t j = 0; j < frame.height; ++j)
        {
            for( int32_t i = 0; i < frame.width; ++i)
            {
                auto pixel = buffer[ j * frame.width + i];
                image.set_pixel( i, j, png::rgba_pixel( RED( pixel), GREEN( pixel), BLUE( pixel), ALPHA( pixel)));
            }
        }

        try
        {
            image.write( filename);
        }
        catch( const std::runtime_error& error)
        {
            fprintf( stderr, "Unable to write `%s`: %s\n", filename.c_str(), error.what());
            return false;
        }
        return true;
        #else
        ( void)filename, ( void)frame;
        return false;
        #endif
    }
}
