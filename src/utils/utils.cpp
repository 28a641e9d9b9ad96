#include <algorithm>
#include <iostream>
#include <locale>
#include <regex>
#include "csscolors.hpp"
#include "utils/utils.hpp"
#if FONT_SUPPORTED
    #include <fontconfig/fontconfig.h>
#endif
#if HAVE_SYS_STAT_H
    #include <sys/types.h>
    #include <sys/stat.h>
#endif

namespace Util
{
    __attribute__((weak)) void fatalError( std::string_view message)
    {
        fprintf( stderr, "csscolors: fatal: %.*s\n", INT_CAST( message.size()), message.data());
        abort();
    }

    bool ltrim( const char*& p)
    {
        while( isspace( static_cast<unsigned char>( *p)))
            ++p;
        return true;
    }

    std::vector<std::string> partition( std::string_view provision, std::string_view regexpr)
    {
        std::regex  key( regexpr.data(), regexpr.size());
        std::cregex_iterator begin( provision.data(), provision.data() + provision.size(), key),
                end, prev;

        std::vector<std::string> results;
        for( ;begin != end; prev = begin, ++begin)
            results.emplace_back( begin->prefix().str());

        if( prev != end && begin == end)
            results.emplace_back( prev->suffix().str());

        return results;
    }

    void preview( FrameBuffer<uint32_t>& frame, FILE *destination, int32_t step)
    {
        step = std::max( step, 1);
        auto *buffer = frame.buffer.get();
        // Upper half block: foreground paints the top pixel, background the bottom one.
        for( int32_t j = 0; j < frame.height; j += 2 * step)
        {
            for( int32_t i = 0; i < frame.width; i += step)
            {
                auto top    = buffer[ j * frame.width + i],
                     bottom = j + step < frame.height ? buffer[( j + step) * frame.width + i] : top;
                fprintf( destination, "\x1B[38;2;%d;%d;%dm\x1B[48;2;%d;%d;%dm▀",
                         RED( top), GREEN( top), BLUE( top), RED( bottom), GREEN( bottom), BLUE( bottom));
            }
            fprintf( destination, "\x1B[0m\n");
        }
    }

    void requestFontList()
    {
        #if FONT_SUPPORTED
        if( !FcInit())
            return;

        auto locale_name = std::locale("").name();
        if( size_t idx = locale_name.find( '_'); idx != std::string::npos)
            locale_name = locale_name.substr( 0, idx).insert( 0, ":lang=");
        else
            locale_name.clear();
        PropertyManager<FcPattern *> pattern( FcNameParse(( FcChar8 *)locale_name.c_str()), FcPatternDestroy);
        PropertyManager<FcObjectSet *> font_object_set( FcObjectSetBuild( FC_FAMILY, FC_STYLE, nullptr),
                                                        FcObjectSetDestroy);
        PropertyManager<FcFontSet *> font_set( FcFontList( nullptr, pattern.get(), font_object_set.get()),
                                               []( auto font_set_local)
                                               {
                                                   if( font_set_local)
                                                       FcFontSetDestroy( font_set_local);
                                               });

        for( int i = 0; font_set && i < font_set->nfont; ++i)
        {
            FcChar8 *family = nullptr, *style = nullptr;
            if( FcPatternGetString( font_set->fonts[ i], FC_FAMILY, 0, &family) != FcResultMatch)
                continue;
            std::cout << "Family: " << ( const char *)family;
            if( FcPatternGetString( font_set->fonts[ i], FC_STYLE, 0, &style) == FcResultMatch)
                std::cout << ", style: " << ( const char *)style;
            std::cout << '\n';
        }
        #else
        fprintf( stderr, "This build has no font support.\n");
        #endif
    }

    std::string getFontFile( std::string_view font)
    {
        if( font.empty())
            return {};

        #if HAVE_SYS_STAT_H
        struct stat info{};
        std::string path( font);
        if( stat( path.c_str(), &info) == 0 && S_ISREG( info.st_mode))
            return path;
        #endif

        #if FONT_SUPPORTED
        if( !FcInit())
            return {};

        std::string style;
        std::cmatch cm;
        std::regex key( R"(^(.*?)\s+(normal|regular|bold|italic|bold italic)\s*$)", std::regex_constants::icase);
        std::string family( font);
        if( std::regex_match( family.c_str(), cm, key))
        {
            style  = cm[ 2].str();
            family = cm[ 1].str();
        }

        auto parts = Util::partition( family, R"(\s*,\s*)");
        if( parts.empty())
            parts.emplace_back( family);
        for( auto& part : parts)
        {
            PropertyManager<FcPattern *> pattern( FcPatternCreate(), FcPatternDestroy);
            FcPatternAddString( pattern.get(), FC_FAMILY, ( const FcChar8 *)part.c_str());
            if( !style.empty())
                FcPatternAddString( pattern.get(), FC_STYLE, ( const FcChar8 *)style.c_str());
            PropertyManager<FcObjectSet *> font_object_set( FcObjectSetBuild( FC_FILE, nullptr),
                                                            FcObjectSetDestroy);
            PropertyManager<FcFontSet *> font_set( FcFontList( nullptr, pattern.get(), font_object_set.get()),
                                                   []( auto font_set_local)
                                                   {
                                                       if( font_set_local)
                                                           FcFontSetDestroy( font_set_local);
                                                   });
            for( int i = 0; font_set && i < font_set->nfont; ++i)
            {
                FcChar8 *filename = nullptr;
                if( FcPatternGetString( font_set->fonts[ i], FC_FILE, 0, &filename) == FcResultMatch)
                    return ( const char *)filename;
            }
        }
        #endif

        return {};
    }
}
