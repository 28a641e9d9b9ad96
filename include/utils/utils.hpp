#ifndef CSSCOLORS_UTILS_HPP
#define CSSCOLORS_UTILS_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "csscolors.hpp"

namespace Util
{
    /*
     * Reports an unrecoverable misuse of the library and terminates.
     * The library ships a weak definition; a program may provide its own,
     * which must not return either.
     */
    [[noreturn]] void fatalError( std::string_view message);

    /*
     * Splits a given string into lines, padding each one on the right to
     * the length of the longest when `pad` is set.
     */
    template <typename T>
    std::pair<std::vector<std::basic_string<T>>, int> expand( std::basic_string_view<T> provision, bool pad = true)
    {
        std::vector<std::basic_string<T>> parts;
        int j = 0, max_length = 0, prev = '\0';
        for( int i = 0; i < INT_CAST( provision.length()); ++i)
        {
            if( provision[ i] == '\n')
            {
                int length = i - j - ( prev == '\r');
                parts.emplace_back( provision.substr( j, length));
                j = i + 1;
                max_length = std::max<int>( length, max_length);
            }
            prev = provision[ i];
        }
        parts.emplace_back( provision.substr( j));
        max_length = std::max<int>( parts.back().length(), max_length);
        if( pad)
        {
            for( auto& line : parts)
                line.append( std::basic_string<T>( max_length - line.length(), ' '));
        }
        return { parts, max_length};
    }

    /*
     * Consumes white space up to a non-empty character.
     */
    bool ltrim( const char*& p);

    /*
     * Split the given string `provision` based on the given regular expression.
     */
    std::vector<std::string> partition( std::string_view provision, std::string_view reg_expr);

    /*
     * Writes the frame to a terminal, one cell per column and pair of rows,
     * sampling every `step`th pixel.
     */
    void preview( FrameBuffer<uint32_t>& frame, FILE *destination, int32_t step = 1);

    void requestFontList();

    /*
     * Resolves a font family (optionally followed by a style, e.g.
     * "DejaVu Sans Bold") or a path to a font file.
     */
    std::string getFontFile( std::string_view font);
}

#endif //CSSCOLORS_UTILS_HPP
