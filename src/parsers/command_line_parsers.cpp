#include <algorithm>
#include <array>
#include <iomanip>
#include <iostream>
#include <string>
#include "csscolors.hpp"
#include "parsers/command_line_parsers.hpp"
#include "parsers/option-builder.hpp"
#include "parsers/option_defs.hpp"
#include "plugins/image_manager.hpp"
#include "utils/utils.hpp"

#define MIN_TILE_SIZE                  8
#define MAX_TILE_SIZE                  1024
#define NO_DEFAULT                     std::vector<std::string_view>{}

namespace CssColors
{
    __attribute__((weak)) std::string_view getDefaultFont()
    {
        return PROJECT_DEFAULT_FONT;
    }

    CommandLineParser::CommandLineParser( int ac, char **av)
    : argc( ac), argv( av)
    {
    }

    ApplicationDirector CommandLineParser::process()
    {
        ApplicationDirector director;

        OptionBuilder builder( argc, argv);
        bool mismatched = false;
        builder.addMismatchConsumer([ &mismatched]( auto *token, int)
        {
            std::cerr << "Unknown option: " << token <<'\n';
            mismatched = true;
        });
        builder.addOption( HELP_PROMPT,    SHORT( HELP_PROMPT))
               .addOption( INPUT_COLOR,    SHORT( INPUT_COLOR),   NO_DEFAULT, 1)
               .addOption( APPLY_RULE,     SHORT( APPLY_RULE),    NO_DEFAULT, 1)
               .addOption( OUTPUT,         SHORT( OUTPUT),        NO_DEFAULT, 1)
               .addOption( QUALITY_INDEX,  SHORT( QUALITY_INDEX), "100", 1)
               .addOption( TILE_SIZE,      SHORT( TILE_SIZE),     "96", 1)
               .addOption( FONT_PROFILE,   SHORT( FONT_PROFILE),  getDefaultFont(), 1)
               .addOption( NO_LABELS,      SHORT( NO_LABELS))
               .addOption( PREVIEW,        SHORT( PREVIEW))
               .addOption( VERBOSE,        SHORT( VERBOSE))
               .addOption( LIST_FONTS,     SHORT( LIST_FONTS))
               .build();

        if( builder.isSet( HELP_PROMPT))
        {
            helpMe( *argv, stdout);
            exit( EXIT_SUCCESS);
        }

        if( builder.isSet( LIST_FONTS))
        {
            puts( "Available fonts:\n");
            Util::requestFontList();
            exit( EXIT_SUCCESS);
        }

        director.color = builder.asDefault( INPUT_COLOR);
        if( mismatched || !ACCESSIBLE( director.color))
        {
            if( !mismatched)
                fprintf( stderr, "No input color given.\n");
            helpMe( *argv, stderr);
            exit( EXIT_FAILURE);
        }

        director.operations = builder.asDefault( APPLY_RULE);

        auto output = builder.asDefault( OUTPUT);
        if( ACCESSIBLE( output))
        {
            director.src_filename = output;
            if( ImageManager::isJPEG( output))
                director.out_format = OutputFormat::JPEG;
            else if( ImageManager::isPNG( output))
                director.out_format = OutputFormat::PNG;
            else
            {
                fprintf( stderr, "Unsupported image format: `%s`, expected .png, .jpg or .jpeg\n", output);
                exit( EXIT_FAILURE);
            }
        }

        auto quality = builder.asInt( QUALITY_INDEX);
        if( quality < 1 || quality > PERCENT_SCALE)
        {
            fprintf( stderr, "Image quality must be in [1, %d]\n", PERCENT_SCALE);
            exit( EXIT_FAILURE);
        }

        auto tile_size = builder.asInt( TILE_SIZE);
        if( tile_size < MIN_TILE_SIZE || tile_size > MAX_TILE_SIZE)
        {
            fprintf( stderr, "Tile size must be in [%d, %d]\n", MIN_TILE_SIZE, MAX_TILE_SIZE);
            exit( EXIT_FAILURE);
        }

        director.image_quality = INT_CAST( quality);
        director.tile_size     = static_cast<size_t>( tile_size);
        director.font_profile  = builder.asDefault( FONT_PROFILE);
        director.labels        = !builder.isSet( NO_LABELS);
        director.preview       = builder.isSet( PREVIEW);
        director.verbose       = builder.isSet( VERBOSE);

        return director;
    }

    void CommandLineParser::helpMe( std::string_view program, FILE *destination)
    {
        std::array<std::string_view, OPTIONS_COUNT> options =
        {
            STRUCTURE_PREFIX( INPUT_COLOR),
            STRUCTURE_PREFIX( APPLY_RULE),
            STRUCTURE_PREFIX( OUTPUT),
            STRUCTURE_PREFIX( QUALITY_INDEX),
            STRUCTURE_PREFIX( TILE_SIZE),
            STRUCTURE_PREFIX( FONT_PROFILE),
            STRUCTURE_PREFIX( NO_LABELS),
            STRUCTURE_PREFIX( PREVIEW),
            STRUCTURE_PREFIX( VERBOSE),
            STRUCTURE_PREFIX( LIST_FONTS),
            STRUCTURE_PREFIX( HELP_PROMPT)
        };
        std::array<std::string_view, OPTIONS_COUNT> options_message =
        {
            MESSAGE( INPUT_COLOR),
            MESSAGE( APPLY_RULE),
            MESSAGE( OUTPUT),
            MESSAGE( QUALITY_INDEX),
            MESSAGE( TILE_SIZE),
            MESSAGE( FONT_PROFILE),
            MESSAGE( NO_LABELS),
            MESSAGE( PREVIEW),
            MESSAGE( VERBOSE),
            MESSAGE( LIST_FONTS),
            MESSAGE( HELP_PROMPT)
        };

        size_t max_length{};
        std::for_each( std::cbegin( options), std::cend( options),
                       [ &max_length]( auto each){ max_length = std::max( max_length, each.size());});

        auto slash = program.rfind( '/');
        if( slash != std::string_view::npos)
            program.remove_prefix( slash + 1);
        fprintf( destination, "Usage: %.*s --color=COLOR [OPTION]...\n", INT_CAST( program.size()), program.data());
        fprintf( destination, "Apply CSS color operations to COLOR and print the result\n\n");
        fprintf( destination, "The following options can be used to tune the tool:\n");
        for( size_t j = 0; j < OPTIONS_COUNT; ++j)
        {
            auto help_lines = Util::expand( options_message[ j]).first;
            auto indent = INT_CAST( max_length) + ALLOWANCE;
            fprintf( destination, "  %-*.*s%s\n", indent, INT_CAST( options[ j].size()), options[ j].data(),
                     help_lines[ 0].c_str());
            for( size_t idx = 1; idx < help_lines.size(); ++idx)
                fprintf( destination, "  %*s%s\n", indent, "", help_lines[ idx].c_str());
        }
        fprintf( destination, "\nExample: %.*s -c \"rgb(255, 99, 71)\" -a \"saturate(20) spin(-30)\" -o tomato.png\n",
                 INT_CAST( program.size()), program.data());
    }
}
