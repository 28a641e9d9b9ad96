/***************************************************************************/
/*                                                                         */
/*  csscolors.cpp                                                          */
/*                                                                         */
/*    A terminal based CSS color manipulation utility                      */
/*                                                                         */
/*  Copyright 2022 by Adesina Meekness                                     */
/*                                                                         */
/*                                                                         */
/*       ##    ## ##                                                       */
/*       ##    ##  #                                                       */
/*       ###  ###  #  ##                                                   */
/*       # # # ##  # #                                                     */
/* ####  # ### ##  ###                                                     */
/*       #  #  ##  # ##                                                    */
/*       #  #  ##  #  ##                                                   */
/*                                                                         */
/*                                                                         */
/*  This file is part of the Csscolors project, and may only be used,      */
/*  modified, and distributed under the terms of the GNU project           */
/*  license, LICENSE.TXT.  By continuing to use, modify, or distribute     */
/*  this file you indicate that you have read the license and              */
/*  understand and accept it fully.                                        */
/*                                                                         */
/***************************************************************************/

#include <algorithm>
#include <iostream>
#include "csscolors.hpp"
#include "parsers/command_line_parsers.hpp"
#include "parsers/rule_parser.hpp"
#include "pipeline/color_pipeline.hpp"
#include "plugins/plugin_manager.hpp"
#include "plugins/image_manager.hpp"
#include "renderers/swatch_renderer.hpp"
#include "utils/utils.hpp"
#include "utils/timer.hpp"

using namespace CssColors;

int main( int argc, char *argv[])
{
    Timer::start();
    auto cmd_parser          = CommandLineParser( argc, argv);
    auto activity_director   = cmd_parser.process();
    auto plugin_manager      = PluginManager::instance();

    auto start = RuleParser::parseColor( activity_director.color);
    if( !start.has_value())
        return EXIT_FAILURE;

    std::vector<Operation> operations;
    if( ACCESSIBLE( activity_director.operations))
    {
        auto parsed = RuleParser::parseOperations( activity_director.operations);
        if( !parsed.has_value())
            return EXIT_FAILURE;
        operations = std::move( *parsed);
    }

    auto steps = ColorPipeline::run( *start, operations);
    if( activity_director.verbose)
    {
        std::clog << "start: " << describe( steps.front()) << " -> " << steps.front() <<'\n';
        for( size_t i = 0; i < operations.size(); ++i)
            std::clog << "step " << i + 1 << ": " << operations[ i].text << " -> " << steps[ i + 1] <<'\n';
    }
    std::cout << steps.back() <<'\n';

    if( !ACCESSIBLE( activity_director.src_filename) && !activity_director.preview)
        return EXIT_SUCCESS;

    plugin_manager->install( std::make_unique<SwatchRenderer>( activity_director));
    plugin_manager->install( std::make_unique<ImageManager>( activity_director));

    auto swatch_renderer = plugin_manager->get<SwatchRenderer>( SWATCH_RENDERER);
    auto surface = swatch_renderer->render( steps);
    if( activity_director.verbose)
        std::clog << "Rendered " << steps.size() << " tile(s) after: " << Timer::yield( GLOBAL_TIME_ID) <<'\n';

    if( activity_director.preview)
        Util::preview( surface, stdout, std::max( INT_CAST( activity_director.tile_size) / 16, 1));

    if( ACCESSIBLE( activity_director.src_filename))
    {
        auto image_manager = plugin_manager->get<ImageManager>( IMAGE_MANAGER);
        if( !ACCESSIBLE( image_manager) || !image_manager->writeImage( surface))
            return EXIT_FAILURE;
        if( activity_director.verbose)
            std::clog << "Finished writing `" << activity_director.src_filename << "` after: "
                      << Timer::yield( GLOBAL_TIME_ID) <<'\n';
    }

    return EXIT_SUCCESS;
}
