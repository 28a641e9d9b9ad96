#include <chrono>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>
#include "csscolors.hpp"
#include "parsers/command_line_parsers.hpp"
#include "parsers/option-builder.hpp"
#include "parsers/option_defs.hpp"
#include "plugins/image_manager.hpp"
#include "utils/timer.hpp"
#include "CppUTest/TestHarness.h"

using namespace CssColors;

/*
 * Owns a writable copy of the arguments, as the option parser splits
 * `key=value` in place.
 */
class CommandLineArguments
{
public:
    CommandLineArguments( std::initializer_list<const char *> arguments)
    {
        for( auto *argument : arguments)
            storage.emplace_back( argument, argument + strlen( argument) + 1);
        for( auto& argument : storage)
            pointers.push_back( argument.data());
        pointers.push_back( nullptr);
    }

    int count() const
    {
        return INT_CAST( storage.size());
    }

    char **values()
    {
        return pointers.data();
    }

private:
    std::vector<std::vector<char>> storage;
    std::vector<char *> pointers;
};

TEST_GROUP( OptionBuilderTests)
{
    std::unique_ptr<CommandLineArguments> args;
    std::unique_ptr<OptionBuilder> builder;
    std::vector<std::string> mismatches;

    OptionBuilder& newBuilder( std::initializer_list<const char *> arguments)
    {
        args    = std::make_unique<CommandLineArguments>( arguments);
        builder = std::make_unique<OptionBuilder>( args->count(), args->values());
        builder->addMismatchConsumer([ this]( const char *token, int)
        {
            mismatches.emplace_back( token);
        });
        builder->addOption( "color", "c", std::vector<std::string_view>{}, 1)
                .addOption( "quality", "q", "100", 1)
                .addOption( "verbose", "v");
        return *builder;
    }
};

TEST( OptionBuilderTests, LongKeyWithValue)
{
    newBuilder({ "csscolors", "--color=rgb(1, 2, 3)"}).build();
    CHECK( builder->isSet( "color"));
    CHECK( builder->isSet( "c"));
    STRCMP_EQUAL( "rgb(1, 2, 3)", builder->asDefault( "color"));
    STRCMP_EQUAL( "rgb(1, 2, 3)", builder->asDefault( "c"));
}

TEST( OptionBuilderTests, ShortKeyTakesTheNextArgument)
{
    newBuilder({ "csscolors", "-c", "hsl(1, 2, 3)", "-q", "42"}).build();
    STRCMP_EQUAL( "hsl(1, 2, 3)", builder->asDefault( "color"));
    LONGS_EQUAL( 42, builder->asInt( "quality"));
    LONGS_EQUAL( 42, builder->asInt( "q"));
}

TEST( OptionBuilderTests, MissingOptionsFallBackToDefaults)
{
    newBuilder({ "csscolors"}).build();
    CHECK_FALSE( builder->isSet( "quality"));
    LONGS_EQUAL( 100, builder->asInt( "quality"));
    LONGS_EQUAL( 100, builder->asInt( "q"));
    CHECK( builder->asDefault( "color") == nullptr);
    CHECK_FALSE( builder->asBool( "verbose"));
    LONGS_EQUAL( 0, builder->get( "color").size());
}

TEST( OptionBuilderTests, FlagsNeedNoValue)
{
    newBuilder({ "csscolors", "-v"}).build();
    CHECK( builder->isSet( "verbose"));
    CHECK( builder->asBool( "verbose"));
    CHECK( mismatches.empty());
}

TEST( OptionBuilderTests, ReportsUnknownTokens)
{
    newBuilder({ "csscolors", "--bogus", "stray", "-v"}).build();
    LONGS_EQUAL( 2, mismatches.size());
    STRCMP_EQUAL( "bogus", mismatches[ 0].c_str());
    STRCMP_EQUAL( "stray", mismatches[ 1].c_str());
    CHECK( builder->isSet( "v"));
}

TEST_GROUP( CommandLineParserTests)
{
    std::unique_ptr<CommandLineArguments> args;

    ApplicationDirector process( std::initializer_list<const char *> arguments)
    {
        args = std::make_unique<CommandLineArguments>( arguments);
        return CommandLineParser( args->count(), args->values()).process();
    }
};

TEST( CommandLineParserTests, DefaultsWithOnlyAColor)
{
    auto director = process({ "csscolors", "-c", "rgb(1, 2, 3)"});
    STRCMP_EQUAL( "rgb(1, 2, 3)", director.color);
    CHECK( director.operations == nullptr);
    CHECK( director.src_filename == nullptr);
    LONGS_EQUAL( 100, director.image_quality);
    LONGS_EQUAL( 96, director.tile_size);
    STRCMP_EQUAL( std::string( getDefaultFont()).c_str(), director.font_profile.c_str());
    CHECK( director.labels);
    CHECK_FALSE( director.preview);
    CHECK_FALSE( director.verbose);
}

TEST( CommandLineParserTests, EveryOptionLandsInTheDirector)
{
    auto director = process({ "csscolors", "--color=hsla(6, 93, 71, 128)", "--apply=spin(30) greyscale",
                              "-o", "swatch.JPEG", "-q=80", "--tile-size", "64", "-f", "Liberation Mono",
                              "-n", "--preview", "-v"});
    STRCMP_EQUAL( "hsla(6, 93, 71, 128)", director.color);
    STRCMP_EQUAL( "spin(30) greyscale", director.operations);
    STRCMP_EQUAL( "swatch.JPEG", director.src_filename);
    CHECK( director.out_format == OutputFormat::JPEG);
    LONGS_EQUAL( 80, director.image_quality);
    LONGS_EQUAL( 64, director.tile_size);
    STRCMP_EQUAL( "Liberation Mono", director.font_profile.c_str());
    CHECK_FALSE( director.labels);
    CHECK( director.preview);
    CHECK( director.verbose);
}

TEST( CommandLineParserTests, PngOutputIsRecognised)
{
    auto director = process({ "csscolors", "-c", "rgb(1, 2, 3)", "--output=out/swatch.png"});
    STRCMP_EQUAL( "out/swatch.png", director.src_filename);
    CHECK( director.out_format == OutputFormat::PNG);
}

TEST_GROUP( ImageFormatTests)
{
};

TEST( ImageFormatTests, MatchesExtensionsCaseInsensitively)
{
    CHECK( ImageManager::isJPEG( "a.jpg"));
    CHECK( ImageManager::isJPEG( "a.JPEG"));
    CHECK( ImageManager::isJPEG( "dir.v2/a.jpeg"));
    CHECK( ImageManager::isPNG( "a.png"));
    CHECK( ImageManager::isPNG( "a.PnG"));
}

TEST( ImageFormatTests, RejectsOtherNames)
{
    CHECK_FALSE( ImageManager::isJPEG( "a.png"));
    CHECK_FALSE( ImageManager::isJPEG( "jpg"));
    CHECK_FALSE( ImageManager::isJPEG( "a.jpgx"));
    CHECK_FALSE( ImageManager::isPNG( "a."));
    CHECK_FALSE( ImageManager::isPNG( "a.png.bak"));
    CHECK_FALSE( ImageManager::isPNG( ""));
}

TEST_GROUP( TimerTests)
{
};

TEST( TimerTests, FormatsInWords)
{
    using std::chrono::milliseconds;
    STRCMP_EQUAL( "0 milliseconds", Timer::format( milliseconds( 0)).c_str());
    STRCMP_EQUAL( "1 millisecond", Timer::format( milliseconds( 1)).c_str());
    STRCMP_EQUAL( "1 second, 20 milliseconds", Timer::format( milliseconds( 1020)).c_str());
    STRCMP_EQUAL( "1 minute, 1 second, 1 millisecond", Timer::format( milliseconds( 61001)).c_str());
    STRCMP_EQUAL( "2 minutes", Timer::format( milliseconds( 120000)).c_str());
    STRCMP_EQUAL( "3 seconds", Timer::format( milliseconds( 3000)).c_str());
}

TEST( TimerTests, UnknownEpochHasNoElapsedTime)
{
    LONGS_EQUAL( 0, Timer::elapsed( SIZE_MAX).count());
}

TEST( TimerTests, EpochsAreDistinct)
{
    auto first  = Timer::start(),
         second = Timer::start();
    CHECK( first != second);
    CHECK( Timer::elapsed( first).count() >= 0);
}
