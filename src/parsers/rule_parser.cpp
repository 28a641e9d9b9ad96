#include <algorithm>
#include <regex>
#include "csscolors.hpp"
#include "utils/utils.hpp"
#include "parsers/rule_parser.hpp"

namespace CssColors
{
    namespace
    {
        enum class Arity
        {
            None,
            Amount,
            Degrees,
            Weight,
            Mix
        };

        struct Signature
        {
            std::string_view name;
            Operation::Kind  kind;
            Arity            arity;
        };

        constexpr Signature signatures[] =
        {
            { "saturate",   Operation::Kind::Saturate,   Arity::Amount},
            { "desaturate", Operation::Kind::Desaturate, Arity::Amount},
            { "lighten",    Operation::Kind::Lighten,    Arity::Amount},
            { "darken",     Operation::Kind::Darken,     Arity::Amount},
            { "fadein",     Operation::Kind::FadeIn,     Arity::Amount},
            { "fadeout",    Operation::Kind::FadeOut,    Arity::Amount},
            { "fade",       Operation::Kind::Fade,       Arity::Amount},
            { "spin",       Operation::Kind::Spin,       Arity::Degrees},
            { "mix",        Operation::Kind::Mix,        Arity::Mix},
            { "tint",       Operation::Kind::Tint,       Arity::Weight},
            { "shade",      Operation::Kind::Shade,      Arity::Weight},
            { "greyscale",  Operation::Kind::Greyscale,  Arity::None},
            { "to-rgb",     Operation::Kind::ToRgb,      Arity::None},
            { "to-rgba",    Operation::Kind::ToRgba,     Arity::None},
            { "to-hsl",     Operation::Kind::ToHsl,      Arity::None},
            { "to-hsla",    Operation::Kind::ToHsla,     Arity::None}
        };

        bool isBlank( std::string_view given)
        {
            return std::all_of( given.cbegin(), given.cend(), []( unsigned char c) { return isspace( c); });
        }
    }

    std::optional<ColorVariant> RuleParser::parseColor( std::string_view rule)
    {
        std::cmatch cm;
        std::regex key( R"(^\s*(rgb|hsl)(a?)\s*\((.*)\)\s*$)", std::regex_constants::icase);
        if( !std::regex_match( rule.data(), rule.data() + rule.size(), cm, key))
        {
            fprintf( stderr, "Invalid color: `%.*s`, expected rgb(), rgba(), hsl() or hsla()\n",
                     INT_CAST( rule.size()), rule.data());
            return {};
        }

        auto is_rgb    = tolower( static_cast<unsigned char>( *cm[ 1].first)) == 'r';
        auto has_alpha = cm[ 2].length() > 0;
        auto channels  = splitArguments( cm[ 3].str());
        size_t expected = has_alpha ? 4 : 3;
        if( channels.size() != expected)
        {
            fprintf( stderr, "Invalid color: `%.*s` takes %zu channels, %zu given\n",
                     INT_CAST( rule.size()), rule.data(), expected, channels.size());
            return {};
        }

        long values[ 4]{};
        for( size_t i = 0; i < expected; ++i)
        {
            auto upper = i == 3 || is_rgb ? RGB_SCALE : i == 0 ? UINT16_MAX : PERCENT_SCALE;
            auto value = parseInteger( channels[ i], 0, upper);
            if( !value.has_value())
                return {};
            values[ i] = *value;
        }

        auto byte = []( long value) { return static_cast<uint8_t>( value); };
        if( is_rgb)
        {
            if( has_alpha)
                return RGBA( byte( values[ 0]), byte( values[ 1]), byte( values[ 2]), byte( values[ 3]));
            return RGB( byte( values[ 0]), byte( values[ 1]), byte( values[ 2]));
        }

        auto hue = static_cast<uint16_t>( values[ 0]);
        if( has_alpha)
            return HSLA( hue, byte( values[ 1]), byte( values[ 2]), byte( values[ 3]));
        return HSL( hue, byte( values[ 1]), byte( values[ 2]));
    }

    std::optional<std::vector<Operation>> RuleParser::parseOperations( std::string_view rule)
    {
        std::vector<Operation> operations;
        std::string text( rule);
        const char *ctx = text.c_str();
        while( Util::ltrim( ctx) && *ctx)
        {
            const char *start = ctx;
            while( isalpha( static_cast<unsigned char>( *ctx)) || *ctx == '-')
                ++ctx;
            std::string_view name( start, ctx - start);
            if( name.empty())
            {
                fprintf( stderr, "Expected an operation at: %s\n", start);
                return {};
            }

            std::string_view arguments;
            bool has_arguments = *ctx == '(';
            if( has_arguments)
            {
                const char *open = ctx;
                int depth = 0;
                do
                {
                    if( *ctx == '(')
                        ++depth;
                    else if( *ctx == ')')
                        --depth;
                    ++ctx;
                }
                while( *ctx && depth > 0);

                if( depth != 0)
                {
                    fprintf( stderr, "Expected `)` after expression: %s\n", open);
                    return {};
                }
                arguments = std::string_view( open + 1, ctx - open - 2);
            }

            if( *ctx && !isspace( static_cast<unsigned char>( *ctx)))
            {
                fprintf( stderr, "Unexpected `%c` after `%.*s`\n", *ctx, INT_CAST( ctx - start), start);
                return {};
            }

            auto operation = parseOperation( name, arguments, has_arguments);
            if( !operation.has_value())
                return {};
            operation->text.assign( start, ctx - start);
            operations.push_back( std::move( *operation));
        }

        return operations;
    }

    std::optional<Operation> RuleParser::parseOperation( std::string_view name, std::string_view arguments,
                                                         bool has_arguments)
    {
        std::string lowered( name.size(), '\0');
        std::transform( name.cbegin(), name.cend(), lowered.begin(),
                        []( unsigned char c) { return static_cast<char>( tolower( c)); });

        auto match = std::find_if( std::cbegin( signatures), std::cend( signatures),
                                   [ &lowered]( auto& signature) { return signature.name == lowered; });
        if( match == std::cend( signatures))
        {
            fprintf( stderr, "Unknown operation: `%s`\n", lowered.c_str());
            return {};
        }

        Operation operation{ match->kind};
        auto omitted = !has_arguments || isBlank( arguments);
        switch( match->arity)
        {
            case Arity::None:
                if( !omitted)
                {
                    fprintf( stderr, "`%s` takes no arguments\n", lowered.c_str());
                    return {};
                }
                break;
            case Arity::Amount:
            case Arity::Degrees:
            {
                if( omitted)
                {
                    fprintf( stderr, "`%s` expects an amount\n", lowered.c_str());
                    return {};
                }
                // Spins stay under a full turn either way.
                auto is_spin = match->arity == Arity::Degrees;
                auto value = parseInteger( arguments, is_spin ? 1 - DEG_MAX : 0, is_spin ? DEG_MAX - 1 : RGB_SCALE);
                if( !value.has_value())
                    return {};
                operation.amount = static_cast<int16_t>( *value);
                break;
            }
            case Arity::Weight:
            {
                operation.amount = DEFAULT_MIX_WEIGHT;
                if( omitted)
                    break;
                auto value = parseInteger( arguments, 0, PERCENT_SCALE);
                if( !value.has_value())
                    return {};
                operation.amount = static_cast<int16_t>( *value);
                break;
            }
            case Arity::Mix:
            {
                auto parts = splitArguments( arguments);
                if( omitted || parts.size() > 2)
                {
                    fprintf( stderr, "`mix` expects a color and an optional weight\n");
                    return {};
                }
                operation.operand = parseColor( parts[ 0]);
                if( !operation.operand.has_value())
                    return {};
                operation.amount = DEFAULT_MIX_WEIGHT;
                if( parts.size() == 2)
                {
                    auto value = parseInteger( parts[ 1], 0, PERCENT_SCALE);
                    if( !value.has_value())
                        return {};
                    operation.amount = static_cast<int16_t>( *value);
                }
                break;
            }
        }

        return operation;
    }

    std::optional<long> RuleParser::parseInteger( std::string_view given, long lower, long upper)
    {
        std::cmatch cm;
        std::regex key( R"(^\s*([+-]?\d{1,9})\s*$)");
        if( std::regex_match( given.data(), given.data() + given.size(), cm, key))
        {
            auto value = std::stol( cm[ 1].str());
            if( value >= lower && value <= upper)
                return value;
        }

        fprintf( stderr, "`%.*s` is not a whole number in [%ld, %ld]\n",
                 INT_CAST( given.size()), given.data(), lower, upper);
        return {};
    }

    std::vector<std::string> RuleParser::splitArguments( std::string_view arguments)
    {
        std::vector<std::string> parts( 1);
        int depth = 0;
        for( auto c : arguments)
        {
            if( c == ',' && depth == 0)
            {
                parts.emplace_back();
                continue;
            }
            depth += ( c == '(') - ( c == ')');
            parts.back().push_back( c);
        }

        return parts;
    }
}
