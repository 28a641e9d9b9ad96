#include "csscolors.hpp"
#include "pipeline/color_pipeline.hpp"

namespace CssColors
{
    ColorVariant ColorPipeline::apply( const ColorVariant& color, const Operation& operation)
    {
        using Kind = Operation::Kind;
        auto amount = static_cast<uint8_t>( operation.amount);

        return std::visit( [ &operation, amount]( const auto& model) -> ColorVariant
        {
            switch( operation.kind)
            {
                case Kind::Saturate:   return model.saturate( amount);
                case Kind::Desaturate: return model.desaturate( amount);
                case Kind::Lighten:    return model.lighten( amount);
                case Kind::Darken:     return model.darken( amount);
                case Kind::FadeIn:     return model.fadein( amount);
                case Kind::FadeOut:    return model.fadeout( amount);
                case Kind::Fade:       return model.fade( amount);
                case Kind::Spin:       return model.spin( operation.amount);
                case Kind::Tint:       return model.tint( amount);
                case Kind::Shade:      return model.shade( amount);
                case Kind::Greyscale:  return model.greyscale();
                case Kind::ToRgb:      return model.toRgb();
                case Kind::ToRgba:     return model.toRgba();
                case Kind::ToHsl:      return model.toHsl();
                case Kind::ToHsla:     return model.toHsla();
                case Kind::Mix:
                    if( !operation.operand.has_value())
                        return model;
                    return std::visit( [ &model, amount]( const auto& other) -> ColorVariant
                                       { return model.mix( other, amount); },
                                       *operation.operand);
            }
            return model;
        }, color);
    }

    std::vector<ColorVariant> ColorPipeline::run( const ColorVariant& start, const std::vector<Operation>& operations)
    {
        std::vector<ColorVariant> steps{ start};
        steps.reserve( operations.size() + 1);
        for( auto& operation : operations)
            steps.push_back( apply( steps.back(), operation));

        return steps;
    }
}
