#ifndef CSSCOLORS_COLOR_MODELS_HPP
#define CSSCOLORS_COLOR_MODELS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include "models/ratio.hpp"
#include "models/angle.hpp"
#include "codecs/color_space_converter.hpp"

#define DEFAULT_MIX_WEIGHT 50

namespace CssColors
{
    struct RGB;
    struct RGBA;
    struct HSL;
    struct HSLA;

    /*
     * Anything exposing an alpha-bearing counterpart and a way into RGBA
     * can take part in `mix`.
     */
    template <typename T, typename = void>
    struct IsColor : std::false_type
    {
    };

    template <typename T>
    struct IsColor<T, std::void_t<typename T::Alpha, decltype( std::declval<const T&>().toRgba())>>
            : std::true_type
    {
    };

    template <typename T>
    inline constexpr bool is_color_v = IsColor<T>::value;

    /*
     * Every model below answers the same set of conversions and
     * Less-style operations. `Alpha` names the model that a fade or a mix
     * turns it into: the opaque models gain an alpha channel, the others
     * stay what they are.
     *
     * Operations never modify the receiver; they return a new color.
     */

    struct RGB
    {
        using Alpha = RGBA;

        RGB( uint8_t red, uint8_t green, uint8_t blue);

        RGB( Ratio red, Ratio green, Ratio blue);

        [[nodiscard]] std::string toCss() const;

        [[nodiscard]] RGB toRgb() const;

        [[nodiscard]] RGBA toRgba() const;

        [[nodiscard]] HSL toHsl() const;

        [[nodiscard]] HSLA toHsla() const;

        [[nodiscard]] RGB saturate( uint8_t amount) const;

        [[nodiscard]] RGB desaturate( uint8_t amount) const;

        [[nodiscard]] RGB lighten( uint8_t amount) const;

        [[nodiscard]] RGB darken( uint8_t amount) const;

        // No alpha channel to fade; returns the color unchanged.
        [[nodiscard]] RGB fadein( uint8_t amount) const;

        [[nodiscard]] RGB fadeout( uint8_t amount) const;

        [[nodiscard]] Alpha fade( uint8_t amount) const;

        [[nodiscard]] RGB spin( int16_t amount) const;

        template <typename Color, typename = std::enable_if_t<is_color_v<Color>>>
        [[nodiscard]] Alpha mix( const Color& other, uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA tint( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA shade( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGB greyscale() const;

        bool operator==( const RGB& right) const;

        bool operator!=( const RGB& right) const;

        Ratio r, g, b;
    };

    struct RGBA
    {
        using Alpha = RGBA;

        RGBA( uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha);

        RGBA( Ratio red, Ratio green, Ratio blue, Ratio alpha);

        [[nodiscard]] std::string toCss() const;

        [[nodiscard]] RGB toRgb() const;

        [[nodiscard]] RGBA toRgba() const;

        [[nodiscard]] HSL toHsl() const;

        [[nodiscard]] HSLA toHsla() const;

        [[nodiscard]] RGBA saturate( uint8_t amount) const;

        [[nodiscard]] RGBA desaturate( uint8_t amount) const;

        [[nodiscard]] RGBA lighten( uint8_t amount) const;

        [[nodiscard]] RGBA darken( uint8_t amount) const;

        [[nodiscard]] RGBA fadein( uint8_t amount) const;

        [[nodiscard]] RGBA fadeout( uint8_t amount) const;

        [[nodiscard]] Alpha fade( uint8_t amount) const;

        [[nodiscard]] RGB spin( int16_t amount) const;

        /*
         * Weighted blend of `this` and `other`, where `weight` is the share of
         * `this` in percent. The color weight also accounts for the difference
         * in opacity; the alpha is blended on `weight` alone.
         */
        template <typename Color, typename = std::enable_if_t<is_color_v<Color>>>
        [[nodiscard]] Alpha mix( const Color& other, uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA tint( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA shade( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA greyscale() const;

        bool operator==( const RGBA& right) const;

        bool operator!=( const RGBA& right) const;

        Ratio r, g, b, a;
    };

    struct HSL
    {
        using Alpha = HSLA;

        // Hue in degrees, saturation and lightness in percent.
        HSL( uint16_t hue, uint8_t saturation, uint8_t lightness);

        HSL( Angle hue, Ratio saturation, Ratio lightness);

        [[nodiscard]] std::string toCss() const;

        [[nodiscard]] RGB toRgb() const;

        [[nodiscard]] RGBA toRgba() const;

        [[nodiscard]] HSL toHsl() const;

        [[nodiscard]] HSLA toHsla() const;

        [[nodiscard]] HSL saturate( uint8_t amount) const;

        [[nodiscard]] HSL desaturate( uint8_t amount) const;

        [[nodiscard]] HSL lighten( uint8_t amount) const;

        [[nodiscard]] HSL darken( uint8_t amount) const;

        [[nodiscard]] HSL fadein( uint8_t amount) const;

        [[nodiscard]] HSL fadeout( uint8_t amount) const;

        [[nodiscard]] Alpha fade( uint8_t amount) const;

        /*
         * Rotates the hue by `amount` degrees, counter-clockwise when negative.
         * Rotations of a full turn or more are a programming error.
         */
        [[nodiscard]] RGB spin( int16_t amount) const;

        template <typename Color, typename = std::enable_if_t<is_color_v<Color>>>
        [[nodiscard]] Alpha mix( const Color& other, uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA tint( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA shade( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] HSL greyscale() const;

        bool operator==( const HSL& right) const;

        bool operator!=( const HSL& right) const;

        Angle h;
        Ratio s, l;
    };

    struct HSLA
    {
        using Alpha = HSLA;

        HSLA( uint16_t hue, uint8_t saturation, uint8_t lightness, uint8_t alpha);

        HSLA( Angle hue, Ratio saturation, Ratio lightness, Ratio alpha);

        [[nodiscard]] std::string toCss() const;

        [[nodiscard]] RGB toRgb() const;

        [[nodiscard]] RGBA toRgba() const;

        [[nodiscard]] HSL toHsl() const;

        [[nodiscard]] HSLA toHsla() const;

        [[nodiscard]] HSLA saturate( uint8_t amount) const;

        [[nodiscard]] HSLA desaturate( uint8_t amount) const;

        [[nodiscard]] HSLA lighten( uint8_t amount) const;

        [[nodiscard]] HSLA darken( uint8_t amount) const;

        [[nodiscard]] HSLA fadein( uint8_t amount) const;

        [[nodiscard]] HSLA fadeout( uint8_t amount) const;

        [[nodiscard]] Alpha fade( uint8_t amount) const;

        [[nodiscard]] RGB spin( int16_t amount) const;

        template <typename Color, typename = std::enable_if_t<is_color_v<Color>>>
        [[nodiscard]] Alpha mix( const Color& other, uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA tint( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] RGBA shade( uint8_t weight = DEFAULT_MIX_WEIGHT) const;

        [[nodiscard]] HSLA greyscale() const;

        bool operator==( const HSLA& right) const;

        bool operator!=( const HSLA& right) const;

        Angle h;
        Ratio s, l, a;
    };

    template <typename Color, typename>
    RGBA RGB::mix( const Color& other, uint8_t weight) const
    {
        return toRgba().mix( other, weight);
    }

    template <typename Color, typename>
    RGBA RGBA::mix( const Color& other, uint8_t weight) const
    {
        return ColorSpaceConverter::mix( *this, other.toRgba(), weight);
    }

    template <typename Color, typename>
    HSLA HSL::mix( const Color& other, uint8_t weight) const
    {
        return toHsla().mix( other, weight);
    }

    template <typename Color, typename>
    HSLA HSLA::mix( const Color& other, uint8_t weight) const
    {
        return toRgba().mix( other, weight).toHsla();
    }

    std::ostream& operator<<( std::ostream& out, const RGB& color);

    std::ostream& operator<<( std::ostream& out, const RGBA& color);

    std::ostream& operator<<( std::ostream& out, const HSL& color);

    std::ostream& operator<<( std::ostream& out, const HSLA& color);
}

#endif //CSSCOLORS_COLOR_MODELS_HPP
