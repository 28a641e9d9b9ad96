/***************************************************************************/
/*                                                                         */
/*  csscolors.hpp                                                          */
/*                                                                         */
/*    Forward declaration           									   */
/*                                                                         */
/*  Copyright 2022 by                                                      */
/*  Adesina Meekness                                                       */
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

#ifndef CSSCOLORS_HPP
#define CSSCOLORS_HPP

#include "config.h"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <memory>
#include <type_traits>

#define ALLOWANCE                      2
#define EPSILON                        1.e-7f
#define ZERO( fl)                      ( std::abs( fl) <= EPSILON)
#define ACCESSIBLE( ptr)               (( ptr) != nullptr)
/*
 * Packed pixels are laid out as 0xRRGGBBAA.
 */
#define RED( color)                    (( uint8_t)(( color) >> 24u))
#define GREEN( color)                  (( uint8_t)((( color) >> 16u) & 0xFFu))
#define BLUE( color)                   (( uint8_t)((( color) >> 8u) & 0xFFu))
#define ALPHA( color)                  (( uint8_t)(( color) & 0xFFu))
#define PACK_RGBA( red, green, blue, alpha) (((( uint32_t)(( uint8_t)red))  << 24u) |\
                                            ((( uint32_t)(( uint8_t)green)) << 16u) |\
                                            ((( uint32_t)(( uint8_t)blue))  << 8u) | (( uint8_t)alpha))
#define RGB_SCALE                      255
#define PERCENT_SCALE                  100
#define DEG_MAX                        360
#define FLOAT_CAST( value)             ( static_cast<float>( value))
#define INT_CAST( value)               ( static_cast<int>( value))
#define From26Dot6( value)             (( value) / 64)

#define GLOBAL_TIME_ID                 0

/*
 * CommandLineParser -> ApplicationDirector
 * RuleParser        -> ColorPipeline
 * SwatchRenderer
 * ImageManager      <- Plugin
 */

#define IMAGE_MANAGER                  "ImageManager"

typedef void( *DeleterType)( unsigned char *);

/*
 *  Implements a loose ownership semantics.
 *  Holds this resource. If the resource is still valid when the deleter
 *  is about to be called, delete it.
 */
template<typename Resource>
class PropertyManager
{
 public:
  template <typename MayBe_Resource, typename Deleter>
   PropertyManager( MayBe_Resource&& resource, Deleter&& deleter)
      : resource( std::forward<MayBe_Resource>( resource)),
        destructor( std::forward<Deleter>( deleter))
  {
  }

  PropertyManager( const PropertyManager&) = delete;
  PropertyManager( PropertyManager&&) = default;

  auto& get()
  {
    return resource;
  }

  auto operator->()
  {
    return resource;
  }

  explicit operator bool() const
  {
    return resource;
  }

  ~PropertyManager()
  {
    if( destructor)
      std::invoke( destructor, resource);
  }

 private:
  Resource resource;
  std::function<void( Resource)> destructor;
};

/*
 * A painted surface. One packed pixel per element for uint32_t buffers.
 */
template <typename Size_Class = uint32_t,
	      typename = std::enable_if_t<std::is_integral_v<Size_Class>>>
struct FrameBuffer
{
  std::shared_ptr<Size_Class> buffer;
  int32_t width, height, n_channel;
  FrameBuffer( std::shared_ptr<Size_Class> buffer = nullptr,
               int32_t width = {}, int32_t height = {}, int32_t bit_depth = {})
  : buffer( buffer), width( width), height( height), n_channel( bit_depth)
  {
  }
};

enum class OutputFormat
{
    PNG,
    JPEG
};

/*
 * Everything the command line asked for, handed from the parser to the
 * pipeline, the renderer and the image writer.
 */
struct ApplicationDirector
{
    const char 			   *color{ nullptr},          // Input color, e.g. `rgb(255,99,71)`.
                           *operations{ nullptr},     // Operation chain, e.g. `saturate(20) spin(-30)`.
                           *src_filename{ nullptr};   // Swatch image destination.
    std::string             font_profile;
    size_t 				    tile_size{ 96};
    int                     image_quality{ 100};
    bool                    labels{ true};
    bool                    preview{ false};
    bool                    verbose{ false};
    OutputFormat            out_format{ OutputFormat::PNG};
};

#endif //CSSCOLORS_HPP
