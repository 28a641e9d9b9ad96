/***************************************************************************/
/*                                                                         */
/*  option_defs.hpp                                                        */
/*                                                                         */
/*    Command line options and their help messages                         */
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

#ifndef CSSCOLORS_OPTION_DEFS_HPP
#define CSSCOLORS_OPTION_DEFS_HPP

#define SHORT( option)                 option##_SHORT
#define MESSAGE( option)               option##_MESSAGE
#define STRUCTURE_PREFIX( option)      "-" option##_SHORT ", --" option

#define HELP_PROMPT                    "help"
#define HELP_PROMPT_SHORT              "h"
#define HELP_PROMPT_MESSAGE            "Display this help and exit."

#define INPUT_COLOR                    "color"
#define INPUT_COLOR_SHORT              "c"
#define INPUT_COLOR_MESSAGE            "The color to start from, one of:\n"       \
                                       "rgb(R, G, B), rgba(R, G, B, A),\n"        \
                                       "hsl(H, S, L) or hsla(H, S, L, A).\n"      \
                                       "R, G, B and A are 0-255, H is in degrees,\n" \
                                       "S and L are percentages."

#define APPLY_RULE                     "apply"
#define APPLY_RULE_SHORT               "a"
#define APPLY_RULE_MESSAGE             "Operations to apply in order, e.g.\n"     \
                                       "\"saturate(20) spin(-30) tint(25)\".\n"   \
                                       "Available: saturate, desaturate,\n"       \
                                       "lighten, darken, fadein, fadeout, fade,\n" \
                                       "spin, mix(COLOR[, WEIGHT]), tint, shade,\n" \
                                       "greyscale, to-rgb, to-rgba, to-hsl,\n"    \
                                       "to-hsla."

#define OUTPUT                         "output"
#define OUTPUT_SHORT                   "o"
#define OUTPUT_MESSAGE                 "Write a swatch of every step to this\n"   \
                                       "file (.png, .jpg or .jpeg)."

#define QUALITY_INDEX                  "quality"
#define QUALITY_INDEX_SHORT            "q"
#define QUALITY_INDEX_MESSAGE          "JPEG quality, 1-100 (default 100)."

#define TILE_SIZE                      "tile-size"
#define TILE_SIZE_SHORT                "t"
#define TILE_SIZE_MESSAGE              "Edge of each swatch tile in pixels\n"     \
                                       "(default 96)."

#define FONT_PROFILE                   "font"
#define FONT_PROFILE_SHORT             "f"
#define FONT_PROFILE_MESSAGE           "Font family or font file for the labels."

#define NO_LABELS                      "no-labels"
#define NO_LABELS_SHORT                "n"
#define NO_LABELS_MESSAGE              "Do not label the swatch tiles."

#define PREVIEW                        "preview"
#define PREVIEW_SHORT                  "p"
#define PREVIEW_MESSAGE                "Show the swatch in the terminal\n"        \
                                       "(needs 24-bit color)."

#define VERBOSE                        "verbose"
#define VERBOSE_SHORT                  "v"
#define VERBOSE_MESSAGE                "Log every step and timings to stderr."

#define LIST_FONTS                     "list-fonts"
#define LIST_FONTS_SHORT               "l"
#define LIST_FONTS_MESSAGE             "List the fonts available for labels."

#define OPTIONS_COUNT                  11

#endif //CSSCOLORS_OPTION_DEFS_HPP
