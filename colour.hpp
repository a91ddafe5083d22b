// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _COLOUR_HPP
#define _COLOUR_HPP

#include <stdint.h>
#include "vec.hpp"

// Colours are passed around as 32 bit words in one canonical layout:
// 0xRRGGBBxx (the low byte is unused).  The device decides where the
// channels really live in a pixel, and tells us as bit offsets.
typedef uint32_t colour;

struct channel_offsets {
    unsigned int red, green, blue;
};

inline colour make_colour(unsigned int r, unsigned int g, unsigned int b)
{
    return ((r & 0xff) << 24) | ((g & 0xff) << 16) | ((b & 0xff) << 8);
}

inline unsigned int colour_r(colour c) { return (c >> 24) & 0xff; }
inline unsigned int colour_g(colour c) { return (c >> 16) & 0xff; }
inline unsigned int colour_b(colour c) { return (c >> 8) & 0xff; }

// [0:1] float channels, clamped
inline colour colour_from_vec(const vec3 &v)
{
    unsigned int ch[3];
    for(int i=0; i<3; i++) {
        float f = v[i] < 0 ? 0 : (v[i] > 1 ? 1 : v[i]);
        ch[i] = (unsigned int)(f * 255 + 0.5f);
    }
    return make_colour(ch[0], ch[1], ch[2]);
}

// Offsets come from a framebuffer that already passed validation, so
// they are not range checked here.
inline uint32_t encode_colour(colour c, const channel_offsets &off)
{
    return (colour_r(c) << off.red) |
           (colour_g(c) << off.green) |
           (colour_b(c) << off.blue);
}

inline colour decode_colour(uint32_t native, const channel_offsets &off)
{
    return make_colour((native >> off.red) & 0xff,
                       (native >> off.green) & 0xff,
                       (native >> off.blue) & 0xff);
}

#endif // _COLOUR_HPP
