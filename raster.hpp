// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _RASTER_HPP
#define _RASTER_HPP

#include "vec.hpp"
#include "colour.hpp"

class framebuf;
class sampler;

// Triangle rasterization utility.  It walks scanlines top to bottom,
// providing a per-fragment callback to pick the colour of each pixel
// it covers, and writes that colour into the framebuffer.

// Screen-space vertices, in raster order (y=0 is the top row).
// Sub-pixel positions are fine.
struct tri {
    vec2 v[3];
};

// Handles one rasterized fragment out of the inner loop.  x/y are
// the pixel coordinates; att is the three vertex attributes blended
// affinely (no perspective) at that pixel.  Returns the colour to
// store.
typedef colour (*frag_fn)(int x, int y, const vec3 &att, void *arg);

// att[i] belongs to t.v[i], whatever order the vertices end up being
// walked in.  Triangles with no height or no area draw nothing.
// Nothing is clipped: a pixel outside the framebuffer throws
// std::out_of_range from framebuf::set(), leaving the rows above it
// drawn.
void rasterize_tri(framebuf *fb, const tri &t, const vec3 *att,
                   frag_fn fragment, void *frag_arg);

// Flat fill
void draw_tri(framebuf *fb, const tri &t, colour c);

// Per-vertex colours, as [0:1] RGB
void draw_tri(framebuf *fb, const tri &t, const vec3 *colours);

// Per-vertex texture coordinates
void draw_tri(framebuf *fb, const tri &t, const vec2 *uvs, const sampler &s);

#endif // _RASTER_HPP
