// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _TEXTURE_H
#define _TEXTURE_H

#include <vector>
#include "colour.hpp"

// Immutable 2D grid of colours, row-major, first row at the top.
class texture {
public:
    texture() : w(0), h(0) {}
    texture(unsigned int width, unsigned int height, const colour *texels);

    // Replaces tex with the decoded image.  False (and tex untouched)
    // if the file can't be read or decoded.
    static bool load_jpeg(const char *path, texture &tex);

    unsigned int width() const { return w; }
    unsigned int height() const { return h; }

    // Throws std::out_of_range for x past the row end.  There is no
    // separate check of y: a row past the bottom lands outside the
    // texel array, which throws std::out_of_range from the array
    // bounds check instead.
    colour get(unsigned int x, unsigned int y) const;

private:
    unsigned int w, h;
    std::vector<colour> texels;
};

// Nearest-neighbor lookups with repeat wrapping.  Only refers to the
// texture, which must outlive it.
class sampler {
public:
    explicit sampler(const texture &t) : tex(t) {}

    // Texture coordinates map to texels through the magnitude of
    // their signed fractional part: floor(|frac(u)| * width).  Never
    // fails for finite input; NaN/Inf are undefined.
    colour sample(float u, float v) const;

private:
    const texture &tex;
};

#endif // _TEXTURE_H
