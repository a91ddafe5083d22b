// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cmath>
#include <cstdio>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include "util.hpp"
#include "jpg.hpp"
#include "texture.hpp"

using namespace std;

texture::texture(unsigned int width, unsigned int height, const colour *t)
    : w(width), h(height), texels(t, t + (size_t)width*height)
{
}

bool texture::load_jpeg(const char *path, texture &tex)
{
    vector<unsigned char> data;
    if(!read_file(path, data))
        return false;

    int w, h;
    vector<colour> img;
    if(data.empty() || !jpg().load(&data[0], data.size(), w, h, img)) {
        fprintf(stderr, "%s: not a usable JPEG\n", path);
        return false;
    }

    tex.w = w;
    tex.h = h;
    tex.texels.swap(img);
    return true;
}

colour texture::get(unsigned int x, unsigned int y) const
{
    if(x >= w) {
        char msg[64];
        snprintf(msg, sizeof(msg), "texel x=%u past width %u", x, w);
        throw out_of_range(msg);
    }
    return texels.at(x + (size_t)y*w);
}

// |frac(f)|, kept below 1.0 so the scaled result can't land on the
// texel one past the end.
static float wrap(float f)
{
    return min(ulp_less(1.0), fabsf(f - truncf(f)));
}

colour sampler::sample(float u, float v) const
{
    // Double math for the scale: the float product of a fraction just
    // under one and a large extent can round up to the extent itself.
    unsigned int x = (unsigned int)floor((double)wrap(u) * tex.width());
    unsigned int y = (unsigned int)floor((double)wrap(v) * tex.height());
    return tex.get(x, y);
}
