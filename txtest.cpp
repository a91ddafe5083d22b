// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstdio>
#include <cmath>
#include "texture.hpp"
#include "test.hpp"

using namespace std;

// 2x2 checker with four distinct texels
static const colour quad[] = { make_colour(255, 0, 0), make_colour(0, 255, 0),
                               make_colour(0, 0, 255), make_colour(255, 255, 255) };

// w*h texture where every texel is distinct
static vector<colour> ramp(unsigned int w, unsigned int h)
{
    vector<colour> v;
    for(unsigned int y=0; y<h; y++)
        for(unsigned int x=0; x<w; x++)
            v.push_back(make_colour(x, y, x ^ y));
    return v;
}

TEST(texget)
{
    vector<colour> buf = ramp(5, 3);
    texture tex(5, 3, &buf[0]);
    EXPECT(tex.width() == 5 && tex.height() == 3);
    for(unsigned int y=0; y<3; y++)
        for(unsigned int x=0; x<5; x++)
            EXPECT(tex.get(x, y) == buf[x + y*5]);
    return true;
}

TEST(texbounds)
{
    vector<colour> buf = ramp(5, 3);
    texture tex(5, 3, &buf[0]);
    EXPECT_THROW(tex.get(5, 0), out_of_range, "x=5");
    EXPECT_THROW(tex.get(7, 2), out_of_range, "x=7");

    // Rows past the bottom have no check of their own; they run off
    // the texel array and throw from there.
    EXPECT_THROW(tex.get(0, 3), out_of_range, "");
    EXPECT_THROW(tex.get(4, 100), out_of_range, "");
    return true;
}

TEST(sample_wrap)
{
    texture tex(2, 2, quad);
    sampler s(tex);
    EXPECT(s.sample(0.5, 0.5) == quad[3]);
    EXPECT(s.sample(1.5, 0.5) == s.sample(0.5, 0.5));
    EXPECT(s.sample(0.25, 0.25) == quad[0]);
    EXPECT(s.sample(0.75, 0.25) == quad[1]);
    EXPECT(s.sample(0.25, 0.75) == quad[2]);

    // Whole numbers land on the first texel
    EXPECT(s.sample(0, 0) == quad[0]);
    EXPECT(s.sample(3, -2) == quad[0]);
    return true;
}

TEST(sample_periodic)
{
    vector<colour> buf = ramp(8, 4);
    texture tex(8, 4, &buf[0]);
    sampler s(tex);

    // Dyadic coordinates keep the fractional parts exact
    for(int i=0; i<32; i++) {
        float u = i / 32.0, v = (31 - i) / 32.0;
        for(int k=0; k<5; k++) {
            EXPECT(s.sample(u + k, v) == s.sample(u, v));
            EXPECT(s.sample(u, v + k) == s.sample(u, v));
            EXPECT(s.sample(-u - k, v) == s.sample(-u, v));
            EXPECT(s.sample(u, -v - k) == s.sample(u, -v));
        }
    }
    return true;
}

TEST(sample_mirror)
{
    // The magnitude of the signed fraction is what gets scaled, so
    // negative coordinates mirror across zero instead of tiling
    // straight through it.
    vector<colour> buf = ramp(8, 1);
    texture tex(8, 1, &buf[0]);
    sampler s(tex);
    EXPECT(s.sample(-0.25, 0) == tex.get(2, 0));
    EXPECT(s.sample(0.75, 0) == tex.get(6, 0));
    EXPECT(s.sample(-0.25, 0) != s.sample(0.75, 0));

    // Just under a whole number still picks the last texel
    EXPECT(s.sample(0.99999994f, 0) == tex.get(7, 0));
    return true;
}

TEST(texjpeg_missing)
{
    texture tex;
    EXPECT(!texture::load_jpeg("/nonexistent/texture.jpg", tex));
    EXPECT(tex.width() == 0 && tex.height() == 0);
    return true;
}
