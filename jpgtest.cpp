// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstdlib>
#include <unistd.h>
#include "framebuf.hpp"
#include "texture.hpp"
#include "raster.hpp"
#include "jpg.hpp"
#include "test.hpp"

using namespace std;

// JPEG is lossy; flat regions come back within a few counts
static bool close_to(colour a, colour b)
{
    return abs((int)colour_r(a) - (int)colour_r(b)) <= 8 &&
           abs((int)colour_g(a) - (int)colour_g(b)) <= 8 &&
           abs((int)colour_b(a) - (int)colour_b(b)) <= 8;
}

static string tmpname(const char *base)
{
    const char *dir = getenv("TMPDIR");
    char buf[256];
    snprintf(buf, sizeof(buf), "%s/%s-%d.jpg", dir ? dir : "/tmp", base, (int)getpid());
    return buf;
}

TEST(jpg_screenshot)
{
    // Left half red, right half blue, in a BGRx-ordered device
    mem_fbdev dev(32, 16);
    dev.offsets.red = 8;
    dev.offsets.green = 16;
    dev.offsets.blue = 24;
    framebuf fb(dev.device());
    colour red = make_colour(255, 0, 0), blue = make_colour(0, 0, 255);
    for(int y=0; y<16; y++)
        for(int x=0; x<32; x++)
            fb.set(x, y, x < 16 ? red : blue);

    string path = tmpname("jpg_screenshot");
    EXPECT(fb.dump(path.c_str(), 100));

    texture tex;
    bool loaded = texture::load_jpeg(path.c_str(), tex);
    unlink(path.c_str());
    EXPECT(loaded);
    EXPECT(tex.width() == 32 && tex.height() == 16);
    EXPECT(close_to(tex.get(2, 8), red));
    EXPECT(close_to(tex.get(29, 8), blue));
    return true;
}

TEST(jpg_texture_draw)
{
    // Save a 2-colour image, load it as a texture and map it over a
    // triangle: the top-left sampled texels must come out green.
    struct img {
        static colour px(int x, int y, void *arg) {
            (void)y; (void)arg;
            return x < 8 ? make_colour(0, 255, 0) : make_colour(255, 255, 0);
        }
    };
    string path = tmpname("jpg_texture_draw");
    EXPECT(save_jpeg(path.c_str(), 16, 16, img::px, 0, 100));

    texture tex;
    bool loaded = texture::load_jpeg(path.c_str(), tex);
    unlink(path.c_str());
    EXPECT(loaded);
    sampler s(tex);

    mem_fbdev dev(8, 8);
    framebuf fb(dev.device());
    tri t;
    t.v[0] = vec2(0, 0); t.v[1] = vec2(8, 0); t.v[2] = vec2(0, 8);
    vec2 uv[] = { vec2(0, 0), vec2(1, 0), vec2(0, 1) };
    draw_tri(&fb, t, uv, s);
    EXPECT(close_to(decode_colour(fb.get(1, 1), fb.offsets()), make_colour(0, 255, 0)));
    EXPECT(close_to(decode_colour(fb.get(6, 0), fb.offsets()), make_colour(255, 255, 0)));
    return true;
}

TEST(jpg_garbage)
{
    jpg dec;
    unsigned char junk[] = { 'n', 'o', 't', ' ', 'a', ' ', 'j', 'p', 'e', 'g' };
    int w, h;
    vector<colour> out;
    EXPECT(!dec.load(junk, sizeof(junk), w, h, out));

    // The decoder is still usable afterwards
    EXPECT(!dec.load(junk, 2, w, h, out));
    return true;
}

TEST(jpg_save_throws)
{
    // A pixel source that fails partway leaves no file behind
    struct img {
        static colour px(int x, int y, void *arg) {
            (void)x; (void)arg;
            if(y == 5)
                throw out_of_range("row 5");
            return make_colour(0, 0, 0);
        }
    };
    string path = tmpname("jpg_save_throws");
    EXPECT_THROW(save_jpeg(path.c_str(), 8, 8, img::px, 0), out_of_range, "row 5");
    EXPECT(access(path.c_str(), F_OK) != 0);
    return true;
}
