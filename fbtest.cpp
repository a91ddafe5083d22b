// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <algorithm>
#include <cstdlib>
#include <unistd.h>
#include "framebuf.hpp"
#include "test.hpp"

using namespace std;

TEST(colour_roundtrip)
{
    // Every assignment of the three byte lanes to the channels, with
    // the spare lane at each position.
    unsigned int lanes[] = { 0, 8, 16, 24 };
    sort(lanes, lanes + 4);
    colour samples[] = { make_colour(0, 0, 0), make_colour(255, 255, 255),
                         make_colour(0x12, 0x34, 0x56), make_colour(255, 0, 128),
                         make_colour(1, 2, 3) };
    int perms = 0;
    do {
        channel_offsets off = { lanes[0], lanes[1], lanes[2] };
        for(unsigned int i=0; i<sizeof(samples)/sizeof(samples[0]); i++)
            EXPECT(decode_colour(encode_colour(samples[i], off), off) == samples[i]);
        perms++;
    } while(next_permutation(lanes, lanes + 4));
    EXPECT(perms == 24);
    return true;
}

TEST(colour_encode)
{
    colour c = make_colour(0x11, 0x22, 0x33);
    channel_offsets xrgb = { 16, 8, 0 }, bgrx = { 8, 16, 24 };
    EXPECT(encode_colour(c, xrgb) == 0x00112233);
    EXPECT(encode_colour(c, bgrx) == 0x33221100);

    // The canonical spare byte never reaches the device
    EXPECT(encode_colour(c | 0xff, xrgb) == 0x00112233);

    EXPECT(colour_from_vec(vec3(1, 0, 0.5)) == make_colour(255, 0, 128));
    EXPECT(colour_from_vec(vec3(-1, 2, 0)) == make_colour(0, 255, 0));
    return true;
}

TEST(fb_open)
{
    mem_fbdev dev(8, 4, 16);
    {
        framebuf fb(dev.device());
        EXPECT(fb.ok());
        EXPECT(fb.width() == 8 && fb.height() == 4);
        EXPECT(dev.acquired == 1 && dev.released == 0);

        fb.set(3, 2, make_colour(0xaa, 0xbb, 0xcc));
        EXPECT(dev.pixel(3, 2) == 0x00aabbcc);
        EXPECT(fb.get(3, 2) == 0x00aabbcc);
        EXPECT(dev.mem[3 + 2*16] == 0x00aabbcc);
    }
    EXPECT(dev.released == 1);
    return true;
}

TEST(fb_unavailable)
{
    mem_fbdev dev(4, 4);
    dev.fail = true;
    {
        framebuf fb(dev.device());
        EXPECT(!fb.ok());
        EXPECT_THROW(fb.set(0, 0, 0), out_of_range, "(0, 0)");
    }
    // Nothing was handed out, so nothing goes back
    EXPECT(dev.acquired == 0 && dev.released == 0);
    return true;
}

TEST(fb_format)
{
    mem_fbdev dev(4, 4, 0, 2);
    EXPECT_THROW(framebuf fb(dev.device()), domain_error, "2 bytes per pixel");
    EXPECT(dev.acquired == 1 && dev.released == 1);
    return true;
}

TEST(fb_bounds)
{
    mem_fbdev dev(4, 4);
    framebuf fb(dev.device());

    // The check is against the buffer, not the visible rectangle:
    // with a stride equal to the width, x=4 wraps to the next row.
    fb.set(3, 3, make_colour(1, 2, 3));
    fb.set(4, 0, make_colour(4, 5, 6));
    EXPECT(dev.pixel(0, 1) == 0x00040506);

    EXPECT_THROW(fb.set(0, 4, 0), out_of_range, "pixel (0, 4)");
    EXPECT_THROW(fb.get(16, 3), out_of_range, "pixel (16, 3)");
    EXPECT_THROW(fb.set(-1, 0, 0), out_of_range, "pixel (-1, 0)");
    EXPECT_THROW(fb.get(0, -2), out_of_range, "pixel (0, -2)");
    return true;
}

TEST(fb_offsets)
{
    // Visible area starts one row and two columns into the buffer
    mem_fbdev dev(4, 2, 8);
    dev.x_offset = 2;
    dev.y_offset = 1;
    dev.offsets.red = 0;
    dev.offsets.green = 8;
    dev.offsets.blue = 16;
    dev.resize();

    framebuf fb(dev.device());
    fb.set(1, 1, make_colour(0x10, 0x20, 0x30));
    EXPECT(dev.mem[(1+2) + (1+1)*8] == 0x00302010);
    EXPECT(decode_colour(fb.get(1, 1), fb.offsets()) == make_colour(0x10, 0x20, 0x30));

    // (5,1) is address 7 + 16 = 23 < 24; (6,1) is past the end
    fb.set(5, 1, 0);
    EXPECT_THROW(fb.set(6, 1, 0), out_of_range, "(6, 1)");
    return true;
}

TEST(fb_release_once)
{
    mem_fbdev dev(2, 2);
    {
        framebuf fb(dev.device());
        fb.release();
        EXPECT(dev.released == 1);
        fb.release();
        EXPECT(!fb.ok());
        EXPECT_THROW(fb.get(0, 0), out_of_range, "(0, 0)");
    }
    EXPECT(dev.released == 1);

    // Unwinding out of a failed write still gives the memory back
    mem_fbdev dev2(2, 2);
    try {
        framebuf fb(dev2.device());
        fb.set(0, 0, 0);
        fb.set(0, 9, 0);
        return false;
    } catch(out_of_range &e) {
        EXPECT(strstr(e.what(), "(0, 9)"));
    }
    EXPECT(dev2.acquired == 1 && dev2.released == 1);
    return true;
}

TEST(fb_dump_overrun)
{
    // Device claims more rows than it mapped
    mem_fbdev dev(4, 4);
    dev.height = 8;
    framebuf fb(dev.device());
    EXPECT(fb.ok() && fb.height() == 8);
    fb.set(3, 3, make_colour(1, 2, 3));

    const char *dir = getenv("TMPDIR");
    char path[256];
    snprintf(path, sizeof(path), "%s/fb_dump_overrun-%d.jpg", dir ? dir : "/tmp", (int)getpid());
    EXPECT(!fb.dump(path));
    EXPECT(access(path, F_OK) != 0);

    // Same for a pan offset pushing the view past the end
    mem_fbdev dev2(4, 4);
    dev2.y_offset = 1;
    framebuf fb2(dev2.device());
    EXPECT(!fb2.dump(path));
    EXPECT(access(path, F_OK) != 0);
    return true;
}
