// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <stdint.h>
#include "jpg.hpp"
#include "framebuf.hpp"

using namespace std;

// Only one hardware format is supported: a full 32 bit word per
// pixel, channels wherever the device says they are.
const unsigned int FB_BYTES_PER_PIXEL = 4;

framebuf::framebuf(const fbdev &d)
    : dev(d), npixels(0), held(false)
{
    memset(&h, 0, sizeof(h));
    held = dev.acquire(&h, dev.arg);
    if(!held)
        h.buffer = 0;
    else if(!h.buffer)
        release();

    if(held && h.bytes_per_pixel != FB_BYTES_PER_PIXEL) {
        char msg[64];
        snprintf(msg, sizeof(msg), "unsupported pixel format: %u bytes per pixel",
                 h.bytes_per_pixel);
        release();
        throw domain_error(msg);
    }
    if(held)
        npixels = h.buffer_len / FB_BYTES_PER_PIXEL;
}

framebuf::~framebuf()
{
    release();
}

void framebuf::release()
{
    if(!held)
        return;
    held = false;
    dev.release(&h, dev.arg);
    h.buffer = 0;
    npixels = 0;
}

size_t framebuf::addr(int x, int y) const
{
    uint64_t a = 0;
    if(x >= 0 && y >= 0)
        a = ((uint64_t)x + h.x_offset) + ((uint64_t)y + h.y_offset) * h.line_length;

    if(x < 0 || y < 0 || a >= npixels) {
        char msg[64];
        snprintf(msg, sizeof(msg), "pixel (%d, %d) outside framebuffer", x, y);
        throw out_of_range(msg);
    }

    // Can only trip where size_t is narrower than the device memory
    // could be (i.e. 32 bit builds with huge framebuffers)
    if(a > (uint64_t)PTRDIFF_MAX / sizeof(uint32_t))
        throw overflow_error("pixel address exceeds addressable range");

    return (size_t)a;
}

uint32_t framebuf::get(int x, int y) const
{
    return h.buffer[addr(x, y)];
}

void framebuf::set(int x, int y, colour c)
{
    h.buffer[addr(x, y)] = encode_colour(c, h.offsets);
}

static colour dump_pixel(int x, int y, void *arg)
{
    const framebuf *fb = (const framebuf*)arg;
    return decode_colour(fb->get(x, y), fb->offsets());
}

bool framebuf::dump(const char *path, int quality) const
{
    if(!ok())
        return false;

    // The visible area has to fit in the buffer for every pixel of
    // it to be readable
    if(width() && height()) {
        uint64_t last = (uint64_t)width() - 1 + h.x_offset +
                        ((uint64_t)height() - 1 + h.y_offset) * h.line_length;
        if(last >= npixels) {
            fprintf(stderr, "%s: visible area %ux%u+%u+%u exceeds the framebuffer\n",
                    path, width(), height(), h.x_offset, h.y_offset);
            return false;
        }
    }
    return save_jpeg(path, width(), height(), dump_pixel, (void*)this, quality);
}
