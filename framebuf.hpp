// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _FRAMEBUF_HPP
#define _FRAMEBUF_HPP

#include "fbdev.hpp"
#include "colour.hpp"

// Direct access to a 32 bit per pixel device framebuffer.  The device
// memory is acquired at construction and handed back exactly once,
// either by an explicit release() or by the destructor, whichever
// comes first.
//
// Every access is bounds checked against the device memory.  There is
// no clipping: a pixel outside the buffer is a caller bug and throws
// std::out_of_range naming the coordinates.
class framebuf {
public:
    // Check ok() afterwards: a device that can't be opened leaves an
    // empty framebuf.  A device that isn't 32bpp throws
    // std::domain_error (after releasing it).
    explicit framebuf(const fbdev &dev);
    ~framebuf();

    bool ok() const { return h.buffer != 0; }
    void release();

    uint32_t get(int x, int y) const;
    void set(int x, int y, colour c);

    unsigned int width() const { return h.x_res; }
    unsigned int height() const { return h.y_res; }
    const channel_offsets& offsets() const { return h.offsets; }

    // Screenshot of the visible area, as a JPEG
    bool dump(const char *path, int quality=90) const;

private:
    framebuf(const framebuf&);
    framebuf& operator=(const framebuf&);

    size_t addr(int x, int y) const;

    fbdev dev;
    fb_handle h;
    size_t npixels;
    bool held;
};

#endif // _FRAMEBUF_HPP
