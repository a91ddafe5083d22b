// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _FBDEV_HPP
#define _FBDEV_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "colour.hpp"

// Raw description of a block of device pixel memory, as handed out by
// an fbdev.  Nothing here is validated; framebuf does that.
struct fb_handle {
    uint32_t *buffer;      // null if the device could not be acquired
    size_t buffer_len;     // in bytes
    unsigned int bytes_per_pixel;
    channel_offsets offsets;
    unsigned int x_offset, y_offset; // viewport origin within the buffer
    unsigned int x_res, y_res;       // visible size
    unsigned int line_length;        // row stride, in pixels
};

// Device collaborator.  acquire() fills in the handle and returns
// false (leaving buffer null) if the memory isn't available;
// release() gives back whatever acquire() handed out.  The arg
// pointer is passed through untouched.
struct fbdev {
    bool (*acquire)(fb_handle *h, void *arg);
    void (*release)(fb_handle *h, void *arg);
    void *arg;
};

// Linux fbdev (e.g. "/dev/fb0").  Needs read/write access to the
// device node, normally membership in the "video" group.  The path
// string must outlive the returned fbdev.
fbdev linux_fbdev(const char *path);

// Heap memory posing as a device, for tests and headless runs.  The
// pixel memory is allocated up front and survives release() so the
// result can still be inspected afterwards.
struct mem_fbdev {
    mem_fbdev(unsigned int w, unsigned int h, unsigned int stride=0,
              unsigned int bpp=4);

    fbdev device();
    uint32_t pixel(unsigned int x, unsigned int y) const;

    unsigned int width, height, line_length, bytes_per_pixel;
    unsigned int x_offset, y_offset;
    channel_offsets offsets;
    bool fail;     // hand out a null buffer
    int acquired;  // acquire() calls that succeeded
    int released;  // release() calls
    std::vector<uint32_t> mem;

    // Resizes the backing store after geometry changes
    void resize();
};

#endif // _FBDEV_HPP
