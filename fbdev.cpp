// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <linux/fb.h>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include "fbdev.hpp"

using namespace std;

static bool linux_acquire(fb_handle *h, void *arg)
{
    const char *path = (const char*)arg;
    memset(h, 0, sizeof(*h));

    int fd = open(path, O_RDWR);
    if(fd < 0) {
        fprintf(stderr, "%s: %s\n", path, strerror(errno));
        return false;
    }

    fb_var_screeninfo var;
    if(ioctl(fd, FBIOGET_VSCREENINFO, &var) < 0) {
        fprintf(stderr, "%s: screen info query failed: %s\n", path, strerror(errno));
        close(fd);
        return false;
    }

    // Ask for 32bpp color.  If the driver refuses, whatever it's
    // actually doing gets re-read below and framebuf decides if it
    // can cope.
    var.bits_per_pixel = 32;
    var.grayscale = 0;
    if(ioctl(fd, FBIOPUT_VSCREENINFO, &var) < 0)
        fprintf(stderr, "%s: driver refused 32bpp mode\n", path);

    fb_fix_screeninfo fix;
    if(ioctl(fd, FBIOGET_VSCREENINFO, &var) < 0 ||
       ioctl(fd, FBIOGET_FSCREENINFO, &fix) < 0) {
        fprintf(stderr, "%s: screen info query failed: %s\n", path, strerror(errno));
        close(fd);
        return false;
    }

    h->bytes_per_pixel = var.bits_per_pixel / 8;
    h->offsets.red = var.red.offset;
    h->offsets.green = var.green.offset;
    h->offsets.blue = var.blue.offset;
    h->x_offset = var.xoffset;
    h->y_offset = var.yoffset;
    h->x_res = var.xres;
    h->y_res = var.yres;
    h->line_length = fix.line_length / sizeof(uint32_t);
    h->buffer_len = fix.smem_len;

    void *mem = mmap(0, h->buffer_len, PROT_READ|PROT_WRITE, MAP_SHARED, fd, 0);
    close(fd); // the mapping keeps its own reference
    if(mem == MAP_FAILED) {
        fprintf(stderr, "%s: mmap failed: %s\n", path, strerror(errno));
        return false;
    }
    h->buffer = (uint32_t*)mem;
    return true;
}

static void linux_release(fb_handle *h, void *arg)
{
    (void)arg;
    if(h->buffer)
        munmap(h->buffer, h->buffer_len);
    h->buffer = 0;
}

fbdev linux_fbdev(const char *path)
{
    fbdev d = { linux_acquire, linux_release, (void*)path };
    return d;
}

mem_fbdev::mem_fbdev(unsigned int w, unsigned int h, unsigned int stride,
                     unsigned int bpp)
    : width(w), height(h), line_length(stride ? stride : w),
      bytes_per_pixel(bpp), x_offset(0), y_offset(0),
      fail(false), acquired(0), released(0)
{
    // Common little-endian xRGB8888 layout
    offsets.red = 16;
    offsets.green = 8;
    offsets.blue = 0;
    resize();
}

void mem_fbdev::resize()
{
    mem.assign((size_t)line_length * (height + y_offset), 0);
}

uint32_t mem_fbdev::pixel(unsigned int x, unsigned int y) const
{
    return mem[(x + x_offset) + (size_t)(y + y_offset) * line_length];
}

static bool mem_acquire(fb_handle *h, void *arg)
{
    mem_fbdev *m = (mem_fbdev*)arg;
    memset(h, 0, sizeof(*h));
    if(m->fail || m->mem.empty())
        return false;

    h->buffer = &m->mem[0];
    h->buffer_len = m->mem.size() * sizeof(uint32_t);
    h->bytes_per_pixel = m->bytes_per_pixel;
    h->offsets = m->offsets;
    h->x_offset = m->x_offset;
    h->y_offset = m->y_offset;
    h->x_res = m->width;
    h->y_res = m->height;
    h->line_length = m->line_length;
    m->acquired++;
    return true;
}

static void mem_release(fb_handle *h, void *arg)
{
    mem_fbdev *m = (mem_fbdev*)arg;
    m->released++;
    h->buffer = 0;
}

fbdev mem_fbdev::device()
{
    fbdev d = { mem_acquire, mem_release, this };
    return d;
}
