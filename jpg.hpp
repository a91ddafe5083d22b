// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _JPG_HPP
#define _JPG_HPP

#include <cstdio>
#include <csetjmp>
#include <vector>
#include <jpeglib.h>
#include "colour.hpp"

// Minimal libjpeg loader, jpg().load(buf,len,w,h,out) fills out with
// w*h colours in natural (i.e. top-down) order.  Reuse the object
// for multiple files for a modest performance increase.  Only
// 3-component (RGB) images are accepted.
struct jpg {
    jpeg_source_mgr sm; // "superclass" must be first
    jpeg_decompress_struct jdec;
    jpeg_error_mgr errmgr;
    jmp_buf bail;
    const unsigned char* buf;
    int len;

    jpg();
    ~jpg();

    bool load(const unsigned char *mem, int bytes, int &w, int &h,
              std::vector<colour> &out);

private:
    static void init_cb(j_decompress_ptr) {}
    static void term_cb(j_decompress_ptr) {}
    static boolean fill_cb(j_decompress_ptr jdec);
    static void skip_cb(j_decompress_ptr jdec, long n);
    static void error_cb(j_common_ptr cinfo);

    jpg(const jpg&);
    jpg& operator=(const jpg&);
};

// Whole-file read, false (with a message on stderr) on failure
bool read_file(const char *path, std::vector<unsigned char> &out);

// Encodes a w*h image fetched one pixel at a time through fn, in
// row-major order starting at the top.
typedef colour (*pixel_fn)(int x, int y, void *arg);
bool save_jpeg(const char *path, int w, int h, pixel_fn fn, void *arg,
               int quality=90);

#endif // _JPG_HPP
