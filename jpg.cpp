// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstring>
#include <cerrno>
#include "jpg.hpp"

using namespace std;

// Fed to the decoder in place of more data when it runs off the end
// of a truncated buffer.
static const JOCTET fake_eoi[] = { 0xff, JPEG_EOI };

jpg::jpg()
    : buf(0), len(0)
{
    memset(&sm, 0, sizeof(sm));
    memset(&jdec, 0, sizeof(jdec));
    memset(&errmgr, 0, sizeof(errmgr));
    sm.init_source = init_cb;
    sm.fill_input_buffer = fill_cb;
    sm.skip_input_data = skip_cb;
    sm.resync_to_restart = jpeg_resync_to_restart;
    sm.term_source = term_cb;
    jdec.err = jpeg_std_error(&errmgr);
    errmgr.error_exit = error_cb;
    jdec.client_data = this;
    jpeg_create_decompress(&jdec);
    jdec.src = &sm;
}

jpg::~jpg() { jpeg_destroy_decompress(&jdec); }

// libjpeg's default error handler calls exit(), which is not an
// option for a library.  Bounce back into load() instead.
void jpg::error_cb(j_common_ptr cinfo)
{
    char msg[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, msg);
    fprintf(stderr, "jpeg: %s\n", msg);
    longjmp(((jpg*)cinfo->client_data)->bail, 1);
}

boolean jpg::fill_cb(j_decompress_ptr jdec)
{
    jpg* me = (jpg*)jdec->src;
    if(me->buf) {
        jdec->src->next_input_byte = me->buf;
        jdec->src->bytes_in_buffer = me->len;
        me->buf = 0;
    } else {
        jdec->src->next_input_byte = fake_eoi;
        jdec->src->bytes_in_buffer = sizeof(fake_eoi);
    }
    return TRUE;
}

void jpg::skip_cb(j_decompress_ptr jdec, long n)
{
    if(n <= 0)
        return;
    while(n > (long)jdec->src->bytes_in_buffer) {
        n -= jdec->src->bytes_in_buffer;
        fill_cb(jdec);
    }
    jdec->src->next_input_byte += n;
    jdec->src->bytes_in_buffer -= n;
}

bool jpg::load(const unsigned char *mem, int bytes, int &w, int &h,
               vector<colour> &out)
{
    buf = mem;
    len = bytes;
    sm.next_input_byte = 0;
    sm.bytes_in_buffer = 0;

    if(setjmp(bail)) {
        jpeg_abort_decompress(&jdec);
        return false;
    }

    if(jpeg_read_header(&jdec, TRUE) != JPEG_HEADER_OK) {
        jpeg_abort_decompress(&jdec);
        return false;
    }
    jdec.out_color_space = JCS_RGB;
    jpeg_start_decompress(&jdec);
    w = jdec.output_width;
    h = jdec.output_height;
    if(jdec.output_components != 3) {
        fprintf(stderr, "jpeg: %d components, only RGB supported\n", jdec.output_components);
        jpeg_abort_decompress(&jdec);
        return false;
    }

    // Scanline memory comes from libjpeg's image pool, so it goes
    // away with the decode even when error_cb longjmps out.
    JSAMPARRAY line = (*jdec.mem->alloc_sarray)((j_common_ptr)&jdec, JPOOL_IMAGE, 3*w, 1);
    out.resize((size_t)w*h);
    for(int y=0; y<h; y++) {
        jpeg_read_scanlines(&jdec, line, 1);
        for(int x=0; x<w; x++) {
            unsigned char *p = &line[0][x*3];
            out[(size_t)w*y+x] = make_colour(p[0], p[1], p[2]);
        }
    }
    jpeg_finish_decompress(&jdec);
    return true;
}

bool read_file(const char *path, vector<unsigned char> &out)
{
    FILE *f = fopen(path, "rb");
    if(!f) {
        fprintf(stderr, "%s: %s\n", path, strerror(errno));
        return false;
    }
    out.clear();
    unsigned char chunk[4096];
    size_t n;
    while((n = fread(chunk, 1, sizeof(chunk), f)) > 0)
        out.insert(out.end(), chunk, chunk + n);
    bool ok = !ferror(f);
    if(!ok)
        fprintf(stderr, "%s: read error\n", path);
    fclose(f);
    return ok;
}

struct jpg_out {
    jpeg_compress_struct jenc;
    jpeg_error_mgr errmgr;
    jmp_buf bail;
};

static void jpg_out_error(j_common_ptr cinfo)
{
    char msg[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, msg);
    fprintf(stderr, "jpeg: %s\n", msg);
    longjmp(((jpg_out*)cinfo->client_data)->bail, 1);
}

bool save_jpeg(const char *path, int w, int h, pixel_fn fn, void *arg, int quality)
{
    vector<unsigned char> line(3*w);
    FILE *f = fopen(path, "wb");
    if(!f) {
        fprintf(stderr, "%s: %s\n", path, strerror(errno));
        return false;
    }

    jpg_out jo;
    memset(&jo, 0, sizeof(jo));
    jo.jenc.err = jpeg_std_error(&jo.errmgr);
    jo.errmgr.error_exit = jpg_out_error;
    jo.jenc.client_data = &jo;

    if(setjmp(jo.bail)) {
        jpeg_destroy_compress(&jo.jenc);
        fclose(f);
        return false;
    }

    jpeg_create_compress(&jo.jenc);
    jpeg_stdio_dest(&jo.jenc, f);
    jo.jenc.image_width = w;
    jo.jenc.image_height = h;
    jo.jenc.input_components = 3;
    jo.jenc.in_color_space = JCS_RGB;
    jpeg_set_defaults(&jo.jenc);
    jpeg_set_quality(&jo.jenc, quality, TRUE);
    jpeg_start_compress(&jo.jenc, TRUE);

    // The pixel callback may throw: don't leave the encoder, the file
    // or half an image behind.
    try {
        for(int y=0; y<h; y++) {
            for(int x=0; x<w; x++) {
                colour c = fn(x, y, arg);
                line[3*x+0] = colour_r(c);
                line[3*x+1] = colour_g(c);
                line[3*x+2] = colour_b(c);
            }
            JSAMPROW row = &line[0];
            jpeg_write_scanlines(&jo.jenc, &row, 1);
        }
    } catch(...) {
        jpeg_destroy_compress(&jo.jenc);
        fclose(f);
        remove(path);
        throw;
    }

    jpeg_finish_compress(&jo.jenc);
    jpeg_destroy_compress(&jo.jenc);
    bool ok = fclose(f) == 0;
    if(!ok)
        fprintf(stderr, "%s: write error\n", path);
    return ok;
}
