// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include "util.hpp"
#include "framebuf.hpp"
#include "texture.hpp"
#include "raster.hpp"

using namespace std;

// Attributes are affine over the screen-space triangle.  With A as
// the origin, any point is P = A + s*(B-A) + t*(C-A), and each
// attribute is att(P) = attA + s*(attB-attA) + t*(attC-attA).  Rather
// than solving for s/t at every pixel, fold the 2x2 inverse into
// per-attribute X and Y steps once per triangle:
//
//   |bx-ax cx-ax|   |s|   |px-ax|
//   |by-ay cy-ay| * |t| = |py-ay|
//
//   att(P) = attA + (px-ax)*ddx + (py-ay)*ddy
struct tri_setup {
    framebuf *fb;
    frag_fn fragment;
    void *arg;
    vec2 a;
    vec3 atta, ddx, ddy;
};

// Each row's boundaries are taken straight from the first row's, not
// accumulated, so the last row of a tall triangle sees no drift.
static void draw_rows(const tri_setup &ts, int y0, int y1,
                      double xl, double xr, double stepl, double stepr)
{
    for(int y=y0; y<y1; y++) {
        double rows = y - y0;
        int xend = ifloor(xr + rows*stepr);
        for(int x=ifloor(xl + rows*stepl); x<xend; x++) {
            vec3 att = ts.atta + ts.ddx * (x - ts.a.x()) + ts.ddy * (y - ts.a.y());
            ts.fb->set(x, y, ts.fragment(x, y, att, ts.arg));
        }
    }
}

void rasterize_tri(framebuf *fb, const tri &t, const vec3 *att,
                   frag_fn fragment, void *frag_arg)
{
    // Row and column indices are ints; anything that can't floor into
    // one can't address a pixel either.
    for(int i=0; i<3; i++) {
        float x = t.v[i].x(), y = t.v[i].y();
        if(!(fabs(x) < INT_MAX && fabs(y) < INT_MAX)) {
            char msg[96];
            snprintf(msg, sizeof(msg), "vertex %d (%g, %g) outside addressable range",
                     i, x, y);
            throw out_of_range(msg);
        }
    }

    // Sort top to bottom.  Only strict comparisons swap, so vertices
    // sharing a row keep their input order.
    int idx[] = { 0, 1, 2 };
    if(t.v[idx[0]].y() > t.v[idx[1]].y()) swap(idx[0], idx[1]);
    if(t.v[idx[1]].y() > t.v[idx[2]].y()) swap(idx[1], idx[2]);
    if(t.v[idx[0]].y() > t.v[idx[1]].y()) swap(idx[0], idx[1]);

    // Renaming.  The attributes move with their vertices.
    const vec2 &a = t.v[idx[0]], &b = t.v[idx[1]], &c = t.v[idx[2]];
    const vec3 &atta = att[idx[0]], &attb = att[idx[1]], &attc = att[idx[2]];

    vec2 high = c - a;  // full height, the long edge
    vec2 upper = b - a;
    vec2 lower = c - b;

    if(high.y() == 0)
        return;

    float det = upper.x()*high.y() - high.x()*upper.y();
    if(det == 0)
        return; // collinear: has height, but no area to fill

    tri_setup ts;
    ts.fb = fb;
    ts.fragment = fragment;
    ts.arg = frag_arg;
    ts.a = a;
    ts.atta = atta;
    vec3 ba = attb - atta, ca = attc - atta;
    ts.ddx = (ba * high.y() - ca * upper.y()) / det;
    ts.ddy = (ca * upper.x() - ba * high.x()) / det;

    // Where the long edge crosses B's row.  If that's left of B, the
    // long edge is the left boundary all the way down.
    double splitx = a.x() + ((double)upper.y() / high.y()) * high.x();
    bool left_tri = splitx < b.x();

    // Upper half: both boundaries start at A.  The edge inverse
    // gradients are only taken for edges with height, which the row
    // tests guarantee.
    if(ifloor(a.y()) != ifloor(b.y())) {
        double gh = high.inverse_gradient(), gu = upper.inverse_gradient();
        draw_rows(ts, ifloor(a.y()), ifloor(b.y()), a.x(), a.x(),
                  left_tri ? gh : gu, left_tri ? gu : gh);
    }

    // Lower half, down to and including C's row.  Rows are stepped
    // from B.y, so C's row is sampled at or below C when B.y's
    // fraction is no smaller than C.y's.  The edges have met (or
    // crossed) there and the span is empty.
    if(ifloor(b.y()) != ifloor(c.y())) {
        double gh = high.inverse_gradient(), gl = lower.inverse_gradient();
        int y0 = ifloor(b.y()), y1 = ifloor(c.y()) + 1;
        if((double)b.y() + (y1 - 1 - y0) >= c.y())
            y1--;
        if(left_tri)
            draw_rows(ts, y0, y1, splitx, b.x(), gh, gl);
        else
            draw_rows(ts, y0, y1, b.x(), splitx, gl, gh);
    }
}

static colour flat_frag(int, int, const vec3 &, void *arg)
{
    return *(const colour*)arg;
}

void draw_tri(framebuf *fb, const tri &t, colour c)
{
    vec3 att[3];
    rasterize_tri(fb, t, att, flat_frag, &c);
}

static colour shade_frag(int, int, const vec3 &att, void *)
{
    return colour_from_vec(att);
}

void draw_tri(framebuf *fb, const tri &t, const vec3 *colours)
{
    rasterize_tri(fb, t, colours, shade_frag, 0);
}

static colour tex_frag(int, int, const vec3 &att, void *arg)
{
    return ((const sampler*)arg)->sample(att.x(), att.y());
}

void draw_tri(framebuf *fb, const tri &t, const vec2 *uvs, const sampler &s)
{
    vec3 att[3];
    for(int i=0; i<3; i++)
        att[i] = vec3(uvs[i].x(), uvs[i].y(), 0);
    rasterize_tri(fb, t, att, tex_frag, (void*)&s);
}
