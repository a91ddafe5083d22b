// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <algorithm>
#include <cstdlib>
#include "framebuf.hpp"
#include "texture.hpp"
#include "raster.hpp"
#include "test.hpp"

using namespace std;

static tri make_tri(float ax, float ay, float bx, float by, float cx, float cy)
{
    tri t;
    t.v[0] = vec2(ax, ay);
    t.v[1] = vec2(bx, by);
    t.v[2] = vec2(cx, cy);
    return t;
}

// Per-pixel write counter, fed by the fragment callback
struct coverage {
    int w, h;
    vector<int> hits;
    coverage(int width, int height) : w(width), h(height), hits(width*height) {}
    int at(int x, int y) const { return hits[x + y*w]; }
};

static colour count_frag(int x, int y, const vec3 &att, void *arg)
{
    (void)att;
    coverage *cv = (coverage*)arg;
    if(x >= 0 && x < cv->w && y >= 0 && y < cv->h)
        cv->hits[x + y*cv->w]++;
    return make_colour(255, 255, 255);
}

static int total(const coverage &cv)
{
    int n = 0;
    for(unsigned int i=0; i<cv.hits.size(); i++)
        n += cv.hits[i];
    return n;
}

//
// Independent geometry for checking coverage: signed distances to
// the triangle's edges, positive inside.
//
struct ref_tri {
    double x[3], y[3];
    double sgn;

    ref_tri(const tri &t) {
        for(int i=0; i<3; i++) { x[i] = t.v[i].x(); y[i] = t.v[i].y(); }
        double area = (x[1]-x[0])*(y[2]-y[0]) - (x[2]-x[0])*(y[1]-y[0]);
        sgn = area < 0 ? -1 : 1;
    }

    double edge(int i, double px, double py) const {
        int j = (i + 1) % 3;
        double ex = x[j] - x[i], ey = y[j] - y[i];
        return sgn * (ex*(py - y[i]) - ey*(px - x[i])) / sqrt(ex*ex + ey*ey);
    }

    bool inside(double px, double py, double margin) const {
        for(int i=0; i<3; i++)
            if(edge(i, px, py) < margin)
                return false;
        return true;
    }

    // Unit square at pixel (px,py) lies within the triangle, by more
    // than a rounding error
    bool contains_square(int px, int py) const {
        const double m = 1e-3;
        return inside(px, py, m) && inside(px+1, py, m) &&
               inside(px, py+1, m) && inside(px+1, py+1, m);
    }

    // Separating axis test of the unit square at pixel (px,py)
    // against the triangle grown by a rounding error
    bool overlaps_square(int px, int py) const {
        const double m = 1e-3;
        double xmin = min(x[0], min(x[1], x[2])), xmax = max(x[0], max(x[1], x[2]));
        double ymin = min(y[0], min(y[1], y[2])), ymax = max(y[0], max(y[1], y[2]));
        if(xmax < px - m || xmin > px + 1 + m || ymax < py - m || ymin > py + 1 + m)
            return false;
        for(int i=0; i<3; i++) {
            double best = max(max(edge(i, px, py), edge(i, px+1, py)),
                              max(edge(i, px, py+1), edge(i, px+1, py+1)));
            if(best < -m)
                return false;
        }
        return true;
    }
};

static const int COV_W = 32, COV_H = 32;

static tri cov_tris[] = {
    make_tri(2, 3,       28, 9,    11, 27),
    make_tri(5.5, 1.25,  30, 30,   1, 20.75),
    make_tri(16, 2,      16.5, 29, 3, 15),
    make_tri(0, 0,       31, 0,    0, 31),
    make_tri(4, 4,       28, 28,   4, 28),
    make_tri(10.3, 0.7,  20.9, 5.1, 15.2, 30.6),
    make_tri(30, 1,      2, 16.5,  29, 30),
};
static const int NCOV = sizeof(cov_tris) / sizeof(cov_tris[0]);

static void cover(const tri &t, coverage &cv)
{
    mem_fbdev dev(cv.w, cv.h);
    framebuf fb(dev.device());
    vec3 att[3];
    rasterize_tri(&fb, t, att, count_frag, &cv);
}

TEST(tri_single_write)
{
    for(int i=0; i<NCOV; i++) {
        coverage cv(COV_W, COV_H);
        cover(cov_tris[i], cv);
        EXPECT(total(cv) > 0);
        for(int y=0; y<COV_H; y++)
            for(int x=0; x<COV_W; x++)
                EXPECT(cv.at(x, y) <= 1);
    }
    return true;
}

TEST(tri_interior)
{
    for(int i=0; i<NCOV; i++) {
        coverage cv(COV_W, COV_H);
        cover(cov_tris[i], cv);
        ref_tri ref(cov_tris[i]);
        for(int y=0; y<COV_H; y++) {
            for(int x=0; x<COV_W; x++) {
                if(ref.contains_square(x, y) && !cv.at(x, y)) {
                    printf("tri %d: interior pixel (%d, %d) not drawn\n", i, x, y);
                    return false;
                }
            }
        }
    }
    return true;
}

TEST(tri_no_strays)
{
    for(int i=0; i<NCOV; i++) {
        coverage cv(COV_W, COV_H);
        cover(cov_tris[i], cv);
        ref_tri ref(cov_tris[i]);
        for(int y=0; y<COV_H; y++) {
            for(int x=0; x<COV_W; x++) {
                if(cv.at(x, y) && !ref.overlaps_square(x, y)) {
                    printf("tri %d: pixel (%d, %d) drawn outside\n", i, x, y);
                    return false;
                }
            }
        }
    }
    return true;
}

// Coverage can't depend on which order the vertices come in
TEST(tri_vertex_order)
{
    for(int i=0; i<NCOV; i++) {
        coverage base(COV_W, COV_H);
        cover(cov_tris[i], base);

        int perm[] = { 0, 1, 2 };
        while(next_permutation(perm, perm + 3)) {
            tri t;
            for(int j=0; j<3; j++)
                t.v[j] = cov_tris[i].v[perm[j]];
            coverage cv(COV_W, COV_H);
            cover(t, cv);
            EXPECT(cv.hits == base.hits);
        }
    }
    return true;
}

TEST(tri_scenario_fill)
{
    const colour c = make_colour(0x80, 0x40, 0x20);
    mem_fbdev dev(4, 4);
    framebuf fb(dev.device());
    draw_tri(&fb, make_tri(0, 0, 4, 0, 0, 4), c);
    dump_ppm("tri_scenario_fill.ppm", fb);

    // Upper left half: 4, 3, 2, 1 pixels down the rows
    for(int y=0; y<4; y++)
        for(int x=0; x<4; x++)
            EXPECT((dev.pixel(x, y) == 0x00804020) == (x < 4 - y));

    // Mirrored: the long edge is on the right now
    mem_fbdev dev2(4, 4);
    framebuf fb2(dev2.device());
    draw_tri(&fb2, make_tri(4, 0, 0, 0, 4, 4), c);
    for(int y=0; y<4; y++)
        for(int x=0; x<4; x++)
            EXPECT((dev2.pixel(x, y) != 0) == (x >= y));
    return true;
}

TEST(tri_overflow)
{
    const colour c = make_colour(255, 255, 255);
    mem_fbdev dev(4, 4);
    framebuf fb(dev.device());
    EXPECT_THROW(draw_tri(&fb, make_tri(0, 2, 4, 2, 0, 6), c),
                 out_of_range, "pixel (0, 4)");

    // Rows above the offending one were drawn before it tripped
    for(int x=0; x<4; x++)
        EXPECT(dev.pixel(x, 2) != 0);
    for(int x=0; x<3; x++)
        EXPECT(dev.pixel(x, 3) != 0);
    EXPECT(dev.pixel(3, 3) == 0);
    for(int y=0; y<2; y++)
        for(int x=0; x<4; x++)
            EXPECT(dev.pixel(x, y) == 0);
    return true;
}

// Random float in [0, n], on a grid fine enough to hit integers
static float rnd(int n)
{
    return (rand() % (n * 64 + 1)) / 64.0f;
}

TEST(tri_bottom_edge)
{
    // A vertex sitting exactly on the bottom edge of the surface
    // touches row H but covers none of it.
    const int W = 64, H = 64;
    coverage cv(W, H);
    cover(make_tri(40, 64, 44.9, 17.8, 14.7, 23), cv);
    EXPECT(total(cv) > 0);

    srand(1234);
    for(int i=0; i<20000; i++) {
        tri t = make_tri(rnd(W), H, rnd(W), rnd(H - 1), rnd(W), rnd(H - 1));
        swap(t.v[0], t.v[i % 3]);
        try {
            cover(t, cv);
        } catch(out_of_range &e) {
            printf("(%g, %g) (%g, %g) (%g, %g): %s\n",
                   t.v[0].x(), t.v[0].y(), t.v[1].x(), t.v[1].y(),
                   t.v[2].x(), t.v[2].y(), e.what());
            return false;
        }
    }
    return true;
}

TEST(tri_vertex_range)
{
    mem_fbdev dev(4, 4);
    framebuf fb(dev.device());
    const colour c = make_colour(255, 255, 255);

    EXPECT_THROW(draw_tri(&fb, make_tri(0, 0, 4, 0, 0, 3e9), c),
                 out_of_range, "vertex 2");
    EXPECT_THROW(draw_tri(&fb, make_tri(-5e9, 1, 4, 0, 0, 3), c),
                 out_of_range, "vertex 0");
    EXPECT_THROW(draw_tri(&fb, make_tri(0, 0, 4, NAN, 0, 3), c),
                 out_of_range, "vertex 1");
    for(int y=0; y<4; y++)
        for(int x=0; x<4; x++)
            EXPECT(dev.pixel(x, y) == 0);

    // Far off but still addressable: fails at the first row that
    // runs off the surface, as any other overflow does
    EXPECT_THROW(draw_tri(&fb, make_tri(0, 0, 4, 0, 0, 2e9), c),
                 out_of_range, "pixel (0, 4)");
    return true;
}

TEST(tri_degenerate)
{
    tri flat[] = {
        make_tri(0, 2, 5, 2, 9, 2),        // no height
        make_tri(7.5, 3, 1, 3, 4, 3),
        make_tri(0, 0, 2, 2, 4, 4),        // collinear
        make_tri(3, 1, 3, 6, 3, 9),        // vertical line
        make_tri(1, 1.2, 3, 1.5, 2, 1.7),  // never crosses a row
    };
    for(unsigned int i=0; i<sizeof(flat)/sizeof(flat[0]); i++) {
        coverage cv(16, 16);
        cover(flat[i], cv);
        EXPECT(total(cv) == 0);
    }
    return true;
}

// Attributes stay with the vertex they were given for, even though
// the walk reorders the vertices top to bottom.
TEST(tri_attr_pairing)
{
    mem_fbdev dev(8, 8);
    framebuf fb(dev.device());
    tri t = make_tri(0, 7,  0, 0,  7, 0);
    vec3 colours[] = { vec3(1, 0, 0), vec3(0, 1, 0), vec3(0, 0, 1) };
    draw_tri(&fb, t, colours);
    dump_ppm("tri_attr_pairing.ppm", fb);

    // Right on vertex 1
    EXPECT(decode_colour(fb.get(0, 0), fb.offsets()) == make_colour(0, 255, 0));

    // Down the left side towards vertex 0 (red)
    colour c = decode_colour(fb.get(0, 6), fb.offsets());
    EXPECT(colour_r(c) > 200 && colour_g(c) < 50 && colour_b(c) == 0);

    // Along the top towards vertex 2 (blue)
    c = decode_colour(fb.get(6, 0), fb.offsets());
    EXPECT(colour_b(c) > 200 && colour_g(c) < 50 && colour_r(c) == 0);
    return true;
}

static colour att_frag(int x, int y, const vec3 &att, void *arg)
{
    vector<vec3> *out = (vector<vec3>*)arg;
    (*out)[x + y*8] = att;
    return 0;
}

// Interpolated values are exactly the affine map through the three
// vertices, evaluated at the integer pixel coordinate
TEST(tri_affine)
{
    mem_fbdev dev(8, 8);
    framebuf fb(dev.device());
    tri t = make_tri(0, 0,  8, 0,  0, 8);
    vec3 att[] = { vec3(1, 2, 3), vec3(5, 2, 3), vec3(1, 6, -1) };
    vector<vec3> seen(64, vec3(-99, -99, -99));
    rasterize_tri(&fb, t, att, att_frag, &seen);
    for(int y=0; y<8; y++) {
        for(int x=0; x<8-y; x++) {
            vec3 expect = vec3(1 + 0.5f*x, 2 + 0.5f*y, 3 - 0.5f*y);
            EXPECT(seen[x + y*8] == expect);
        }
    }
    return true;
}

TEST(tri_textured)
{
    static const colour quad[] = { make_colour(255, 0, 0), make_colour(0, 255, 0),
                                   make_colour(0, 0, 255), make_colour(255, 255, 255) };
    texture tex(2, 2, quad);
    sampler s(tex);

    mem_fbdev dev(4, 4);
    framebuf fb(dev.device());
    coverage cv(4, 4);

    // Two halves of the square, sharing the diagonal
    vec2 uv0[] = { vec2(0, 0), vec2(1, 0), vec2(0, 1) };
    vec2 uv1[] = { vec2(1, 0), vec2(1, 1), vec2(0, 1) };
    tri t0 = make_tri(0, 0, 4, 0, 0, 4), t1 = make_tri(4, 0, 4, 4, 0, 4);
    draw_tri(&fb, t0, uv0, s);
    draw_tri(&fb, t1, uv1, s);
    dump_ppm("tri_textured.ppm", fb);

    // The halves tile the square exactly
    vec3 none[3];
    rasterize_tri(&fb, t0, none, count_frag, &cv);
    rasterize_tri(&fb, t1, none, count_frag, &cv);
    for(int y=0; y<4; y++)
        for(int x=0; x<4; x++)
            EXPECT(cv.at(x, y) == 1);

    // Re-render the texture over the top and check each quadrant
    draw_tri(&fb, t0, uv0, s);
    draw_tri(&fb, t1, uv1, s);
    for(int y=0; y<4; y++)
        for(int x=0; x<4; x++)
            EXPECT(decode_colour(fb.get(x, y), fb.offsets()) == quad[x/2 + 2*(y/2)]);
    return true;
}
