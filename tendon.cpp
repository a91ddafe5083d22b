// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstdio>
#include <cstdlib>
#include <string>
#include <stdexcept>
#include "framebuf.hpp"
#include "texture.hpp"
#include "raster.hpp"

using namespace std;

// Draws a red/green/blue shaded triangle (and, given a JPEG, a
// textured one beside it) straight into the framebuffer, then dumps
// a screenshot.

// Booleans settable via command line
bool draw_colour = true;
bool dump = true;
bool headless = false;

struct optrec { const char *name; bool *ptr; } boolopts[] = {
    { "colour", &draw_colour },
    { "dump", &dump },
    { "headless", &headless },
    {}
};

string device = "/dev/fb0";
string screenshot = "screenshot.jpg";
string texture_file;

struct stropt { const char *name; string *ptr; } stropts[] = {
    { "device", &device },
    { "screenshot", &screenshot },
    { "texture", &texture_file },
    {}
};

bool parse_command_line(int argc, char **argv)
{
    for(int i=1; i<argc; i++) {
        string arg = argv[i];
        bool val = true;

        if(arg.substr(0, 2) != "--")
            return false;
        arg = arg.substr(2);

        int j;
        for(j=0; stropts[j].name; j++)
            if(arg == stropts[j].name)
                break;
        if(stropts[j].name) {
            if(i == argc-1)
                return false;
            *stropts[j].ptr = argv[++i];
            continue;
        }

        if(arg.substr(0, 3) == "no-") {
            val = false;
            arg = arg.substr(3);
        }
        for(j=0; boolopts[j].name; j++) {
            if(arg == boolopts[j].name) {
                *boolopts[j].ptr = val;
                break;
            }
        }
        if(!boolopts[j].name)
            return false;
    }
    return true;
}

static void usage(const char *argv0)
{
    printf("Usage: %s [options]\n", argv0);
    for(int i=0; stropts[i].name; i++)
        printf("       [--%s <arg>] (default=\"%s\")\n",
               stropts[i].name, stropts[i].ptr->c_str());
    for(int i=0; boolopts[i].name; i++)
        printf("       [--{no-}%s] (default=%s)\n",
               boolopts[i].name, *boolopts[i].ptr ? "true" : "false");
}

static vec2 at(const framebuf &fb, float fx, float fy)
{
    return vec2(fx * fb.width(), fy * fb.height());
}

static void draw(framebuf &fb, const texture *tex)
{
    if(draw_colour) {
        tri t;
        t.v[0] = at(fb, 0.08, 0.75);
        t.v[1] = at(fb, 0.50, 0.75);
        t.v[2] = at(fb, 0.29, 0.12);
        vec3 colours[] = { vec3(1, 0, 0), vec3(0, 1, 0), vec3(0, 0, 1) };
        draw_tri(&fb, t, colours);
    }

    if(tex) {
        sampler s(*tex);
        tri t;
        t.v[0] = at(fb, 0.55, 0.12);
        t.v[1] = at(fb, 0.92, 0.12);
        t.v[2] = at(fb, 0.55, 0.75);
        vec2 uv[] = { vec2(0, 0), vec2(0.999, 0), vec2(0, 0.999) };
        draw_tri(&fb, t, uv, s);
    }
}

int main(int argc, char **argv)
{
    if(!parse_command_line(argc, argv)) {
        usage(argv[0]);
        return 1;
    }

    texture tex;
    if(texture_file.size() && !texture::load_jpeg(texture_file.c_str(), tex))
        return 1;

    mem_fbdev mem(640, 480);
    fbdev dev = headless ? mem.device() : linux_fbdev(device.c_str());

    try {
        framebuf fb(dev);
        if(!fb.ok()) {
            fprintf(stderr, "%s: framebuffer unavailable (try --headless)\n",
                    headless ? "memory" : device.c_str());
            return 1;
        }
        printf("%ux%u framebuffer, channels at r%u g%u b%u\n", fb.width(), fb.height(),
               fb.offsets().red, fb.offsets().green, fb.offsets().blue);

        draw(fb, texture_file.size() ? &tex : 0);

        if(dump) {
            if(!fb.dump(screenshot.c_str()))
                return 1;
            printf("wrote %s\n", screenshot.c_str());
        }
    } catch(exception &e) {
        fprintf(stderr, "fatal: %s\n", e.what());
        return 2;
    }
    return 0;
}
