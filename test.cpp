// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include <cstdlib>
#include <set>
#include "framebuf.hpp"
#include "test.hpp"

using namespace std;

// Booleans settable via command line
bool halt = true;
bool dump_images = false;

set<string> tests_enabled;

struct optrec { const char *name; bool *ptr; } boolopts[] = {
    { "halt", &halt },
    { "dump", &dump_images },
    {}
};

const unsigned int MAX_TESTS = 1024;
static const struct test_rec *tests[MAX_TESTS];
static unsigned int ntests = 0;

test_rec::test_rec(const char *n, bool(*f)())
    : name(n), fn(f)
{
    if(ntests < MAX_TESTS)
        tests[ntests++] = this;
    else
        fprintf(stderr, "TOO MANY TESTS, skipping %s\n", n);
}

bool parse_command_line(int argc, char **argv)
{
    for(int i=1; i<argc; i++) {
        string arg = argv[i];
        bool val = true;

        if(arg.substr(0, 2) != "--") {
            bool ok = false;
            for(unsigned int j=0; j<ntests; j++)
                if(arg == tests[j]->name)
                    ok = true;
            if(!ok) {
                printf("No such test: %s\n", argv[i]);
                return false;
            }
            tests_enabled.insert(argv[i]);
            continue;
        }
        arg = arg.substr(2);
        if(arg.substr(0, 3) == "no-") {
            val = false;
            arg = arg.substr(3);
        }

        if(arg == "tests") {
            // Dump list of tests
            for(unsigned int i=0; i<ntests; i++)
                printf("%s\n", tests[i]->name);
            exit(0);
        } else {
            int j;
            for(j=0; boolopts[j].name; j++) {
                if(arg == boolopts[j].name) {
                    *boolopts[j].ptr = val;
                    break;
                }
            }
            if(!boolopts[j].name)
                return false;
        }
    }
    return true;
}

void dump_ppm(const char *name, const framebuf &fb)
{
    if(!dump_images)
        return;
    FILE* out = fopen(name, "wb");
    if(!out) {
        fprintf(stderr, "%s: can't write\n", name);
        return;
    }
    fprintf(out, "P6\n%u %u\n255\n", fb.width(), fb.height());
    for(unsigned int y=0; y<fb.height(); y++) {
        for(unsigned int x=0; x<fb.width(); x++) {
            colour c = decode_colour(fb.get(x, y), fb.offsets());
            fputc(colour_r(c), out);
            fputc(colour_g(c), out);
            fputc(colour_b(c), out);
        }
    }
    fclose(out);
}

// A test that throws something it didn't expect fails rather than
// taking the runner down with it.
static bool run_one(const test_rec *t)
{
    try {
        return t->fn();
    } catch(exception &e) {
        printf("## %s threw: %s\n", t->name, e.what());
        return false;
    }
}

bool run_all_tests()
{
    bool all_ok = true;
    for(unsigned int i=0; i<ntests; i++) {
        if(tests_enabled.size())
            if(tests_enabled.find(tests[i]->name) == tests_enabled.end())
                continue;

        printf("## TEST: %s\n", tests[i]->name);
        bool result = run_one(tests[i]);
        printf("## %s %s\n", tests[i]->name, result ? "SUCCEEDED" : "FAILED");
        if(!result) {
            all_ok = false;
            if(halt)
                return false;
        }
    }
    return all_ok;
}

int main(int argc, char** argv)
{
    if(!parse_command_line(argc, argv)) {
        printf("Usage: %s [<test1_name>] [<test2_name>]...\n", argv[0]);
        printf("       [--tests]  (prints list of tests to stdout)\n");
        for(int i=0; boolopts[i].name; i++)
            printf("       [--{no-}%s] (default=%s)\n",
                   boolopts[i].name,
                   *boolopts[i].ptr ? "true" : "false");
        printf("Available tests:\n");
        for(unsigned int i=0; i<ntests; i++)
            printf("  %s\n", tests[i]->name);
        return 1;
    }

    return run_all_tests() ? 0 : 1;
}
