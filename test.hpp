// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _TEST_HPP
#define _TEST_HPP

#include <vector>
#include <string>
#include <stdexcept>
#include <cmath>
#include <cstdio>
#include <cstring>

using namespace std;

class framebuf;

struct test_rec {
    const char *name; bool (*fn)();
    test_rec(const char *n, bool(*f)());
};
#define TEST(N) bool(N)(); const static test_rec t_##N(#N, N); bool(N)()

// Reports a failed expectation (with its source line) and fails the
// enclosing test.
#define EXPECT(cond) do { if(!(cond)) {                          \
            printf("%s:%d: expected %s\n", __FILE__, __LINE__, #cond); \
            return false; } } while(0)

// Fails the test unless the statement throws exception type E whose
// what() contains msg.
#define EXPECT_THROW(stmt, E, msg) do { bool died = false;       \
        try { stmt; } catch(E &e) {                               \
            died = true;                                          \
            if(!strstr(e.what(), (msg))) {                        \
                printf("%s:%d: wrong message \"%s\"\n", __FILE__, __LINE__, e.what()); \
                return false; }                                   \
        }                                                         \
        if(!died) {                                               \
            printf("%s:%d: %s didn't throw\n", __FILE__, __LINE__, #stmt); \
            return false; } } while(0)

// Set by --dump: tests write images of what they rendered
extern bool dump_images;

// Writes the visible area of a framebuffer as a binary PPM (only
// when dump_images is set)
void dump_ppm(const char *name, const framebuf &fb);

#endif // _TEST_HPP
