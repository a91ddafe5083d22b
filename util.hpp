// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _UTIL_HPP
#define _UTIL_HPP

#include <cmath>

typedef union { int i; float f; } uif;

// The largest float below a positive value: decrementing the bit
// pattern borrows from the exponent when the mantissa rolls over.
inline float ulp_less(double val)
{
    uif u;
    u.f = val;
    u.i -= 1;
    return u.f;
}

// Integer row/column containing a floating point coordinate
inline int ifloor(float f)
{
    return (int)std::floor(f);
}

inline int ifloor(double d)
{
    return (int)std::floor(d);
}

#endif // _UTIL_HPP
