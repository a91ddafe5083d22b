// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#ifndef _VEC_HPP
#define _VEC_HPP

#include <cmath>

// Small fixed-size float vectors.  One template covers the 2/3/4
// component cases; vec2/vec3/vec4 are the names the rest of the code
// uses.  Components are plain floats, and x()/y()/z()/w() are only
// shorthand for indexes 0..3 (using z() on a vec2 is a compile error).
template<int N>
class vec {
public:
    vec() { for(int i=0; i<N; i++) c[i] = 0; }
    vec(float x, float y) { init(x, y, 0, 0); }
    vec(float x, float y, float z) { init(x, y, z, 0); }
    vec(float x, float y, float z, float w) { init(x, y, z, w); }

    float& operator[](int i) { return c[i]; }
    float operator[](int i) const { return c[i]; }

    float x() const { return c[0]; }
    float y() const { return c[1]; }
    float z() const { return comp<2>(); }
    float w() const { return comp<3>(); }

    vec operator+(const vec &v) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] + v.c[i]; return r; }
    vec operator-(const vec &v) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] - v.c[i]; return r; }
    vec operator+(float s) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] + s; return r; }
    vec operator-(float s) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] - s; return r; }
    vec operator*(float s) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] * s; return r; }
    vec operator/(float s) const { vec r; for(int i=0; i<N; i++) r.c[i] = c[i] / s; return r; }

    vec& operator+=(const vec &v) { for(int i=0; i<N; i++) c[i] += v.c[i]; return *this; }
    vec& operator-=(const vec &v) { for(int i=0; i<N; i++) c[i] -= v.c[i]; return *this; }
    vec& operator*=(float s) { for(int i=0; i<N; i++) c[i] *= s; return *this; }
    vec& operator/=(float s) { for(int i=0; i<N; i++) c[i] /= s; return *this; }

    bool operator==(const vec &v) const {
        for(int i=0; i<N; i++)
            if(c[i] != v.c[i])
                return false;
        return true;
    }
    bool operator!=(const vec &v) const { return !(*this == v); }

    float dot(const vec &v) const {
        float sum = 0;
        for(int i=0; i<N; i++)
            sum += c[i] * v.c[i];
        return sum;
    }

    float magnitude() const { return std::sqrt(dot(*this)); }

    // Zero vectors come back as NaNs, same as the division would.
    vec normal() const { return *this / magnitude(); }

    // dx/dy of an edge vector: how far X moves per scanline.  Only
    // meaningful for 2D vectors with a nonzero Y.
    double inverse_gradient() const {
        static_assert(N == 2, "inverse_gradient() is defined on 2D vectors");
        return (double)c[0] / c[1];
    }

private:
    template<int I> float comp() const {
        static_assert(I < N, "vector component out of range");
        return c[I];
    }

    void init(float x, float y, float z, float w) {
        float in[] = { x, y, z, w };
        for(int i=0; i<N; i++)
            c[i] = in[i];
    }

    float c[N];
};

template<int N>
inline vec<N> operator*(float s, const vec<N> &v) { return v * s; }

inline vec<3> cross(const vec<3> &a, const vec<3> &b)
{
    return vec<3>(a[1]*b[2] - a[2]*b[1],
                  a[2]*b[0] - a[0]*b[2],
                  a[0]*b[1] - a[1]*b[0]);
}

typedef vec<2> vec2;
typedef vec<3> vec3;
typedef vec<4> vec4;

#endif // _VEC_HPP
