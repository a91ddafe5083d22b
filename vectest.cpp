// Copyright 2013, Andrew Ross
// Distributable under the GNU LGPL v2.1 , see COPYING for details
#include "vec.hpp"
#include "test.hpp"

using namespace std;

static bool near(float a, float b) { return fabs(a - b) < 1e-6; }

TEST(vecarith)
{
    vec2 a(1, 2), b(3, -4);
    EXPECT(a + b == vec2(4, -2));
    EXPECT(a - b == vec2(-2, 6));
    EXPECT(a + 1 == vec2(2, 3));
    EXPECT(a - 1 == vec2(0, 1));
    EXPECT(a * 3 == vec2(3, 6));
    EXPECT(2 * a == vec2(2, 4));
    EXPECT(b / 2 == vec2(1.5, -2));

    vec4 c(1, 2, 3, 4);
    c += vec4(1, 1, 1, 1);
    c *= 2;
    EXPECT(c == vec4(4, 6, 8, 10));
    EXPECT(c.w() == 10);
    return true;
}

TEST(vecnorm)
{
    vec3 v(3, 4, 5);
    EXPECT(near(v.magnitude(), sqrt(50.0f)));
    EXPECT(near(v.normal().magnitude(), 1));

    vec2 u = vec2(3, 4).normal();
    EXPECT(near(u.x(), 0.6) && near(u.y(), 0.8));
    EXPECT(vec2(3, 4).dot(vec2(-1, 1.5)) == 3);
    return true;
}

TEST(veccross)
{
    vec3 x(1, 0, 0), y(0, 1, 0), z(0, 0, 1);
    EXPECT(cross(x, y) == z);
    EXPECT(cross(y, z) == x);
    EXPECT(cross(y, x) == z * -1);

    vec3 a(2, -1, 3), b(0.5, 4, -2);
    vec3 n = cross(a, b);
    EXPECT(near(n.dot(a), 0) && near(n.dot(b), 0));
    return true;
}

TEST(invgrad)
{
    EXPECT(vec2(4, 2).inverse_gradient() == 2);
    EXPECT(vec2(-4, 4).inverse_gradient() == -1);
    EXPECT(vec2(0, 3).inverse_gradient() == 0);
    return true;
}
