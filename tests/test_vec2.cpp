#include <gtest/gtest.h>
#include <math/vec2.hpp>
#include <numbers>

using namespace trailsketch;

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
}

TEST(Vec2Test, Arithmetic) {
    Vec2 a(1.0, 2.0);
    Vec2 b(4.0, 6.0);

    EXPECT_EQ(a + b, Vec2(5.0, 8.0));
    EXPECT_EQ(b - a, Vec2(3.0, 4.0));
    EXPECT_EQ(a * 2.0, Vec2(2.0, 4.0));
    EXPECT_EQ(2.0 * a, Vec2(2.0, 4.0));
    EXPECT_EQ(b / 2.0, Vec2(2.0, 3.0));
    EXPECT_EQ(-a, Vec2(-1.0, -2.0));
}

TEST(Vec2Test, DotAndCross) {
    Vec2 x = vec2::unit_x();
    Vec2 y = vec2::unit_y();

    EXPECT_DOUBLE_EQ(x.dot(y), 0.0);
    EXPECT_DOUBLE_EQ(x.cross(y), 1.0);
    EXPECT_DOUBLE_EQ(y.cross(x), -1.0);
    EXPECT_DOUBLE_EQ(Vec2(1.0, 2.0).dot(Vec2(3.0, 4.0)), 11.0);
}

TEST(Vec2Test, LengthAndDistance) {
    Vec2 v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.length_squared(), 25.0);
    EXPECT_DOUBLE_EQ(v.distance_to(vec2::zero()), 5.0);

    Vec2 n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, 1e-12);
    EXPECT_EQ(vec2::zero().normalized(), vec2::zero());
}

TEST(Vec2Test, RotatedCounterClockwise) {
    Vec2 r = vec2::unit_x().rotated(std::numbers::pi / 2.0);
    EXPECT_NEAR(r.x, 0.0, 1e-12);
    EXPECT_NEAR(r.y, 1.0, 1e-12);
}

TEST(Vec2Test, Lerp) {
    Vec2 m = lerp(Vec2(0.0, 0.0), Vec2(10.0, 20.0), 0.25);
    EXPECT_DOUBLE_EQ(m.x, 2.5);
    EXPECT_DOUBLE_EQ(m.y, 5.0);
}

TEST(Vec2Test, DistanceToSegment) {
    Vec2 a(0.0, 0.0);
    Vec2 b(10.0, 0.0);

    EXPECT_DOUBLE_EQ(distance_to_segment(Vec2(5.0, 3.0), a, b), 3.0);
    EXPECT_DOUBLE_EQ(distance_to_segment(Vec2(-3.0, 4.0), a, b), 5.0);
    EXPECT_DOUBLE_EQ(distance_to_segment(Vec2(13.0, 4.0), a, b), 5.0);
    // Degenerate segment
    EXPECT_DOUBLE_EQ(distance_to_segment(Vec2(3.0, 4.0), a, a), 5.0);
}
