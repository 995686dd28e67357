#include <gtest/gtest.h>
#include <geometry/cubic_bezier.hpp>
#include "test_helpers.hpp"

using namespace trailsketch;

// ============================================
// CubicBezier Tests
// ============================================

TEST(CubicBezierTest, Evaluate) {
    CubicBezier curve(
        Vec2(0.0, 0.0),
        Vec2(0.0, 1.0),
        Vec2(1.0, 1.0),
        Vec2(1.0, 0.0)
    );

    Vec2 start = curve.evaluate(0.0);
    EXPECT_DOUBLE_EQ(start.x, 0.0);
    EXPECT_DOUBLE_EQ(start.y, 0.0);

    Vec2 mid = curve.evaluate(0.5);
    EXPECT_DOUBLE_EQ(mid.x, 0.5);
    EXPECT_DOUBLE_EQ(mid.y, 0.75);

    Vec2 end = curve.evaluate(1.0);
    EXPECT_DOUBLE_EQ(end.x, 1.0);
    EXPECT_DOUBLE_EQ(end.y, 0.0);
}

TEST(CubicBezierTest, FromQuadratic) {
    Vec2 p0(0.0, 0.0);
    Vec2 c(5.0, 10.0);
    Vec2 p1(10.0, 0.0);

    CubicBezier curve = CubicBezier::from_quadratic(p0, c, p1);

    for (int i = 0; i <= 10; ++i) {
        double t = i / 10.0;
        double u = 1.0 - t;
        Vec2 expected = p0 * (u * u) + c * (2.0 * u * t) + p1 * (t * t);
        Vec2 actual = curve.evaluate(t);
        EXPECT_NEAR(actual.x, expected.x, 1e-12);
        EXPECT_NEAR(actual.y, expected.y, 1e-12);
    }
}

TEST(CubicBezierTest, Split) {
    CubicBezier curve(
        Vec2(0.0, 0.0),
        Vec2(0.0, 1.0),
        Vec2(1.0, 1.0),
        Vec2(1.0, 0.0)
    );

    auto [left, right] = curve.split(0.5);

    Vec2 mid_original = curve.evaluate(0.5);
    EXPECT_NEAR(left.end().x, mid_original.x, 1e-12);
    EXPECT_NEAR(left.end().y, mid_original.y, 1e-12);
    EXPECT_NEAR(right.start().x, mid_original.x, 1e-12);
    EXPECT_NEAR(right.start().y, mid_original.y, 1e-12);

    // Halves trace the original curve
    Vec2 quarter = curve.evaluate(0.25);
    EXPECT_NEAR(left.evaluate(0.5).x, quarter.x, 1e-12);
    EXPECT_NEAR(left.evaluate(0.5).y, quarter.y, 1e-12);
}

TEST(CubicBezierTest, IsFlat) {
    CubicBezier straight(Vec2(0.0, 0.0), Vec2(1.0, 0.0), Vec2(2.0, 0.0), Vec2(3.0, 0.0));
    EXPECT_TRUE(straight.is_flat(1e-9));

    CubicBezier bump(Vec2(0.0, 0.0), Vec2(1.0, 0.5), Vec2(2.0, 0.5), Vec2(3.0, 0.0));
    EXPECT_TRUE(bump.is_flat(0.5));
    EXPECT_FALSE(bump.is_flat(0.4));
}

TEST(CubicBezierTest, FlattenIntoExcludesStart) {
    CubicBezier straight(Vec2(0.0, 0.0), Vec2(1.0, 0.0), Vec2(2.0, 0.0), Vec2(3.0, 0.0));

    Polyline polyline;
    straight.flatten_into(polyline, 0.01);

    ASSERT_EQ(polyline.size(), 1u);
    EXPECT_EQ(polyline.front(), Vec2(3.0, 0.0));
}

TEST(CubicBezierTest, FlattenIntoWithinTolerance) {
    CubicBezier curve(Vec2(0.0, 0.0), Vec2(0.0, 100.0), Vec2(100.0, 100.0), Vec2(100.0, 0.0));
    const double tolerance = 0.05;

    Polyline polyline;
    polyline.append(curve.start());
    curve.flatten_into(polyline, tolerance);

    EXPECT_GT(polyline.size(), 10u);
    EXPECT_EQ(polyline.back(), curve.end());
    double deviation = test::max_deviation(
        [&](double t) { return curve.evaluate(t); }, polyline);
    EXPECT_LE(deviation, tolerance + 1e-9);
}

TEST(CubicBezierTest, FlattenDepthIsCapped) {
    CubicBezier curve(Vec2(0.0, 0.0), Vec2(0.0, 100.0), Vec2(100.0, 100.0), Vec2(100.0, 0.0));

    Polyline polyline;
    curve.flatten_into(polyline, 1e-300, 4);

    // 2^4 leaves
    EXPECT_EQ(polyline.size(), 16u);
}
