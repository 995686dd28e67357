#ifndef TRAILSKETCH_GEOMETRY_CUBIC_BEZIER_HPP
#define TRAILSKETCH_GEOMETRY_CUBIC_BEZIER_HPP

#include <math/vec2.hpp>
#include <geometry/polyline.hpp>
#include <array>
#include <utility>

namespace trailsketch {

// A single cubic Bezier curve segment
struct CubicBezier {
    std::array<Vec2, 4> control_points;

    // Constructors
    CubicBezier() = default;
    CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3);

    // Exact degree elevation of the quadratic (p0, c, p1)
    static CubicBezier from_quadratic(const Vec2& p0, const Vec2& c, const Vec2& p1);

    // Evaluate position at parameter t in [0, 1]
    Vec2 evaluate(double t) const;

    // Split curve at parameter t into two curves
    std::pair<CubicBezier, CubicBezier> split(double t) const;

    // True when both inner control points are within tolerance of the
    // chord segment. The curve lies in the convex hull of its control
    // points, so every curve point is then within tolerance of the chord.
    bool is_flat(double tolerance) const;

    // Append the flattened curve to polyline, excluding the start point
    // (assumed already present). Recursive midpoint subdivision until
    // is_flat(tolerance) or max_depth.
    void flatten_into(Polyline& polyline, double tolerance, int max_depth = 24) const;

    // Access control points by name
    const Vec2& start() const { return control_points[0]; }
    const Vec2& control1() const { return control_points[1]; }
    const Vec2& control2() const { return control_points[2]; }
    const Vec2& end() const { return control_points[3]; }
};

}  // namespace trailsketch

#endif // TRAILSKETCH_GEOMETRY_CUBIC_BEZIER_HPP
