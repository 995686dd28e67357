#include "cubic_bezier.hpp"

namespace trailsketch {

CubicBezier::CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3)
    : control_points{p0, p1, p2, p3} {}

CubicBezier CubicBezier::from_quadratic(const Vec2& p0, const Vec2& c, const Vec2& p1) {
    // C1 = P0 + 2/3 (Q - P0), C2 = P1 + 2/3 (Q - P1)
    return CubicBezier(p0,
                       p0 + (c - p0) * (2.0 / 3.0),
                       p1 + (c - p1) * (2.0 / 3.0),
                       p1);
}

Vec2 CubicBezier::evaluate(double t) const {
    double u = 1.0 - t;
    double tt = t * t;
    double uu = u * u;
    double ttt = tt * t;
    double uuu = uu * u;

    return control_points[0] * uuu +
           control_points[1] * (3.0 * uu * t) +
           control_points[2] * (3.0 * u * tt) +
           control_points[3] * ttt;
}

std::pair<CubicBezier, CubicBezier> CubicBezier::split(double t) const {
    // De Casteljau subdivision
    Vec2 p01 = lerp(control_points[0], control_points[1], t);
    Vec2 p12 = lerp(control_points[1], control_points[2], t);
    Vec2 p23 = lerp(control_points[2], control_points[3], t);

    Vec2 p012 = lerp(p01, p12, t);
    Vec2 p123 = lerp(p12, p23, t);

    Vec2 p0123 = lerp(p012, p123, t);

    CubicBezier left(control_points[0], p01, p012, p0123);
    CubicBezier right(p0123, p123, p23, control_points[3]);

    return {left, right};
}

bool CubicBezier::is_flat(double tolerance) const {
    return distance_to_segment(control_points[1], control_points[0], control_points[3]) <= tolerance &&
           distance_to_segment(control_points[2], control_points[0], control_points[3]) <= tolerance;
}

void CubicBezier::flatten_into(Polyline& polyline, double tolerance, int max_depth) const {
    if (max_depth <= 0 || is_flat(tolerance)) {
        polyline.append(end());
        return;
    }

    auto [left, right] = split(0.5);
    left.flatten_into(polyline, tolerance, max_depth - 1);
    right.flatten_into(polyline, tolerance, max_depth - 1);
}

}  // namespace trailsketch
