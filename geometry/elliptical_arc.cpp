#include "elliptical_arc.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace trailsketch {

namespace {

// Signed angle from u to v
double angle_between(const Vec2& u, const Vec2& v) {
    return std::atan2(u.cross(v), u.dot(v));
}

Vec2 point_on_ellipse(const EllipticalArc::CenterForm& c, double theta) {
    double cos_phi = std::cos(c.phi);
    double sin_phi = std::sin(c.phi);
    double ct = std::cos(theta);
    double st = std::sin(theta);
    return {c.center.x + c.rx * cos_phi * ct - c.ry * sin_phi * st,
            c.center.y + c.rx * sin_phi * ct + c.ry * cos_phi * st};
}

}  // namespace

bool EllipticalArc::is_line() const {
    return radii.x == 0.0 || radii.y == 0.0;
}

EllipticalArc::CenterForm EllipticalArc::to_center() const {
    // Endpoint to center conversion, SVG implementation notes F.6.5
    CenterForm c;
    c.phi = x_axis_rotation * std::numbers::pi / 180.0;
    double cos_phi = std::cos(c.phi);
    double sin_phi = std::sin(c.phi);

    Vec2 half = (start - end) * 0.5;
    double x1 = cos_phi * half.x + sin_phi * half.y;
    double y1 = -sin_phi * half.x + cos_phi * half.y;

    double rx = std::abs(radii.x);
    double ry = std::abs(radii.y);

    // Scale radii up when no ellipse through both endpoints exists
    double lambda = (x1 * x1) / (rx * rx) + (y1 * y1) / (ry * ry);
    if (lambda > 1.0) {
        double s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }

    double rxsq = rx * rx;
    double rysq = ry * ry;
    double num = rxsq * rysq - rxsq * y1 * y1 - rysq * x1 * x1;
    double den = rxsq * y1 * y1 + rysq * x1 * x1;
    double coef = (den > 0.0) ? std::sqrt(std::max(0.0, num / den)) : 0.0;
    if (large_arc == sweep) {
        coef = -coef;
    }

    double cx1 = coef * rx * y1 / ry;
    double cy1 = -coef * ry * x1 / rx;

    Vec2 mid = (start + end) * 0.5;
    c.center = {cos_phi * cx1 - sin_phi * cy1 + mid.x,
                sin_phi * cx1 + cos_phi * cy1 + mid.y};
    c.rx = rx;
    c.ry = ry;

    Vec2 u{(x1 - cx1) / rx, (y1 - cy1) / ry};
    Vec2 v{(-x1 - cx1) / rx, (-y1 - cy1) / ry};
    c.theta_start = angle_between(vec2::unit_x(), u);
    double delta = angle_between(u, v);

    // Sweep: angles increase. No sweep: angles decrease.
    if (!sweep && delta > 0.0) {
        delta -= 2.0 * std::numbers::pi;
    } else if (sweep && delta < 0.0) {
        delta += 2.0 * std::numbers::pi;
    }
    c.theta_delta = delta;
    return c;
}

Vec2 EllipticalArc::evaluate(double t) const {
    if (is_empty()) {
        return start;
    }
    if (is_line()) {
        return lerp(start, end, t);
    }
    if (t <= 0.0) return start;
    if (t >= 1.0) return end;
    CenterForm c = to_center();
    return point_on_ellipse(c, c.theta_start + c.theta_delta * t);
}

void EllipticalArc::flatten_into(Polyline& polyline, double tolerance) const {
    if (is_empty()) {
        return;
    }
    if (is_line()) {
        polyline.append(end);
        return;
    }

    CenterForm c = to_center();

    // The ellipse is an affine image of the unit circle stretched by at
    // most r_max, so a circle sagitta of tolerance / r_max bounds the
    // chord deviation by tolerance.
    double r_max = std::max(c.rx, c.ry);
    double cos_half = std::clamp(1.0 - tolerance / r_max, -1.0, 1.0);
    double step = std::min(2.0 * std::acos(cos_half), std::numbers::pi);

    constexpr double kMaxSegments = 65536.0;
    double segments = kMaxSegments;
    if (step > 0.0) {
        segments = std::min(kMaxSegments, std::ceil(std::abs(c.theta_delta) / step));
    }
    int count = std::max(1, static_cast<int>(segments));

    for (int i = 1; i < count; ++i) {
        double theta = c.theta_start + c.theta_delta * static_cast<double>(i) / static_cast<double>(count);
        polyline.append(point_on_ellipse(c, theta));
    }
    polyline.append(end);
}

}  // namespace trailsketch
