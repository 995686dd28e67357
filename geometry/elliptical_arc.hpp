#ifndef TRAILSKETCH_GEOMETRY_ELLIPTICAL_ARC_HPP
#define TRAILSKETCH_GEOMETRY_ELLIPTICAL_ARC_HPP

#include <math/vec2.hpp>
#include <geometry/polyline.hpp>

namespace trailsketch {

// Elliptical arc in SVG endpoint parameterization.
//
// The arc runs from `start` to `end` on an ellipse with radii `radii`
// whose x axis is rotated by `x_axis_rotation` degrees. `large_arc` and
// `sweep` select one of the four candidate arcs exactly as in SVG path
// data. Out-of-range radii are corrected on conversion to center form.
struct EllipticalArc {
    Vec2 start;
    Vec2 radii;
    double x_axis_rotation = 0.0;  // degrees
    bool large_arc = false;
    bool sweep = false;
    Vec2 end;

    // Center parameterization derived from the endpoint form
    struct CenterForm {
        Vec2 center;
        double rx = 0.0;
        double ry = 0.0;
        double phi = 0.0;          // radians
        double theta_start = 0.0;  // radians
        double theta_delta = 0.0;  // radians, signed by sweep direction
    };

    // Zero radius on either axis: the arc is a straight line
    bool is_line() const;

    // Coincident endpoints: the arc is omitted entirely
    bool is_empty() const { return start == end; }

    // Requires !is_line() && !is_empty()
    CenterForm to_center() const;

    // Position at normalized parameter t in [0, 1] along the arc
    Vec2 evaluate(double t) const;

    // Append the flattened arc to polyline, excluding the start point.
    // Samples uniformly in the ellipse parameter so that no chord deviates
    // from the arc by more than tolerance.
    void flatten_into(Polyline& polyline, double tolerance) const;
};

}  // namespace trailsketch

#endif // TRAILSKETCH_GEOMETRY_ELLIPTICAL_ARC_HPP
