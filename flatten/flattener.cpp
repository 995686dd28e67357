#include "flattener.hpp"
#include <common/errors.hpp>
#include <geometry/cubic_bezier.hpp>
#include <geometry/elliptical_arc.hpp>
#include <cmath>
#include <stdexcept>
#include <variant>

namespace trailsketch {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void check_tolerance(double tolerance) {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        throw std::invalid_argument("flattening tolerance must be finite and positive");
    }
}

}  // namespace

double effective_tolerance(const FlattenConfig& config,
                           const std::vector<PathOutline>& outlines) {
    check_tolerance(config.tolerance);
    if (!config.relative) {
        return config.tolerance;
    }

    auto bounds = control_bounds(outlines);
    double diagonal = bounds ? bounds->diagonal() : 0.0;
    double tolerance = config.tolerance * diagonal;
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        return config.tolerance;
    }
    return tolerance;
}

Polyline flatten(const PathOutline& outline, double tolerance) {
    check_tolerance(tolerance);

    const auto& commands = outline.commands();
    if (commands.empty() || !std::holds_alternative<command::MoveTo>(commands.front())) {
        throw ParseError("outline must begin with a move command");
    }

    Polyline polyline;
    Vec2 current;
    Vec2 subpath_start;

    for (const auto& cmd : commands) {
        std::visit(overloaded{
            [&](const command::MoveTo& c) {
                polyline.append(c.to);
                current = c.to;
                subpath_start = c.to;
            },
            [&](const command::LineTo& c) {
                polyline.append(c.to);
                current = c.to;
            },
            [&](const command::QuadTo& c) {
                CubicBezier::from_quadratic(current, c.control, c.to)
                    .flatten_into(polyline, tolerance);
                current = c.to;
            },
            [&](const command::CubicTo& c) {
                CubicBezier(current, c.control1, c.control2, c.to)
                    .flatten_into(polyline, tolerance);
                current = c.to;
            },
            [&](const command::ArcTo& c) {
                EllipticalArc arc{current, c.radii, c.x_axis_rotation,
                                  c.large_arc, c.sweep, c.to};
                arc.flatten_into(polyline, tolerance);
                current = c.to;
            },
            [&](const command::ClosePath&) {
                if (polyline.back().distance_to(subpath_start) > tolerance) {
                    polyline.append(subpath_start);
                }
                current = subpath_start;
            },
        }, cmd);
    }

    return polyline;
}

std::vector<Polyline> flatten_all(const std::vector<PathOutline>& outlines,
                                  const FlattenConfig& config) {
    double tolerance = effective_tolerance(config, outlines);
    std::vector<Polyline> polylines;
    polylines.reserve(outlines.size());
    for (const auto& outline : outlines) {
        polylines.push_back(flatten(outline, tolerance));
    }
    return polylines;
}

}  // namespace trailsketch
