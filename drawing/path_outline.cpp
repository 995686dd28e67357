#include "path_outline.hpp"
#include <algorithm>
#include <cmath>

namespace trailsketch {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

PathOutline::PathOutline(std::vector<PathCommand> commands)
    : commands_(std::move(commands)) {}

std::vector<Vec2> PathOutline::control_points() const {
    std::vector<Vec2> points;
    Vec2 current;
    for (const auto& cmd : commands_) {
        std::visit(overloaded{
            [&](const command::MoveTo& c) { points.push_back(c.to); current = c.to; },
            [&](const command::LineTo& c) { points.push_back(c.to); current = c.to; },
            [&](const command::QuadTo& c) {
                points.push_back(c.control);
                points.push_back(c.to);
                current = c.to;
            },
            [&](const command::CubicTo& c) {
                points.push_back(c.control1);
                points.push_back(c.control2);
                points.push_back(c.to);
                current = c.to;
            },
            [&](const command::ArcTo& c) {
                // Approximate extent: larger radius around the chord midpoint
                double r = std::max(std::abs(c.radii.x), std::abs(c.radii.y));
                r = std::max(r, current.distance_to(c.to) * 0.5);
                Vec2 mid = (current + c.to) * 0.5;
                points.push_back(c.to);
                points.push_back(mid + Vec2(r, r));
                points.push_back(mid - Vec2(r, r));
                current = c.to;
            },
            [&](const command::ClosePath&) {}
        }, cmd);
    }
    return points;
}

std::optional<Bounds> control_bounds(const std::vector<PathOutline>& outlines) {
    std::optional<Bounds> result;
    for (const auto& outline : outlines) {
        for (const auto& p : outline.control_points()) {
            if (!result) {
                result = Bounds{p, p};
                continue;
            }
            result->min.x = std::min(result->min.x, p.x);
            result->min.y = std::min(result->min.y, p.y);
            result->max.x = std::max(result->max.x, p.x);
            result->max.y = std::max(result->max.y, p.y);
        }
    }
    return result;
}

}  // namespace trailsketch
