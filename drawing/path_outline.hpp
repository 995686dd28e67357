#ifndef TRAILSKETCH_DRAWING_PATH_OUTLINE_HPP
#define TRAILSKETCH_DRAWING_PATH_OUTLINE_HPP

#include <math/vec2.hpp>
#include <geometry/polyline.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace trailsketch {
namespace command {

// All coordinates are absolute, in drawing units
struct MoveTo { Vec2 to; };
struct LineTo { Vec2 to; };
struct QuadTo { Vec2 control; Vec2 to; };
struct CubicTo { Vec2 control1; Vec2 control2; Vec2 to; };
struct ArcTo {
    Vec2 radii;
    double x_axis_rotation = 0.0;  // degrees
    bool large_arc = false;
    bool sweep = false;
    Vec2 to;
};
struct ClosePath {};

}  // namespace command

using PathCommand = std::variant<
    command::MoveTo, command::LineTo,
    command::QuadTo, command::CubicTo,
    command::ArcTo, command::ClosePath
>;

// One continuous (or closed) drawing primitive. Immutable once built.
class PathOutline {
public:
    PathOutline() = default;
    explicit PathOutline(std::vector<PathCommand> commands);

    const std::vector<PathCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

    // Every coordinate appearing in the commands, control points included.
    // Arcs contribute their endpoint and an approximate radius box.
    std::vector<Vec2> control_points() const;

private:
    std::vector<PathCommand> commands_;
};

// Bounding box of every outline's control points, or nullopt when the
// outlines carry no coordinates at all
std::optional<Bounds> control_bounds(const std::vector<PathOutline>& outlines);

}  // namespace trailsketch

#endif // TRAILSKETCH_DRAWING_PATH_OUTLINE_HPP
