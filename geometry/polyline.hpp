#ifndef TRAILSKETCH_GEOMETRY_POLYLINE_HPP
#define TRAILSKETCH_GEOMETRY_POLYLINE_HPP

#include <math/vec2.hpp>
#include <vector>

namespace trailsketch {

// Axis-aligned bounding box
struct Bounds {
    Vec2 min;
    Vec2 max;

    double width() const { return max.x - min.x; }
    double height() const { return max.y - min.y; }
    double diagonal() const { return (max - min).length(); }
    Vec2 center() const { return (min + max) * 0.5; }
};

// Ordered sequence of 2D points joined by straight segments.
// Consecutive points are always distinct: append() drops a point equal
// to the current last point.
class Polyline {
public:
    Polyline() = default;
    explicit Polyline(const std::vector<Vec2>& points);

    // Append a point unless it coincides with the last one.
    // Returns true if the point was added.
    bool append(const Vec2& point);

    const std::vector<Vec2>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const Vec2& front() const { return points_.front(); }
    const Vec2& back() const { return points_.back(); }
    const Vec2& operator[](size_t i) const { return points_[i]; }

    // Sum of consecutive segment lengths
    double arc_length() const;

    // Vertex mean; zero for an empty polyline
    Vec2 centroid() const;

    // Requires a non-empty polyline
    Bounds bounds() const;

    // Same points in opposite order
    Polyline reversed() const;

    bool operator==(const Polyline& other) const { return points_ == other.points_; }
    bool operator!=(const Polyline& other) const { return !(*this == other); }

private:
    std::vector<Vec2> points_;
};

}  // namespace trailsketch

#endif // TRAILSKETCH_GEOMETRY_POLYLINE_HPP
