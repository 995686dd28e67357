#include "polyline.hpp"
#include <algorithm>
#include <stdexcept>

namespace trailsketch {

Polyline::Polyline(const std::vector<Vec2>& points) {
    points_.reserve(points.size());
    for (const auto& p : points) {
        append(p);
    }
}

bool Polyline::append(const Vec2& point) {
    if (!points_.empty() && points_.back() == point) {
        return false;
    }
    points_.push_back(point);
    return true;
}

double Polyline::arc_length() const {
    double length = 0.0;
    for (size_t i = 1; i < points_.size(); ++i) {
        length += points_[i - 1].distance_to(points_[i]);
    }
    return length;
}

Vec2 Polyline::centroid() const {
    if (points_.empty()) {
        return vec2::zero();
    }
    Vec2 sum;
    for (const auto& p : points_) {
        sum += p;
    }
    return sum / static_cast<double>(points_.size());
}

Bounds Polyline::bounds() const {
    if (points_.empty()) {
        throw std::logic_error("Polyline::bounds: empty polyline");
    }
    Bounds b{points_.front(), points_.front()};
    for (const auto& p : points_) {
        b.min.x = std::min(b.min.x, p.x);
        b.min.y = std::min(b.min.y, p.y);
        b.max.x = std::max(b.max.x, p.x);
        b.max.y = std::max(b.max.y, p.y);
    }
    return b;
}

Polyline Polyline::reversed() const {
    Polyline result;
    result.points_.assign(points_.rbegin(), points_.rend());
    return result;
}

}  // namespace trailsketch
