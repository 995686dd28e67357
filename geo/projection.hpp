#ifndef TRAILSKETCH_GEO_PROJECTION_HPP
#define TRAILSKETCH_GEO_PROJECTION_HPP

#include "geo_point.hpp"
#include <math/vec2.hpp>

namespace trailsketch {

// Maps planar meters around an anchor to geographic coordinates and back.
// Implementations throw InvalidAnchor when the anchor cannot be used.
class Projection {
public:
    virtual ~Projection() = default;

    virtual GeoPoint project(const Vec2& planar, const GeoAnchor& anchor) const = 0;
    virtual Vec2 unproject(const GeoPoint& geo, const GeoAnchor& anchor) const = 0;
};

}  // namespace trailsketch

#endif // TRAILSKETCH_GEO_PROJECTION_HPP
