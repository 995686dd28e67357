#ifndef TRAILSKETCH_GEO_EQUIRECTANGULAR_PROJECTION_HPP
#define TRAILSKETCH_GEO_EQUIRECTANGULAR_PROJECTION_HPP

#include "projection.hpp"

namespace trailsketch {

// Mean Earth radius (IUGG), meters
constexpr double kEarthRadius = 6371008.8;

// Local flat-Earth approximation around the anchor:
//   dlat = dy / R,  dlon = dx / (R cos(lat0))
// Distances are accurate to well under 1% for extents of a few tens of
// kilometers away from the poles.
class EquirectangularProjection : public Projection {
public:
    GeoPoint project(const Vec2& planar, const GeoAnchor& anchor) const override;
    Vec2 unproject(const GeoPoint& geo, const GeoAnchor& anchor) const override;
};

// Throws InvalidAnchor for a pole, non-finite values or an out-of-range
// geographic position
void check_anchor(const GeoAnchor& anchor);

// Map any finite longitude into [-180, 180]
double wrap_longitude(double longitude);

}  // namespace trailsketch

#endif // TRAILSKETCH_GEO_EQUIRECTANGULAR_PROJECTION_HPP
