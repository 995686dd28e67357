#ifndef TRAILSKETCH_GEO_GEO_PROJECTOR_HPP
#define TRAILSKETCH_GEO_GEO_PROJECTOR_HPP

#include "geo_point.hpp"
#include "projection.hpp"
#include <geometry/polyline.hpp>
#include <vector>

namespace trailsketch {

// Process-wide equirectangular projection
const Projection& default_projection();

// Place a planar polyline (meters) on the map.
// Throws InvalidAnchor for an unusable anchor or a point past a pole.
std::vector<GeoPoint> to_geo(const Polyline& polyline, const GeoAnchor& anchor,
                             const Projection& projection = default_projection());

// Inverse of to_geo
Polyline to_planar(const std::vector<GeoPoint>& points, const GeoAnchor& anchor,
                   const Projection& projection = default_projection());

// Great-circle distance in meters
double haversine_distance(const GeoPoint& a, const GeoPoint& b);

// Sum of great-circle distances between consecutive points
double route_length_m(const std::vector<GeoPoint>& points);

}  // namespace trailsketch

#endif // TRAILSKETCH_GEO_GEO_PROJECTOR_HPP
