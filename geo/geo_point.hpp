#ifndef TRAILSKETCH_GEO_GEO_POINT_HPP
#define TRAILSKETCH_GEO_GEO_POINT_HPP

#include <math/vec2.hpp>
#include <cmath>

namespace trailsketch {

// WGS84 position in degrees, no altitude
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;

    GeoPoint() = default;
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    // Finite, latitude in [-90, 90], longitude in [-180, 180]
    bool is_valid() const {
        return std::isfinite(latitude) && std::isfinite(longitude) &&
               latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    bool operator==(const GeoPoint& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

// Ties a planar point to the geographic position it is drawn at
struct GeoAnchor {
    GeoPoint geo;
    Vec2 planar;

    GeoAnchor() = default;
    GeoAnchor(const GeoPoint& g, const Vec2& p) : geo(g), planar(p) {}
};

}  // namespace trailsketch

#endif // TRAILSKETCH_GEO_GEO_POINT_HPP
