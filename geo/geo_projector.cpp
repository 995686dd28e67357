#include "geo_projector.hpp"
#include "equirectangular_projection.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace trailsketch {

const Projection& default_projection() {
    static const EquirectangularProjection projection;
    return projection;
}

std::vector<GeoPoint> to_geo(const Polyline& polyline, const GeoAnchor& anchor,
                             const Projection& projection) {
    std::vector<GeoPoint> points;
    points.reserve(polyline.size());
    for (const auto& p : polyline.points()) {
        points.push_back(projection.project(p, anchor));
    }
    return points;
}

Polyline to_planar(const std::vector<GeoPoint>& points, const GeoAnchor& anchor,
                   const Projection& projection) {
    Polyline polyline;
    for (const auto& g : points) {
        polyline.append(projection.unproject(g, anchor));
    }
    return polyline;
}

double haversine_distance(const GeoPoint& a, const GeoPoint& b) {
    constexpr double kDegToRad = std::numbers::pi / 180.0;
    double lat1 = a.latitude * kDegToRad;
    double lat2 = b.latitude * kDegToRad;
    double dlat = lat2 - lat1;
    double dlon = (b.longitude - a.longitude) * kDegToRad;

    double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    return 2.0 * kEarthRadius * std::asin(std::sqrt(std::min(1.0, h)));
}

double route_length_m(const std::vector<GeoPoint>& points) {
    double total = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        total += haversine_distance(points[i - 1], points[i]);
    }
    return total;
}

}  // namespace trailsketch
