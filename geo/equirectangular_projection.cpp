#include "equirectangular_projection.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <numbers>
#include <string>

namespace trailsketch {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

}  // namespace

void check_anchor(const GeoAnchor& anchor) {
    if (!anchor.geo.is_valid()) {
        throw InvalidAnchor("anchor position out of range: " +
                            std::to_string(anchor.geo.latitude) + ", " +
                            std::to_string(anchor.geo.longitude));
    }
    if (std::abs(anchor.geo.latitude) >= 90.0) {
        throw InvalidAnchor("anchor latitude at a pole");
    }
    if (!std::isfinite(anchor.planar.x) || !std::isfinite(anchor.planar.y)) {
        throw InvalidAnchor("anchor planar point is not finite");
    }
}

double wrap_longitude(double longitude) {
    if (longitude >= -180.0 && longitude <= 180.0) {
        return longitude;
    }
    double wrapped = std::fmod(longitude + 180.0, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    return wrapped - 180.0;
}

GeoPoint EquirectangularProjection::project(const Vec2& planar,
                                            const GeoAnchor& anchor) const {
    check_anchor(anchor);

    Vec2 d = planar - anchor.planar;
    double lat0 = anchor.geo.latitude * kDegToRad;
    double latitude = anchor.geo.latitude + (d.y / kEarthRadius) * kRadToDeg;
    double longitude = anchor.geo.longitude +
                       (d.x / (kEarthRadius * std::cos(lat0))) * kRadToDeg;

    if (!(latitude >= -90.0 && latitude <= 90.0)) {
        throw InvalidAnchor("drawing extends past a pole from this anchor");
    }
    return GeoPoint(latitude, wrap_longitude(longitude));
}

Vec2 EquirectangularProjection::unproject(const GeoPoint& geo,
                                          const GeoAnchor& anchor) const {
    check_anchor(anchor);

    double lat0 = anchor.geo.latitude * kDegToRad;
    // Shortest way around, so routes crossing the antimeridian stay whole
    double dlon = wrap_longitude(geo.longitude - anchor.geo.longitude);
    double dlat = geo.latitude - anchor.geo.latitude;

    double x = dlon * kDegToRad * kEarthRadius * std::cos(lat0);
    double y = dlat * kDegToRad * kEarthRadius;
    return anchor.planar + Vec2(x, y);
}

}  // namespace trailsketch
