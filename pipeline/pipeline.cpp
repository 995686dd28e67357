#include "pipeline.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <drawing/svg_reader.hpp>
#include <geo/equirectangular_projection.hpp>
#include <geo/geo_projector.hpp>
#include <merge/path_merger.hpp>
#include <route/gpx_codec.hpp>
#include <cmath>
#include <stdexcept>

namespace trailsketch {

Polyline load_drawing(std::string_view svg, const FlattenConfig& config) {
    auto log = logging::get_logger();

    std::vector<PathOutline> outlines = read_svg(svg);
    if (outlines.empty()) {
        throw EmptyDrawing();
    }
    double tolerance = effective_tolerance(config, outlines);
    log->debug("load_drawing: {} outlines, tolerance {}", outlines.size(), tolerance);

    std::vector<Polyline> polylines;
    polylines.reserve(outlines.size());
    for (const auto& outline : outlines) {
        polylines.push_back(flatten(outline, tolerance));
    }

    Polyline merged = merge(polylines);

    // SVG y grows downward; planar y grows northward
    Polyline flipped;
    for (const auto& p : merged.points()) {
        flipped.append(Vec2(p.x, -p.y));
    }
    log->debug("load_drawing: {} points, arc length {}", flipped.size(), flipped.arc_length());
    return flipped;
}

LoadedRoute load_route(std::string_view gpx) {
    auto log = logging::get_logger();

    std::vector<GeoPoint> points = gpx::decode(gpx);

    // Average longitude offsets from the first point so routes across the
    // antimeridian get a sensible center
    double lat_sum = 0.0;
    double dlon_sum = 0.0;
    const double lon0 = points.front().longitude;
    for (const auto& p : points) {
        lat_sum += p.latitude;
        dlon_sum += wrap_longitude(p.longitude - lon0);
    }
    double n = static_cast<double>(points.size());
    GeoPoint center(lat_sum / n, wrap_longitude(lon0 + dlon_sum / n));

    LoadedRoute route;
    route.anchor = GeoAnchor(center, vec2::zero());
    route.polyline = to_planar(points, route.anchor);
    log->debug("load_route: {} points around {}, {}", points.size(),
               center.latitude, center.longitude);
    return route;
}

std::vector<GeoPoint> render(const Polyline& polyline, const TransformParameters& params,
                             const GeoAnchor& anchor) {
    auto log = logging::get_logger();
    Polyline shaped = transform(polyline, params, anchor.planar);
    std::vector<GeoPoint> points = to_geo(shaped, anchor);
    log->debug("render: rotation {} stretch {} length {} m -> {} points",
               params.rotation, params.stretch, params.target_length, points.size());
    return points;
}

std::string save_route(const std::vector<GeoPoint>& points, const std::string& name) {
    return gpx::encode(points, name);
}

GeoAnchor anchor_at_centroid(const Polyline& polyline, const GeoPoint& center) {
    return GeoAnchor(center, polyline.centroid());
}

GeoAnchor move_anchor(const GeoAnchor& anchor, const GeoPoint& center) {
    return GeoAnchor(center, anchor.planar);
}

GeoAnchor translate_anchor(const GeoAnchor& anchor, double delta_lat, double delta_lon) {
    GeoAnchor moved(GeoPoint(anchor.geo.latitude + delta_lat,
                             wrap_longitude(anchor.geo.longitude + delta_lon)),
                    anchor.planar);
    check_anchor(moved);
    return moved;
}

double length_to_slider(double km) {
    if (!std::isfinite(km) || km <= 0.0) {
        throw std::invalid_argument("path length must be finite and positive");
    }
    return (std::log10(km) + 1.0) * 1000.0;
}

double slider_to_length(double value) {
    return std::pow(10.0, value / 1000.0 - 1.0);
}

}  // namespace trailsketch
