#ifndef TRAILSKETCH_PIPELINE_PIPELINE_HPP
#define TRAILSKETCH_PIPELINE_PIPELINE_HPP

#include <flatten/flattener.hpp>
#include <geo/geo_point.hpp>
#include <geometry/polyline.hpp>
#include <transform/transform_engine.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trailsketch {

// Default map position for a freshly loaded drawing
constexpr double kDefaultCenterLatitude = 54.904643;
constexpr double kDefaultCenterLongitude = 23.957831;

// Everything the user can adjust, re-threaded through the pipeline on
// every change
struct PipelineConfig {
    FlattenConfig flatten;
    TransformParameters transform;
    GeoPoint center{kDefaultCenterLatitude, kDefaultCenterLongitude};
    std::string route_name;
};

// A route read back into planar form
struct LoadedRoute {
    Polyline polyline;
    GeoAnchor anchor;
};

// SVG document -> single merged polyline with y pointing north
Polyline load_drawing(std::string_view svg, const FlattenConfig& config = {});

// GPX document -> planar polyline in meters. The anchor is the mean
// position of the route's points, mapped to planar (0, 0).
LoadedRoute load_route(std::string_view gpx);

// Transform about anchor.planar, then place on the map
std::vector<GeoPoint> render(const Polyline& polyline, const TransformParameters& params,
                             const GeoAnchor& anchor);

// GPX document for points
std::string save_route(const std::vector<GeoPoint>& points, const std::string& name = "");

// Anchor that puts the polyline's vertex centroid at center
GeoAnchor anchor_at_centroid(const Polyline& polyline, const GeoPoint& center);

// Same planar pivot, new map position
GeoAnchor move_anchor(const GeoAnchor& anchor, const GeoPoint& center);

// Shift the map position by a geographic offset in degrees.
// Throws InvalidAnchor when the result leaves the valid range.
GeoAnchor translate_anchor(const GeoAnchor& anchor, double delta_lat, double delta_lon);

// Logarithmic path-length control: 0..3000 covers 0.1 km..100 km.
// length_to_slider throws std::invalid_argument for km <= 0.
double length_to_slider(double km);
double slider_to_length(double value);

}  // namespace trailsketch

#endif // TRAILSKETCH_PIPELINE_PIPELINE_HPP
