#ifndef TRAILSKETCH_SERIALIZATION_CONFIG_JSON_HPP
#define TRAILSKETCH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <flatten/flattener.hpp>
#include <transform/transform_engine.hpp>
#include <geo/geo_point.hpp>
#include <pipeline/pipeline.hpp>

namespace trailsketch {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Vec2 must be an array of two numbers");
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

// FlattenConfig serialization
inline void to_json(nlohmann::json& j, const FlattenConfig& config) {
    j = {
        {"tolerance", config.tolerance},
        {"relative", config.relative}
    };
}

inline void from_json(const nlohmann::json& j, FlattenConfig& config) {
    config.tolerance = j.value("tolerance", 0.001);
    config.relative = j.value("relative", true);
}

// TransformParameters serialization
inline void to_json(nlohmann::json& j, const TransformParameters& params) {
    j = {
        {"rotation", params.rotation},
        {"target_length", params.target_length},
        {"stretch", params.stretch}
    };
}

inline void from_json(const nlohmann::json& j, TransformParameters& params) {
    params.rotation = j.value("rotation", 0.0);
    params.target_length = j.value("target_length", 1000.0);
    params.stretch = j.value("stretch", 1.0);
}

// GeoPoint serialization
inline void to_json(nlohmann::json& j, const GeoPoint& point) {
    j = {
        {"latitude", point.latitude},
        {"longitude", point.longitude}
    };
}

inline void from_json(const nlohmann::json& j, GeoPoint& point) {
    point.latitude = j.value("latitude", kDefaultCenterLatitude);
    point.longitude = j.value("longitude", kDefaultCenterLongitude);
}

// GeoAnchor serialization
inline void to_json(nlohmann::json& j, const GeoAnchor& anchor) {
    j = {
        {"geo", anchor.geo},
        {"planar", anchor.planar}
    };
}

inline void from_json(const nlohmann::json& j, GeoAnchor& anchor) {
    anchor.geo = j.at("geo").get<GeoPoint>();
    anchor.planar = j.at("planar").get<Vec2>();
}

// PipelineConfig serialization
inline void to_json(nlohmann::json& j, const PipelineConfig& config) {
    j = {
        {"flatten", config.flatten},
        {"transform", config.transform},
        {"center", config.center},
        {"route_name", config.route_name}
    };
}

inline void from_json(const nlohmann::json& j, PipelineConfig& config) {
    config.flatten = j.value("flatten", FlattenConfig{});
    config.transform = j.value("transform", TransformParameters{});
    config.center = j.value("center", GeoPoint(kDefaultCenterLatitude, kDefaultCenterLongitude));
    config.route_name = j.value("route_name", "");
}

}  // namespace trailsketch

#endif // TRAILSKETCH_SERIALIZATION_CONFIG_JSON_HPP
