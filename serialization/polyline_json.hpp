#ifndef TRAILSKETCH_SERIALIZATION_POLYLINE_JSON_HPP
#define TRAILSKETCH_SERIALIZATION_POLYLINE_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/polyline.hpp>
#include <geo/geo_point.hpp>
#include "config_json.hpp"
#include <optional>

namespace trailsketch {

// Polyline serialization: array of [x, y]
inline void to_json(nlohmann::json& j, const Polyline& polyline) {
    j = nlohmann::json::array();
    for (const auto& p : polyline.points()) {
        j.push_back(p);
    }
}

inline void from_json(const nlohmann::json& j, Polyline& polyline) {
    polyline = Polyline(j.get<std::vector<Vec2>>());
}

// Planar outline artifact: the polyline plus, for routes read back from
// GPX, the anchor that places it on the map
struct OutlineArtifact {
    Polyline polyline;
    std::optional<GeoAnchor> anchor;
};

inline nlohmann::json outline_to_json(const OutlineArtifact& artifact) {
    nlohmann::json j;
    j["points"] = artifact.polyline;
    if (artifact.anchor) {
        j["anchor"] = *artifact.anchor;
    }
    return j;
}

inline OutlineArtifact outline_from_json(const nlohmann::json& j) {
    OutlineArtifact artifact;
    artifact.polyline = j.at("points").get<Polyline>();
    if (j.contains("anchor")) {
        artifact.anchor = j["anchor"].get<GeoAnchor>();
    }
    return artifact;
}

}  // namespace trailsketch

#endif // TRAILSKETCH_SERIALIZATION_POLYLINE_JSON_HPP
