#include "transform_engine.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <vector>

namespace trailsketch {

void validate(const TransformParameters& params) {
    if (!std::isfinite(params.rotation)) {
        throw std::invalid_argument("rotation must be finite");
    }
    if (!std::isfinite(params.target_length) || params.target_length <= 0.0) {
        throw std::invalid_argument("target length must be finite and positive");
    }
    if (!std::isfinite(params.stretch) || params.stretch <= 0.0) {
        throw std::invalid_argument("stretch must be finite and positive");
    }
}

Polyline transform(const Polyline& polyline, const TransformParameters& params,
                   const Vec2& anchor) {
    validate(params);

    double angle = params.rotation * std::numbers::pi / 180.0;

    std::vector<Vec2> local;
    local.reserve(polyline.size());
    for (const auto& p : polyline.points()) {
        Vec2 q = (p - anchor).rotated(angle);
        q.x *= params.stretch;
        local.push_back(q);
    }

    double length = 0.0;
    for (size_t i = 1; i < local.size(); ++i) {
        length += local[i].distance_to(local[i - 1]);
    }
    if (!(length > 0.0)) {
        throw DegeneratePath();
    }

    double scale = params.target_length / length;
    Polyline result;
    for (const auto& q : local) {
        result.append(anchor + q * scale);
    }
    return result;
}

}  // namespace trailsketch
