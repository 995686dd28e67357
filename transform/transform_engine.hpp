#ifndef TRAILSKETCH_TRANSFORM_TRANSFORM_ENGINE_HPP
#define TRAILSKETCH_TRANSFORM_TRANSFORM_ENGINE_HPP

#include <geometry/polyline.hpp>
#include <math/vec2.hpp>

namespace trailsketch {

// User-facing shape controls
struct TransformParameters {
    double rotation = 0.0;         // degrees, counter-clockwise
    double target_length = 1000.0; // meters, total arc length after transform
    double stretch = 1.0;          // x scale relative to y
};

// Throws std::invalid_argument for a non-finite rotation, or a target
// length or stretch that is not finite and positive
void validate(const TransformParameters& params);

// Rotate, stretch and scale polyline about anchor, in that order.
// The result's arc length equals params.target_length.
// Throws DegeneratePath when the stretched polyline has zero length.
Polyline transform(const Polyline& polyline, const TransformParameters& params,
                   const Vec2& anchor);

}  // namespace trailsketch

#endif // TRAILSKETCH_TRANSFORM_TRANSFORM_ENGINE_HPP
