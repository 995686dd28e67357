#ifndef TRAILSKETCH_FLATTEN_FLATTENER_HPP
#define TRAILSKETCH_FLATTEN_FLATTENER_HPP

#include <drawing/path_outline.hpp>
#include <geometry/polyline.hpp>
#include <vector>

namespace trailsketch {

// How the flattening tolerance is chosen.
// relative: tolerance is a fraction of the drawing's control-point
// bounding-box diagonal. Otherwise it is a length in drawing units.
struct FlattenConfig {
    double tolerance = 0.001;
    bool relative = true;
};

// Absolute tolerance for these outlines under config.
// A drawing with a zero-size bounding box falls back to the raw value.
// Throws std::invalid_argument unless config.tolerance is finite and > 0.
double effective_tolerance(const FlattenConfig& config,
                           const std::vector<PathOutline>& outlines);

// Approximate one outline by straight segments.
//
// Lines pass through unchanged; curves and arcs are subdivided until no
// chord deviates from the true curve by more than tolerance. A closepath
// returns to the first point unless the last point is already within
// tolerance of it.
//
// Throws std::invalid_argument for a non-positive or non-finite
// tolerance, and ParseError when the outline does not start with a move.
Polyline flatten(const PathOutline& outline, double tolerance);

// Flatten each outline independently, in order
std::vector<Polyline> flatten_all(const std::vector<PathOutline>& outlines,
                                  const FlattenConfig& config);

}  // namespace trailsketch

#endif // TRAILSKETCH_FLATTEN_FLATTENER_HPP
