#ifndef TRAILSKETCH_MERGE_PATH_MERGER_HPP
#define TRAILSKETCH_MERGE_PATH_MERGER_HPP

#include <geometry/polyline.hpp>
#include <vector>

namespace trailsketch {

// Chain polylines into one continuous route.
//
// Starting from the first polyline, repeatedly append the remaining
// polyline whose nearer endpoint is closest to the open end of the chain,
// reversed when its end point is the nearer one. Ties go to the earlier
// polyline, then to its start point. A junction point that coincides with
// the chain end is emitted once.
//
// Throws EmptyDrawing when polylines is empty or holds only empty
// polylines.
Polyline merge(const std::vector<Polyline>& polylines);

}  // namespace trailsketch

#endif // TRAILSKETCH_MERGE_PATH_MERGER_HPP
