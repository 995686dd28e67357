#include "path_merger.hpp"
#include <common/errors.hpp>
#include <cstddef>
#include <limits>

namespace trailsketch {

Polyline merge(const std::vector<Polyline>& polylines) {
    std::vector<const Polyline*> remaining;
    remaining.reserve(polylines.size());
    for (const auto& polyline : polylines) {
        if (!polyline.empty()) {
            remaining.push_back(&polyline);
        }
    }
    if (remaining.empty()) {
        throw EmptyDrawing();
    }
    if (remaining.size() == 1) {
        return *remaining.front();
    }

    Polyline chain = *remaining.front();
    remaining.erase(remaining.begin());

    while (!remaining.empty()) {
        size_t best = 0;
        bool best_reversed = false;
        double best_distance = std::numeric_limits<double>::infinity();

        // Strict comparisons keep the earliest candidate on ties
        for (size_t i = 0; i < remaining.size(); ++i) {
            double to_start = chain.back().distance_to(remaining[i]->front());
            double to_end = chain.back().distance_to(remaining[i]->back());
            if (to_start < best_distance) {
                best = i;
                best_reversed = false;
                best_distance = to_start;
            }
            if (to_end < best_distance) {
                best = i;
                best_reversed = true;
                best_distance = to_end;
            }
        }

        const auto& next = remaining[best]->points();
        if (best_reversed) {
            for (auto it = next.rbegin(); it != next.rend(); ++it) {
                chain.append(*it);
            }
        } else {
            for (const auto& p : next) {
                chain.append(p);
            }
        }
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
    }

    return chain;
}

}  // namespace trailsketch
