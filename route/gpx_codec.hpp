#ifndef TRAILSKETCH_ROUTE_GPX_CODEC_HPP
#define TRAILSKETCH_ROUTE_GPX_CODEC_HPP

#include <geo/geo_point.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trailsketch {
namespace gpx {

// Placeholder values written for every track point
constexpr const char* kPlaceholderElevation = "0";
constexpr const char* kPlaceholderTime = "1970-01-01T00:00:00Z";

// Serialize points as a GPX 1.1 document with one track and one segment.
// Coordinates carry enough digits for decode() to restore them exactly.
// An empty name omits the <name> element.
// Throws std::invalid_argument for an empty or out-of-range point list.
std::string encode(const std::vector<GeoPoint>& points, const std::string& name = "");

// Track points of every <trk>/<trkseg> in document order.
// Throws CorruptRoute for non-XML input, a root other than <gpx>, no
// track points, or a missing, non-numeric or out-of-range coordinate.
std::vector<GeoPoint> decode(std::string_view document);

// File wrappers; throw std::runtime_error when the file cannot be opened
std::vector<GeoPoint> read_route_file(const std::string& path);
void write_route_file(const std::string& path, const std::vector<GeoPoint>& points,
                      const std::string& name = "");

}  // namespace gpx
}  // namespace trailsketch

#endif // TRAILSKETCH_ROUTE_GPX_CODEC_HPP
