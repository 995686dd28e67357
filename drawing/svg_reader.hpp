#ifndef TRAILSKETCH_DRAWING_SVG_READER_HPP
#define TRAILSKETCH_DRAWING_SVG_READER_HPP

#include "path_outline.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace trailsketch {

// Collects the path outlines of an SVG document in document order.
//
// <path> contributes one outline per sub-path. <line>, <polyline>,
// <polygon>, <rect>, <circle> and <ellipse> are converted to the
// equivalent path commands. Container and metadata elements are walked
// or skipped; elements outside the SVG namespace are skipped.
// Element transforms are not applied.
//
// Throws ParseError for malformed XML, a non-svg root or bad attribute
// values, and UnsupportedElement for content with no outline (text,
// images, use references, ...).
std::vector<PathOutline> read_svg(std::string_view document);

// Reads the file and forwards to read_svg.
// Throws std::runtime_error if the file cannot be opened.
std::vector<PathOutline> read_svg_file(const std::string& path);

}  // namespace trailsketch

#endif // TRAILSKETCH_DRAWING_SVG_READER_HPP
