#include "gpx_codec.hpp"
#include <common/decimal.hpp>
#include <common/errors.hpp>
#include <common/xml.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace trailsketch {
namespace gpx {

using xml::as_xml;
using xml::has_name;

namespace {

const char* const kGpxNamespace = "http://www.topografix.com/GPX/1/1";

double read_coordinate(const xmlNode* trkpt, const char* name, double limit,
                       size_t index) {
    std::string where = "track point " + std::to_string(index);
    auto raw = xml::attribute(trkpt, name);
    if (!raw) {
        throw CorruptRoute(where + " has no " + name);
    }

    // xsd:decimal collapses surrounding whitespace
    std::string_view text(*raw);
    const char* ws = " \t\r\n";
    size_t first = text.find_first_not_of(ws);
    text = first == std::string_view::npos
        ? std::string_view()
        : text.substr(first, text.find_last_not_of(ws) - first + 1);

    auto value = parse_decimal(text);
    if (!value) {
        throw CorruptRoute(where + " has non-numeric " + name + " '" + *raw + "'");
    }
    if (!std::isfinite(*value) || *value < -limit || *value > limit) {
        throw CorruptRoute(where + " " + name + " out of range: " + *raw);
    }
    return *value;
}

}  // namespace

std::string encode(const std::vector<GeoPoint>& points, const std::string& name) {
    if (points.empty()) {
        throw std::invalid_argument("cannot encode an empty route");
    }
    for (const auto& p : points) {
        if (!p.is_valid()) {
            throw std::invalid_argument("route point out of range: " +
                                        format_decimal(p.latitude) + ", " +
                                        format_decimal(p.longitude));
        }
    }

    xml::DocPtr doc(xmlNewDoc(as_xml("1.0")));
    xmlNodePtr root = xmlNewNode(nullptr, as_xml("gpx"));
    xmlDocSetRootElement(doc.get(), root);
    xmlNsPtr ns = xmlNewNs(root, as_xml(kGpxNamespace), nullptr);
    xmlSetNs(root, ns);
    xmlNewProp(root, as_xml("version"), as_xml("1.1"));
    xmlNewProp(root, as_xml("creator"), as_xml("trailsketch"));

    xmlNodePtr trk = xmlNewChild(root, ns, as_xml("trk"), nullptr);
    if (!name.empty()) {
        // xmlNewTextChild escapes the content
        xmlNewTextChild(trk, ns, as_xml("name"), as_xml(name.c_str()));
    }
    xmlNodePtr trkseg = xmlNewChild(trk, ns, as_xml("trkseg"), nullptr);

    for (const auto& p : points) {
        xmlNodePtr trkpt = xmlNewChild(trkseg, ns, as_xml("trkpt"), nullptr);
        // Coordinates are xsd:decimal, which has no exponent form
        xmlNewProp(trkpt, as_xml("lat"), as_xml(format_decimal(p.latitude).c_str()));
        xmlNewProp(trkpt, as_xml("lon"), as_xml(format_decimal(p.longitude).c_str()));
        xmlNewChild(trkpt, ns, as_xml("ele"), as_xml(kPlaceholderElevation));
        xmlNewChild(trkpt, ns, as_xml("time"), as_xml(kPlaceholderTime));
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &buffer, &size, "UTF-8", 1);
    xml::CharPtr owned(buffer);
    if (!owned) {
        throw std::runtime_error("failed to serialize GPX document");
    }
    return std::string(reinterpret_cast<const char*>(owned.get()),
                       static_cast<size_t>(size));
}

std::vector<GeoPoint> decode(std::string_view document) {
    xml::DocPtr doc(xmlReadMemory(document.data(), static_cast<int>(document.size()),
                                "route.gpx", nullptr, xml::kReadOptions));
    if (!doc) {
        throw CorruptRoute("route is not well-formed XML");
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || !has_name(root, "gpx")) {
        throw CorruptRoute("route root element is not <gpx>");
    }

    std::vector<GeoPoint> points;
    for (const xmlNode* trk = root->children; trk != nullptr; trk = trk->next) {
        if (!has_name(trk, "trk")) continue;
        for (const xmlNode* seg = trk->children; seg != nullptr; seg = seg->next) {
            if (!has_name(seg, "trkseg")) continue;
            for (const xmlNode* pt = seg->children; pt != nullptr; pt = pt->next) {
                if (!has_name(pt, "trkpt")) continue;
                double lat = read_coordinate(pt, "lat", 90.0, points.size());
                double lon = read_coordinate(pt, "lon", 180.0, points.size());
                points.emplace_back(lat, lon);
            }
        }
    }

    if (points.empty()) {
        throw CorruptRoute("route contains no track points");
    }
    return points;
}

std::vector<GeoPoint> read_route_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return decode(buffer.str());
}

void write_route_file(const std::string& path, const std::vector<GeoPoint>& points,
                      const std::string& name) {
    std::string document = encode(points, name);
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << document;
}

}  // namespace gpx
}  // namespace trailsketch
