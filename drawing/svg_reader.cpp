#include "svg_reader.hpp"
#include <common/decimal.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <common/xml.hpp>
#include <parser/parser.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace trailsketch {

namespace {

const char* const kSvgNamespace = "http://www.w3.org/2000/svg";

using xml::attribute;
using xml::element_name;

// Elements without a namespace are accepted so bare <svg> files work
bool in_svg_namespace(const xmlNode* node) {
    if (node->ns == nullptr || node->ns->href == nullptr) {
        return true;
    }
    return std::strcmp(reinterpret_cast<const char*>(node->ns->href), kSvgNamespace) == 0;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\f";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// Plain user units, optionally suffixed "px"
double parse_length(const std::string& element, const char* name,
                    const std::string& raw) {
    std::string text = trim(raw);
    if (text.size() > 2 && text.compare(text.size() - 2, 2, "px") == 0) {
        text.erase(text.size() - 2);
    }
    auto value = parse_decimal(text);
    if (!value || !std::isfinite(*value)) {
        throw ParseError("<" + element + "> attribute " + name +
                         " is not a plain length: '" + raw + "'");
    }
    return *value;
}

double length_attribute(const xmlNode* node, const char* name, double fallback = 0.0) {
    auto raw = attribute(node, name);
    if (!raw) {
        return fallback;
    }
    return parse_length(element_name(node), name, *raw);
}

PathOutline line_outline(const xmlNode* node) {
    Vec2 from(length_attribute(node, "x1"), length_attribute(node, "y1"));
    Vec2 to(length_attribute(node, "x2"), length_attribute(node, "y2"));
    return PathOutline({command::MoveTo{from}, command::LineTo{to}});
}

std::optional<PathOutline> poly_outline(const xmlNode* node, bool closed) {
    std::string name = element_name(node);
    auto raw = attribute(node, "points");
    if (!raw) {
        return std::nullopt;
    }

    std::vector<double> numbers = parser::parse_number_list(*raw);
    if (numbers.size() % 2 != 0) {
        throw ParseError("<" + name + "> points has an odd number of coordinates");
    }
    if (numbers.size() < 4) {
        return std::nullopt;
    }

    std::vector<PathCommand> commands;
    commands.push_back(command::MoveTo{Vec2(numbers[0], numbers[1])});
    for (size_t i = 2; i + 1 < numbers.size(); i += 2) {
        commands.push_back(command::LineTo{Vec2(numbers[i], numbers[i + 1])});
    }
    if (closed) {
        commands.push_back(command::ClosePath{});
    }
    return PathOutline(std::move(commands));
}

std::optional<PathOutline> rect_outline(const xmlNode* node) {
    double x = length_attribute(node, "x");
    double y = length_attribute(node, "y");
    double w = length_attribute(node, "width");
    double h = length_attribute(node, "height");
    if (w <= 0.0 || h <= 0.0) {
        return std::nullopt;
    }

    // A single given corner radius applies to both axes
    auto rx_raw = attribute(node, "rx");
    auto ry_raw = attribute(node, "ry");
    double rx = rx_raw ? parse_length("rect", "rx", *rx_raw) : 0.0;
    double ry = ry_raw ? parse_length("rect", "ry", *ry_raw) : 0.0;
    if (rx_raw && !ry_raw) ry = rx;
    if (ry_raw && !rx_raw) rx = ry;
    rx = std::clamp(rx, 0.0, w / 2.0);
    ry = std::clamp(ry, 0.0, h / 2.0);

    if (rx <= 0.0 || ry <= 0.0) {
        return PathOutline({
            command::MoveTo{Vec2(x, y)},
            command::LineTo{Vec2(x + w, y)},
            command::LineTo{Vec2(x + w, y + h)},
            command::LineTo{Vec2(x, y + h)},
            command::ClosePath{},
        });
    }

    Vec2 radii(rx, ry);
    return PathOutline({
        command::MoveTo{Vec2(x + rx, y)},
        command::LineTo{Vec2(x + w - rx, y)},
        command::ArcTo{radii, 0.0, false, true, Vec2(x + w, y + ry)},
        command::LineTo{Vec2(x + w, y + h - ry)},
        command::ArcTo{radii, 0.0, false, true, Vec2(x + w - rx, y + h)},
        command::LineTo{Vec2(x + rx, y + h)},
        command::ArcTo{radii, 0.0, false, true, Vec2(x, y + h - ry)},
        command::LineTo{Vec2(x, y + ry)},
        command::ArcTo{radii, 0.0, false, true, Vec2(x + rx, y)},
        command::ClosePath{},
    });
}

// Four quarter arcs starting at the rightmost point
std::optional<PathOutline> ellipse_outline(const Vec2& center, double rx, double ry) {
    if (rx <= 0.0 || ry <= 0.0) {
        return std::nullopt;
    }
    Vec2 radii(rx, ry);
    return PathOutline({
        command::MoveTo{center + Vec2(rx, 0.0)},
        command::ArcTo{radii, 0.0, false, true, center + Vec2(0.0, ry)},
        command::ArcTo{radii, 0.0, false, true, center + Vec2(-rx, 0.0)},
        command::ArcTo{radii, 0.0, false, true, center + Vec2(0.0, -ry)},
        command::ArcTo{radii, 0.0, false, true, center + Vec2(rx, 0.0)},
        command::ClosePath{},
    });
}

class SvgWalker {
public:
    std::vector<PathOutline> outlines;
    size_t shape_count = 0;

    void walk_children(const xmlNode* parent) {
        for (const xmlNode* node = parent->children; node != nullptr; node = node->next) {
            if (node->type == XML_ELEMENT_NODE) {
                visit(node);
            }
        }
    }

private:
    void visit(const xmlNode* node) {
        if (!in_svg_namespace(node)) {
            return;
        }

        static const std::set<std::string> containers = {"svg", "g", "a", "switch"};
        static const std::set<std::string> skipped = {
            "defs", "title", "desc", "metadata", "style", "script",
            "symbol", "clipPath", "marker", "linearGradient", "radialGradient",
        };

        std::string name = element_name(node);
        if (containers.count(name)) {
            walk_children(node);
            return;
        }
        if (skipped.count(name)) {
            return;
        }

        if (name == "path") {
            ++shape_count;
            auto data = attribute(node, "d");
            if (!data) {
                return;
            }
            for (auto& outline : parser::parse_path_data(*data)) {
                outlines.push_back(std::move(outline));
            }
        } else if (name == "line") {
            ++shape_count;
            outlines.push_back(line_outline(node));
        } else if (name == "polyline" || name == "polygon") {
            ++shape_count;
            add(poly_outline(node, name == "polygon"));
        } else if (name == "rect") {
            ++shape_count;
            add(rect_outline(node));
        } else if (name == "circle") {
            ++shape_count;
            double r = length_attribute(node, "r");
            Vec2 c(length_attribute(node, "cx"), length_attribute(node, "cy"));
            add(ellipse_outline(c, r, r));
        } else if (name == "ellipse") {
            ++shape_count;
            Vec2 c(length_attribute(node, "cx"), length_attribute(node, "cy"));
            add(ellipse_outline(c, length_attribute(node, "rx"), length_attribute(node, "ry")));
        } else {
            throw UnsupportedElement(name);
        }
    }

    void add(std::optional<PathOutline> outline) {
        if (outline) {
            outlines.push_back(std::move(*outline));
        }
    }
};

}  // namespace

std::vector<PathOutline> read_svg(std::string_view document) {
    auto log = logging::get_logger();

    xml::DocPtr doc(xmlReadMemory(document.data(), static_cast<int>(document.size()),
                                "drawing.svg", nullptr, xml::kReadOptions));
    if (!doc) {
        std::string detail = "not well-formed XML";
        const xmlError* err = xmlGetLastError();
        if (err != nullptr && err->message != nullptr) {
            detail = trim(err->message) + " (line " + std::to_string(err->line) + ")";
        }
        throw ParseError("drawing is " + detail);
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || element_name(root) != "svg") {
        throw ParseError("drawing root element is not <svg>");
    }

    SvgWalker walker;
    walker.walk_children(root);

    log->debug("read_svg: {} shape elements, {} outlines",
               walker.shape_count, walker.outlines.size());
    return std::move(walker.outlines);
}

std::vector<PathOutline> read_svg_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_svg(buffer.str());
}

}  // namespace trailsketch
