#include <gtest/gtest.h>
#include <drawing/svg_reader.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <variant>

using namespace trailsketch;
using test::svg_document;

namespace {

template<typename T>
const T& as(const PathCommand& cmd) {
    return std::get<T>(cmd);
}

}  // namespace

// ============================================
// Paths
// ============================================

TEST(SvgReaderTest, PathSubpathsBecomeOutlines) {
    auto outlines = read_svg(svg_document("<path d=\"M0 0 L10 0 M20 20 L30 20\"/>"));
    ASSERT_EQ(outlines.size(), 2u);
    EXPECT_EQ(as<command::MoveTo>(outlines[1].commands()[0]).to, Vec2(20.0, 20.0));
}

TEST(SvgReaderTest, DocumentOrderAcrossGroups) {
    auto outlines = read_svg(svg_document(
        "<g><path d=\"M1 1 L2 2\"/><g><path d=\"M3 3 L4 4\"/></g></g>"
        "<path d=\"M5 5 L6 6\"/>"));
    ASSERT_EQ(outlines.size(), 3u);
    EXPECT_EQ(as<command::MoveTo>(outlines[0].commands()[0]).to, Vec2(1.0, 1.0));
    EXPECT_EQ(as<command::MoveTo>(outlines[1].commands()[0]).to, Vec2(3.0, 3.0));
    EXPECT_EQ(as<command::MoveTo>(outlines[2].commands()[0]).to, Vec2(5.0, 5.0));
}

TEST(SvgReaderTest, EmptyPathDataIgnored) {
    EXPECT_TRUE(read_svg(svg_document("<path d=\"\"/><path/>")).empty());
}

TEST(SvgReaderTest, BadPathDataIsParseError) {
    EXPECT_THROW(read_svg(svg_document("<path d=\"M0 0 L\"/>")), ParseError);
}

// ============================================
// Basic shapes
// ============================================

TEST(SvgReaderTest, Line) {
    auto outlines = read_svg(svg_document("<line x1=\"1\" y1=\"2\" x2=\"3\" y2=\"4\"/>"));
    ASSERT_EQ(outlines.size(), 1u);
    const auto& cmds = outlines[0].commands();
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(as<command::MoveTo>(cmds[0]).to, Vec2(1.0, 2.0));
    EXPECT_EQ(as<command::LineTo>(cmds[1]).to, Vec2(3.0, 4.0));
}

TEST(SvgReaderTest, PolylineAndPolygon) {
    auto outlines = read_svg(svg_document(
        "<polyline points=\"0,0 10,0 10,10\"/>"
        "<polygon points=\"0 0 5 0 5 5\"/>"));
    ASSERT_EQ(outlines.size(), 2u);
    EXPECT_EQ(outlines[0].size(), 3u);
    ASSERT_EQ(outlines[1].size(), 4u);
    EXPECT_TRUE(std::holds_alternative<command::ClosePath>(outlines[1].commands()[3]));
}

TEST(SvgReaderTest, PolylineOddCoordinatesIsParseError) {
    EXPECT_THROW(read_svg(svg_document("<polyline points=\"0,0 10\"/>")), ParseError);
}

TEST(SvgReaderTest, Rect) {
    auto outlines = read_svg(svg_document("<rect x=\"1\" y=\"2\" width=\"10px\" height=\"5\"/>"));
    ASSERT_EQ(outlines.size(), 1u);
    const auto& cmds = outlines[0].commands();
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(as<command::MoveTo>(cmds[0]).to, Vec2(1.0, 2.0));
    EXPECT_EQ(as<command::LineTo>(cmds[1]).to, Vec2(11.0, 2.0));
    EXPECT_EQ(as<command::LineTo>(cmds[2]).to, Vec2(11.0, 7.0));
    EXPECT_EQ(as<command::LineTo>(cmds[3]).to, Vec2(1.0, 7.0));
}

TEST(SvgReaderTest, RoundedRectUsesArcs) {
    auto outlines = read_svg(svg_document("<rect width=\"10\" height=\"10\" rx=\"2\"/>"));
    ASSERT_EQ(outlines.size(), 1u);
    const auto& cmds = outlines[0].commands();
    ASSERT_EQ(cmds.size(), 10u);

    const auto& corner = as<command::ArcTo>(cmds[2]);
    EXPECT_EQ(corner.radii, Vec2(2.0, 2.0));
    EXPECT_EQ(corner.to, Vec2(10.0, 2.0));
}

TEST(SvgReaderTest, CircleAndEllipse) {
    auto outlines = read_svg(svg_document(
        "<circle cx=\"5\" cy=\"5\" r=\"2\"/>"
        "<ellipse cx=\"0\" cy=\"0\" rx=\"4\" ry=\"1\"/>"));
    ASSERT_EQ(outlines.size(), 2u);

    const auto& circle = outlines[0].commands();
    ASSERT_EQ(circle.size(), 6u);
    EXPECT_EQ(as<command::MoveTo>(circle[0]).to, Vec2(7.0, 5.0));
    EXPECT_EQ(as<command::ArcTo>(circle[4]).to, Vec2(7.0, 5.0));

    EXPECT_EQ(as<command::ArcTo>(outlines[1].commands()[1]).radii, Vec2(4.0, 1.0));
}

TEST(SvgReaderTest, ZeroSizeShapesDrawNothing) {
    auto outlines = read_svg(svg_document(
        "<rect width=\"0\" height=\"5\"/><circle r=\"0\"/><polyline points=\"1 1\"/>"));
    EXPECT_TRUE(outlines.empty());
}

TEST(SvgReaderTest, UnsupportedUnitIsParseError) {
    EXPECT_THROW(read_svg(svg_document("<rect width=\"10mm\" height=\"5\"/>")), ParseError);
    EXPECT_THROW(read_svg(svg_document("<circle r=\"50%\"/>")), ParseError);
    EXPECT_THROW(read_svg(svg_document("<circle r=\"2,5\"/>")), ParseError);
}

TEST(SvgReaderTest, SignedAndPixelLengths) {
    auto outlines = read_svg(svg_document(
        "<line x1=\"+1.5\" y1=\" -2px \" x2=\"3e1\" y2=\".5px\"/>"));
    ASSERT_EQ(outlines.size(), 1u);
    const auto& cmds = outlines[0].commands();
    EXPECT_EQ(as<command::MoveTo>(cmds[0]).to, Vec2(1.5, -2.0));
    EXPECT_EQ(as<command::LineTo>(cmds[1]).to, Vec2(30.0, 0.5));
}

// ============================================
// Skipped and unsupported content
// ============================================

TEST(SvgReaderTest, MetadataAndDefsSkipped) {
    auto outlines = read_svg(
        "<svg xmlns=\"http://www.w3.org/2000/svg\""
        " xmlns:sodipodi=\"http://sodipodi.sourceforge.net/DTD/sodipodi-0.dtd\">"
        "<title>t</title><desc>d</desc><metadata/>"
        "<style>path { stroke: red; }</style>"
        "<defs><path d=\"M0 0 L1 1\"/></defs>"
        "<sodipodi:namedview/>"
        "<path d=\"M0 0 L5 5\"/>"
        "</svg>");
    EXPECT_EQ(outlines.size(), 1u);
}

TEST(SvgReaderTest, UnsupportedElement) {
    try {
        read_svg(svg_document("<g><text x=\"0\" y=\"0\">hi</text></g>"));
        FAIL() << "expected UnsupportedElement";
    } catch (const UnsupportedElement& e) {
        EXPECT_EQ(e.element(), "text");
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedElement);
    }

    EXPECT_THROW(read_svg(svg_document("<image href=\"a.png\"/>")), UnsupportedElement);
    EXPECT_THROW(read_svg(svg_document("<use href=\"#a\"/>")), UnsupportedElement);
}

TEST(SvgReaderTest, MalformedXmlIsParseError) {
    EXPECT_THROW(read_svg("<svg><path d=\"M0 0 L1 1\"></svg>"), ParseError);
    EXPECT_THROW(read_svg("not xml at all"), ParseError);
    EXPECT_THROW(read_svg(""), ParseError);
}

TEST(SvgReaderTest, RootMustBeSvg) {
    EXPECT_THROW(read_svg("<html><path d=\"M0 0 L1 1\"/></html>"), ParseError);
}

TEST(SvgReaderTest, NoNamespaceAccepted) {
    auto outlines = read_svg("<svg><path d=\"M0 0 L1 1\"/></svg>");
    EXPECT_EQ(outlines.size(), 1u);
}

TEST(SvgReaderTest, MissingFile) {
    EXPECT_THROW(read_svg_file("/nonexistent/drawing.svg"), std::runtime_error);
}
