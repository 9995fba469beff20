// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "shape/SvgReader.h"

#include <sstream>

#include <gtest/gtest.h>

#include "utils/exceptions.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

class SvgReaderTest : public testing::Test
{
public:
    static SvgDocument readString(const std::string& text)
    {
        std::istringstream input(text);
        return SvgReader::read(input, "test.svg");
    }
};

TEST_F(SvgReaderTest, PageSizeFromViewBox)
{
    const SvgDocument document = readString(R"(<svg xmlns="http://www.w3.org/2000/svg" width="100mm" height="50mm" viewBox="0 0 120.5 60"></svg>)");
    EXPECT_EQ(document.width, MM2INT(120.5));
    EXPECT_EQ(document.height, MM2INT(60));
    EXPECT_TRUE(document.shapes.empty());
}

TEST_F(SvgReaderTest, PageSizeFromAttributes)
{
    const SvgDocument document = readString(R"(<svg xmlns="http://www.w3.org/2000/svg" width="100mm" height="50mm"></svg>)");
    EXPECT_EQ(document.width, MM2INT(100));
    EXPECT_EQ(document.height, MM2INT(50));
}

TEST_F(SvgReaderTest, ReadsShapes)
{
    const SvgDocument document = readString(R"(<?xml version="1.0" encoding="UTF-8"?>
<svg xmlns="http://www.w3.org/2000/svg" width="100mm" height="100mm" viewBox="0 0 100 100">
  <rect x="1" y="2" width="30" height="40" fill="none" stroke="#ff0000" stroke-width="0.1"/>
  <rect x="5" y="5" width="10" height="3" rx="1.5" ry="1.5" fill="none" stroke="#FF0000"/>
  <circle cx="50" cy="50" r="2.25" fill="none" stroke="#0000FF" stroke-width="0.1"/>
  <text x="1" y="1" font-size="3" fill="#999">ignored</text>
  <path d="M 1,1 L 2,1 L 2,2 Z" stroke="#00ff00"/>
  <line x1="0" y1="0" x2="1" y2="1" stroke="#ff0000"/>
</svg>
)");
    ASSERT_EQ(document.shapes.size(), 4);

    const auto* rect = std::get_if<RectShape>(&document.shapes[0].geometry);
    ASSERT_NE(rect, nullptr);
    EXPECT_EQ(rect->position, Point2LL(MM2INT(1), MM2INT(2)));
    EXPECT_EQ(rect->width, MM2INT(30));
    EXPECT_EQ(rect->height, MM2INT(40));
    EXPECT_EQ(document.shapes[0].role, ShapeRole::CUT);
    EXPECT_EQ(document.shapes[0].stroke_width, 100);

    const auto* rounded = std::get_if<RoundedRectShape>(&document.shapes[1].geometry);
    ASSERT_NE(rounded, nullptr);
    EXPECT_EQ(rounded->radius, MM2INT(1.5));

    const auto* circle = std::get_if<CircleShape>(&document.shapes[2].geometry);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->radius, MM2INT(2.25));
    EXPECT_EQ(document.shapes[2].role, ShapeRole::ENGRAVE);

    const auto* path = std::get_if<PathShape>(&document.shapes[3].geometry);
    ASSERT_NE(path, nullptr);
    EXPECT_TRUE(path->closed);
    EXPECT_EQ(path->points.size(), 3);
    EXPECT_EQ(document.shapes[3].role, ShapeRole::CUT) << "Unknown stroke colours are structural.";
}

TEST_F(SvgReaderTest, ZeroRadiusIsPlainRect)
{
    const SvgDocument document = readString(R"(<svg xmlns="http://www.w3.org/2000/svg" width="100mm" height="100mm" viewBox="0 0 100 100">
  <rect x="5" y="5" width="10" height="3" rx="0" fill="none" stroke="#ff0000"/>
  <rect x="5" y="15" width="10" height="3" rx="-1" fill="none" stroke="#ff0000"/>
  <rect x="5" y="25" width="10" height="3" rx="0.5" fill="none" stroke="#ff0000"/>
</svg>
)");
    ASSERT_EQ(document.shapes.size(), 3);
    EXPECT_NE(std::get_if<RectShape>(&document.shapes[0].geometry), nullptr);
    EXPECT_NE(std::get_if<RectShape>(&document.shapes[1].geometry), nullptr);
    EXPECT_NE(std::get_if<RoundedRectShape>(&document.shapes[2].geometry), nullptr);
}

TEST_F(SvgReaderTest, RoleFromStroke)
{
    EXPECT_EQ(SvgReader::roleFromStroke("#0000ff"), ShapeRole::ENGRAVE);
    EXPECT_EQ(SvgReader::roleFromStroke("#0000FF"), ShapeRole::ENGRAVE);
    EXPECT_EQ(SvgReader::roleFromStroke("#ff0000"), ShapeRole::CUT);
    EXPECT_EQ(SvgReader::roleFromStroke("black"), ShapeRole::CUT);
    EXPECT_EQ(SvgReader::roleFromStroke(""), ShapeRole::CUT);
}

TEST_F(SvgReaderTest, PathData)
{
    const PathShape open = SvgReader::parsePathData("M 0,0 L 10.5,0 L 10.5,-2", "test.svg");
    EXPECT_FALSE(open.closed);
    ASSERT_EQ(open.points.size(), 3);
    EXPECT_EQ(open.points[2], Point2LL(MM2INT(10.5), MM2INT(-2)));

    const PathShape implicit_lines = SvgReader::parsePathData("M 0 0 5 0 5 5 z", "test.svg");
    EXPECT_TRUE(implicit_lines.closed);
    EXPECT_EQ(implicit_lines.points.size(), 3);
}

TEST_F(SvgReaderTest, RejectsUnsupportedPathCommands)
{
    EXPECT_THROW(SvgReader::parsePathData("M 0,0 C 1,1 2,2 3,3", "test.svg"), exceptions::SvgParseException);
    EXPECT_THROW(SvgReader::parsePathData("M 0,0 L 1", "test.svg"), exceptions::SvgParseException);
}

TEST_F(SvgReaderTest, RejectsBrokenDocuments)
{
    EXPECT_THROW(readString("<svg><rect></svg>"), exceptions::SvgParseException);
    EXPECT_THROW(readString(R"(<html width="1" height="1"></html>)"), exceptions::SvgParseException);
    EXPECT_THROW(readString(R"(<svg xmlns="http://www.w3.org/2000/svg"></svg>)"), exceptions::SvgParseException);
    EXPECT_THROW(readString(R"(<svg viewBox="0 0 10 10"><rect x="1" y="1" width="2"/></svg>)"), exceptions::SvgParseException);
    EXPECT_THROW(readString(R"(<svg viewBox="0 0 10 10"><circle cx="a" cy="1" r="2"/></svg>)"), exceptions::SvgParseException);
}

TEST_F(SvgReaderTest, MissingFile)
{
    EXPECT_THROW(SvgReader::readFile("/nonexistent/kerf/panel.svg"), exceptions::SvgParseException);
}

} // namespace kerf
// NOLINTEND(*-magic-numbers)
