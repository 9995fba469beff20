// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "shape/ShapeCanvas.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <gtest/gtest.h>

#include "shape/SvgReader.h"
#include "utils/exceptions.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

TEST(ShapeCanvasTest, FormatMM)
{
    EXPECT_EQ(ShapeCanvas::formatMM(0), "0");
    EXPECT_EQ(ShapeCanvas::formatMM(1), "0.001");
    EXPECT_EQ(ShapeCanvas::formatMM(1500), "1.5");
    EXPECT_EQ(ShapeCanvas::formatMM(2000), "2");
    EXPECT_EQ(ShapeCanvas::formatMM(-250), "-0.25");
    EXPECT_EQ(ShapeCanvas::formatMM(315240), "315.24");
    EXPECT_EQ(ShapeCanvas::formatNumber(3.0), "3");
    EXPECT_EQ(ShapeCanvas::formatNumber(2.5), "2.5");
}

TEST(ShapeCanvasTest, DocumentLayout)
{
    ShapeCanvas canvas(MM2INT(10), MM2INT(5));
    canvas.addRect(Point2LL(0, 0), MM2INT(10), MM2INT(5));
    canvas.addCircle(Point2LL(MM2INT(5), MM2INT(2.5)), MM2INT(1), ShapeRole::ENGRAVE);

    const std::string svg = canvas.toSvg();
    EXPECT_EQ(
        svg,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"20mm\" height=\"15mm\" viewBox=\"0 0 20 15\">\n"
        "<!-- Red=cut, Blue=score/engrave. All dims in mm. -->\n"
        "  <rect x=\"5\" y=\"5\" width=\"10\" height=\"5\" fill=\"none\" stroke=\"#ff0000\" stroke-width=\"0.1\"/>\n"
        "  <circle cx=\"10\" cy=\"7.5\" r=\"1\" fill=\"none\" stroke=\"#0000ff\" stroke-width=\"0.1\"/>\n"
        "</svg>\n");
}

TEST(ShapeCanvasTest, PathsAndAnnotations)
{
    ShapeCanvas canvas(MM2INT(10), MM2INT(10), 0);
    canvas.addPolygon(Polygon{ { 0, 0 }, { MM2INT(10), 0 }, { MM2INT(10), MM2INT(10) } });
    canvas.addPolyline({ { 0, 0 }, { MM2INT(1.25), MM2INT(2) } }, false, ShapeRole::ENGRAVE);
    canvas.addAnnotation("A<B & C>", Point2LL(MM2INT(1), MM2INT(2)), 2.0);

    const std::string svg = canvas.toSvg();
    EXPECT_NE(svg.find("<path d=\"M 0,0 L 10,0 L 10,10 Z\" fill=\"none\" stroke=\"#ff0000\""), std::string::npos);
    EXPECT_NE(svg.find("<path d=\"M 0,0 L 1.25,2\" fill=\"none\" stroke=\"#0000ff\""), std::string::npos);
    EXPECT_NE(svg.find("<text x=\"1\" y=\"2\" font-size=\"2\" fill=\"#999\" font-family=\"monospace\">A&lt;B &amp; C&gt;</text>"), std::string::npos);
}

TEST(ShapeCanvasTest, SlotIsFullyRounded)
{
    ShapeCanvas canvas(MM2INT(30), MM2INT(10));
    canvas.addSlot(Point2LL(0, 0), MM2INT(22), MM2INT(3));

    ASSERT_EQ(canvas.getPrimitives().size(), 1);
    const auto* slot = std::get_if<RoundedRectShape>(&canvas.getPrimitives().front().geometry);
    ASSERT_NE(slot, nullptr);
    EXPECT_EQ(slot->radius, MM2INT(1.5));
}

TEST(ShapeCanvasTest, RejectsDegeneratePath)
{
    ShapeCanvas canvas(MM2INT(10), MM2INT(10));
    EXPECT_THROW(canvas.addPolyline({ { 0, 0 } }, false), exceptions::GeometryException);
    EXPECT_TRUE(canvas.getPrimitives().empty());
}

TEST(ShapeCanvasTest, CustomComment)
{
    ShapeCanvas canvas(MM2INT(10), MM2INT(10));
    canvas.setComment("Ponoko sheet");
    EXPECT_NE(canvas.toSvg().find("<!-- Ponoko sheet -->"), std::string::npos);
}

TEST(ShapeCanvasTest, SaveAndReadBack)
{
    ShapeCanvas canvas(MM2INT(40), MM2INT(20));
    canvas.addRect(Point2LL(0, 0), MM2INT(40), MM2INT(20));
    canvas.addRoundedRect(Point2LL(MM2INT(2), MM2INT(2)), MM2INT(10), MM2INT(5), MM2INT(1));
    canvas.addCircle(Point2LL(MM2INT(30), MM2INT(10)), MM2INT(3), ShapeRole::ENGRAVE);
    canvas.addAnnotation("label", Point2LL(0, MM2INT(-3)));

    const std::filesystem::path file_path = std::filesystem::temp_directory_path() / "kerf_shape_canvas_test.svg";
    canvas.save(file_path);

    std::ifstream file(file_path);
    const std::string written((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, canvas.toSvg());

    const SvgDocument document = SvgReader::readFile(file_path);
    EXPECT_EQ(document.width, MM2INT(50));
    EXPECT_EQ(document.height, MM2INT(30));
    ASSERT_EQ(document.shapes.size(), 3) << "The annotation is not read back.";
    EXPECT_TRUE(std::holds_alternative<RectShape>(document.shapes[0].geometry));
    EXPECT_TRUE(std::holds_alternative<RoundedRectShape>(document.shapes[1].geometry));
    EXPECT_EQ(document.shapes[2].role, ShapeRole::ENGRAVE);

    std::filesystem::remove(file_path);
}

TEST(ShapeCanvasTest, SaveToMissingDirectoryThrows)
{
    const ShapeCanvas canvas(MM2INT(10), MM2INT(10));
    const std::filesystem::path file_path = std::filesystem::temp_directory_path() / "kerf_no_such_directory" / "panel.svg";
    EXPECT_THROW(canvas.save(file_path), exceptions::FileWriteException);
}

} // namespace kerf
// NOLINTEND(*-magic-numbers)
