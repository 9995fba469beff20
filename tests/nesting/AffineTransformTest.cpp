// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "nesting/AffineTransform.h"

#include <gtest/gtest.h>

#include "shape/ShapeCanvas.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

class AffineTransformTest : public testing::Test
{
public:
    PanelGeometry part;

    void SetUp() override
    {
        part.content_width = MM2INT(50);
        part.content_height = MM2INT(20);
        part.primitives.push_back(ShapePrimitive{ RectShape{ Point2LL(0, 0), MM2INT(50), MM2INT(20) } });
        part.primitives.push_back(ShapePrimitive{ RoundedRectShape{ Point2LL(MM2INT(5), MM2INT(4)), MM2INT(22), MM2INT(3), MM2INT(1.5) } });
        part.primitives.push_back(ShapePrimitive{ CircleShape{ Point2LL(MM2INT(40), MM2INT(10)), MM2INT(2) }, ShapeRole::ENGRAVE });
        part.primitives.push_back(ShapePrimitive{ PathShape{ { { 0, 0 }, { MM2INT(10), MM2INT(2) }, { MM2INT(3), MM2INT(7) } }, true } });
    }

    //! Two parts are the same when they draw the same document.
    static std::string render(const PanelGeometry& geometry)
    {
        ShapeCanvas canvas(geometry.content_width, geometry.content_height, 0);
        for (const ShapePrimitive& primitive : geometry.primitives)
        {
            canvas.addPrimitive(primitive);
        }
        return canvas.toSvg();
    }
};

TEST_F(AffineTransformTest, Translate)
{
    const PanelGeometry moved = AffineTransform::translate(part, MM2INT(100), MM2INT(-5));
    const auto* circle = std::get_if<CircleShape>(&moved.primitives[2].geometry);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->center, Point2LL(MM2INT(140), MM2INT(5)));
    EXPECT_EQ(circle->radius, MM2INT(2));
    EXPECT_EQ(moved.primitives[2].role, ShapeRole::ENGRAVE);
}

TEST_F(AffineTransformTest, QuarterTurn)
{
    const PanelGeometry turned = AffineTransform::rotate90CW(part);
    EXPECT_EQ(turned.content_width, MM2INT(20));
    EXPECT_EQ(turned.content_height, MM2INT(50));

    const auto* outline = std::get_if<RectShape>(&turned.primitives[0].geometry);
    ASSERT_NE(outline, nullptr);
    EXPECT_EQ(outline->position, Point2LL(0, 0));
    EXPECT_EQ(outline->width, MM2INT(20));
    EXPECT_EQ(outline->height, MM2INT(50));

    // (x, y) -> (H - y, x)
    const auto* slot = std::get_if<RoundedRectShape>(&turned.primitives[1].geometry);
    ASSERT_NE(slot, nullptr);
    EXPECT_EQ(slot->position, Point2LL(MM2INT(13), MM2INT(5)));
    EXPECT_EQ(slot->width, MM2INT(3));
    EXPECT_EQ(slot->height, MM2INT(22));
    EXPECT_EQ(slot->radius, MM2INT(1.5));

    const auto* circle = std::get_if<CircleShape>(&turned.primitives[2].geometry);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->center, Point2LL(MM2INT(10), MM2INT(40)));

    const auto* path = std::get_if<PathShape>(&turned.primitives[3].geometry);
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(path->points[1], Point2LL(MM2INT(18), MM2INT(10)));
    EXPECT_TRUE(path->closed);
}

TEST_F(AffineTransformTest, HalfTurn)
{
    const PanelGeometry turned = AffineTransform::rotate180(part);
    EXPECT_EQ(turned.content_width, MM2INT(50));
    EXPECT_EQ(turned.content_height, MM2INT(20));

    const auto* slot = std::get_if<RoundedRectShape>(&turned.primitives[1].geometry);
    ASSERT_NE(slot, nullptr);
    EXPECT_EQ(slot->position, Point2LL(MM2INT(23), MM2INT(13)));
    EXPECT_EQ(slot->width, MM2INT(22));

    const auto* circle = std::get_if<CircleShape>(&turned.primitives[2].geometry);
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->center, Point2LL(MM2INT(10), MM2INT(10)));
}

TEST_F(AffineTransformTest, FourQuarterTurnsAreIdentity)
{
    PanelGeometry turned = part;
    for (int turn = 0; turn < 4; ++turn)
    {
        turned = AffineTransform::rotate90CW(turned);
    }
    EXPECT_EQ(render(turned), render(part));
}

TEST_F(AffineTransformTest, TwoHalfTurnsAreIdentity)
{
    const PanelGeometry turned = AffineTransform::rotate180(AffineTransform::rotate180(part));
    EXPECT_EQ(render(turned), render(part));
}

TEST_F(AffineTransformTest, AnnotationsFollowTheirAnchor)
{
    const std::vector<ShapePrimitive> labels{ ShapePrimitive{ TextShape{ Point2LL(MM2INT(1), MM2INT(2)), "HDD1", 3.0, "#999" }, ShapeRole::ENGRAVE } };
    const std::vector<ShapePrimitive> moved = AffineTransform::translate(labels, MM2INT(10), MM2INT(10));
    const auto* text = std::get_if<TextShape>(&moved.front().geometry);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->position, Point2LL(MM2INT(11), MM2INT(12)));
    EXPECT_EQ(text->text, "HDD1");
}

} // namespace kerf
// NOLINTEND(*-magic-numbers)
