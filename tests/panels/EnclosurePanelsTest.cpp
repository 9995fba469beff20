// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "panels/EnclosurePanels.h"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <sstream>

#include <gtest/gtest.h>

#include "nesting/GeometryExtractor.h"
#include "panels/PanelFiles.h"
#include "panels/PanelOutlines.h"
#include "panels/ReviewPage.h"
#include "settings/EnclosureConfig.h"
#include "settings/EnclosurePresets.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

class EnclosurePanelsTest : public testing::TestWithParam<std::string>
{
public:
    Settings preset = EnclosurePresets::load(GetParam());
    EnclosureConfig config{ preset };
    EnclosurePanels panels{ config };

    static bool hasVertex(const Polygon& polygon, const Point2LL& vertex)
    {
        return std::find(polygon.begin(), polygon.end(), vertex) != polygon.end();
    }

    static bool hasRect(const ShapeCanvas& canvas, const Point2LL& position, const coord_t width, const coord_t height)
    {
        return std::any_of(
            canvas.getPrimitives().begin(),
            canvas.getPrimitives().end(),
            [&](const ShapePrimitive& primitive)
            {
                const auto* rect = std::get_if<RectShape>(&primitive.geometry);
                return rect != nullptr && primitive.role == ShapeRole::CUT && rect->position == position && rect->width == width && rect->height == height;
            });
    }

    //! The first closed cut path of a drawing is its outline.
    static const PathShape* outlineOf(const ShapeCanvas& canvas)
    {
        for (const ShapePrimitive& primitive : canvas.getPrimitives())
        {
            const auto* path = std::get_if<PathShape>(&primitive.geometry);
            if (path != nullptr && path->closed && primitive.role == ShapeRole::CUT)
            {
                return path;
            }
        }
        return nullptr;
    }

    //! The first cut shape of a drawing is its outline, either a closed path or a plain rectangle.
    static std::optional<Polygon> outlinePolygon(const ShapeCanvas& canvas)
    {
        for (const ShapePrimitive& primitive : canvas.getPrimitives())
        {
            if (primitive.role != ShapeRole::CUT)
            {
                continue;
            }
            if (const auto* path = std::get_if<PathShape>(&primitive.geometry); path != nullptr && path->closed)
            {
                return Polygon(Path(path->points));
            }
            if (const auto* rect = std::get_if<RectShape>(&primitive.geometry); rect != nullptr)
            {
                const Point2LL& p = rect->position;
                return Polygon{ p, p + Point2LL(rect->width, 0), p + Point2LL(rect->width, rect->height), p + Point2LL(0, rect->height) };
            }
            return std::nullopt;
        }
        return std::nullopt;
    }

    static PanelGeometry fabricate(const Panel& panel)
    {
        std::istringstream drawing(panel.canvas.toSvg());
        return GeometryExtractor::parse(drawing, panel.file_name, false);
    }
};

TEST_P(EnclosurePanelsTest, GeneratesAllParts)
{
    const std::vector<Panel> all = panels.generateAll();
    const std::vector<std::string_view> expected_names{ panel_files::bottom,    panel_files::top,        panel_files::front,     panel_files::back,
                                                        panel_files::left_side, panel_files::right_side, panel_files::comb_rail, panel_files::fan_bracket };
    ASSERT_EQ(all.size(), expected_names.size());
    for (size_t panel_idx = 0; panel_idx < all.size(); ++panel_idx)
    {
        EXPECT_EQ(all[panel_idx].file_name, expected_names[panel_idx]);
        const std::optional<Polygon> outline = outlinePolygon(all[panel_idx].canvas);
        ASSERT_TRUE(outline.has_value()) << all[panel_idx].file_name << " does not start with a closed outline.";
        EXPECT_GT(outline->area(), 0.0) << all[panel_idx].file_name << " outline is not clockwise.";
        EXPECT_NE(outline->front(), outline->back());
        for (size_t point_idx = 1; point_idx < outline->size(); ++point_idx)
        {
            EXPECT_NE((*outline)[point_idx - 1], (*outline)[point_idx]) << all[panel_idx].file_name;
        }
        EXPECT_NO_THROW(fabricate(all[panel_idx])) << all[panel_idx].file_name;
    }
}

TEST_P(EnclosurePanelsTest, FabricatedSizes)
{
    const PanelGeometry bottom = fabricate(panels.bottomPanel());
    EXPECT_EQ(bottom.content_width, config.ext_x);
    EXPECT_EQ(bottom.content_height, config.ext_y) << "The front and back fingers reach through the front and back panels.";

    const PanelGeometry side = fabricate(panels.sidePanel(SideHand::LEFT));
    EXPECT_EQ(side.content_width, config.interior_y + 2 * config.side_overlap);
    EXPECT_EQ(side.content_height, config.total_height) << "The side fingers reach through the top and bottom panels.";

    const PanelGeometry front = fabricate(panels.frontPanel());
    EXPECT_EQ(front.content_width, config.front_panel_width + 2 * config.side_thickness);
    EXPECT_EQ(front.content_height, config.front_panel_height);
}

TEST_P(EnclosurePanelsTest, FrontNotchesMeetTopFingers)
{
    const OutlineSpec top = PanelOutlines::topBottom(config);
    const OutlineSpec front = PanelOutlines::frontBack(config);
    const coord_t shift = config.min_overhang + config.side_thickness;

    std::vector<std::pair<coord_t, coord_t>> expected;
    for (const auto& [from, to] : FingerOutline::fingerSpans(top.edge(EdgeSide::TOP), top.width, top.finger_width))
    {
        const coord_t clipped_from = std::clamp(from - shift, coord_t(0), front.width);
        const coord_t clipped_to = std::clamp(to - shift, coord_t(0), front.width);
        if (clipped_to > clipped_from)
        {
            expected.emplace_back(clipped_from, clipped_to);
        }
    }
    ASSERT_FALSE(expected.empty());
    EXPECT_EQ(FingerOutline::fingerSpans(front.edge(EdgeSide::TOP), front.width, front.finger_width), expected);
    EXPECT_EQ(FingerOutline::fingerSpans(front.edge(EdgeSide::BOTTOM), front.width, front.finger_width), expected);

    // The notches are cut as deep as the top panel is thick.
    const Polygon outline = FingerOutline::build(front);
    const auto& [notch_from, notch_to] = expected[expected.size() / 2];
    EXPECT_TRUE(hasVertex(outline, Point2LL(notch_from, config.wall_thickness)));
    EXPECT_TRUE(hasVertex(outline, Point2LL(notch_to, config.wall_thickness)));
}

TEST_P(EnclosurePanelsTest, SideFingersMeetTopBottomSlots)
{
    const std::vector<std::pair<coord_t, coord_t>> slots = PanelOutlines::topBottomSideSlotSpans(config);
    ASSERT_FALSE(slots.empty());
    EXPECT_EQ(slots.front().first, 0);
    EXPECT_EQ(slots.back().second, config.interior_y);

    const Polygon side = FingerOutline::build(PanelOutlines::side(config));
    const Panel bottom = panels.bottomPanel();
    const Panel top = panels.topPanel();
    for (const auto& [from, to] : slots)
    {
        EXPECT_TRUE(hasVertex(side, Point2LL(from + config.side_overlap, config.side_height + config.side_thickness)));
        EXPECT_TRUE(hasVertex(side, Point2LL(to + config.side_overlap, config.side_height + config.side_thickness)));
        EXPECT_TRUE(hasVertex(side, Point2LL(from + config.side_overlap, -config.wall_thickness)));

        for (const coord_t slot_x : { config.min_overhang, config.ext_x - config.min_overhang - config.side_thickness })
        {
            EXPECT_TRUE(hasRect(bottom.canvas, Point2LL(slot_x, from), config.side_thickness, to - from));
            EXPECT_TRUE(hasRect(top.canvas, Point2LL(slot_x, from), config.side_thickness, to - from));
        }
    }
}

TEST_P(EnclosurePanelsTest, FrontFingersMeetSideSlots)
{
    const std::vector<std::pair<coord_t, coord_t>> slots = PanelOutlines::sideFaceSlotSpans(config);
    ASSERT_FALSE(slots.empty());
    EXPECT_GT(slots.front().first, 0) << "The first finger of the zone is kept flat.";
    EXPECT_LE(slots.back().second, config.side_height);

    const Polygon front = FingerOutline::build(PanelOutlines::frontBack(config));
    const Panel side = panels.sidePanel(SideHand::RIGHT);
    const coord_t side_width = config.interior_y + 2 * config.side_overlap;
    for (const auto& [from, to] : slots)
    {
        EXPECT_TRUE(hasVertex(front, Point2LL(-config.side_thickness, from + config.wall_thickness)));
        EXPECT_TRUE(hasVertex(front, Point2LL(config.front_panel_width + config.side_thickness, to + config.wall_thickness)));

        EXPECT_TRUE(hasRect(side.canvas, Point2LL(config.min_overhang, from), config.wall_thickness, to - from));
        EXPECT_TRUE(hasRect(side.canvas, Point2LL(side_width - config.min_overhang - config.wall_thickness, from), config.wall_thickness, to - from));
    }
}

TEST_P(EnclosurePanelsTest, DrawnOutlineIsTheJointOutline)
{
    const Panel side = panels.sidePanel(SideHand::LEFT);
    const PathShape* outline = outlineOf(side.canvas);
    ASSERT_NE(outline, nullptr);
    EXPECT_EQ(outline->points, FingerOutline::build(PanelOutlines::side(config)).getPoints());
    EXPECT_GT(FingerOutline::build(PanelOutlines::side(config)).area(), 0.0);
}

TEST_P(EnclosurePanelsTest, WritesFilesAndReview)
{
    const std::filesystem::path directory = std::filesystem::temp_directory_path() / ("kerf_panels_" + GetParam());
    std::filesystem::create_directories(directory);

    const std::vector<Panel> all = panels.generateAll();
    const std::vector<std::filesystem::path> written = EnclosurePanels::write(all, directory);
    ASSERT_EQ(written.size(), all.size());
    for (const std::filesystem::path& file_path : written)
    {
        EXPECT_TRUE(std::filesystem::exists(file_path)) << file_path;
    }

    const std::filesystem::path review = ReviewPage(config).save(directory, all);
    EXPECT_EQ(review.filename(), panel_files::review_page);
    EXPECT_TRUE(std::filesystem::exists(review));

    std::filesystem::remove_all(directory);
}

INSTANTIATE_TEST_SUITE_P(Presets, EnclosurePanelsTest, testing::Values("nas4", "nas2"));

TEST(ReviewPageTest, Heading)
{
    EXPECT_EQ(ReviewPage::heading("01_bottom_panel.svg"), "bottom panel");
    EXPECT_EQ(ReviewPage::heading("07_drive_comb_rail.svg"), "drive comb rail");
    EXPECT_EQ(ReviewPage::heading("front"), "front");
}

TEST(ReviewPageTest, EmbedsEveryPanelInOrder)
{
    const Settings preset = EnclosurePresets::load("nas4");
    const EnclosureConfig config(preset);
    const std::vector<Panel> all = EnclosurePanels(config).generateAll();

    std::vector<const Panel*> shuffled;
    for (auto panel = all.rbegin(); panel != all.rend(); ++panel)
    {
        shuffled.push_back(&*panel);
    }
    const std::string page = ReviewPage(config).toHtml(shuffled);

    size_t heading_count = 0;
    for (size_t position = page.find("<h2>"); position != std::string::npos; position = page.find("<h2>", position + 1))
    {
        heading_count++;
    }
    EXPECT_EQ(heading_count, 8);
    EXPECT_LT(page.find("<h2>bottom panel</h2>"), page.find("<h2>fan bracket</h2>")) << "Panels are shown in file name order.";
    EXPECT_NE(page.find("<td>195 x 126 x 323 mm</td>"), std::string::npos);
    EXPECT_NE(page.find("<td>185 x 120 mm</td>"), std::string::npos);
    EXPECT_NE(page.find("<td>8 SVG files</td>"), std::string::npos);
    EXPECT_EQ(page.find("<?xml"), std::string::npos) << "Inline drawings carry no XML declaration.";
}

} // namespace kerf
// NOLINTEND(*-magic-numbers)
