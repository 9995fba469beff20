// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "outline/FingerOutline.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "utils/AABB.h"
#include "utils/exceptions.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

class FingerOutlineTest : public testing::Test
{
public:
    // 120x60mm, 12mm fingers, 3mm tabs top and bottom, 5mm protruding tabs left and right.
    OutlineSpec box_spec
        = OutlineSpec::uniform(MM2INT(120), MM2INT(60), MM2INT(12), EdgeMode::TAB, EdgeMode::OUTER_TAB, EdgeMode::TAB, EdgeMode::OUTER_TAB, MM2INT(3), MM2INT(5));

    //! No two consecutive points coincide, including the wrap from the last point to the first.
    static void expectNoCoincidentNeighbours(const Polygon& polygon)
    {
        ASSERT_GE(polygon.size(), 4);
        for (size_t point_idx = 0; point_idx < polygon.size(); ++point_idx)
        {
            const Point2LL& point = polygon[point_idx];
            const Point2LL& next = polygon[(point_idx + 1) % polygon.size()];
            EXPECT_FALSE(std::abs(point.X - next.X) < EPSILON && std::abs(point.Y - next.Y) < EPSILON) << "Points " << point_idx << " and the next coincide.";
        }
    }

    //! Every edge of the outline runs along one of the axes.
    static void expectAxisAligned(const Polygon& polygon)
    {
        for (size_t point_idx = 0; point_idx < polygon.size(); ++point_idx)
        {
            const Point2LL& point = polygon[point_idx];
            const Point2LL& next = polygon[(point_idx + 1) % polygon.size()];
            EXPECT_TRUE(point.X == next.X || point.Y == next.Y) << "Edge from point " << point_idx << " is diagonal.";
        }
    }

    //! No two edges that do not share a point touch. Axis aligned edges touch exactly when their boxes overlap.
    static void expectNoCrossingEdges(const Polygon& polygon)
    {
        const size_t count = polygon.size();
        for (size_t edge_idx = 0; edge_idx < count; ++edge_idx)
        {
            AABB edge_box(polygon[edge_idx], polygon[edge_idx]);
            edge_box.include(polygon[(edge_idx + 1) % count]);
            for (size_t other_idx = edge_idx + 2; other_idx < count; ++other_idx)
            {
                if (edge_idx == 0 && other_idx == count - 1)
                {
                    continue;
                }
                AABB other_box(polygon[other_idx], polygon[other_idx]);
                other_box.include(polygon[(other_idx + 1) % count]);
                EXPECT_FALSE(edge_box.hit(other_box)) << "Edges " << edge_idx << " and " << other_idx << " touch.";
            }
        }
    }
};

TEST_F(FingerOutlineTest, SegmentCountIsOddAndAtLeastThree)
{
    EXPECT_EQ(FingerOutline::segmentCount(MM2INT(120), MM2INT(12)), 11);
    EXPECT_EQ(FingerOutline::segmentCount(MM2INT(60), MM2INT(12)), 5);
    EXPECT_EQ(FingerOutline::segmentCount(MM2INT(10), MM2INT(12)), 3);
    EXPECT_EQ(FingerOutline::segmentCount(MM2INT(195), MM2INT(12)), 17);
    EXPECT_EQ(FingerOutline::segmentCount(MM2INT(120), MM2INT(11)), 11);
}

TEST_F(FingerOutlineTest, SegmentBoundariesCoverZone)
{
    const std::vector<coord_t> boundaries = FingerOutline::segmentBoundaries(MM2INT(-8), MM2INT(195), MM2INT(12));
    ASSERT_EQ(boundaries.size(), 18);
    EXPECT_EQ(boundaries.front(), MM2INT(-8));
    EXPECT_EQ(boundaries.back(), MM2INT(187));
    for (size_t boundary_idx = 1; boundary_idx < boundaries.size(); ++boundary_idx)
    {
        EXPECT_LT(boundaries[boundary_idx - 1], boundaries[boundary_idx]);
    }
}

TEST_F(FingerOutlineTest, TopEdgeHasElevenRuns)
{
    const EdgeWalk top = FingerOutline::walkEdge(box_spec, EdgeSide::TOP);
    ASSERT_EQ(top.events.size(), 11);

    size_t direction_changes = 0;
    for (size_t event_idx = 1; event_idx < top.events.size(); ++event_idx)
    {
        if (top.events[event_idx].offset != top.events[event_idx - 1].offset)
        {
            direction_changes++;
        }
        EXPECT_EQ(top.events[event_idx].from, top.events[event_idx - 1].to) << "Runs must be contiguous.";
    }
    EXPECT_EQ(direction_changes, 10);
    EXPECT_EQ(top.firstOffset(), MM2INT(-3));
    EXPECT_EQ(top.lastOffset(), MM2INT(-3));
    EXPECT_EQ(top.events.front().from, 0);
    EXPECT_EQ(top.events.back().to, MM2INT(120));
}

TEST_F(FingerOutlineTest, BottomEdgeWalksBackwards)
{
    const EdgeWalk bottom = FingerOutline::walkEdge(box_spec, EdgeSide::BOTTOM);
    ASSERT_EQ(bottom.events.size(), 11);
    EXPECT_EQ(bottom.events.front().from, MM2INT(120));
    EXPECT_EQ(bottom.events.back().to, 0);
    for (const SegmentEvent& event : bottom.events)
    {
        EXPECT_GT(event.from, event.to);
    }
}

TEST_F(FingerOutlineTest, BoxOutline)
{
    const Polygon outline = FingerOutline::build(box_spec);

    ASSERT_EQ(outline.size(), 60);
    EXPECT_EQ(outline.front(), Point2LL(MM2INT(-5), MM2INT(3)));
    EXPECT_NE(outline.front(), outline.back()) << "The outline is closed implicitly.";
    EXPECT_GT(outline.area(), 0.0);
    expectNoCoincidentNeighbours(outline);
    expectAxisAligned(outline);

    // The right edge protrudes 5mm on the fingers and sits on the nominal edge on the gaps.
    const Path right_edge{ { MM2INT(125), MM2INT(3) },  { MM2INT(125), MM2INT(12) }, { MM2INT(120), MM2INT(12) },
                           { MM2INT(120), MM2INT(24) }, { MM2INT(125), MM2INT(24) }, { MM2INT(125), MM2INT(36) },
                           { MM2INT(120), MM2INT(36) }, { MM2INT(120), MM2INT(48) }, { MM2INT(125), MM2INT(48) } };
    for (const Point2LL& expected : right_edge)
    {
        EXPECT_NE(std::find(outline.begin(), outline.end(), expected), outline.end()) << "Missing right edge point (" << expected.X << ", " << expected.Y << ").";
    }
}

TEST_F(FingerOutlineTest, CornersAreShared)
{
    const Polygon outline = FingerOutline::build(box_spec);
    for (const EdgeSide side : all_edge_sides)
    {
        const EdgeWalk incoming = FingerOutline::walkEdge(box_spec, previousEdgeSide(side));
        const EdgeWalk outgoing = FingerOutline::walkEdge(box_spec, side);
        const Point2LL corner = FingerOutline::stitchCorner(box_spec, incoming, outgoing);
        EXPECT_NE(std::find(outline.begin(), outline.end(), corner), outline.end()) << "Corner before the " << toString(side) << " edge is missing.";
    }
    // Top-left: the top tab pulls the corner down, the left tab pushes it out.
    EXPECT_EQ(FingerOutline::stitchCorner(box_spec, FingerOutline::walkEdge(box_spec, EdgeSide::LEFT), FingerOutline::walkEdge(box_spec, EdgeSide::TOP)), Point2LL(MM2INT(-5), MM2INT(3)));
}

TEST_F(FingerOutlineTest, StitchRejectsNonAdjacentEdges)
{
    const EdgeWalk top = FingerOutline::walkEdge(box_spec, EdgeSide::TOP);
    const EdgeWalk bottom = FingerOutline::walkEdge(box_spec, EdgeSide::BOTTOM);
    EXPECT_THROW(FingerOutline::stitchCorner(box_spec, top, bottom), exceptions::GeometryException);
}

TEST_F(FingerOutlineTest, MatingEdgesShareBoundaries)
{
    const coord_t length = MM2INT(185);
    const coord_t finger_width = MM2INT(12);
    const std::vector<std::pair<coord_t, coord_t>> tabs = FingerOutline::fingerSpans(EdgeProfile::fingers(EdgeMode::TAB, MM2INT(3)), length, finger_width);
    const std::vector<std::pair<coord_t, coord_t>> outer_tabs = FingerOutline::fingerSpans(EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(3)), length, finger_width);
    const std::vector<std::pair<coord_t, coord_t>> slots = FingerOutline::fingerSpans(EdgeProfile::fingers(EdgeMode::SLOT, MM2INT(5)), length, finger_width);

    EXPECT_EQ(tabs, outer_tabs);
    EXPECT_EQ(tabs, slots);
    EXPECT_EQ(tabs.size(), 8);
}

TEST_F(FingerOutlineTest, FlatRectangle)
{
    OutlineSpec spec;
    spec.width = MM2INT(50);
    spec.height = MM2INT(20);
    spec.finger_width = MM2INT(12);
    const Polygon outline = FingerOutline::build(spec);

    ASSERT_EQ(outline.size(), 4);
    EXPECT_EQ(outline[0], Point2LL(0, 0));
    EXPECT_EQ(outline[1], Point2LL(MM2INT(50), 0));
    EXPECT_EQ(outline[2], Point2LL(MM2INT(50), MM2INT(20)));
    EXPECT_EQ(outline[3], Point2LL(0, MM2INT(20)));
}

TEST_F(FingerOutlineTest, AllModeCombinationsAreSimple)
{
    const std::vector<EdgeMode> modes{ EdgeMode::FLAT, EdgeMode::TAB, EdgeMode::OUTER_TAB, EdgeMode::SLOT };
    for (const EdgeMode top : modes)
    {
        for (const EdgeMode right : modes)
        {
            for (const EdgeMode bottom : modes)
            {
                for (const EdgeMode left : modes)
                {
                    const OutlineSpec spec = OutlineSpec::uniform(MM2INT(97), MM2INT(53), MM2INT(10), top, right, bottom, left, MM2INT(3), MM2INT(5));
                    const Polygon outline = FingerOutline::build(spec);
                    expectNoCoincidentNeighbours(outline);
                    expectAxisAligned(outline);
                    expectNoCrossingEdges(outline);
                    EXPECT_GT(outline.area(), 0.0);
                }
            }
        }
    }
}

TEST_F(FingerOutlineTest, PatternZoneWithFlatExtensions)
{
    // A 100mm edge with the finger zone only over [20, 80].
    OutlineSpec spec;
    spec.width = MM2INT(100);
    spec.height = MM2INT(40);
    spec.finger_width = MM2INT(12);
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(3)).withPattern(MM2INT(20), MM2INT(60));

    const EdgeWalk top = FingerOutline::walkEdge(spec, EdgeSide::TOP);
    ASSERT_EQ(top.events.size(), 7);
    EXPECT_EQ(top.events.front().from, 0);
    EXPECT_EQ(top.events.front().to, MM2INT(20));
    EXPECT_EQ(top.events.front().offset, 0);
    EXPECT_EQ(top.events[1].offset, MM2INT(3));
    EXPECT_EQ(top.events.back().from, MM2INT(80));
    EXPECT_EQ(top.events.back().offset, 0);

    const std::vector<std::pair<coord_t, coord_t>> spans = FingerOutline::fingerSpans(spec.edge(EdgeSide::TOP), spec.width, spec.finger_width);
    ASSERT_EQ(spans.size(), 3);
    EXPECT_EQ(spans.front(), std::make_pair(MM2INT(20), MM2INT(32)));
    EXPECT_EQ(spans.back(), std::make_pair(MM2INT(68), MM2INT(80)));
}

TEST_F(FingerOutlineTest, SkippedEndsStayFlat)
{
    EdgeProfile profile = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(5));
    const std::vector<std::pair<coord_t, coord_t>> all = FingerOutline::fingerSpans(profile, MM2INT(60), MM2INT(12));
    const std::vector<std::pair<coord_t, coord_t>> skipped = FingerOutline::fingerSpans(profile.withSkippedEnds(), MM2INT(60), MM2INT(12));

    ASSERT_EQ(all.size(), 3);
    ASSERT_EQ(skipped.size(), 1);
    EXPECT_EQ(skipped.front(), all[1]);
}

TEST_F(FingerOutlineTest, RejectsInvalidInput)
{
    OutlineSpec zero_width = box_spec;
    zero_width.width = 0;
    EXPECT_THROW(FingerOutline::build(zero_width), exceptions::GeometryException);

    OutlineSpec negative_height = box_spec;
    negative_height.height = MM2INT(-10);
    EXPECT_THROW(FingerOutline::build(negative_height), exceptions::GeometryException);

    OutlineSpec no_fingers = box_spec;
    no_fingers.finger_width = 0;
    EXPECT_THROW(FingerOutline::build(no_fingers), exceptions::GeometryException);

    OutlineSpec negative_depth = box_spec;
    negative_depth.edge(EdgeSide::LEFT).depth = MM2INT(-1);
    EXPECT_THROW(FingerOutline::build(negative_depth), exceptions::GeometryException);

    // Tabs of 35mm top and bottom leave nothing of a 60mm high panel.
    OutlineSpec deep_tabs = OutlineSpec::uniform(MM2INT(120), MM2INT(60), MM2INT(12), EdgeMode::TAB, EdgeMode::FLAT, EdgeMode::TAB, EdgeMode::FLAT, MM2INT(35), 0);
    EXPECT_THROW(FingerOutline::build(deep_tabs), exceptions::GeometryException);

    OutlineSpec empty_zone = box_spec;
    empty_zone.edge(EdgeSide::TOP).withPattern(0, 0);
    EXPECT_THROW(FingerOutline::build(empty_zone), exceptions::GeometryException);
}

TEST_F(FingerOutlineTest, RejectsTabsDeeperThanCornerRun)
{
    // 10mm deep tabs on the left eat the whole first 8mm run of the top edge.
    OutlineSpec spec = OutlineSpec::uniform(MM2INT(40), MM2INT(40), MM2INT(8), EdgeMode::FLAT, EdgeMode::FLAT, EdgeMode::FLAT, EdgeMode::TAB, 0, MM2INT(10));
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(2)).withPattern(MM2INT(8), MM2INT(24));
    EXPECT_THROW(FingerOutline::build(spec), exceptions::GeometryException);
}

TEST_F(FingerOutlineTest, RejectsFingersCrossingNeighbourRecess)
{
    // The first top finger starts 1mm from the corner and drops 6mm, across the 2mm left recess that runs down from 2mm.
    OutlineSpec spec;
    spec.width = MM2INT(100);
    spec.height = MM2INT(60);
    spec.finger_width = MM2INT(12);
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(6)).withPattern(MM2INT(1), MM2INT(98));
    spec.edge(EdgeSide::LEFT) = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(2)).withPattern(MM2INT(2), MM2INT(56));
    EXPECT_THROW(FingerOutline::build(spec), exceptions::GeometryException);

    // The same fingers starting clear of the recess are fine.
    spec.edge(EdgeSide::TOP).withPattern(MM2INT(10), MM2INT(80));
    spec.edge(EdgeSide::LEFT).withPattern(MM2INT(10), MM2INT(40));
    EXPECT_TRUE(FingerOutline::build(spec).isSimple());
}

struct ZonedOutline
{
    std::string name;
    OutlineSpec spec;
};

ZonedOutline zonedOutline(std::string name, const coord_t width, const coord_t height, const coord_t finger_width, const std::array<EdgeProfile, 4>& edges)
{
    ZonedOutline zoned{ std::move(name), OutlineSpec{} };
    zoned.spec.width = width;
    zoned.spec.height = height;
    zoned.spec.finger_width = finger_width;
    zoned.spec.edges = edges;
    return zoned;
}

std::vector<ZonedOutline> zonedOutlines()
{
    // Front panel of the four drive enclosure: notched top and bottom zones starting before the panel edge, side
    // fingers over the side panel height only.
    const EdgeProfile front_notches_top = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(3)).withPattern(MM2INT(-8), MM2INT(195));
    const EdgeProfile front_notches_bottom = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(5)).withPattern(MM2INT(-8), MM2INT(195));
    const EdgeProfile front_side_fingers = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(5)).withPattern(MM2INT(3), MM2INT(315.24)).withSkippedEnds();

    const EdgeProfile past_both_ends = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(3)).withPattern(MM2INT(-8), MM2INT(116));
    const EdgeProfile past_both_ends_tab = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(3)).withPattern(MM2INT(-8), MM2INT(116));
    const EdgeProfile skipped_protrusions = EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(5)).withSkippedEnds();
    const EdgeProfile skipped_tabs = EdgeProfile::fingers(EdgeMode::TAB, MM2INT(3)).withSkippedEnds();

    return {
        zonedOutline("FrontPanel", MM2INT(179), MM2INT(323.24), MM2INT(12), { front_notches_top, front_side_fingers, front_notches_bottom, front_side_fingers }),
        zonedOutline(
            "SidePanel",
            MM2INT(132),
            MM2INT(315.24),
            MM2INT(12),
            { EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(3)).withPattern(MM2INT(6), MM2INT(120)),
              EdgeProfile::flat(),
              EdgeProfile::fingers(EdgeMode::OUTER_TAB, MM2INT(5)).withPattern(MM2INT(6), MM2INT(120)),
              EdgeProfile::flat() }),
        zonedOutline("ZonesPastBothEnds", MM2INT(100), MM2INT(60), MM2INT(12), { past_both_ends, skipped_protrusions, past_both_ends_tab, skipped_protrusions }),
        zonedOutline("SkippedTabsAllRound", MM2INT(97), MM2INT(53), MM2INT(10), { skipped_tabs, skipped_tabs, skipped_tabs, skipped_tabs }),
        zonedOutline(
            "InnerZones",
            MM2INT(100),
            MM2INT(60),
            MM2INT(12),
            { EdgeProfile::fingers(EdgeMode::TAB, MM2INT(4)).withPattern(MM2INT(10), MM2INT(80)),
              EdgeProfile::flat(),
              EdgeProfile::flat(),
              EdgeProfile::fingers(EdgeMode::TAB, MM2INT(4)).withPattern(MM2INT(10), MM2INT(40)) }),
    };
}

class ZonedOutlineTest : public testing::TestWithParam<ZonedOutline>
{
};

TEST_P(ZonedOutlineTest, IsSimple)
{
    const Polygon outline = FingerOutline::build(GetParam().spec);
    FingerOutlineTest::expectNoCoincidentNeighbours(outline);
    FingerOutlineTest::expectAxisAligned(outline);
    FingerOutlineTest::expectNoCrossingEdges(outline);
    EXPECT_TRUE(outline.isSimple());
    EXPECT_GT(outline.area(), 0.0);
}

INSTANTIATE_TEST_SUITE_P(
    FingerOutline,
    ZonedOutlineTest,
    testing::ValuesIn(zonedOutlines()),
    [](const testing::TestParamInfo<ZonedOutline>& info)
    {
        return info.param.name;
    });

} // namespace kerf
// NOLINTEND(*-magic-numbers)
