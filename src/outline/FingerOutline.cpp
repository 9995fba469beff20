// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "outline/FingerOutline.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exceptions.h"

namespace kerf
{

namespace
{

struct ZoneSegment
{
    coord_t from;
    coord_t to;
    bool is_finger;
};

Point2LL outwardNormal(const EdgeSide side)
{
    switch (side)
    {
    case EdgeSide::TOP:
        return Point2LL(0, -1);
    case EdgeSide::RIGHT:
        return Point2LL(1, 0);
    case EdgeSide::BOTTOM:
        return Point2LL(0, 1);
    case EdgeSide::LEFT:
        return Point2LL(-1, 0);
    }
    return Point2LL(0, 0);
}

//! Nominal rectangle corner at which the walk of \p side ends.
Point2LL nominalEnd(const OutlineSpec& spec, const EdgeSide side)
{
    switch (side)
    {
    case EdgeSide::TOP:
        return Point2LL(spec.width, 0);
    case EdgeSide::RIGHT:
        return Point2LL(spec.width, spec.height);
    case EdgeSide::BOTTOM:
        return Point2LL(0, spec.height);
    case EdgeSide::LEFT:
        return Point2LL(0, 0);
    }
    return Point2LL(0, 0);
}

bool walksAscending(const EdgeSide side)
{
    return side == EdgeSide::TOP || side == EdgeSide::RIGHT;
}

/*!
 * The pattern zone of an edge cut into finger and gap segments, clipped to the edge, with flat extensions where the
 * zone does not cover the edge. Ascending, contiguous and covering exactly [0, edge_length].
 */
std::vector<ZoneSegment> zoneSegments(const EdgeProfile& profile, const coord_t edge_length, const coord_t finger_width)
{
    std::vector<ZoneSegment> segments;
    auto append = [&segments](const coord_t from, const coord_t to, const bool is_finger)
    {
        if (to > from)
        {
            segments.push_back(ZoneSegment{ from, to, is_finger });
        }
    };
    auto clip = [edge_length](const coord_t along)
    {
        return std::clamp(along, coord_t(0), edge_length);
    };

    if (profile.mode == EdgeMode::FLAT)
    {
        append(0, edge_length, false);
        return segments;
    }

    const coord_t zone_start = profile.pattern_start.value_or(0);
    const coord_t zone_length = profile.pattern_length.value_or(edge_length);
    const std::vector<coord_t> boundaries = FingerOutline::segmentBoundaries(zone_start, zone_length, finger_width);
    const size_t segment_count = boundaries.size() - 1;

    append(0, clip(boundaries.front()), false);
    for (size_t segment_idx = 0; segment_idx < segment_count; ++segment_idx)
    {
        const bool is_end = segment_idx == 0 || segment_idx == segment_count - 1;
        const bool is_finger = segment_idx % 2 == 0 && ! (profile.skip_ends && is_end);
        append(clip(boundaries[segment_idx]), clip(boundaries[segment_idx + 1]), is_finger);
    }
    append(clip(boundaries.back()), edge_length, false);
    return segments;
}

//! Length along the edge axis of a run, regardless of walk direction.
coord_t runLength(const SegmentEvent& event)
{
    return std::abs(event.to - event.from);
}

void checkCornerClearance(const std::array<EdgeWalk, 4>& walks)
{
    for (const EdgeSide side : all_edge_sides)
    {
        const EdgeWalk& walk = walks[static_cast<size_t>(side)];
        const coord_t before = walks[static_cast<size_t>(previousEdgeSide(side))].lastOffset();
        const coord_t after = walks[static_cast<size_t>(nextEdgeSide(side))].firstOffset();

        // A neighbouring inward offset shortens the end runs of this edge, a neighbouring protrusion lengthens them.
        const bool clear = walk.events.size() == 1 ? runLength(walk.events.front()) + before + after > 0
                                                   : runLength(walk.events.front()) + before > 0 && runLength(walk.events.back()) + after > 0;
        if (! clear)
        {
            throw exceptions::GeometryException(fmt::format("the {} edge has an end segment shorter than the depth of the adjacent edge", toString(side)));
        }
    }
}

} // namespace

OutlineSpec OutlineSpec::uniform(
    const coord_t width,
    const coord_t height,
    const coord_t finger_width,
    const EdgeMode top,
    const EdgeMode right,
    const EdgeMode bottom,
    const EdgeMode left,
    const coord_t top_bottom_depth,
    const coord_t left_right_depth)
{
    OutlineSpec spec;
    spec.width = width;
    spec.height = height;
    spec.finger_width = finger_width;
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(top, top_bottom_depth);
    spec.edge(EdgeSide::RIGHT) = EdgeProfile::fingers(right, left_right_depth);
    spec.edge(EdgeSide::BOTTOM) = EdgeProfile::fingers(bottom, top_bottom_depth);
    spec.edge(EdgeSide::LEFT) = EdgeProfile::fingers(left, left_right_depth);
    return spec;
}

size_t FingerOutline::segmentCount(const coord_t length, const coord_t finger_width)
{
    const double ratio = static_cast<double>(length) / static_cast<double>(finger_width);
    // Ties round to even, so a zone of exactly 2.5 finger widths gets 2 segments and then 3.
    size_t count = static_cast<size_t>(std::max(3LL, static_cast<long long>(std::llrint(ratio))));
    if (count % 2 == 0)
    {
        count++;
    }
    return count;
}

std::vector<coord_t> FingerOutline::segmentBoundaries(const coord_t start, const coord_t length, const coord_t finger_width)
{
    const size_t count = segmentCount(length, finger_width);
    std::vector<coord_t> boundaries;
    boundaries.reserve(count + 1);
    for (size_t boundary_idx = 0; boundary_idx <= count; ++boundary_idx)
    {
        boundaries.push_back(start + std::llrint(static_cast<double>(boundary_idx) * static_cast<double>(length) / static_cast<double>(count)));
    }
    return boundaries;
}

std::vector<std::pair<coord_t, coord_t>> FingerOutline::fingerSpans(const EdgeProfile& profile, const coord_t edge_length, const coord_t finger_width)
{
    std::vector<std::pair<coord_t, coord_t>> spans;
    for (const ZoneSegment& segment : zoneSegments(profile, edge_length, finger_width))
    {
        if (segment.is_finger)
        {
            spans.emplace_back(segment.from, segment.to);
        }
    }
    return spans;
}

EdgeWalk FingerOutline::walkEdge(const OutlineSpec& spec, const EdgeSide side)
{
    const EdgeProfile& profile = spec.edge(side);
    const coord_t finger_offset = profile.outwardOffset();

    EdgeWalk walk{ side, {} };
    for (const ZoneSegment& segment : zoneSegments(profile, spec.edgeLength(side), spec.finger_width))
    {
        const coord_t offset = segment.is_finger ? finger_offset : 0;
        if (! walk.events.empty() && walk.events.back().offset == offset)
        {
            walk.events.back().to = segment.to;
            continue;
        }
        walk.events.push_back(SegmentEvent{ segment.from, segment.to, offset });
    }

    if (! walksAscending(side))
    {
        std::reverse(walk.events.begin(), walk.events.end());
        for (SegmentEvent& event : walk.events)
        {
            std::swap(event.from, event.to);
        }
    }
    return walk;
}

Point2LL FingerOutline::stitchCorner(const OutlineSpec& spec, const EdgeWalk& incoming, const EdgeWalk& outgoing)
{
    if (outgoing.side != nextEdgeSide(incoming.side))
    {
        throw exceptions::GeometryException(fmt::format("cannot join the {} edge to the {} edge", toString(incoming.side), toString(outgoing.side)));
    }
    return nominalEnd(spec, incoming.side) + outwardNormal(incoming.side) * incoming.lastOffset() + outwardNormal(outgoing.side) * outgoing.firstOffset();
}

Point2LL FingerOutline::edgePoint(const OutlineSpec& spec, const EdgeSide side, const coord_t along, const coord_t offset)
{
    switch (side)
    {
    case EdgeSide::TOP:
        return Point2LL(along, -offset);
    case EdgeSide::RIGHT:
        return Point2LL(spec.width + offset, along);
    case EdgeSide::BOTTOM:
        return Point2LL(along, spec.height + offset);
    case EdgeSide::LEFT:
        return Point2LL(-offset, along);
    }
    return Point2LL(along, 0);
}

void FingerOutline::validate(const OutlineSpec& spec)
{
    if (spec.width <= 0 || spec.height <= 0)
    {
        throw exceptions::GeometryException(fmt::format("panel size {}x{}mm must be positive", INT2MM(spec.width), INT2MM(spec.height)));
    }
    if (spec.finger_width <= 0)
    {
        throw exceptions::GeometryException(fmt::format("finger width {}mm must be positive", INT2MM(spec.finger_width)));
    }
    for (const EdgeSide side : all_edge_sides)
    {
        const EdgeProfile& profile = spec.edge(side);
        if (profile.depth < 0)
        {
            throw exceptions::GeometryException(fmt::format("the {} edge has a negative depth of {}mm", toString(side), INT2MM(profile.depth)));
        }
        if (profile.pattern_length.has_value() && profile.pattern_length.value() <= 0)
        {
            throw exceptions::GeometryException(fmt::format("the {} edge has a pattern length of {}mm", toString(side), INT2MM(profile.pattern_length.value())));
        }
    }
    if (spec.edge(EdgeSide::TOP).inwardDepth() + spec.edge(EdgeSide::BOTTOM).inwardDepth() >= spec.height)
    {
        throw exceptions::GeometryException(fmt::format("top and bottom tabs consume the full panel height of {}mm", INT2MM(spec.height)));
    }
    if (spec.edge(EdgeSide::LEFT).inwardDepth() + spec.edge(EdgeSide::RIGHT).inwardDepth() >= spec.width)
    {
        throw exceptions::GeometryException(fmt::format("left and right tabs consume the full panel width of {}mm", INT2MM(spec.width)));
    }
}

Polygon FingerOutline::build(const OutlineSpec& spec)
{
    validate(spec);

    std::array<EdgeWalk, 4> walks;
    for (const EdgeSide side : all_edge_sides)
    {
        walks[static_cast<size_t>(side)] = walkEdge(spec, side);
    }
    checkCornerClearance(walks);

    // corners[k] is where the walk of edge k starts.
    std::array<Point2LL, 4> corners;
    for (const EdgeSide side : all_edge_sides)
    {
        corners[static_cast<size_t>(side)] = stitchCorner(spec, walks[static_cast<size_t>(previousEdgeSide(side))], walks[static_cast<size_t>(side)]);
    }

    Path points;
    for (const EdgeSide side : all_edge_sides)
    {
        const std::vector<SegmentEvent>& events = walks[static_cast<size_t>(side)].events;
        for (size_t event_idx = 0; event_idx < events.size(); ++event_idx)
        {
            const SegmentEvent& event = events[event_idx];
            const bool is_first = event_idx == 0;
            const bool is_last = event_idx == events.size() - 1;
            points.push_back(is_first ? corners[static_cast<size_t>(side)] : edgePoint(spec, side, event.from, event.offset));
            if (! is_last)
            {
                points.push_back(edgePoint(spec, side, event.to, event.offset));
            }
            // The end of the last run is the start corner of the next edge.
        }
    }

    Polygon outline(std::move(points));
    outline.mergeCoincidentPoints();
    if (! outline.isSimple())
    {
        // A finger moved off the corner by a pattern zone or skipped ends can still reach across the neighbouring recess.
        throw exceptions::GeometryException(fmt::format("the joints of the {}x{}mm outline cross each other near a corner", INT2MM(spec.width), INT2MM(spec.height)));
    }
    spdlog::debug("Built {}x{}mm outline with {} points", INT2MM(spec.width), INT2MM(spec.height), outline.size());
    return outline;
}

} // namespace kerf
