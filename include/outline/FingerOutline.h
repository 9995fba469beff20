// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef OUTLINE_FINGER_OUTLINE_H
#define OUTLINE_FINGER_OUTLINE_H

#include <array>
#include <utility>
#include <vector>

#include "geometry/Polygon.h"
#include "outline/EdgeProfile.h"

namespace kerf
{

/*!
 * The nominal rectangle of a panel and the joint policy of each of its edges.
 */
struct OutlineSpec
{
    coord_t width = 0;
    coord_t height = 0;
    coord_t finger_width = 0; //!< Target length of one segment of the finger pattern.
    std::array<EdgeProfile, 4> edges; //!< Indexed by EdgeSide.

    [[nodiscard]] const EdgeProfile& edge(const EdgeSide side) const
    {
        return edges[static_cast<size_t>(side)];
    }

    [[nodiscard]] EdgeProfile& edge(const EdgeSide side)
    {
        return edges[static_cast<size_t>(side)];
    }

    [[nodiscard]] coord_t edgeLength(const EdgeSide side) const
    {
        return (side == EdgeSide::TOP || side == EdgeSide::BOTTOM) ? width : height;
    }

    /*!
     * Full-edge finger patterns with one depth shared by the top and bottom edges and one by the left and right edges.
     */
    static OutlineSpec
        uniform(coord_t width, coord_t height, coord_t finger_width, EdgeMode top, EdgeMode right, EdgeMode bottom, EdgeMode left, coord_t top_bottom_depth, coord_t left_right_depth);
};

/*!
 * One run of constant offset along an edge.
 *
 * \p from and \p to are positions along the edge axis in walk order, so \p from is larger than \p to on the bottom and
 * left edges.
 */
struct SegmentEvent
{
    coord_t from;
    coord_t to;
    coord_t offset; //!< Signed outward offset of the run.
};

struct EdgeWalk
{
    EdgeSide side;
    std::vector<SegmentEvent> events; //!< Never empty, neighbouring runs always differ in offset.

    [[nodiscard]] coord_t firstOffset() const
    {
        return events.front().offset;
    }

    [[nodiscard]] coord_t lastOffset() const
    {
        return events.back().offset;
    }
};

/*!
 * \brief Builds the closed outline of a finger-jointed panel.
 *
 * Each edge is described by a list of runs (\ref walkEdge) and the four walks are joined at corner points derived from
 * the offsets on either side of the corner (\ref stitchCorner). No edge ever emits a corner point on its own, which is
 * what keeps the outline closed and free of spurs for every combination of edge modes.
 *
 * The outline starts at the top-left corner and runs clockwise on screen: top edge left to right, right edge
 * downwards, bottom edge right to left and left edge upwards.
 */
class FingerOutline
{
public:
    /*!
     * Number of pattern segments along a zone: the rounded length over finger width, at least three and always odd so
     * that the pattern starts and ends with a finger.
     */
    static size_t segmentCount(coord_t length, coord_t finger_width);

    /*!
     * Segment boundaries of a zone, from \p start to \p start + \p length inclusive.
     */
    static std::vector<coord_t> segmentBoundaries(coord_t start, coord_t length, coord_t finger_width);

    /*!
     * The finger segments of an edge, clipped to the edge and in ascending order.
     *
     * Panels use this to cut the slots that receive the fingers of a mating edge with the same pattern.
     */
    static std::vector<std::pair<coord_t, coord_t>> fingerSpans(const EdgeProfile& profile, coord_t edge_length, coord_t finger_width);

    static EdgeWalk walkEdge(const OutlineSpec& spec, EdgeSide side);

    /*!
     * The single outline point where \p incoming ends and \p outgoing starts.
     *
     * \throws exceptions::GeometryException if \p outgoing does not follow \p incoming in walk order.
     */
    static Point2LL stitchCorner(const OutlineSpec& spec, const EdgeWalk& incoming, const EdgeWalk& outgoing);

    /*!
     * \throws exceptions::GeometryException on non-positive dimensions or finger width, negative depths or
     * pattern lengths, opposite tab depths consuming the panel, a corner run shorter than the depth it meets, or
     * fingers of neighbouring edges that cross each other.
     */
    static Polygon build(const OutlineSpec& spec);

    static void validate(const OutlineSpec& spec);

    /*!
     * The point at position \p along on the edge axis of \p side, pushed \p offset away from the panel interior.
     */
    static Point2LL edgePoint(const OutlineSpec& spec, EdgeSide side, coord_t along, coord_t offset);
};

} // namespace kerf

#endif // OUTLINE_FINGER_OUTLINE_H
