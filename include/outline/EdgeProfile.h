// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef OUTLINE_EDGE_PROFILE_H
#define OUTLINE_EDGE_PROFILE_H

#include <array>
#include <optional>
#include <string_view>

#include "utils/Coord_t.h"

namespace kerf
{

/*!
 * How the finger segments of an edge deviate from the nominal rectangle side.
 */
enum class EdgeMode
{
    FLAT, //!< No perturbation.
    TAB, //!< Finger segments recede into the panel, to seat in a mating slot.
    OUTER_TAB, //!< Finger segments protrude, to pass through a slot in the mating panel.
    SLOT, //!< Finger segments protrude. Same geometry as OUTER_TAB, named for the mating side.
};

/*!
 * The sides of a rectangle, in the order the outline walks them.
 */
enum class EdgeSide
{
    TOP = 0,
    RIGHT = 1,
    BOTTOM = 2,
    LEFT = 3,
};

constexpr std::array<EdgeSide, 4> all_edge_sides{ EdgeSide::TOP, EdgeSide::RIGHT, EdgeSide::BOTTOM, EdgeSide::LEFT };

[[nodiscard]] constexpr EdgeSide nextEdgeSide(const EdgeSide side)
{
    return static_cast<EdgeSide>((static_cast<int>(side) + 1) % 4);
}

[[nodiscard]] constexpr EdgeSide previousEdgeSide(const EdgeSide side)
{
    return static_cast<EdgeSide>((static_cast<int>(side) + 3) % 4);
}

[[nodiscard]] constexpr std::string_view toString(const EdgeSide side)
{
    switch (side)
    {
    case EdgeSide::TOP:
        return "top";
    case EdgeSide::RIGHT:
        return "right";
    case EdgeSide::BOTTOM:
        return "bottom";
    case EdgeSide::LEFT:
        return "left";
    }
    return "unknown";
}

/*!
 * \brief The joint policy of one edge of a panel.
 *
 * Positions along the edge are measured from the left end for the top and bottom edges and from the top end for the
 * left and right edges, independent of the direction in which the outline walks the edge.
 *
 * By default the finger pattern spans the whole edge. A pattern zone can be set to line the fingers up with a mating
 * panel of a different size: the zone may start before the edge (negative start) or run past its end, in which case the
 * segments are clipped to the edge. The edge outside the zone is flat.
 */
struct EdgeProfile
{
    EdgeMode mode = EdgeMode::FLAT;
    coord_t depth = 0;
    bool skip_ends = false; //!< Keep the first and the last finger of the zone flat.
    std::optional<coord_t> pattern_start;
    std::optional<coord_t> pattern_length;

    static EdgeProfile flat()
    {
        return EdgeProfile{};
    }

    static EdgeProfile fingers(const EdgeMode mode, const coord_t depth)
    {
        EdgeProfile profile;
        profile.mode = mode;
        profile.depth = depth;
        return profile;
    }

    EdgeProfile& withPattern(const coord_t start, const coord_t length)
    {
        pattern_start = start;
        pattern_length = length;
        return *this;
    }

    EdgeProfile& withSkippedEnds()
    {
        skip_ends = true;
        return *this;
    }

    /*!
     * Signed offset of a finger segment away from the panel interior: negative for a tab, positive for a protrusion.
     */
    [[nodiscard]] coord_t outwardOffset() const
    {
        switch (mode)
        {
        case EdgeMode::TAB:
            return -depth;
        case EdgeMode::OUTER_TAB:
        case EdgeMode::SLOT:
            return depth;
        case EdgeMode::FLAT:
            break;
        }
        return 0;
    }

    /*!
     * How far finger segments cut into the panel, zero if they protrude.
     */
    [[nodiscard]] coord_t inwardDepth() const
    {
        return mode == EdgeMode::TAB ? depth : 0;
    }
};

} // namespace kerf

#endif // OUTLINE_EDGE_PROFILE_H
