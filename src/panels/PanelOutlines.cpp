// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "panels/PanelOutlines.h"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "settings/EnclosureConfig.h"

namespace kerf
{

namespace
{

std::vector<std::pair<coord_t, coord_t>> shiftSpans(const std::vector<std::pair<coord_t, coord_t>>& spans, const coord_t shift)
{
    return spans
         | ranges::views::transform(
               [shift](const std::pair<coord_t, coord_t>& span)
               {
                   return std::make_pair(span.first + shift, span.second + shift);
               })
         | ranges::to_vector;
}

} // namespace

OutlineSpec PanelOutlines::topBottom(const EnclosureConfig& config)
{
    OutlineSpec spec;
    spec.width = config.ext_x;
    spec.height = config.interior_y;
    spec.finger_width = config.finger_width;
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, config.wall_thickness);
    spec.edge(EdgeSide::BOTTOM) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, config.wall_thickness);
    return spec;
}

OutlineSpec PanelOutlines::frontBack(const EnclosureConfig& config)
{
    // Front/back x = 0 lies on the side panel inner face, which is this far in from the top/bottom panel edge.
    const coord_t notch_offset = config.min_overhang + config.side_thickness;

    OutlineSpec spec;
    spec.width = config.front_panel_width;
    spec.height = config.front_panel_height;
    spec.finger_width = config.finger_width;
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::TAB, config.wall_thickness).withPattern(-notch_offset, config.ext_x);
    spec.edge(EdgeSide::BOTTOM) = EdgeProfile::fingers(EdgeMode::TAB, config.side_thickness).withPattern(-notch_offset, config.ext_x);
    // The finger zone covers the side panel height. Above and below it the panel reaches into the top and bottom panels.
    spec.edge(EdgeSide::LEFT) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, config.side_thickness).withPattern(config.wall_thickness, config.side_height).withSkippedEnds();
    spec.edge(EdgeSide::RIGHT) = spec.edge(EdgeSide::LEFT);
    return spec;
}

OutlineSpec PanelOutlines::side(const EnclosureConfig& config)
{
    OutlineSpec spec;
    spec.width = config.interior_y + 2 * config.side_overlap;
    spec.height = config.side_height;
    spec.finger_width = config.finger_width;
    spec.edge(EdgeSide::TOP) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, config.wall_thickness).withPattern(config.side_overlap, config.interior_y);
    spec.edge(EdgeSide::BOTTOM) = EdgeProfile::fingers(EdgeMode::OUTER_TAB, config.side_thickness).withPattern(config.side_overlap, config.interior_y);
    return spec;
}

std::vector<std::pair<coord_t, coord_t>> PanelOutlines::topBottomSideSlotSpans(const EnclosureConfig& config)
{
    const OutlineSpec side_spec = side(config);
    const std::vector<std::pair<coord_t, coord_t>> tabs = FingerOutline::fingerSpans(side_spec.edge(EdgeSide::BOTTOM), side_spec.width, side_spec.finger_width);
    return shiftSpans(tabs, -config.side_overlap);
}

std::vector<std::pair<coord_t, coord_t>> PanelOutlines::sideFaceSlotSpans(const EnclosureConfig& config)
{
    const OutlineSpec front_spec = frontBack(config);
    const EdgeProfile& tab_edge = front_spec.edge(EdgeSide::LEFT);
    const std::vector<std::pair<coord_t, coord_t>> tabs = FingerOutline::fingerSpans(tab_edge, front_spec.height, front_spec.finger_width);
    return shiftSpans(tabs, -tab_edge.pattern_start.value_or(0));
}

} // namespace kerf
