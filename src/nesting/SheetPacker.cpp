// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "nesting/SheetPacker.h"


#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "nesting/AffineTransform.h"
#include "nesting/GeometryExtractor.h"
#include "panels/PanelFiles.h"
#include "settings/EnclosureConfig.h"

namespace kerf
{

namespace
{

std::string sizeString(const PanelGeometry& part)
{
    return fmt::format("{}x{}mm", ShapeCanvas::formatMM(part.content_width), ShapeCanvas::formatMM(part.content_height));
}

} // namespace

SheetPacker::SheetPacker(const EnclosureConfig& config)
    : config_(config)
{
}

PanelGeometry SheetPacker::load(const std::filesystem::path& panel_directory, std::string_view file_name, const bool keep_engrave) const
{
    return GeometryExtractor::parseFile(panel_directory / file_name, keep_engrave, config_.fabrication_stroke_width);
}

Sheet SheetPacker::pack3mmSheet(const PanelGeometry& front, const PanelGeometry& back, const PanelGeometry& top) const
{
    const std::string thickness = ShapeCanvas::formatMM(config_.wall_thickness);
    spdlog::info("Front: {}", sizeString(front));
    spdlog::info("Back:  {}", sizeString(back));
    spdlog::info("Top:   {} (rotating 90° CW)", sizeString(top));

    Sheet sheet(fmt::format("{}mm sheet", thickness), config_.sheet_width, config_.sheet_height);
    const Point2LL front_position(0, 0);
    const Point2LL back_position(front.content_width + config_.sheet_gap, 0);
    const Point2LL top_position(back_position.X + back.content_width + config_.sheet_gap, 0);

    sheet.place(front, Rotation::NONE, front_position);
    sheet.place(back, Rotation::NONE, back_position);
    sheet.place(top, Rotation::CW90, top_position);

    sheet.addLabel(fmt::format("FRONT ({}mm)", thickness), front_position);
    sheet.addLabel(fmt::format("BACK ({}mm)", thickness), back_position);
    sheet.addLabel(fmt::format("TOP ({}mm, rotated)", thickness), top_position);

    sheet.checkBounds();
    return sheet;
}

PanelGeometry SheetPacker::interleaveCombRails(const PanelGeometry& comb) const
{
    const coord_t second_rail_x = config_.comb_interleave_dx + config_.comb_interleave_extra;
    const coord_t second_rail_y = config_.comb_bar_height + config_.sheet_gap;

    PanelGeometry assembly;
    assembly.content_width = second_rail_x + comb.content_width;
    assembly.content_height = second_rail_y + comb.content_height;
    assembly.primitives = comb.primitives;

    const PanelGeometry second_rail = AffineTransform::translate(AffineTransform::rotate180(comb), second_rail_x, second_rail_y);
    assembly.primitives.insert(assembly.primitives.end(), second_rail.primitives.begin(), second_rail.primitives.end());

    const coord_t saved = 2 * comb.content_height + config_.sheet_gap - assembly.content_height;
    spdlog::info("Interleaved combs: {} (saved {}mm vs stacked)", sizeString(assembly), ShapeCanvas::formatMM(saved));
    return assembly;
}

Sheet SheetPacker::pack5mmSheet(const PanelGeometry& bottom, const PanelGeometry& left, const PanelGeometry& right, const PanelGeometry& comb, const PanelGeometry& fan) const
{
    const std::string thickness = ShapeCanvas::formatMM(config_.side_thickness);
    spdlog::info("Bottom:      {}", sizeString(bottom));
    spdlog::info("Left side:   {}", sizeString(left));
    spdlog::info("Right side:  {}", sizeString(right));
    spdlog::info("Comb rail:   {} (x2, interleaved)", sizeString(comb));
    spdlog::info("Fan bracket: {}", sizeString(fan));

    Sheet sheet(fmt::format("{}mm sheet", thickness), config_.sheet_width, config_.sheet_height);

    // Column 1: the side panels.
    const Point2LL left_position(0, 0);
    const Point2LL right_position(left.content_width + config_.sheet_gap, 0);
    const coord_t column_width = left.content_width + config_.sheet_gap + right.content_width;
    const coord_t column_height = left.content_height;

    // Column 2: comb rails at the top, fan bracket aligned with the bottom of the side panels.
    const Point2LL combs_position(column_width + config_.sheet_gap, 0);
    const Point2LL fan_position(combs_position.X, column_height - fan.content_height);

    // Column 3: the bottom panel, pulled back over the fan bracket column.
    const Point2LL bottom_position(fan_position.X + fan.content_width + config_.sheet_gap - config_.bottom_panel_shift, 0);

    sheet.place(left, Rotation::NONE, left_position);
    sheet.place(right, Rotation::NONE, right_position);
    const AABB combs_footprint = sheet.place(interleaveCombRails(comb), Rotation::CW90, combs_position);
    sheet.place(fan, Rotation::NONE, fan_position);
    sheet.place(bottom, Rotation::CW90, bottom_position);
    spdlog::debug("Combs rotated 90°: {}x{}mm", ShapeCanvas::formatMM(combs_footprint.width()), ShapeCanvas::formatMM(combs_footprint.height()));

    sheet.addLabel(fmt::format("LEFT SIDE ({}mm)", thickness), left_position);
    sheet.addLabel(fmt::format("RIGHT SIDE ({}mm)", thickness), right_position);
    sheet.addLabel(fmt::format("COMB RAILS ({}mm, interleaved+90°)", thickness), combs_position);
    sheet.addLabel(fmt::format("FAN BRACKET ({}mm)", thickness), fan_position);
    sheet.addLabel(fmt::format("BOTTOM ({}mm, 90°)", thickness), bottom_position);

    sheet.checkBounds();
    return sheet;
}

Sheet SheetPacker::pack3mmSheet(const std::filesystem::path& panel_directory) const
{
    return pack3mmSheet(load(panel_directory, panel_files::front), load(panel_directory, panel_files::back, true), load(panel_directory, panel_files::top));
}

Sheet SheetPacker::pack5mmSheet(const std::filesystem::path& panel_directory) const
{
    return pack5mmSheet(
        load(panel_directory, panel_files::bottom),
        load(panel_directory, panel_files::left_side),
        load(panel_directory, panel_files::right_side),
        load(panel_directory, panel_files::comb_rail),
        load(panel_directory, panel_files::fan_bracket));
}

} // namespace kerf
