// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "settings/EnclosureConfig.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "settings/Settings.h"
#include "utils/exceptions.h"

namespace kerf
{

namespace
{

coord_t roundUpTo(const coord_t value, const coord_t multiple)
{
    return ((value + multiple - 1) / multiple) * multiple;
}

} // namespace

EnclosureConfig::EnclosureConfig(const Settings& settings)
    : wall_thickness(settings.get<coord_t>("wall_thickness"))
    , side_thickness(settings.get<coord_t>("side_thickness"))
    , bracket_thickness(settings.get<coord_t>("bracket_thickness"))
    , finger_width(settings.get<coord_t>("finger_width"))
    , min_overhang(settings.get<coord_t>("min_overhang"))
    , side_overhang(settings.get<coord_t>("side_overhang"))
    , rod_diameter(settings.get<coord_t>("rod_diameter"))
    , rod_hole_diameter(settings.get<coord_t>("rod_hole_diameter"))
    , grommet_diameter(settings.get<coord_t>("grommet_diameter"))
    , pi5_length(settings.get<coord_t>("pi5_length"))
    , pi5_width(settings.get<coord_t>("pi5_width"))
    , pi5_hole_spacing_x(settings.get<coord_t>("pi5_hole_spacing_x"))
    , pi5_hole_spacing_y(settings.get<coord_t>("pi5_hole_spacing_y"))
    , pi5_hole_diameter(settings.get<coord_t>("pi5_hole_diameter"))
    , pi5_hole_offset_x(settings.get<coord_t>("pi5_hole_offset_x"))
    , pi5_hole_offset_y(settings.get<coord_t>("pi5_hole_offset_y"))
    , hat_length(settings.get<coord_t>("hat_length"))
    , hat_width(settings.get<coord_t>("hat_width"))
    , drive_count(settings.get<size_t>("drive_count"))
    , hdd_length(settings.get<coord_t>("hdd_length"))
    , hdd_width(settings.get<coord_t>("hdd_width"))
    , hdd_thickness(settings.get<coord_t>("hdd_thickness"))
    , hdd_side_hole_z(settings.get<std::vector<coord_t>>("hdd_side_hole_z"))
    , drive_gap(settings.get<coord_t>("drive_gap"))
    , drive_edge_margin(settings.get<coord_t>("drive_edge_margin"))
    , fan_size(settings.get<coord_t>("fan_size"))
    , fan_depth(settings.get<coord_t>("fan_depth"))
    , fan_hole_spacing(settings.get<coord_t>("fan_hole_spacing"))
    , fan_mount_hole(settings.get<coord_t>("fan_mount_hole"))
    , fan_gap(settings.get<coord_t>("fan_gap"))
    , fan_top_clearance(settings.get<coord_t>("fan_top_clearance"))
    , cable_zone_height(settings.get<coord_t>("cable_zone_height"))
    , pi5_standoff_height(settings.get<coord_t>("pi5_standoff_height"))
    , pi5_envelope_height(settings.get<coord_t>("pi5_envelope_height"))
    , pi5_to_hat_gap(settings.get<coord_t>("pi5_to_hat_gap"))
    , hat_envelope_height(settings.get<coord_t>("hat_envelope_height"))
    , comb_bar_height(settings.get<coord_t>("comb_bar_height"))
    , comb_tooth_width(settings.get<coord_t>("comb_tooth_width"))
    , screw_head_clearance(settings.get<coord_t>("screw_head_clearance"))
    , interior_rounding(settings.get<coord_t>("interior_rounding"))
    , logo_text(settings.get<std::string>("logo_text"))
    , sheet_width(settings.get<coord_t>("sheet_width"))
    , sheet_height(settings.get<coord_t>("sheet_height"))
    , sheet_gap(settings.get<coord_t>("sheet_gap"))
    , fabrication_stroke_width(settings.get<coord_t>("fabrication_stroke_width"))
    , comb_interleave_dx(settings.get<coord_t>("comb_interleave_dx"))
    , comb_interleave_extra(settings.get<coord_t>("comb_interleave_extra"))
    , bottom_panel_shift(settings.get<coord_t>("bottom_panel_shift"))
{
    if (drive_count == 0)
    {
        throw exceptions::SettingsException("drive_count", "at least one drive is required");
    }
    if (interior_rounding <= 0)
    {
        throw exceptions::SettingsException("interior_rounding", "must be positive");
    }

    const coord_t drive_count_mu = static_cast<coord_t>(drive_count);
    drive_group_width = drive_count_mu * hdd_thickness + (drive_count_mu - 1) * drive_gap;
    drive_zone_width = drive_group_width + 2 * drive_edge_margin;

    // The interior has to hold the drive group, the HAT and the Pi with 20mm to spare.
    interior_x = std::max({ drive_zone_width, hat_length + MM2INT(20), pi5_length + MM2INT(20) });
    // Front to back: screw clearance, a comb rail, the drive, a comb rail, screw clearance.
    interior_y = std::max(2 * screw_head_clearance + 2 * bracket_thickness + hdd_width, pi5_width + MM2INT(20));
    interior_x = roundUpTo(interior_x, interior_rounding);
    interior_y = roundUpTo(interior_y, interior_rounding);

    ext_x = interior_x + 2 * side_thickness;
    ext_y = interior_y + 2 * wall_thickness;
    side_overlap = side_overhang + wall_thickness;

    z_bottom_top = side_thickness;
    z_pi5_pcb = z_bottom_top + pi5_standoff_height;
    z_pi5_top = z_pi5_pcb + pi5_envelope_height;
    z_hat_pcb = z_pi5_top + pi5_to_hat_gap;
    z_hat_top = z_hat_pcb + hat_envelope_height;
    z_drive_bottom = z_hat_top + cable_zone_height;
    z_drive_top = z_drive_bottom + hdd_length;
    z_fan_bracket = z_drive_top + fan_gap;
    z_fan_top = z_fan_bracket + wall_thickness + fan_depth;
    z_top_panel = z_fan_top + fan_top_clearance;
    total_height = z_top_panel + wall_thickness;
    side_height = z_top_panel - side_thickness;

    comb_bar_z = z_drive_top - comb_bar_height;
    comb_tooth_length = hdd_length - comb_bar_height - MM2INT(10);
    comb_total_height = comb_bar_height + comb_tooth_length;

    rod_inset = side_thickness + 2 * rod_diameter;
    front_panel_width = ext_x - 2 * (min_overhang + side_thickness);
    front_panel_height = side_height + wall_thickness + side_thickness;

    if (front_panel_width <= 0 || side_height <= 0 || comb_tooth_length <= 0)
    {
        throw exceptions::GeometryException("the configured parts do not leave room for the enclosure panels");
    }
}

void EnclosureConfig::logSummary() const
{
    spdlog::info("Interior: {:.2f} x {:.2f} mm", INT2MM(interior_x), INT2MM(interior_y));
    spdlog::info("Exterior: {:.1f} x {:.1f} mm", INT2MM(ext_x), INT2MM(ext_y));
    spdlog::info("Total height: {:.1f} mm ({:.1f} in)", INT2MM(total_height), INT2MM(total_height) / 25.4);
    spdlog::debug("Drive bottom Z: {:.2f} mm", INT2MM(z_drive_bottom));
    spdlog::debug("Side panel height: {:.2f} mm", INT2MM(side_height));
    spdlog::debug("Front/back panel: {:.2f} x {:.2f} mm", INT2MM(front_panel_width), INT2MM(front_panel_height));
}

} // namespace kerf
