// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_ENCLOSURE_CONFIG_H
#define SETTINGS_ENCLOSURE_CONFIG_H

#include <string>
#include <vector>

#include "utils/Coord_t.h"

namespace kerf
{

class Settings;

/*!
 * \brief All physical parameters of the enclosure and the dimensions derived from them.
 *
 * Built once from a settings stack and passed by const reference to every panel assembler and to the sheet packer.
 * All lengths are in micrometres. The enclosure frame has X running left to right, Y running front to back and Z running
 * bottom to top.
 */
struct EnclosureConfig
{
    explicit EnclosureConfig(const Settings& settings);

    // Material
    coord_t wall_thickness; //!< Front, back and top panels.
    coord_t side_thickness; //!< Side and bottom panels.
    coord_t bracket_thickness; //!< Comb rails and fan bracket.

    // Joints
    coord_t finger_width;
    coord_t min_overhang; //!< Material left between a slot and the panel edge.
    coord_t side_overhang; //!< How far the side panels reach past the outer face of the front/back panels.

    // Corner rods
    coord_t rod_diameter;
    coord_t rod_hole_diameter;
    coord_t grommet_diameter;

    // Raspberry Pi 5
    coord_t pi5_length;
    coord_t pi5_width;
    coord_t pi5_hole_spacing_x;
    coord_t pi5_hole_spacing_y;
    coord_t pi5_hole_diameter;
    coord_t pi5_hole_offset_x;
    coord_t pi5_hole_offset_y;

    // SATA HAT
    coord_t hat_length;
    coord_t hat_width;

    // 3.5" drives, mounted on end with the connector down
    size_t drive_count;
    coord_t hdd_length;
    coord_t hdd_width;
    coord_t hdd_thickness;
    std::vector<coord_t> hdd_side_hole_z; //!< Side mounting holes, measured from the connector end.
    coord_t drive_gap; //!< Face to face between neighbouring drives.
    coord_t drive_edge_margin; //!< Outer drive face to side wall.

    // Fan
    coord_t fan_size;
    coord_t fan_depth;
    coord_t fan_hole_spacing;
    coord_t fan_mount_hole;
    coord_t fan_gap; //!< Airflow gap between the drive tops and the fan bracket.
    coord_t fan_top_clearance; //!< Between the fan and the top panel.

    // Vertical stack
    coord_t cable_zone_height;
    coord_t pi5_standoff_height;
    coord_t pi5_envelope_height;
    coord_t pi5_to_hat_gap;
    coord_t hat_envelope_height;

    // Comb rails
    coord_t comb_bar_height;
    coord_t comb_tooth_width;
    coord_t screw_head_clearance; //!< Between a comb face and the front/back panel.

    // Interior dimensions are rounded up to a multiple of this
    coord_t interior_rounding;

    std::string logo_text;

    // Nesting
    coord_t sheet_width;
    coord_t sheet_height;
    coord_t sheet_gap;
    coord_t fabrication_stroke_width;
    coord_t comb_interleave_dx; //!< Sideways shift of the second comb rail so the teeth mesh.
    coord_t comb_interleave_extra; //!< Added to comb_interleave_dx when placing the second comb rail.
    coord_t bottom_panel_shift; //!< Pulls the rotated bottom panel back over the fan bracket column.

    // Derived
    coord_t drive_group_width;
    coord_t drive_zone_width;
    coord_t interior_x;
    coord_t interior_y;
    coord_t ext_x;
    coord_t ext_y;
    coord_t side_overlap; //!< Side panel wing past each front/back panel inner face.
    coord_t z_bottom_top;
    coord_t z_pi5_pcb;
    coord_t z_pi5_top;
    coord_t z_hat_pcb;
    coord_t z_hat_top;
    coord_t z_drive_bottom;
    coord_t z_drive_top;
    coord_t z_fan_bracket;
    coord_t z_fan_top;
    coord_t z_top_panel;
    coord_t total_height;
    coord_t side_height; //!< Height of the side panels and of the finger zone of the front/back panels.
    coord_t comb_bar_z;
    coord_t comb_tooth_length;
    coord_t comb_total_height;
    coord_t rod_inset;
    coord_t front_panel_width; //!< Between the inner faces of the side panels.
    coord_t front_panel_height;

    /*!
     * Log the headline dimensions.
     */
    void logSummary() const;
};

} // namespace kerf

#endif // SETTINGS_ENCLOSURE_CONFIG_H
