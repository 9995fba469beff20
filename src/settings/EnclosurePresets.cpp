// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "settings/EnclosurePresets.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils/exceptions.h"

namespace kerf
{

void EnclosurePresets::addCommon(Settings& settings)
{
    settings.add("wall_thickness", "3.0");
    settings.add("side_thickness", "5.0");
    settings.add("bracket_thickness", "5.0");

    settings.add("finger_width", "12.0");
    settings.add("min_overhang", "3.0");
    settings.add("side_overhang", "3.0");

    settings.add("rod_diameter", "4.0");
    settings.add("rod_hole_diameter", "4.5");
    settings.add("grommet_diameter", "10.0");

    settings.add("pi5_length", "85.0");
    settings.add("pi5_width", "56.0");
    settings.add("pi5_hole_spacing_x", "58.0");
    settings.add("pi5_hole_spacing_y", "49.0");
    settings.add("pi5_hole_diameter", "2.7");
    settings.add("pi5_hole_offset_x", "3.5");
    settings.add("pi5_hole_offset_y", "3.5");

    settings.add("hat_length", "100.0");
    settings.add("hat_width", "56.0");

    settings.add("hdd_length", "146.99");
    settings.add("hdd_width", "101.6");
    settings.add("hdd_thickness", "26.11");
    settings.add("hdd_side_hole_z", "[28.5, 70.5, 130.5]");
    settings.add("drive_gap", "19.0");
    settings.add("drive_edge_margin", "11.5");

    settings.add("fan_size", "80.0");
    settings.add("fan_depth", "25.0");
    settings.add("fan_hole_spacing", "71.5");
    settings.add("fan_mount_hole", "4.3");
    settings.add("fan_gap", "10.0");
    settings.add("fan_top_clearance", "5.0");

    settings.add("cable_zone_height", "82.0");
    settings.add("pi5_standoff_height", "10.0");
    settings.add("pi5_envelope_height", "18.0");
    settings.add("pi5_to_hat_gap", "3.0");
    settings.add("hat_envelope_height", "12.25");

    settings.add("comb_bar_height", "12.0");
    settings.add("comb_tooth_width", "20.0");
    settings.add("screw_head_clearance", "4.0");

    settings.add("interior_rounding", "5.0");
    settings.add("logo_text", "pi-nas");

    // Ponoko P3 sheet.
    settings.add("sheet_width", "790.0");
    settings.add("sheet_height", "384.0");
    settings.add("sheet_gap", "3.0");
    settings.add("fabrication_stroke_width", "0.01");
    settings.add("comb_interleave_dx", "4.0");
    settings.add("comb_interleave_extra", "4.5");
    settings.add("bottom_panel_shift", "23.0");
}

Settings EnclosurePresets::load(const std::string& name)
{
    Settings settings;
    addCommon(settings);
    if (name == "nas4")
    {
        settings.add("drive_count", "4");
    }
    else if (name == "nas2")
    {
        // Two drives leave the interior width to the HAT, so the cable zone can take the spare height.
        settings.add("drive_count", "2");
        settings.add("cable_zone_height", "85.0");
    }
    else
    {
        throw exceptions::SettingsException("preset", fmt::format("unknown preset '{}', expected one of {}", name, names()));
    }
    spdlog::debug("Loaded enclosure preset '{}'", name);
    return settings;
}

std::vector<std::string> EnclosurePresets::names()
{
    return { "nas4", "nas2" };
}

} // namespace kerf
