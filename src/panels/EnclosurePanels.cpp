// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "panels/EnclosurePanels.h"

#include <array>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "outline/FingerOutline.h"
#include "panels/PanelFeatures.h"
#include "panels/PanelFiles.h"
#include "panels/PanelOutlines.h"
#include "settings/EnclosureConfig.h"

namespace kerf
{

namespace
{

constexpr coord_t title_lift = 3000; //!< Panel titles sit this far above the panel.
constexpr coord_t outline_margin_extra = 3000; //!< Added to the panel thickness to get the drawing margin.
constexpr double label_font_size = 2.0;

// Raspberry Pi 5 on the bottom panel, ports facing the front panel.
constexpr coord_t pi_front_clearance = 2000;
constexpr coord_t pi_hole_keepout = 4000;
constexpr coord_t sd_slot_start = 22050; //!< Along the short board edge, from the GPIO corner.
constexpr coord_t sd_slot_end = 34000;
constexpr coord_t sd_hole_width = 14000;
constexpr coord_t sd_hole_length = 20000;
constexpr coord_t sd_hole_radius = 3000;
constexpr coord_t sd_hole_keepout = 2000;

// Bottom panel vents.
constexpr coord_t bottom_vent_width = 22000;
constexpr coord_t bottom_vent_height = 3000;
constexpr coord_t bottom_vent_web = 5000;
constexpr coord_t bottom_vent_side_clearance = 5000;
constexpr coord_t bottom_vent_edge_margin = 8000;

/*!
 * A Pi 5 connector opening in the front panel, relative to the board edge and the PCB underside.
 */
struct PortCutout
{
    std::string_view name;
    coord_t x;
    coord_t z;
    coord_t width;
    coord_t height;
};

constexpr std::array<PortCutout, 4> pi_ports{ {
    { "GbE", 1250, 450, 17900, 16500 },
    { "USB3", 21300, 1450, 15600, 17600 },
    { "USB2", 39100, 1450, 15800, 17600 },
    { "HAT", 34600, 21550, 20800, 8100 },
} };
constexpr coord_t port_lift = 1000;
constexpr coord_t port_radius = 1500;
constexpr coord_t dc_jack_offset_x = 17000; //!< Left of the Pi.
constexpr coord_t dc_jack_height = 15000; //!< Above the bottom panel.
constexpr coord_t dc_jack_radius = 4000;

// Front and back vents.
constexpr coord_t front_vent_width = 22000;
constexpr coord_t front_vent_height = 2500;
constexpr coord_t front_vent_margin = 20000;

// Side panel comb rail slots and vents.
constexpr coord_t comb_tab_slot_height = 10300;
constexpr coord_t side_vent_width = 18000;
constexpr coord_t side_vent_height = 2500;
constexpr coord_t side_vent_bracket_clearance = 2000;

// Comb rail.
constexpr coord_t comb_tooth_shift = 7000; //!< Teeth sit left of the drive centres.
constexpr coord_t comb_tab_height = 10000;
constexpr coord_t comb_drive_drop = 9000; //!< Drive connector end below the tooth tips.
constexpr coord_t comb_screw_radius = 1700;
constexpr coord_t comb_washer_radius = 3500;
constexpr coord_t comb_canvas_extra = 20000;

// Fan bracket.
constexpr coord_t fan_bracket_clearance = 1000;
constexpr coord_t fan_bracket_canvas_extra = 10000;

} // namespace

EnclosurePanels::EnclosurePanels(const EnclosureConfig& config)
    : config_(config)
{
}

coord_t EnclosurePanels::frontPanelY(const coord_t z) const
{
    return config_.z_top_panel - z + config_.side_thickness;
}

coord_t EnclosurePanels::sidePanelY(const coord_t z) const
{
    return config_.z_top_panel - z;
}

void EnclosurePanels::addSideSlots(ShapeCanvas& canvas) const
{
    const coord_t slot_width = config_.side_thickness;
    for (const coord_t slot_x : { config_.min_overhang, config_.ext_x - config_.min_overhang - slot_width })
    {
        for (const auto& [from, to] : PanelOutlines::topBottomSideSlotSpans(config_))
        {
            canvas.addRect(Point2LL(slot_x, from), slot_width, to - from);
        }
    }
}

Panel EnclosurePanels::bottomPanel() const
{
    const coord_t width = config_.ext_x;
    const coord_t height = config_.interior_y;
    Panel panel{ std::string(panel_files::bottom), ShapeCanvas(width, height, config_.side_thickness + outline_margin_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("BOTTOM PANEL {:.0f}x{:.0f}mm ({}mm)", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.side_thickness)),
        Point2LL(0, -title_lift));

    canvas.addPolygon(FingerOutline::build(PanelOutlines::topBottom(config_)));
    addSideSlots(canvas);
    PanelFeatures::addRodHoles(canvas, config_, width, height);

    // The board lies with its long edge front to back, so board X runs backwards along panel Y from the port end.
    const Point2LL pi_origin((width - config_.pi5_width) / 2, pi_front_clearance);
    const coord_t hole_x0 = config_.pi5_hole_offset_x;
    const coord_t hole_y0 = config_.pi5_hole_offset_y;
    const coord_t hole_x1 = hole_x0 + config_.pi5_hole_spacing_x;
    const coord_t hole_y1 = hole_y0 + config_.pi5_hole_spacing_y;
    std::vector<AABB> vent_exclusions;
    for (const Point2LL& board_hole : { Point2LL(hole_x0, hole_y0), Point2LL(hole_x1, hole_y0), Point2LL(hole_x0, hole_y1), Point2LL(hole_x1, hole_y1) })
    {
        const Point2LL hole = pi_origin + Point2LL(board_hole.Y, config_.pi5_length - board_hole.X);
        canvas.addCircle(hole, config_.pi5_hole_diameter / 2);
        vent_exclusions.emplace_back(hole - Point2LL(pi_hole_keepout, pi_hole_keepout), hole + Point2LL(pi_hole_keepout, pi_hole_keepout));
    }

    // The SD card sits at the far end of the board; the hole overshoots the board edge for finger access.
    const Point2LL sd_position
        = pi_origin + Point2LL(sd_slot_start + (sd_slot_end - sd_slot_start - sd_hole_width) / 2, config_.pi5_length - sd_hole_length / 4);
    AABB sd_keepout(sd_position, sd_position + Point2LL(sd_hole_width, sd_hole_length));
    sd_keepout.expand(sd_hole_keepout);
    vent_exclusions.push_back(sd_keepout);

    const coord_t vent_margin_x = config_.min_overhang + config_.side_thickness + bottom_vent_side_clearance;
    const VentGrid vents{ AABB(Point2LL(vent_margin_x, bottom_vent_edge_margin), Point2LL(width - vent_margin_x, height - bottom_vent_edge_margin)),
                          bottom_vent_width,
                          bottom_vent_height,
                          bottom_vent_web,
                          vent_exclusions };
    const size_t vent_count = PanelFeatures::addVentGrid(canvas, vents);
    spdlog::debug("Bottom panel: {} vent slots", vent_count);

    canvas.addRoundedRect(sd_position, sd_hole_width, sd_hole_length, sd_hole_radius);
    canvas.addAnnotation("SD card", sd_position - Point2LL(0, 1500), label_font_size);

    canvas.addRect(pi_origin, config_.pi5_width, config_.pi5_length, ShapeRole::ENGRAVE);
    canvas.addAnnotation("Pi5 (ports at front)", pi_origin + Point2LL(2000, 10000));
    return panel;
}

Panel EnclosurePanels::topPanel() const
{
    const coord_t width = config_.ext_x;
    const coord_t height = config_.interior_y;
    Panel panel{ std::string(panel_files::top), ShapeCanvas(width, height, config_.wall_thickness + outline_margin_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("TOP PANEL {:.0f}x{:.0f}mm ({}mm)", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.wall_thickness)),
        Point2LL(0, -title_lift));

    canvas.addPolygon(FingerOutline::build(PanelOutlines::topBottom(config_)));
    addSideSlots(canvas);
    PanelFeatures::addRodHoles(canvas, config_, width, height);

    // The fan hangs from the bracket below, so the top panel only needs the grille.
    FanGrille grille;
    grille.center = Point2LL(width / 2, height / 2);
    const size_t slot_count = PanelFeatures::addFanGrille(canvas, grille);
    spdlog::debug("Top panel: {} grille slots", slot_count);
    return panel;
}

Panel EnclosurePanels::frontPanel() const
{
    const coord_t width = config_.front_panel_width;
    const coord_t height = config_.front_panel_height;
    Panel panel{ std::string(panel_files::front), ShapeCanvas(width, height, config_.side_thickness + outline_margin_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("FRONT PANEL {:.0f}x{:.1f}mm ({}mm)", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.wall_thickness)),
        Point2LL(0, -title_lift));

    canvas.addPolygon(FingerOutline::build(PanelOutlines::frontBack(config_)));

    const coord_t pi_x = (width - config_.pi5_width) / 2;
    const coord_t pcb_y = frontPanelY(config_.z_pi5_pcb);
    for (const PortCutout& port : pi_ports)
    {
        const Point2LL position(pi_x + port.x, pcb_y - port.z - port.height - port_lift);
        canvas.addRoundedRect(position, port.width, port.height, port_radius);
        canvas.addAnnotation(std::string(port.name), position - Point2LL(0, 1500), label_font_size);
    }

    const Point2LL dc_jack(pi_x - dc_jack_offset_x, frontPanelY(config_.side_thickness + dc_jack_height));
    canvas.addCircle(dc_jack, dc_jack_radius);
    canvas.addAnnotation("DC 12V", dc_jack + Point2LL(6000, 1000), label_font_size);

    const std::vector<coord_t> columns = PanelFeatures::spread(front_vent_margin, width - front_vent_margin - front_vent_width, 3);
    auto add_vent_rows = [&](const coord_t z_first, const coord_t z_last, const size_t rows)
    {
        for (const coord_t z : PanelFeatures::spread(z_first, z_last, rows))
        {
            for (const coord_t x : columns)
            {
                canvas.addSlot(Point2LL(x, frontPanelY(z)), front_vent_width, front_vent_height);
            }
        }
    };
    const coord_t cable_first = config_.z_hat_top + MM2INT(15.0);
    const coord_t cable_last = config_.z_drive_bottom - MM2INT(10.0);
    if (cable_last > cable_first)
    {
        add_vent_rows(cable_first, cable_last, 5);
    }
    add_vent_rows(config_.z_drive_bottom + MM2INT(15.0), config_.z_drive_top - MM2INT(10.0), 8);
    return panel;
}

Panel EnclosurePanels::backPanel() const
{
    const coord_t width = config_.front_panel_width;
    const coord_t height = config_.front_panel_height;
    Panel panel{ std::string(panel_files::back), ShapeCanvas(width, height, config_.side_thickness + outline_margin_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("BACK PANEL {:.0f}x{:.1f}mm ({}mm)", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.wall_thickness)),
        Point2LL(0, -title_lift));

    canvas.addPolygon(FingerOutline::build(PanelOutlines::frontBack(config_)));
    PanelFeatures::addLogo(canvas, config_.logo_text, width, height);
    return panel;
}

Panel EnclosurePanels::sidePanel(const SideHand hand) const
{
    const OutlineSpec outline = PanelOutlines::side(config_);
    const coord_t width = outline.width;
    const coord_t height = outline.height;
    const bool is_left = hand == SideHand::LEFT;
    Panel panel{ std::string(is_left ? panel_files::left_side : panel_files::right_side),
                 ShapeCanvas(width, height, config_.side_thickness + outline_margin_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("{} SIDE {:.1f}x{:.1f}mm ({}mm)", is_left ? "LEFT" : "RIGHT", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.side_thickness)),
        Point2LL(0, -title_lift));

    canvas.addPolygon(FingerOutline::build(outline));

    // Through-slots for the side fingers of the front and back panels.
    const coord_t face_slot_width = config_.wall_thickness;
    for (const coord_t slot_x : { config_.min_overhang, width - config_.min_overhang - face_slot_width })
    {
        for (const auto& [from, to] : PanelOutlines::sideFaceSlotSpans(config_))
        {
            canvas.addRect(Point2LL(slot_x, from), face_slot_width, to - from);
        }
    }

    // Slots for the comb rail tabs, one rail in front of the drives and one behind them.
    // Panel X of an enclosure Y position is measured from the front panel inner face.
    const coord_t rail_front_y = config_.wall_thickness + config_.screw_head_clearance + config_.bracket_thickness / 2;
    const coord_t rail_back_y = config_.ext_y - config_.wall_thickness - config_.screw_head_clearance - config_.bracket_thickness / 2;
    const coord_t tab_slot_width = config_.bracket_thickness;
    const coord_t bar_center_y = sidePanelY(config_.comb_bar_z + config_.comb_bar_height / 2);
    for (const coord_t rail_y : { rail_front_y, rail_back_y })
    {
        const coord_t slot_x = config_.side_overlap + (rail_y - config_.wall_thickness) - tab_slot_width / 2;
        canvas.addRect(Point2LL(slot_x, bar_center_y - comb_tab_slot_height / 2), tab_slot_width, comb_tab_slot_height);
    }

    // Vent columns between the two comb rails.
    const coord_t vent_first_x = config_.side_overlap + (rail_front_y - config_.wall_thickness) + tab_slot_width / 2 + side_vent_bracket_clearance;
    const coord_t vent_last_x = config_.side_overlap + (rail_back_y - config_.wall_thickness) - tab_slot_width / 2 - side_vent_bracket_clearance - side_vent_width;
    const std::vector<coord_t> columns = PanelFeatures::spread(vent_first_x, vent_last_x, 3);
    auto add_vent_rows = [&](const coord_t z_first, const coord_t z_last, const size_t rows)
    {
        for (const coord_t z : PanelFeatures::spread(z_first, z_last, rows))
        {
            for (const coord_t x : columns)
            {
                canvas.addSlot(Point2LL(x, sidePanelY(z)), side_vent_width, side_vent_height);
            }
        }
    };
    const coord_t cable_first = config_.z_hat_top + MM2INT(15.0);
    const coord_t cable_last = config_.z_drive_bottom - MM2INT(10.0);
    if (cable_last > cable_first)
    {
        add_vent_rows(cable_first, cable_last, 4);
    }
    add_vent_rows(config_.z_drive_bottom + MM2INT(20.0), config_.z_drive_top - MM2INT(10.0), 6);
    return panel;
}

Panel EnclosurePanels::combRail() const
{
    const coord_t rail_width = config_.front_panel_width;
    const coord_t bar_height = config_.comb_bar_height;
    const coord_t total_height = config_.comb_total_height;
    const coord_t tooth_width = config_.comb_tooth_width;
    const coord_t tooth_pitch = config_.hdd_thickness + config_.drive_gap;
    const coord_t edge_margin = (rail_width - config_.drive_group_width) / 2;
    auto tooth_x = [&](const size_t tooth_idx)
    {
        const coord_t drive_center = edge_margin + config_.hdd_thickness / 2 + static_cast<coord_t>(tooth_idx) * tooth_pitch;
        return drive_center - tooth_width / 2 - comb_tooth_shift;
    };

    Panel panel{ std::string(panel_files::comb_rail), ShapeCanvas(rail_width + comb_canvas_extra, total_height + comb_canvas_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("DRIVE COMB RAIL (x2) {:.1f}x{:.1f}mm ({}mm acrylic)", INT2MM(rail_width), INT2MM(total_height), ShapeCanvas::formatMM(config_.bracket_thickness)),
        Point2LL(0, -title_lift));

    // Bar with a tab at either end reaching into the side panels, teeth hanging down.
    const coord_t tab_length = config_.side_thickness;
    const coord_t tab_top = bar_height / 2 - comb_tab_height / 2;
    const coord_t tab_bottom = tab_top + comb_tab_height;
    Path outline{ { 0, 0 },
                  { rail_width, 0 },
                  { rail_width, tab_top },
                  { rail_width + tab_length, tab_top },
                  { rail_width + tab_length, tab_bottom },
                  { rail_width, tab_bottom },
                  { rail_width, bar_height } };
    for (size_t tooth_idx = config_.drive_count; tooth_idx-- > 0;)
    {
        const coord_t x = tooth_x(tooth_idx);
        outline.emplace_back(x + tooth_width, bar_height);
        outline.emplace_back(x + tooth_width, total_height);
        outline.emplace_back(x, total_height);
        outline.emplace_back(x, bar_height);
    }
    outline.insert(outline.end(), { { 0, bar_height }, { 0, tab_bottom }, { -tab_length, tab_bottom }, { -tab_length, tab_top }, { 0, tab_top } });
    Polygon rail(std::move(outline));
    rail.mergeCoincidentPoints();
    canvas.addPolygon(rail);

    // Drive screw holes, measured up from the connector end of the drive.
    const coord_t drive_bottom_y = total_height + comb_drive_drop;
    for (size_t tooth_idx = 0; tooth_idx < config_.drive_count; ++tooth_idx)
    {
        const coord_t tooth_center = tooth_x(tooth_idx) + tooth_width / 2;
        for (const coord_t hole_z : config_.hdd_side_hole_z)
        {
            const Point2LL hole(tooth_center, drive_bottom_y - hole_z);
            canvas.addCircle(hole, comb_screw_radius);
            canvas.addCircle(hole, comb_washer_radius, ShapeRole::ENGRAVE);
        }
    }

    for (size_t tooth_idx = 0; tooth_idx < config_.drive_count; ++tooth_idx)
    {
        const coord_t x = tooth_x(tooth_idx);
        const coord_t drive_left = x + tooth_width / 2 - config_.hdd_thickness / 2;
        canvas.addRect(Point2LL(drive_left, drive_bottom_y - config_.hdd_length), config_.hdd_thickness, config_.hdd_length, ShapeRole::ENGRAVE);
        canvas.addAnnotation(fmt::format("HDD{}", tooth_idx + 1), Point2LL(x + 1000, drive_bottom_y - config_.hdd_length / 2));
    }
    return panel;
}

Panel EnclosurePanels::fanBracket() const
{
    const coord_t width = config_.front_panel_width - 2 * fan_bracket_clearance;
    const coord_t height = config_.interior_y - 2 * fan_bracket_clearance;
    Panel panel{ std::string(panel_files::fan_bracket), ShapeCanvas(width + fan_bracket_canvas_extra, height + fan_bracket_canvas_extra) };
    ShapeCanvas& canvas = panel.canvas;
    canvas.addAnnotation(
        fmt::format("FAN BRACKET {:.0f}x{:.0f}mm ({}mm acrylic)", INT2MM(width), INT2MM(height), ShapeCanvas::formatMM(config_.bracket_thickness)),
        Point2LL(0, -title_lift));

    canvas.addRect(Point2LL(0, 0), width, height);

    // The rods pass through the top and bottom panels, so their holes are placed in top/bottom panel coordinates.
    const Point2LL bracket_origin(config_.min_overhang + config_.side_thickness + fan_bracket_clearance, fan_bracket_clearance);
    const coord_t inset = config_.rod_inset;
    for (const Point2LL& rod : { Point2LL(inset, inset),
                                 Point2LL(config_.ext_x - inset, inset),
                                 Point2LL(inset, config_.interior_y - inset),
                                 Point2LL(config_.ext_x - inset, config_.interior_y - inset) })
    {
        canvas.addCircle(rod - bracket_origin, config_.rod_hole_diameter / 2);
    }

    const Point2LL center(width / 2, height / 2);
    canvas.addCircle(center, FanGrille{}.radius);
    const coord_t half_spacing = config_.fan_hole_spacing / 2;
    for (const Point2LL& corner : { Point2LL(-half_spacing, -half_spacing), Point2LL(half_spacing, -half_spacing), Point2LL(-half_spacing, half_spacing), Point2LL(half_spacing, half_spacing) })
    {
        canvas.addCircle(center + corner, config_.fan_mount_hole / 2);
    }
    return panel;
}

std::vector<Panel> EnclosurePanels::generateAll() const
{
    std::vector<Panel> panels;
    panels.push_back(bottomPanel());
    panels.push_back(topPanel());
    panels.push_back(frontPanel());
    panels.push_back(backPanel());
    panels.push_back(sidePanel(SideHand::LEFT));
    panels.push_back(sidePanel(SideHand::RIGHT));
    panels.push_back(combRail());
    panels.push_back(fanBracket());
    return panels;
}

std::vector<std::filesystem::path> EnclosurePanels::writeAll(const std::filesystem::path& directory) const
{
    return write(generateAll(), directory);
}

std::vector<std::filesystem::path> EnclosurePanels::write(const std::vector<Panel>& panels, const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> written;
    for (const Panel& panel : panels)
    {
        const std::filesystem::path file_path = directory / panel.file_name;
        panel.canvas.save(file_path);
        spdlog::info("  {}", panel.file_name);
        written.push_back(file_path);
    }
    return written;
}

} // namespace kerf
