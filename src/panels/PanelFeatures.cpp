// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "panels/PanelFeatures.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "settings/EnclosureConfig.h"

namespace kerf
{

namespace
{

//! Strokes run between two points of a unit cell with Y pointing down. The x-height band is 0.25 to 0.75.
struct GlyphStroke
{
    double x0;
    double y0;
    double x1;
    double y1;
};

const std::unordered_map<char, std::vector<GlyphStroke>>& strokeFont()
{
    static const std::unordered_map<char, std::vector<GlyphStroke>> font{
        { 'p',
          {
              { 0.25, 0.25, 0.10, 0.95 }, // stem into the descender
              { 0.25, 0.25, 0.55, 0.25 },
              { 0.55, 0.25, 0.78, 0.30 },
              { 0.78, 0.30, 0.82, 0.42 },
              { 0.82, 0.42, 0.78, 0.55 },
              { 0.78, 0.55, 0.55, 0.60 },
              { 0.55, 0.60, 0.20, 0.60 },
          } },
        { 'i',
          {
              { 0.35, 0.25, 0.25, 0.75 },
              { 0.42, 0.08, 0.40, 0.15 }, // dot
          } },
        { '-',
          {
              { 0.15, 0.45, 0.75, 0.45 },
          } },
        { 'n',
          {
              { 0.25, 0.25, 0.15, 0.75 },
              { 0.25, 0.40, 0.45, 0.25 },
              { 0.45, 0.25, 0.65, 0.25 },
              { 0.65, 0.25, 0.75, 0.40 },
              { 0.75, 0.40, 0.65, 0.75 },
          } },
        { 'a',
          {
              { 0.70, 0.25, 0.50, 0.25 },
              { 0.50, 0.25, 0.25, 0.35 },
              { 0.25, 0.35, 0.20, 0.50 },
              { 0.20, 0.50, 0.25, 0.65 },
              { 0.25, 0.65, 0.50, 0.75 },
              { 0.50, 0.75, 0.65, 0.70 },
              { 0.78, 0.25, 0.62, 0.75 },
          } },
        { 's',
          {
              { 0.75, 0.30, 0.55, 0.25 },
              { 0.55, 0.25, 0.30, 0.28 },
              { 0.30, 0.28, 0.22, 0.38 },
              { 0.22, 0.38, 0.35, 0.48 },
              { 0.35, 0.48, 0.60, 0.55 },
              { 0.60, 0.55, 0.68, 0.65 },
              { 0.68, 0.65, 0.55, 0.75 },
              { 0.55, 0.75, 0.30, 0.72 },
              { 0.30, 0.72, 0.15, 0.65 },
          } },
    };
    return font;
}

constexpr double logo_slant = 0.18;
constexpr double logo_char_width = 18.0;
constexpr double logo_char_height = 30.0;
constexpr double logo_char_gap = 3.0;
constexpr std::array<double, 3> logo_bold_offsets{ -0.6, 0.0, 0.6 };

bool overlapsInterior(const AABB& a, const AABB& b)
{
    return a.min_.X < b.max_.X && a.max_.X > b.min_.X && a.min_.Y < b.max_.Y && a.max_.Y > b.min_.Y;
}

Point2LL polarPoint(const Point2LL& center, const coord_t radius, const double angle)
{
    return center + Point2LL(std::llrint(static_cast<double>(radius) * std::cos(angle)), std::llrint(static_cast<double>(radius) * std::sin(angle)));
}

} // namespace

void PanelFeatures::addRodHoles(ShapeCanvas& canvas, const EnclosureConfig& config, const coord_t width, const coord_t height)
{
    const coord_t inset = config.rod_inset;
    for (const Point2LL& center : { Point2LL(inset, inset), Point2LL(width - inset, inset), Point2LL(inset, height - inset), Point2LL(width - inset, height - inset) })
    {
        canvas.addCircle(center, config.rod_hole_diameter / 2);
        canvas.addCircle(center, config.grommet_diameter / 2, ShapeRole::ENGRAVE);
    }
}

size_t PanelFeatures::addVentGrid(ShapeCanvas& canvas, const VentGrid& grid)
{
    const coord_t pitch_x = grid.slot_width + grid.web;
    const coord_t pitch_y = grid.slot_height + grid.web;
    const coord_t columns = grid.field.width() / pitch_x;
    const coord_t rows = grid.field.height() / pitch_y;
    if (columns <= 0 || rows <= 0)
    {
        spdlog::debug("Vent field {}x{}mm holds no slots", INT2MM(grid.field.width()), INT2MM(grid.field.height()));
        return 0;
    }
    const Point2LL start(grid.field.min_.X + (grid.field.width() - (columns * pitch_x - grid.web)) / 2, grid.field.min_.Y + (grid.field.height() - (rows * pitch_y - grid.web)) / 2);

    size_t slot_count = 0;
    for (coord_t column = 0; column < columns; ++column)
    {
        for (coord_t row = 0; row < rows; ++row)
        {
            const Point2LL position = start + Point2LL(column * pitch_x, row * pitch_y);
            const AABB slot(position, position + Point2LL(grid.slot_width, grid.slot_height));
            const bool excluded = std::any_of(
                grid.exclusions.begin(),
                grid.exclusions.end(),
                [&slot](const AABB& exclusion)
                {
                    return overlapsInterior(slot, exclusion);
                });
            if (excluded)
            {
                continue;
            }
            canvas.addSlot(position, grid.slot_width, grid.slot_height);
            slot_count++;
        }
    }
    return slot_count;
}

std::vector<coord_t> PanelFeatures::grilleRings(const FanGrille& grille)
{
    std::vector<coord_t> rings;
    for (coord_t inner_radius = grille.hub_radius; inner_radius + grille.slot_width <= grille.radius; inner_radius += grille.slot_width + grille.ring_gap)
    {
        rings.push_back(inner_radius);
    }
    return rings;
}

size_t PanelFeatures::addFanGrille(ShapeCanvas& canvas, const FanGrille& grille)
{
    const double slot_width = INT2MM(grille.slot_width);
    const double spoke_gap = INT2MM(grille.spoke_gap);

    size_t slot_count = 0;
    for (const coord_t inner_radius : grilleRings(grille))
    {
        const coord_t outer_radius = inner_radius + grille.slot_width;
        const double mid_radius = INT2MM(inner_radius) + slot_width / 2;
        const double spoke_angle = spoke_gap / mid_radius;
        const size_t slots = std::max(size_t(4), static_cast<size_t>(2 * std::numbers::pi * mid_radius / (slot_width * 3 + spoke_gap)));
        const double arc_angle = (2 * std::numbers::pi - static_cast<double>(slots) * spoke_angle) / static_cast<double>(slots);
        const size_t segments = std::max(size_t(4), static_cast<size_t>(arc_angle * mid_radius / 2));

        for (size_t slot_idx = 0; slot_idx < slots; ++slot_idx)
        {
            const double start_angle = 2 * std::numbers::pi * static_cast<double>(slot_idx) / static_cast<double>(slots) + spoke_angle / 2;
            Path outer;
            Path inner;
            for (size_t segment_idx = 0; segment_idx <= segments; ++segment_idx)
            {
                const double angle = start_angle + arc_angle * static_cast<double>(segment_idx) / static_cast<double>(segments);
                outer.push_back(polarPoint(grille.center, outer_radius, angle));
                inner.push_back(polarPoint(grille.center, inner_radius, angle));
            }
            outer.insert(outer.end(), inner.rbegin(), inner.rend());
            canvas.addPolyline(std::move(outer), true);
            slot_count++;
        }
    }
    return slot_count;
}

bool PanelFeatures::hasGlyph(const char character)
{
    return strokeFont().contains(character);
}

void PanelFeatures::addLogo(ShapeCanvas& canvas, std::string_view text, const coord_t panel_width, const coord_t panel_height)
{
    if (text.empty())
    {
        return;
    }
    const double char_count = static_cast<double>(text.size());
    const double logo_width = char_count * logo_char_width + (char_count - 1) * logo_char_gap;
    const double x0 = (INT2MM(panel_width) - logo_width) / 2;
    const double y0 = INT2MM(panel_height) * 0.25 - logo_char_height / 2;

    for (size_t char_idx = 0; char_idx < text.size(); ++char_idx)
    {
        const auto glyph = strokeFont().find(text[char_idx]);
        if (glyph == strokeFont().end())
        {
            spdlog::warn("No logo glyph for '{}', leaving a gap", text[char_idx]);
            continue;
        }
        const double cell_x = x0 + static_cast<double>(char_idx) * (logo_char_width + logo_char_gap);
        auto place = [cell_x, y0](const double ux, const double uy)
        {
            return std::make_pair(cell_x + ux * logo_char_width + logo_slant * (1.0 - uy) * logo_char_height, y0 + uy * logo_char_height);
        };

        for (const GlyphStroke& stroke : glyph->second)
        {
            const auto [ax, ay] = place(stroke.x0, stroke.y0);
            const auto [bx, by] = place(stroke.x1, stroke.y1);
            const double length = std::hypot(bx - ax, by - ay);
            const double nx = length > 0 ? -(by - ay) / length : 0.0;
            const double ny = length > 0 ? (bx - ax) / length : 0.0;
            for (const double offset : logo_bold_offsets)
            {
                canvas.addPolyline({ Point2LL(MM2INT(ax + nx * offset), MM2INT(ay + ny * offset)), Point2LL(MM2INT(bx + nx * offset), MM2INT(by + ny * offset)) }, false, ShapeRole::ENGRAVE);
            }
        }
    }
}

std::vector<coord_t> PanelFeatures::spread(const coord_t first, const coord_t last, const size_t count)
{
    std::vector<coord_t> positions;
    if (count == 1)
    {
        positions.push_back(first);
        return positions;
    }
    for (size_t idx = 0; idx < count; ++idx)
    {
        positions.push_back(first + std::llrint(static_cast<double>(last - first) * static_cast<double>(idx) / static_cast<double>(count - 1)));
    }
    return positions;
}

} // namespace kerf
