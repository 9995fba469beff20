// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef PANELS_PANEL_FEATURES_H
#define PANELS_PANEL_FEATURES_H

#include <string_view>
#include <vector>

#include "shape/ShapeCanvas.h"

namespace kerf
{

struct EnclosureConfig;

/*!
 * A rectangular field filled with a regular grid of vent slots.
 */
struct VentGrid
{
    AABB field;
    coord_t slot_width;
    coord_t slot_height;
    coord_t web; //!< Material left between neighbouring slots.
    std::vector<AABB> exclusions; //!< Slots overlapping any of these are left out.
};

/*!
 * Concentric rings of arc slots, open enough for airflow and too narrow for a finger.
 */
struct FanGrille
{
    Point2LL center;
    coord_t radius = MM2INT(37.0);
    coord_t hub_radius = MM2INT(6.0);
    coord_t slot_width = MM2INT(3.0);
    coord_t ring_gap = MM2INT(4.0);
    coord_t spoke_gap = MM2INT(3.0);
};

/*!
 * \brief Cut-outs and engravings shared by several panels.
 */
class PanelFeatures
{
public:
    /*!
     * Rod clearance holes with engraved grommet rings, inset from the four corners of a horizontal panel.
     */
    static void addRodHoles(ShapeCanvas& canvas, const EnclosureConfig& config, coord_t width, coord_t height);

    /*!
     * Centre the largest grid of slots that fits the field and cut every slot that does not overlap an exclusion.
     *
     * \return The number of slots cut.
     */
    static size_t addVentGrid(ShapeCanvas& canvas, const VentGrid& grid);

    /*!
     * \return The ring start radii that fit inside the grille.
     */
    static std::vector<coord_t> grilleRings(const FanGrille& grille);

    /*!
     * Every arc slot is one closed path: the outer arc forwards, then the inner arc backwards.
     *
     * \return The number of slots cut.
     */
    static size_t addFanGrille(ShapeCanvas& canvas, const FanGrille& grille);

    /*!
     * Engrave \p text in a slanted single-stroke font, each stroke drawn three times side by side for weight.
     * Characters without a glyph leave a gap. The text is centred across the panel, a quarter of the way down.
     */
    static void addLogo(ShapeCanvas& canvas, std::string_view text, coord_t panel_width, coord_t panel_height);

    /*!
     * Whether the stroke font has a glyph for \p character.
     */
    static bool hasGlyph(char character);

    /*!
     * Positions spread evenly from \p first to \p last inclusive.
     */
    static std::vector<coord_t> spread(coord_t first, coord_t last, size_t count);
};

} // namespace kerf

#endif // PANELS_PANEL_FEATURES_H
