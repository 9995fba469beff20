// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef PANELS_PANEL_OUTLINES_H
#define PANELS_PANEL_OUTLINES_H

#include <utility>
#include <vector>

#include "outline/FingerOutline.h"

namespace kerf
{

struct EnclosureConfig;

/*!
 * \brief The finger-jointed outlines of the enclosure shell and the slots that receive their fingers.
 *
 * Mating edges are built from the same pattern zone, so a slot or notch on one panel falls exactly where the finger of
 * the other panel lands.
 */
class PanelOutlines
{
public:
    /*!
     * Top and bottom panels: ext_x by interior_y, fingers on the front and back edges reaching into the notches of the
     * front and back panels. The sides are straight; the side panels pass through slots instead.
     */
    static OutlineSpec topBottom(const EnclosureConfig& config);

    /*!
     * Front and back panels: they sit between the side panels and reach into the top and bottom panels. Their top and
     * bottom notches follow the finger pattern of the top/bottom panel shifted by the position of the side panel inner
     * face; their side fingers pass through the face of the side panels.
     */
    static OutlineSpec frontBack(const EnclosureConfig& config);

    /*!
     * Side panels: fingers on the top and bottom edges over the interior depth, with flat wings that wrap around the
     * front and back panels.
     */
    static OutlineSpec side(const EnclosureConfig& config);

    /*!
     * Spans along the interior depth, from the front panel inner face, of the slots in the top and bottom panels that
     * receive the side panel fingers.
     */
    static std::vector<std::pair<coord_t, coord_t>> topBottomSideSlotSpans(const EnclosureConfig& config);

    /*!
     * Spans along the side panel height, from its top edge, of the slots that receive the front and back panel side
     * fingers.
     */
    static std::vector<std::pair<coord_t, coord_t>> sideFaceSlotSpans(const EnclosureConfig& config);
};

} // namespace kerf

#endif // PANELS_PANEL_OUTLINES_H
