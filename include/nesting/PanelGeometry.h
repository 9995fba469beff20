// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef NESTING_PANEL_GEOMETRY_H
#define NESTING_PANEL_GEOMETRY_H

#include <vector>

#include "shape/ShapePrimitive.h"

namespace kerf
{

/*!
 * The fabrication geometry of one part, normalized so that the bounding box of its cut shapes starts at (0, 0).
 */
struct PanelGeometry
{
    coord_t content_width = 0;
    coord_t content_height = 0;
    std::vector<ShapePrimitive> primitives;
};

} // namespace kerf

#endif // NESTING_PANEL_GEOMETRY_H
