// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef NESTING_AFFINE_TRANSFORM_H
#define NESTING_AFFINE_TRANSFORM_H

#include <vector>

#include "nesting/PanelGeometry.h"

namespace kerf
{

/*!
 * \brief Rigid moves of primitive lists on a fabrication sheet.
 *
 * Every operation returns new primitives with the same count, order and roles. Rotations work on a content box of
 * \p width by \p height with its minimum corner at the origin and map that box onto itself (180 degrees) or onto a box
 * of \p height by \p width (90 degrees clockwise). Radii never change.
 */
class AffineTransform
{
public:
    static std::vector<ShapePrimitive> translate(const std::vector<ShapePrimitive>& primitives, coord_t dx, coord_t dy);

    /*!
     * (x, y) becomes (height - y, x).
     */
    static std::vector<ShapePrimitive> rotate90CW(const std::vector<ShapePrimitive>& primitives, coord_t width, coord_t height);

    /*!
     * (x, y) becomes (width - x, height - y).
     */
    static std::vector<ShapePrimitive> rotate180(const std::vector<ShapePrimitive>& primitives, coord_t width, coord_t height);

    static PanelGeometry translate(const PanelGeometry& panel, coord_t dx, coord_t dy);

    //! Rotated panel, with its content size swapped.
    static PanelGeometry rotate90CW(const PanelGeometry& panel);

    static PanelGeometry rotate180(const PanelGeometry& panel);
};

} // namespace kerf

#endif // NESTING_AFFINE_TRANSFORM_H
