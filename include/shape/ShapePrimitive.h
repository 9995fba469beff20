// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef SHAPE_SHAPE_PRIMITIVE_H
#define SHAPE_SHAPE_PRIMITIVE_H

#include <string>
#include <string_view>
#include <variant>

#include "geometry/Polygon.h"
#include "utils/AABB.h"

namespace kerf
{

/*!
 * What the laser does with a shape: cut through the sheet or only score its surface.
 */
enum class ShapeRole
{
    CUT,
    ENGRAVE,
};

constexpr std::string_view cut_stroke_colour = "#ff0000";
constexpr std::string_view engrave_stroke_colour = "#0000ff";

[[nodiscard]] constexpr std::string_view strokeColour(const ShapeRole role)
{
    return role == ShapeRole::ENGRAVE ? engrave_stroke_colour : cut_stroke_colour;
}

//! Stroke width of shapes on a panel drawing.
constexpr coord_t panel_stroke_width = 100;

struct RectShape
{
    Point2LL position; //!< Top-left corner.
    coord_t width;
    coord_t height;
};

struct RoundedRectShape
{
    Point2LL position; //!< Top-left corner of the unrounded rectangle.
    coord_t width;
    coord_t height;
    coord_t radius;
};

struct CircleShape
{
    Point2LL center;
    coord_t radius;
};

struct PathShape
{
    Path points;
    bool closed;
};

/*!
 * A label on a drawing. Never structural: it is ignored by bounding boxes and fabrication output.
 */
struct TextShape
{
    Point2LL position; //!< Baseline start.
    std::string text;
    double font_size; //!< In millimetres.
    std::string fill;
};

using ShapeGeometry = std::variant<RectShape, RoundedRectShape, CircleShape, PathShape, TextShape>;

struct ShapePrimitive
{
    ShapeGeometry geometry;
    ShapeRole role = ShapeRole::CUT;
    coord_t stroke_width = panel_stroke_width;

    [[nodiscard]] bool isAnnotation() const
    {
        return std::holds_alternative<TextShape>(geometry);
    }

    /*!
     * The extent of the geometry, ignoring stroke width. Invalid for annotations and empty paths.
     */
    [[nodiscard]] AABB boundingBox() const;
};

} // namespace kerf

#endif // SHAPE_SHAPE_PRIMITIVE_H
