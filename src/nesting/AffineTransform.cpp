// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "nesting/AffineTransform.h"

#include <algorithm>
#include <cstdlib>
#include <type_traits>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

namespace kerf
{

namespace
{

/*!
 * Apply a rigid point mapping to every primitive.
 *
 * Rectangles are mapped through two opposite corners, so a quarter turn swaps their width and height.
 */
template<typename PointMap>
std::vector<ShapePrimitive> mapPrimitives(const std::vector<ShapePrimitive>& primitives, const PointMap& map_point)
{
    auto map_primitive = [&map_point](const ShapePrimitive& primitive)
    {
        ShapePrimitive mapped = primitive;
        std::visit(
            [&map_point](auto& shape)
            {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, RectShape> || std::is_same_v<T, RoundedRectShape>)
                {
                    const Point2LL a = map_point(shape.position);
                    const Point2LL b = map_point(shape.position + Point2LL(shape.width, shape.height));
                    shape.position = Point2LL(std::min(a.X, b.X), std::min(a.Y, b.Y));
                    shape.width = std::abs(b.X - a.X);
                    shape.height = std::abs(b.Y - a.Y);
                }
                else if constexpr (std::is_same_v<T, CircleShape>)
                {
                    shape.center = map_point(shape.center);
                }
                else if constexpr (std::is_same_v<T, PathShape>)
                {
                    shape.points = shape.points | ranges::views::transform(map_point) | ranges::to<Path>();
                }
                else if constexpr (std::is_same_v<T, TextShape>)
                {
                    shape.position = map_point(shape.position);
                }
            },
            mapped.geometry);
        return mapped;
    };
    return primitives | ranges::views::transform(map_primitive) | ranges::to_vector;
}

} // namespace

std::vector<ShapePrimitive> AffineTransform::translate(const std::vector<ShapePrimitive>& primitives, const coord_t dx, const coord_t dy)
{
    const Point2LL offset(dx, dy);
    return mapPrimitives(
        primitives,
        [offset](const Point2LL& point)
        {
            return point + offset;
        });
}

std::vector<ShapePrimitive> AffineTransform::rotate90CW(const std::vector<ShapePrimitive>& primitives, [[maybe_unused]] const coord_t width, const coord_t height)
{
    return mapPrimitives(
        primitives,
        [height](const Point2LL& point)
        {
            return Point2LL(height - point.Y, point.X);
        });
}

std::vector<ShapePrimitive> AffineTransform::rotate180(const std::vector<ShapePrimitive>& primitives, const coord_t width, const coord_t height)
{
    return mapPrimitives(
        primitives,
        [width, height](const Point2LL& point)
        {
            return Point2LL(width - point.X, height - point.Y);
        });
}

PanelGeometry AffineTransform::translate(const PanelGeometry& panel, const coord_t dx, const coord_t dy)
{
    return PanelGeometry{ panel.content_width, panel.content_height, translate(panel.primitives, dx, dy) };
}

PanelGeometry AffineTransform::rotate90CW(const PanelGeometry& panel)
{
    return PanelGeometry{ panel.content_height, panel.content_width, rotate90CW(panel.primitives, panel.content_width, panel.content_height) };
}

PanelGeometry AffineTransform::rotate180(const PanelGeometry& panel)
{
    return PanelGeometry{ panel.content_width, panel.content_height, rotate180(panel.primitives, panel.content_width, panel.content_height) };
}

} // namespace kerf
