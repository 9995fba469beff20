// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "shape/ShapePrimitive.h"

#include <type_traits>

namespace kerf
{

AABB ShapePrimitive::boundingBox() const
{
    return std::visit(
        [](const auto& shape) -> AABB
        {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, RectShape> || std::is_same_v<T, RoundedRectShape>)
            {
                return AABB(shape.position, shape.position + Point2LL(shape.width, shape.height));
            }
            else if constexpr (std::is_same_v<T, CircleShape>)
            {
                const Point2LL extent(shape.radius, shape.radius);
                return AABB(shape.center - extent, shape.center + extent);
            }
            else if constexpr (std::is_same_v<T, PathShape>)
            {
                return AABB(shape.points);
            }
            else
            {
                return AABB();
            }
        },
        geometry);
}

} // namespace kerf
