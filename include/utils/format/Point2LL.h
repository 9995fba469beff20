// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_FORMAT_POINT2LL_H
#define UTILS_FORMAT_POINT2LL_H

#include <fmt/format.h>

#include "geometry/Point2LL.h"

namespace fmt
{
/*!
 * Writes a point in millimetres, e.g. "(12.5, 3)".
 */
template<>
struct formatter<kerf::Point2LL> : formatter<string_view>
{
    template<typename FormatContext>
    auto format(const kerf::Point2LL& point, FormatContext& ctx) const
    {
        return formatter<string_view>::format(fmt::format("({}, {})", INT2MM(point.X), INT2MM(point.Y)), ctx);
    }
};

} // namespace fmt

#endif // UTILS_FORMAT_POINT2LL_H
