// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher.

#ifndef UTILS_COORD_T_H
#define UTILS_COORD_T_H

#include <cmath>
#include <cstdint>

namespace kerf
{

/*!
 * Fixed point coordinate, in micrometres.
 *
 * Every length crossing an external interface (settings, SVG, DXF) is in millimetres and is converted with MM2INT and
 * INT2MM on the boundary.
 */
using coord_t = std::int64_t;

//! Two points closer than this along both axes are the same point.
constexpr coord_t EPSILON = 1;

#define INT2MM(n) (static_cast<double>(n) / 1000.0)
#define MM2INT(n) (static_cast<coord_t>((n) * 1000 + 0.5 * (((n) > 0) - ((n) < 0))))

/*! Returns true if the given value is null or small enough to be considered null */
[[nodiscard]] inline bool fuzzy_is_zero(const coord_t value)
{
    return std::abs(value) <= EPSILON;
}

/*! Returns true if the given values are equal or close enough to be considered equal */
[[nodiscard]] inline bool fuzzy_equal(const coord_t a, const coord_t b)
{
    return fuzzy_is_zero(b - a);
}

} // namespace kerf


#endif // UTILS_COORD_T_H
