// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher.

#ifndef GEOMETRY_POINT2LL_H
#define GEOMETRY_POINT2LL_H

/**
The integer point class represents micrometres in 2D space.
Integer points are used to avoid floating point rounding errors, so that two panels computing the same joint get bit-identical
coordinates.
*/
#define INLINE static inline

#include <cmath>
#include <limits>

#include "utils/Coord_t.h"
#include "utils/types/generic.h"

namespace kerf
{

struct Point2LL
{
    coord_t X{ 0 };
    coord_t Y{ 0 };

    Point2LL() = default;

    Point2LL(const coord_t x, const coord_t y)
        : X(x)
        , Y(y)
    {
    }

    bool operator==(const Point2LL& other) const = default;
};

#define POINT_MIN std::numeric_limits<coord_t>::min()
#define POINT_MAX std::numeric_limits<coord_t>::max()

/* Extra operators to make it easier to do math with the 64bit Point objects */
INLINE Point2LL operator-(const Point2LL& p0)
{
    return { -p0.X, -p0.Y };
}

INLINE Point2LL operator+(const Point2LL& p0, const Point2LL& p1)
{
    return { p0.X + p1.X, p0.Y + p1.Y };
}

INLINE Point2LL operator-(const Point2LL& p0, const Point2LL& p1)
{
    return { p0.X - p1.X, p0.Y - p1.Y };
}

INLINE Point2LL operator*(const Point2LL& p0, const coord_t i)
{
    return { p0.X * i, p0.Y * i };
}

template<utils::numeric T> // Use only for numeric types.
INLINE Point2LL operator*(const Point2LL& p0, const T i)
{
    return { std::llrint(static_cast<T>(p0.X) * i), std::llrint(static_cast<T>(p0.Y) * i) };
}

template<utils::numeric T>
INLINE Point2LL operator*(const T i, const Point2LL& p0)
{
    return p0 * i;
}

INLINE Point2LL operator/(const Point2LL& p0, const coord_t i)
{
    return { p0.X / i, p0.Y / i };
}

INLINE Point2LL& operator+=(Point2LL& p0, const Point2LL& p1)
{
    p0.X += p1.X;
    p0.Y += p1.Y;
    return p0;
}

INLINE Point2LL& operator-=(Point2LL& p0, const Point2LL& p1)
{
    p0.X -= p1.X;
    p0.Y -= p1.Y;
    return p0;
}

/*!
 * Whether two points are the same up to \ref EPSILON on both axes.
 */
INLINE bool fuzzy_equal(const Point2LL& p0, const Point2LL& p1)
{
    return fuzzy_equal(p0.X, p1.X) && fuzzy_equal(p0.Y, p1.Y);
}

INLINE coord_t cross(const Point2LL& p0, const Point2LL& p1)
{
    return p0.X * p1.Y - p0.Y * p1.X;
}

} // namespace kerf

#endif // GEOMETRY_POINT2LL_H
