// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "utils/AABB.h"

#include <algorithm>
#include <limits>

namespace kerf
{


AABB::AABB()
    : min_(POINT_MAX, POINT_MAX)
    , max_(POINT_MIN, POINT_MIN)
{
}

AABB::AABB(const Point2LL& min, const Point2LL& max)
    : min_(min)
    , max_(max)
{
}

AABB::AABB(const Path& points)
    : min_(POINT_MAX, POINT_MAX)
    , max_(POINT_MIN, POINT_MIN)
{
    include(points);
}

AABB::AABB(const Polygon& poly)
    : min_(POINT_MAX, POINT_MAX)
    , max_(POINT_MIN, POINT_MIN)
{
    include(poly.getPoints());
}

bool AABB::contains(const Point2LL& point) const
{
    return point.X >= min_.X && point.X <= max_.X && point.Y >= min_.Y && point.Y <= max_.Y;
}

bool AABB::contains(const AABB& other) const
{
    if (area() < 0)
    {
        return false;
    }
    if (other.area() < 0)
    {
        return true;
    }
    return other.min_.X >= min_.X && other.max_.X <= max_.X && other.min_.Y >= min_.Y && other.max_.Y <= max_.Y;
}

coord_t AABB::area() const
{
    if (max_.X < min_.X || max_.Y < min_.Y)
    {
        return -1;
    } // Do the unititialized check explicitly, so there aren't any problems with over/underflow and POINT_MAX/POINT_MIN.
    return (max_.X - min_.X) * (max_.Y - min_.Y);
}

bool AABB::isValid() const
{
    return area() >= 0;
}

bool AABB::hit(const AABB& other) const
{
    if (max_.X < other.min_.X)
        return false;
    if (min_.X > other.max_.X)
        return false;
    if (max_.Y < other.min_.Y)
        return false;
    if (min_.Y > other.max_.Y)
        return false;
    return true;
}

void AABB::include(const Point2LL& point)
{
    min_.X = std::min(min_.X, point.X);
    min_.Y = std::min(min_.Y, point.Y);
    max_.X = std::max(max_.X, point.X);
    max_.Y = std::max(max_.Y, point.Y);
}

void AABB::include(const Path& points)
{
    for (const Point2LL& point : points)
    {
        include(point);
    }
}

void AABB::include(const AABB& other)
{
    // Note that this is different from including the min and max points, since when 'min > max' it's used to denote an negative/empty box.
    min_.X = std::min(min_.X, other.min_.X);
    min_.Y = std::min(min_.Y, other.min_.Y);
    max_.X = std::max(max_.X, other.max_.X);
    max_.Y = std::max(max_.Y, other.max_.Y);
}

void AABB::expand(coord_t dist)
{
    if (! isValid())
    {
        return;
    }
    min_.X -= dist;
    min_.Y -= dist;
    max_.X += dist;
    max_.Y += dist;
}

} // namespace kerf
