// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "geometry/Polygon.h"

#include <algorithm>

namespace kerf
{

namespace
{

//! Sign of the turn from a->b to a->c: positive counter-clockwise in a Y-up frame, zero when collinear.
int orientation(const Point2LL& a, const Point2LL& b, const Point2LL& c)
{
    const coord_t turn = cross(b - a, c - a);
    return (turn > 0) - (turn < 0);
}

//! For a point collinear with segment a-b, whether it lies on the segment.
bool onSegment(const Point2LL& a, const Point2LL& b, const Point2LL& point)
{
    return std::min(a.X, b.X) <= point.X && point.X <= std::max(a.X, b.X) && std::min(a.Y, b.Y) <= point.Y && point.Y <= std::max(a.Y, b.Y);
}

bool segmentsTouch(const Point2LL& a, const Point2LL& b, const Point2LL& c, const Point2LL& d)
{
    const int side_c = orientation(a, b, c);
    const int side_d = orientation(a, b, d);
    const int side_a = orientation(c, d, a);
    const int side_b = orientation(c, d, b);
    if (side_c * side_d < 0 && side_a * side_b < 0)
    {
        return true;
    }
    return (side_c == 0 && onSegment(a, b, c)) || (side_d == 0 && onSegment(a, b, d)) || (side_a == 0 && onSegment(c, d, a)) || (side_b == 0 && onSegment(c, d, b));
}

} // namespace

Polygon::Polygon(const std::initializer_list<Point2LL>& initializer)
    : points_(initializer)
{
}

Polygon::Polygon(Path&& points)
    : points_(std::move(points))
{
}

double Polygon::area() const
{
    if (points_.size() < 3)
    {
        return 0.0;
    }

    double doubled_area = 0.0;
    Point2LL previous = points_.back();
    for (const Point2LL& point : points_)
    {
        doubled_area += static_cast<double>(previous.X) * static_cast<double>(point.Y) - static_cast<double>(point.X) * static_cast<double>(previous.Y);
        previous = point;
    }
    return doubled_area / 2.0;
}

void Polygon::mergeCoincidentPoints()
{
    if (points_.empty())
    {
        return;
    }

    Path merged;
    merged.reserve(points_.size());
    merged.push_back(points_.front());
    for (size_t point_idx = 1; point_idx < points_.size(); ++point_idx)
    {
        if (! fuzzy_equal(points_[point_idx], merged.back()))
        {
            merged.push_back(points_[point_idx]);
        }
    }
    if (merged.size() > 1 && fuzzy_equal(merged.front(), merged.back()))
    {
        merged.pop_back();
    }
    points_ = std::move(merged);
}

bool Polygon::isSimple() const
{
    const size_t count = points_.size();
    if (count < 3)
    {
        return false;
    }
    for (size_t edge_idx = 0; edge_idx < count; ++edge_idx)
    {
        const Point2LL& start = points_[edge_idx];
        const Point2LL& end = points_[(edge_idx + 1) % count];
        const Point2LL& after = points_[(edge_idx + 2) % count];
        const coord_t forward = (end.X - start.X) * (after.X - end.X) + (end.Y - start.Y) * (after.Y - end.Y);
        if (orientation(start, end, after) == 0 && forward < 0)
        {
            return false;
        }
        // Edges edge_idx and edge_idx + 1 share a point, as do the last and the first edge.
        for (size_t other_idx = edge_idx + 2; other_idx < count; ++other_idx)
        {
            if (edge_idx == 0 && other_idx == count - 1)
            {
                continue;
            }
            if (segmentsTouch(start, end, points_[other_idx], points_[(other_idx + 1) % count]))
            {
                return false;
            }
        }
    }
    return true;
}

} // namespace kerf
