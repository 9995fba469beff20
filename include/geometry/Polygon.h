// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef GEOMETRY_POLYGON_H
#define GEOMETRY_POLYGON_H

#include <initializer_list>
#include <vector>

#include "geometry/Point2LL.h"

namespace kerf
{

using Path = std::vector<Point2LL>;

/*!
 * \brief A closed sequence of points.
 *
 * The closing segment from the last point back to the first is implicit: the last point never repeats the first.
 * Outlines produced by the outline builder run clockwise on screen (Y pointing down), starting at the top-left corner
 * of the rectangle they were derived from.
 */
class Polygon
{
private:
    Path points_;

public:
    // Required for some std calls as a container
    using value_type = Point2LL;
    using iterator = typename Path::iterator;
    using const_iterator = typename Path::const_iterator;

    /*! \brief Builds an empty polygon */
    Polygon() = default;

    Polygon(const Polygon& other) = default;

    Polygon(Polygon&& other) = default;

    /*! \brief Constructor with a points initializer list, provided for convenience */
    Polygon(const std::initializer_list<Point2LL>& initializer);

    /*! \brief Constructor that takes ownership of the given list of points */
    explicit Polygon(Path&& points);

    Polygon& operator=(const Polygon& other) = default;

    Polygon& operator=(Polygon&& other) = default;

    [[nodiscard]] const Path& getPoints() const
    {
        return points_;
    }

    [[nodiscard]] size_t size() const
    {
        return points_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return points_.empty();
    }

    void push_back(const Point2LL& point)
    {
        points_.push_back(point);
    }

    [[nodiscard]] const_iterator begin() const
    {
        return points_.begin();
    }

    [[nodiscard]] const_iterator end() const
    {
        return points_.end();
    }

    [[nodiscard]] const Point2LL& front() const
    {
        return points_.front();
    }

    [[nodiscard]] const Point2LL& back() const
    {
        return points_.back();
    }

    const Point2LL& operator[](size_t index) const
    {
        return points_[index];
    }

    /*!
     * Signed area of the polygon, in square micrometres.
     *
     * With the Y axis pointing down (screen and SVG convention) a clockwise polygon has a positive area.
     */
    [[nodiscard]] double area() const;

    /*!
     * Merge consecutive points that lie within \ref EPSILON of each other, then drop a last point that coincides
     * with the first one.
     */
    void mergeCoincidentPoints();

    /*!
     * Whether the polygon is a single simple closed curve: no edge touches an edge it is not connected to and no edge
     * doubles back over the previous one.
     */
    [[nodiscard]] bool isSimple() const;
};

} // namespace kerf

#endif // GEOMETRY_POLYGON_H
