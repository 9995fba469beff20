// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher.

#ifndef UTILS_AABB_H
#define UTILS_AABB_H

#include "geometry/Point2LL.h"
#include "geometry/Polygon.h"

namespace kerf
{

/* Axis aligned boundary box */
class AABB
{
public:
    Point2LL min_, max_;

    AABB(); //!< initializes with invalid min and max
    AABB(const Point2LL& min, const Point2LL& max); //!< initializes with given min and max
    explicit AABB(const Path& points); //!< Computes the boundary box for the given points
    explicit AABB(const Polygon& poly); //!< Computes the boundary box for the given polygon

    /*!
     * Whether the bounding box contains the specified point.
     * \param point The point to check whether it is inside the bounding box.
     * \return ``true`` if the bounding box contains the specified point, or
     * ``false`` otherwise.
     */
    bool contains(const Point2LL& point) const;

    /*!
     * Whether this bounding box contains the other bounding box.
     */
    bool contains(const AABB& other) const;

    /*!
     * Returns the area of this bounding box.
     * Note: Area is negative for uninitialized, and 0 for empty.
     */
    coord_t area() const;

    /*!
     * Whether anything was ever included in this box.
     */
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] coord_t width() const
    {
        return max_.X - min_.X;
    }

    [[nodiscard]] coord_t height() const
    {
        return max_.Y - min_.Y;
    }

    /*!
     * Check whether this aabb overlaps with another.
     *
     * In the boundary case true is returned.
     *
     * \param other the aabb to check for overlaps with
     * \return Whether the two aabbs overlap
     */
    bool hit(const AABB& other) const;

    /*!
     * \brief Includes the specified point in the bounding box.
     *
     * The bounding box is expanded if the point is not within the bounding box.
     *
     * \param point The point to include in the bounding box.
     */
    void include(const Point2LL& point);

    void include(const Path& points);

    /*!
     * \brief Includes the specified bounding box in the bounding box.
     *
     * The bounding box is expanded to include the other bounding box.
     *
     * This performs a union on two bounding boxes.
     *
     * \param other The bounding box to include in this one.
     */
    void include(const AABB& other);

    /*!
     * Expand the borders of the bounding box in each direction with the given amount
     *
     * \param dist The distance by which to expand the borders of the bounding box
     */
    void expand(coord_t dist);
};

} // namespace kerf
#endif // UTILS_AABB_H
