// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef SHAPE_SHAPE_CANVAS_H
#define SHAPE_SHAPE_CANVAS_H

#include <filesystem>
#include <string>
#include <vector>

#include "shape/ShapePrimitive.h"
#include "utils/NoCopy.h"

namespace kerf
{

/*!
 * \brief Collects the shapes of one drawing and writes them as an SVG document in millimetres.
 *
 * Shapes are added in drawing coordinates; the written page is the content size plus a margin on every side and all
 * coordinates are shifted by that margin. Shapes can only be appended.
 */
class ShapeCanvas : NoCopy
{
public:
    static constexpr coord_t default_margin = 5000;
    static constexpr double default_font_size = 3.0;
    static constexpr std::string_view annotation_fill = "#999";
    static constexpr std::string_view default_comment = "Red=cut, Blue=score/engrave. All dims in mm.";

    ShapeCanvas(coord_t content_width, coord_t content_height, coord_t margin = default_margin);

    ShapeCanvas(ShapeCanvas&& other) noexcept = default;
    ShapeCanvas& operator=(ShapeCanvas&& other) noexcept = default;

    void addRect(const Point2LL& position, coord_t width, coord_t height, ShapeRole role = ShapeRole::CUT);

    void addRoundedRect(const Point2LL& position, coord_t width, coord_t height, coord_t radius, ShapeRole role = ShapeRole::CUT);

    /*!
     * A rounded rectangle with fully rounded short ends.
     */
    void addSlot(const Point2LL& position, coord_t width, coord_t height, ShapeRole role = ShapeRole::CUT);

    void addCircle(const Point2LL& center, coord_t radius, ShapeRole role = ShapeRole::CUT);

    /*!
     * \throws exceptions::GeometryException when \p points holds fewer than two points.
     */
    void addPolyline(Path points, bool closed, ShapeRole role = ShapeRole::CUT);

    void addPolygon(const Polygon& polygon, ShapeRole role = ShapeRole::CUT);

    void addAnnotation(std::string text, const Point2LL& position, double font_size = default_font_size, std::string_view fill = annotation_fill);

    /*!
     * Add a shape as is, keeping its stroke width.
     */
    void addPrimitive(ShapePrimitive primitive);

    void setComment(std::string comment);

    [[nodiscard]] const std::vector<ShapePrimitive>& getPrimitives() const
    {
        return primitives_;
    }

    [[nodiscard]] coord_t getContentWidth() const
    {
        return content_width_;
    }

    [[nodiscard]] coord_t getContentHeight() const
    {
        return content_height_;
    }

    [[nodiscard]] coord_t getMargin() const
    {
        return margin_;
    }

    [[nodiscard]] std::string toSvg() const;

    /*!
     * \throws exceptions::FileWriteException when the file cannot be written.
     */
    void save(const std::filesystem::path& file_path) const;

    /*!
     * Millimetres with at most three decimals, without trailing zeros or a trailing decimal point.
     */
    static std::string formatMM(coord_t value);

    static std::string formatNumber(double value);

private:
    coord_t content_width_;
    coord_t content_height_;
    coord_t margin_;
    std::string comment_;
    std::vector<ShapePrimitive> primitives_;
};

} // namespace kerf

#endif // SHAPE_SHAPE_CANVAS_H
