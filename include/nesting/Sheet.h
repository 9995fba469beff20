// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef NESTING_SHEET_H
#define NESTING_SHEET_H

#include <filesystem>
#include <string>
#include <vector>

#include "nesting/PanelGeometry.h"
#include "shape/ShapeCanvas.h"

namespace kerf
{

enum class Rotation
{
    NONE,
    CW90,
    HALF,
};

struct SheetLabel
{
    std::string text;
    Point2LL part_origin;
};

/*!
 * \brief One fabrication sheet with parts placed on it.
 *
 * Parts are rotated about their own content box first and then moved so that the box starts at the given position.
 * The written document is as large as the placed parts need, not as large as the sheet; exceeding the sheet is
 * reported but never an error.
 */
class Sheet
{
public:
    static constexpr double label_font_size = 4.0;
    static constexpr std::string_view label_fill = "#cccccc";
    static constexpr coord_t label_lift = 2000; //!< Labels sit this far above the part origin.

    Sheet(std::string name, coord_t width, coord_t height);

    /*!
     * \return The footprint of the placed part on the sheet.
     */
    AABB place(const PanelGeometry& part, Rotation rotation, const Point2LL& position);

    void addLabel(std::string text, const Point2LL& part_origin);

    /*!
     * Union of the footprints of all placed parts. Invalid while the sheet is empty.
     */
    [[nodiscard]] AABB bounds() const;

    /*!
     * Compare the placed parts against the sheet size, logging and recording a warning when they do not fit.
     *
     * \return Whether the parts fit.
     */
    bool checkBounds();

    [[nodiscard]] const std::vector<std::string>& getWarnings() const
    {
        return warnings_;
    }

    [[nodiscard]] const std::vector<ShapePrimitive>& getPrimitives() const
    {
        return primitives_;
    }

    [[nodiscard]] size_t partCount() const
    {
        return footprints_.size();
    }

    [[nodiscard]] const std::string& getName() const
    {
        return name_;
    }

    [[nodiscard]] ShapeCanvas toCanvas() const;

    void save(const std::filesystem::path& file_path) const;

private:
    std::string name_;
    coord_t width_;
    coord_t height_;
    std::vector<ShapePrimitive> primitives_;
    std::vector<AABB> footprints_;
    std::vector<SheetLabel> labels_;
    std::vector<std::string> warnings_;
};

} // namespace kerf

#endif // NESTING_SHEET_H
