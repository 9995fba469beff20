// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "nesting/Sheet.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "nesting/AffineTransform.h"
#include "utils/format/Point2LL.h"

namespace kerf
{

Sheet::Sheet(std::string name, const coord_t width, const coord_t height)
    : name_(std::move(name))
    , width_(width)
    , height_(height)
{
}

AABB Sheet::place(const PanelGeometry& part, const Rotation rotation, const Point2LL& position)
{
    PanelGeometry oriented;
    switch (rotation)
    {
    case Rotation::CW90:
        oriented = AffineTransform::rotate90CW(part);
        break;
    case Rotation::HALF:
        oriented = AffineTransform::rotate180(part);
        break;
    case Rotation::NONE:
        oriented = part;
        break;
    }

    const PanelGeometry placed = AffineTransform::translate(oriented, position.X, position.Y);
    primitives_.insert(primitives_.end(), placed.primitives.begin(), placed.primitives.end());

    const AABB footprint(position, position + Point2LL(placed.content_width, placed.content_height));
    footprints_.push_back(footprint);
    spdlog::debug("Placed {}x{}mm part on {} at {}", INT2MM(placed.content_width), INT2MM(placed.content_height), name_, position);
    return footprint;
}

void Sheet::addLabel(std::string text, const Point2LL& part_origin)
{
    labels_.push_back(SheetLabel{ std::move(text), part_origin });
}

AABB Sheet::bounds() const
{
    AABB total;
    for (const AABB& footprint : footprints_)
    {
        total.include(footprint);
    }
    return total;
}

bool Sheet::checkBounds()
{
    const AABB total = bounds();
    if (! total.isValid() || (total.max_.X <= width_ && total.max_.Y <= height_))
    {
        return true;
    }
    std::string warning = fmt::format(
        "Parts on {} don't fit on the {}x{}mm sheet, they need {}x{}mm",
        name_,
        ShapeCanvas::formatMM(width_),
        ShapeCanvas::formatMM(height_),
        ShapeCanvas::formatMM(total.max_.X),
        ShapeCanvas::formatMM(total.max_.Y));
    spdlog::warn("{}", warning);
    warnings_.push_back(std::move(warning));
    return false;
}

ShapeCanvas Sheet::toCanvas() const
{
    const AABB total = bounds();
    const coord_t used_width = total.isValid() ? total.max_.X : 0;
    const coord_t used_height = total.isValid() ? total.max_.Y : 0;

    ShapeCanvas canvas(used_width, used_height, 0);
    canvas.setComment(fmt::format("Ponoko sheet: {}x{}mm. Red=cut, Blue=engrave.", ShapeCanvas::formatMM(used_width), ShapeCanvas::formatMM(used_height)));
    for (const SheetLabel& label : labels_)
    {
        canvas.addAnnotation(label.text, label.part_origin - Point2LL(0, label_lift), label_font_size, label_fill);
    }
    for (const ShapePrimitive& primitive : primitives_)
    {
        canvas.addPrimitive(primitive);
    }
    return canvas;
}

void Sheet::save(const std::filesystem::path& file_path) const
{
    const ShapeCanvas canvas = toCanvas();
    canvas.save(file_path);
    spdlog::info("  {} ({}x{}mm)", file_path.filename().generic_string(), ShapeCanvas::formatMM(canvas.getContentWidth()), ShapeCanvas::formatMM(canvas.getContentHeight()));
}

} // namespace kerf
