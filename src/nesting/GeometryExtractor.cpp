// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "nesting/GeometryExtractor.h"

#include <spdlog/spdlog.h>

#include "nesting/AffineTransform.h"
#include "utils/exceptions.h"

namespace kerf
{

PanelGeometry GeometryExtractor::extract(const SvgDocument& document, std::string_view document_name, const bool keep_engrave, const coord_t stroke_width)
{
    std::vector<ShapePrimitive> retained;
    AABB cut_box;
    for (const ShapePrimitive& shape : document.shapes)
    {
        if (shape.isAnnotation() || (shape.role == ShapeRole::ENGRAVE && ! keep_engrave))
        {
            continue;
        }
        if (shape.role == ShapeRole::CUT)
        {
            cut_box.include(shape.boundingBox());
        }
        retained.push_back(shape);
        retained.back().stroke_width = stroke_width;
    }

    if (! cut_box.isValid())
    {
        throw exceptions::EmptyGeometryException(document_name);
    }

    PanelGeometry panel{ cut_box.width(), cut_box.height(), AffineTransform::translate(retained, -cut_box.min_.X, -cut_box.min_.Y) };
    spdlog::debug("Extracted {} shapes from {}: {}x{}mm", panel.primitives.size(), document_name, INT2MM(panel.content_width), INT2MM(panel.content_height));
    return panel;
}

PanelGeometry GeometryExtractor::parse(std::istream& input, std::string_view document_name, const bool keep_engrave, const coord_t stroke_width)
{
    return extract(SvgReader::read(input, document_name), document_name, keep_engrave, stroke_width);
}

PanelGeometry GeometryExtractor::parseFile(const std::filesystem::path& file_path, const bool keep_engrave, const coord_t stroke_width)
{
    return extract(SvgReader::readFile(file_path), file_path.filename().generic_string(), keep_engrave, stroke_width);
}

} // namespace kerf
