// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef NESTING_GEOMETRY_EXTRACTOR_H
#define NESTING_GEOMETRY_EXTRACTOR_H

#include <filesystem>
#include <istream>
#include <string_view>

#include "nesting/PanelGeometry.h"
#include "shape/SvgReader.h"

namespace kerf
{

/*!
 * \brief Turns a panel drawing back into placeable fabrication geometry.
 *
 * Annotations are dropped, engraved shapes are dropped unless asked for, and the size of the part is measured from its
 * cut shapes only, since engraving never changes the extent of the piece that falls out of the sheet.
 */
class GeometryExtractor
{
public:
    //! Stroke width the laser service expects on a fabrication sheet.
    static constexpr coord_t fabrication_stroke_width = 10;

    /*!
     * \throws exceptions::EmptyGeometryException when the document has no cut shapes.
     */
    static PanelGeometry extract(const SvgDocument& document, std::string_view document_name, bool keep_engrave, coord_t stroke_width = fabrication_stroke_width);

    static PanelGeometry parse(std::istream& input, std::string_view document_name, bool keep_engrave, coord_t stroke_width = fabrication_stroke_width);

    static PanelGeometry parseFile(const std::filesystem::path& file_path, bool keep_engrave, coord_t stroke_width = fabrication_stroke_width);
};

} // namespace kerf

#endif // NESTING_GEOMETRY_EXTRACTOR_H
