// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef SHAPE_SVG_READER_H
#define SHAPE_SVG_READER_H

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "shape/ShapePrimitive.h"

namespace kerf
{

/*!
 * The drawable content of an SVG document, in page coordinates.
 */
struct SvgDocument
{
    coord_t width = 0;
    coord_t height = 0; //!< From the viewBox, or the height attribute when there is no viewBox.
    std::vector<ShapePrimitive> shapes; //!< Rectangles, circles and paths in document order.
};

/*!
 * \brief Reads back the flat SVG documents written by \ref ShapeCanvas.
 *
 * Only direct children of the root element are read. Text and unknown elements are skipped. Paths may use absolute
 * M and L commands, bare coordinate pairs and Z.
 */
class SvgReader
{
public:
    /*!
     * \throws exceptions::SvgParseException on malformed XML, a missing root element, a missing or non-numeric
     * attribute, or a path command other than M, L or Z.
     */
    static SvgDocument read(std::istream& input, std::string_view document_name);

    static SvgDocument readFile(const std::filesystem::path& file_path);

    /*!
     * Blue strokes are engraved, anything else is cut. The comparison ignores case.
     */
    static ShapeRole roleFromStroke(std::string_view stroke);

    static PathShape parsePathData(std::string_view path_data, std::string_view document_name);
};

} // namespace kerf

#endif // SHAPE_SVG_READER_H
