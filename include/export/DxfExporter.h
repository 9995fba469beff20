// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef EXPORT_DXF_EXPORTER_H
#define EXPORT_DXF_EXPORTER_H

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "shape/SvgReader.h"

namespace kerf
{

enum class DxfLayer
{
    CUT,
    ENGRAVE,
};

[[nodiscard]] constexpr std::string_view toString(const DxfLayer layer)
{
    return layer == DxfLayer::ENGRAVE ? "ENGRAVE" : "CUT";
}

/*!
 * One DXF entity in drawing coordinates, Y pointing up.
 */
struct DxfEntity
{
    enum class Type
    {
        CIRCLE,
        LWPOLYLINE,
    };

    Type type;
    DxfLayer layer;
    Path points; //!< The circle center, or the polyline vertices. A closed polyline never repeats its first vertex.
    coord_t radius = 0;
    bool closed = false;
};

/*!
 * \brief Converts a fabrication sheet drawing into an AutoCAD DXF exchange file.
 *
 * The file has the two layers CUT and ENGRAVE, millimetre units and only CIRCLE and LWPOLYLINE entities. Rounded
 * corners are cut off with a straight segment, which is fine at the radii used on the panels. Text is never exported.
 */
class DxfExporter
{
public:
    //! First and last vertex of a path closer than this along both axes close the path.
    static constexpr coord_t closure_tolerance = 10;

    static std::vector<DxfEntity> convert(const SvgDocument& document);

    static void write(std::ostream& out, const std::vector<DxfEntity>& entities);

    [[nodiscard]] static std::string toDxf(const SvgDocument& document);

    /*!
     * Convert an SVG file into a DXF file next to it with the same name.
     *
     * \return The path of the written DXF file.
     * \throws exceptions::FileWriteException when the file cannot be written.
     */
    static std::filesystem::path exportFile(const std::filesystem::path& svg_path);
};

} // namespace kerf

#endif // EXPORT_DXF_EXPORTER_H
