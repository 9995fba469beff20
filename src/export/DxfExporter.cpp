// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "export/DxfExporter.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

#include <fmt/format.h>
#include <range/v3/algorithm/unique.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "utils/exceptions.h"

namespace kerf
{

namespace
{

bool nearlyCoincide(const Point2LL& a, const Point2LL& b)
{
    return std::abs(a.X - b.X) < DxfExporter::closure_tolerance && std::abs(a.Y - b.Y) < DxfExporter::closure_tolerance;
}

std::string formatCoordinate(const coord_t value)
{
    return fmt::format("{:.4f}", INT2MM(value));
}

} // namespace

std::vector<DxfEntity> DxfExporter::convert(const SvgDocument& document)
{
    const coord_t sheet_height = document.height;
    auto flip = [sheet_height](const Point2LL& point)
    {
        return Point2LL(point.X, sheet_height - point.Y);
    };

    std::vector<DxfEntity> entities;
    for (const ShapePrimitive& shape : document.shapes)
    {
        const DxfLayer layer = shape.role == ShapeRole::ENGRAVE ? DxfLayer::ENGRAVE : DxfLayer::CUT;
        std::visit(
            [&](const auto& geometry)
            {
                using T = std::decay_t<decltype(geometry)>;
                if constexpr (std::is_same_v<T, RectShape>)
                {
                    const Point2LL& p = geometry.position;
                    const Path corners{ p, p + Point2LL(geometry.width, 0), p + Point2LL(geometry.width, geometry.height), p + Point2LL(0, geometry.height) };
                    entities.push_back(DxfEntity{ DxfEntity::Type::LWPOLYLINE, layer, corners | ranges::views::transform(flip) | ranges::to<Path>(), 0, true });
                }
                else if constexpr (std::is_same_v<T, RoundedRectShape>)
                {
                    const coord_t x = geometry.position.X;
                    const coord_t y = geometry.position.Y;
                    const coord_t w = geometry.width;
                    const coord_t h = geometry.height;
                    const coord_t r = geometry.radius;
                    Path chamfered{ { x + r, y }, { x + w - r, y }, { x + w, y + r }, { x + w, y + h - r }, { x + w - r, y + h }, { x + r, y + h }, { x, y + h - r }, { x, y + r } };
                    // A radius of half a side collapses the chamfer corners on that side.
                    chamfered.erase(ranges::unique(chamfered), chamfered.end());
                    if (chamfered.size() > 1 && chamfered.front() == chamfered.back())
                    {
                        chamfered.pop_back();
                    }
                    entities.push_back(DxfEntity{ DxfEntity::Type::LWPOLYLINE, layer, chamfered | ranges::views::transform(flip) | ranges::to<Path>(), 0, true });
                }
                else if constexpr (std::is_same_v<T, CircleShape>)
                {
                    entities.push_back(DxfEntity{ DxfEntity::Type::CIRCLE, layer, { flip(geometry.center) }, geometry.radius, true });
                }
                else if constexpr (std::is_same_v<T, PathShape>)
                {
                    if (geometry.points.size() < 2)
                    {
                        return;
                    }
                    Path vertices = geometry.points | ranges::views::transform(flip) | ranges::to<Path>();
                    const bool ends_meet = vertices.size() > 2 && nearlyCoincide(vertices.front(), vertices.back());
                    if (ends_meet)
                    {
                        vertices.pop_back();
                    }
                    entities.push_back(DxfEntity{ DxfEntity::Type::LWPOLYLINE, layer, std::move(vertices), 0, geometry.closed || ends_meet });
                }
            },
            shape.geometry);
    }
    return entities;
}

void DxfExporter::write(std::ostream& out, const std::vector<DxfEntity>& entities)
{
    auto group = [&out](const int code, const auto& value)
    {
        out << fmt::format("  {}\n{}\n", code, value);
    };

    group(0, "SECTION");
    group(2, "HEADER");
    group(9, "$INSUNITS");
    group(70, 4); // Millimetres.
    group(0, "ENDSEC");

    group(0, "SECTION");
    group(2, "TABLES");
    group(0, "TABLE");
    group(2, "LAYER");
    group(70, 2);
    for (const auto& [layer, colour] : { std::pair{ DxfLayer::CUT, 1 }, std::pair{ DxfLayer::ENGRAVE, 5 } })
    {
        group(0, "LAYER");
        group(2, toString(layer));
        group(70, 0);
        group(62, colour);
        group(6, "CONTINUOUS");
    }
    group(0, "ENDTAB");
    group(0, "ENDSEC");

    group(0, "SECTION");
    group(2, "ENTITIES");
    for (const DxfEntity& entity : entities)
    {
        if (entity.type == DxfEntity::Type::CIRCLE)
        {
            group(0, "CIRCLE");
            group(8, toString(entity.layer));
            group(10, formatCoordinate(entity.points.front().X));
            group(20, formatCoordinate(entity.points.front().Y));
            group(40, formatCoordinate(entity.radius));
            continue;
        }
        group(0, "LWPOLYLINE");
        group(8, toString(entity.layer));
        group(90, entity.points.size());
        group(70, entity.closed ? 1 : 0);
        for (const Point2LL& vertex : entity.points)
        {
            group(10, formatCoordinate(vertex.X));
            group(20, formatCoordinate(vertex.Y));
        }
    }
    group(0, "ENDSEC");
    group(0, "EOF");
}

std::string DxfExporter::toDxf(const SvgDocument& document)
{
    std::ostringstream out;
    write(out, convert(document));
    return out.str();
}

std::filesystem::path DxfExporter::exportFile(const std::filesystem::path& svg_path)
{
    const SvgDocument document = SvgReader::readFile(svg_path);
    const std::vector<DxfEntity> entities = convert(document);

    std::filesystem::path dxf_path = svg_path;
    dxf_path.replace_extension(".dxf");
    std::ofstream out(dxf_path);
    if (! out.is_open())
    {
        throw exceptions::FileWriteException(dxf_path);
    }
    write(out, entities);
    out.close();
    if (out.fail())
    {
        throw exceptions::FileWriteException(dxf_path);
    }
    spdlog::info("  {} ({} entities)", dxf_path.filename().generic_string(), entities.size());
    return dxf_path;
}

} // namespace kerf
