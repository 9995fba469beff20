// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "shape/ShapeCanvas.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <type_traits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exceptions.h"

namespace kerf
{

namespace
{

void trimDecimals(std::string& formatted)
{
    if (formatted.find('.') == std::string::npos)
    {
        return;
    }
    while (formatted.back() == '0')
    {
        formatted.pop_back();
    }
    if (formatted.back() == '.')
    {
        formatted.pop_back();
    }
    if (formatted == "-0")
    {
        formatted = "0";
    }
}

std::string escapeXml(const std::string& text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

} // namespace

ShapeCanvas::ShapeCanvas(const coord_t content_width, const coord_t content_height, const coord_t margin)
    : content_width_(content_width)
    , content_height_(content_height)
    , margin_(margin)
    , comment_(default_comment)
{
}

void ShapeCanvas::addRect(const Point2LL& position, const coord_t width, const coord_t height, const ShapeRole role)
{
    primitives_.push_back(ShapePrimitive{ RectShape{ position, width, height }, role });
}

void ShapeCanvas::addRoundedRect(const Point2LL& position, const coord_t width, const coord_t height, const coord_t radius, const ShapeRole role)
{
    primitives_.push_back(ShapePrimitive{ RoundedRectShape{ position, width, height, radius }, role });
}

void ShapeCanvas::addSlot(const Point2LL& position, const coord_t width, const coord_t height, const ShapeRole role)
{
    addRoundedRect(position, width, height, std::min(width, height) / 2, role);
}

void ShapeCanvas::addCircle(const Point2LL& center, const coord_t radius, const ShapeRole role)
{
    primitives_.push_back(ShapePrimitive{ CircleShape{ center, radius }, role });
}

void ShapeCanvas::addPolyline(Path points, const bool closed, const ShapeRole role)
{
    if (points.size() < 2)
    {
        throw exceptions::GeometryException(fmt::format("a path needs at least two points, got {}", points.size()));
    }
    primitives_.push_back(ShapePrimitive{ PathShape{ std::move(points), closed }, role });
}

void ShapeCanvas::addPolygon(const Polygon& polygon, const ShapeRole role)
{
    addPolyline(polygon.getPoints(), true, role);
}

void ShapeCanvas::addAnnotation(std::string text, const Point2LL& position, const double font_size, const std::string_view fill)
{
    primitives_.push_back(ShapePrimitive{ TextShape{ position, std::move(text), font_size, std::string(fill) }, ShapeRole::ENGRAVE });
}

void ShapeCanvas::addPrimitive(ShapePrimitive primitive)
{
    primitives_.push_back(std::move(primitive));
}

void ShapeCanvas::setComment(std::string comment)
{
    comment_ = std::move(comment);
}

std::string ShapeCanvas::formatMM(const coord_t value)
{
    const coord_t magnitude = std::abs(value);
    std::string formatted = fmt::format("{}{}.{:03}", value < 0 ? "-" : "", magnitude / 1000, magnitude % 1000);
    trimDecimals(formatted);
    return formatted;
}

std::string ShapeCanvas::formatNumber(const double value)
{
    std::string formatted = fmt::format("{:.3f}", value);
    trimDecimals(formatted);
    return formatted;
}

std::string ShapeCanvas::toSvg() const
{
    const std::string page_width = formatMM(content_width_ + 2 * margin_);
    const std::string page_height = formatMM(content_height_ + 2 * margin_);
    const Point2LL shift(margin_, margin_);

    fmt::memory_buffer out;
    auto appender = std::back_inserter(out);
    fmt::format_to(appender, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");
    fmt::format_to(
        appender,
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{}mm\" height=\"{}mm\" viewBox=\"0 0 {} {}\">\n",
        page_width,
        page_height,
        page_width,
        page_height);
    if (! comment_.empty())
    {
        fmt::format_to(appender, "<!-- {} -->\n", comment_);
    }

    for (const ShapePrimitive& primitive : primitives_)
    {
        const std::string style = fmt::format("fill=\"none\" stroke=\"{}\" stroke-width=\"{}\"", strokeColour(primitive.role), formatMM(primitive.stroke_width));
        std::visit(
            [&](const auto& shape)
            {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, RectShape>)
                {
                    const Point2LL position = shape.position + shift;
                    fmt::format_to(
                        appender,
                        "  <rect x=\"{}\" y=\"{}\" width=\"{}\" height=\"{}\" {}/>\n",
                        formatMM(position.X),
                        formatMM(position.Y),
                        formatMM(shape.width),
                        formatMM(shape.height),
                        style);
                }
                else if constexpr (std::is_same_v<T, RoundedRectShape>)
                {
                    const Point2LL position = shape.position + shift;
                    fmt::format_to(
                        appender,
                        "  <rect x=\"{}\" y=\"{}\" width=\"{}\" height=\"{}\" rx=\"{}\" ry=\"{}\" {}/>\n",
                        formatMM(position.X),
                        formatMM(position.Y),
                        formatMM(shape.width),
                        formatMM(shape.height),
                        formatMM(shape.radius),
                        formatMM(shape.radius),
                        style);
                }
                else if constexpr (std::is_same_v<T, CircleShape>)
                {
                    const Point2LL center = shape.center + shift;
                    fmt::format_to(appender, "  <circle cx=\"{}\" cy=\"{}\" r=\"{}\" {}/>\n", formatMM(center.X), formatMM(center.Y), formatMM(shape.radius), style);
                }
                else if constexpr (std::is_same_v<T, PathShape>)
                {
                    fmt::format_to(appender, "  <path d=\"");
                    for (size_t point_idx = 0; point_idx < shape.points.size(); ++point_idx)
                    {
                        const Point2LL point = shape.points[point_idx] + shift;
                        fmt::format_to(appender, "{}{} {},{}", point_idx == 0 ? "" : " ", point_idx == 0 ? 'M' : 'L', formatMM(point.X), formatMM(point.Y));
                    }
                    fmt::format_to(appender, "{}\" {}/>\n", shape.closed ? " Z" : "", style);
                }
                else if constexpr (std::is_same_v<T, TextShape>)
                {
                    const Point2LL position = shape.position + shift;
                    fmt::format_to(
                        appender,
                        "  <text x=\"{}\" y=\"{}\" font-size=\"{}\" fill=\"{}\" font-family=\"monospace\">{}</text>\n",
                        formatMM(position.X),
                        formatMM(position.Y),
                        formatNumber(shape.font_size),
                        shape.fill,
                        escapeXml(shape.text));
                }
            },
            primitive.geometry);
    }
    fmt::format_to(appender, "</svg>\n");
    return fmt::to_string(out);
}

void ShapeCanvas::save(const std::filesystem::path& file_path) const
{
    const std::string document = toSvg();
    std::FILE* out = std::fopen(file_path.string().c_str(), "w");
    if (out == nullptr)
    {
        throw exceptions::FileWriteException(file_path);
    }
    const size_t written = std::fwrite(document.data(), 1, document.size(), out);
    const bool closed = std::fclose(out) == 0;
    if (written != document.size() || ! closed)
    {
        throw exceptions::FileWriteException(file_path);
    }
    spdlog::debug("Wrote {} shapes to {}", primitives_.size(), file_path.generic_string());
}

} // namespace kerf
