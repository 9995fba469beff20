// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "shape/SvgReader.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exceptions.h"

namespace kerf
{

namespace
{

namespace pt = boost::property_tree;

double parseNumber(const std::string& text, std::string_view document_name, std::string_view what)
{
    try
    {
        size_t parsed_length = 0;
        const double value = std::stod(text, &parsed_length);
        if (parsed_length != text.size())
        {
            throw exceptions::SvgParseException(document_name, fmt::format("{} has trailing characters in '{}'", what, text));
        }
        return value;
    }
    catch (const std::invalid_argument&)
    {
        throw exceptions::SvgParseException(document_name, fmt::format("{} is not a number: '{}'", what, text));
    }
    catch (const std::out_of_range&)
    {
        throw exceptions::SvgParseException(document_name, fmt::format("{} is out of range: '{}'", what, text));
    }
}

coord_t attributeMM(const pt::ptree& element, std::string_view tag, const std::string& attribute, std::string_view document_name)
{
    const boost::optional<std::string> text = element.get_optional<std::string>("<xmlattr>." + attribute);
    if (! text)
    {
        throw exceptions::SvgParseException(document_name, fmt::format("<{}> has no '{}' attribute", tag, attribute));
    }
    const double value = parseNumber(*text, document_name, fmt::format("<{}> attribute '{}'", tag, attribute));
    return MM2INT(value);
}

std::vector<std::string> splitTokens(std::string_view text)
{
    std::string separated(text);
    std::replace(separated.begin(), separated.end(), ',', ' ');
    std::istringstream stream(separated);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::string stripUnit(std::string text)
{
    if (text.size() > 2 && text.compare(text.size() - 2, 2, "mm") == 0)
    {
        text.resize(text.size() - 2);
    }
    return text;
}

void readPageSize(const pt::ptree& root, SvgDocument& document, std::string_view document_name)
{
    const boost::optional<std::string> view_box = root.get_optional<std::string>("<xmlattr>.viewBox");
    if (view_box)
    {
        const std::vector<std::string> values = splitTokens(*view_box);
        if (values.size() != 4)
        {
            throw exceptions::SvgParseException(document_name, fmt::format("viewBox '{}' does not have four values", *view_box));
        }
        const double view_width = parseNumber(values[2], document_name, "viewBox width");
        const double view_height = parseNumber(values[3], document_name, "viewBox height");
        document.width = MM2INT(view_width);
        document.height = MM2INT(view_height);
        return;
    }

    const boost::optional<std::string> width = root.get_optional<std::string>("<xmlattr>.width");
    const boost::optional<std::string> height = root.get_optional<std::string>("<xmlattr>.height");
    if (! width || ! height)
    {
        throw exceptions::SvgParseException(document_name, "the root element has neither a viewBox nor a width and height");
    }
    const double page_width = parseNumber(stripUnit(*width), document_name, "page width");
    const double page_height = parseNumber(stripUnit(*height), document_name, "page height");
    document.width = MM2INT(page_width);
    document.height = MM2INT(page_height);
}

} // namespace

ShapeRole SvgReader::roleFromStroke(std::string_view stroke)
{
    std::string lowered(stroke);
    std::transform(
        lowered.begin(),
        lowered.end(),
        lowered.begin(),
        [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
    return lowered == engrave_stroke_colour ? ShapeRole::ENGRAVE : ShapeRole::CUT;
}

PathShape SvgReader::parsePathData(std::string_view path_data, std::string_view document_name)
{
    const std::vector<std::string> tokens = splitTokens(path_data);
    PathShape path{ {}, false };
    size_t token_idx = 0;
    while (token_idx < tokens.size())
    {
        const std::string& token = tokens[token_idx];
        if (token == "Z" || token == "z")
        {
            path.closed = true;
            token_idx++;
            continue;
        }
        if (token == "M" || token == "L")
        {
            token_idx++;
        }
        else if (std::isalpha(static_cast<unsigned char>(token.front())))
        {
            throw exceptions::SvgParseException(document_name, fmt::format("unsupported path command '{}'", token));
        }
        if (token_idx + 1 >= tokens.size())
        {
            throw exceptions::SvgParseException(document_name, fmt::format("path data '{}' ends in an incomplete coordinate pair", path_data));
        }
        const double x = parseNumber(tokens[token_idx], document_name, "path coordinate");
        const double y = parseNumber(tokens[token_idx + 1], document_name, "path coordinate");
        path.points.emplace_back(MM2INT(x), MM2INT(y));
        token_idx += 2;
    }
    return path;
}

SvgDocument SvgReader::read(std::istream& input, std::string_view document_name)
{
    pt::ptree tree;
    try
    {
        pt::read_xml(input, tree);
    }
    catch (const pt::xml_parser_error& error)
    {
        throw exceptions::SvgParseException(document_name, fmt::format("line {}: {}", error.line(), error.message()));
    }

    const boost::optional<const pt::ptree&> root = std::as_const(tree).get_child_optional("svg");
    if (! root)
    {
        throw exceptions::SvgParseException(document_name, "no <svg> root element");
    }

    SvgDocument document;
    readPageSize(*root, document, document_name);

    for (const auto& [tag, element] : *root)
    {
        if (tag != "rect" && tag != "circle" && tag != "path")
        {
            continue;
        }

        ShapePrimitive primitive;
        primitive.role = roleFromStroke(element.get<std::string>("<xmlattr>.stroke", ""));
        if (element.get_optional<std::string>("<xmlattr>.stroke-width"))
        {
            primitive.stroke_width = attributeMM(element, tag, "stroke-width", document_name);
        }

        if (tag == "rect")
        {
            const Point2LL position(attributeMM(element, tag, "x", document_name), attributeMM(element, tag, "y", document_name));
            const coord_t width = attributeMM(element, tag, "width", document_name);
            const coord_t height = attributeMM(element, tag, "height", document_name);
            const coord_t radius = element.get_optional<std::string>("<xmlattr>.rx") ? attributeMM(element, tag, "rx", document_name) : 0;
            if (radius > 0)
            {
                primitive.geometry = RoundedRectShape{ position, width, height, radius };
            }
            else
            {
                primitive.geometry = RectShape{ position, width, height };
            }
        }
        else if (tag == "circle")
        {
            const Point2LL center(attributeMM(element, tag, "cx", document_name), attributeMM(element, tag, "cy", document_name));
            primitive.geometry = CircleShape{ center, attributeMM(element, tag, "r", document_name) };
        }
        else
        {
            const boost::optional<std::string> path_data = element.get_optional<std::string>("<xmlattr>.d");
            if (! path_data)
            {
                throw exceptions::SvgParseException(document_name, "<path> has no 'd' attribute");
            }
            PathShape path = parsePathData(*path_data, document_name);
            if (path.points.empty())
            {
                spdlog::debug("Skipping empty path in {}", document_name);
                continue;
            }
            primitive.geometry = std::move(path);
        }
        document.shapes.push_back(std::move(primitive));
    }
    return document;
}

SvgDocument SvgReader::readFile(const std::filesystem::path& file_path)
{
    std::ifstream input(file_path);
    if (! input.is_open())
    {
        throw exceptions::SvgParseException(file_path.generic_string(), "cannot open file");
    }
    return read(input, file_path.filename().generic_string());
}

} // namespace kerf
