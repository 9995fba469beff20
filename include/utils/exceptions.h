// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_EXCEPTIONS_H
#define UTILS_EXCEPTIONS_H

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace kerf::exceptions
{

/*!
 * Invalid geometry input: non-positive dimensions, negative depths or an edge configuration that cannot form a simple
 * outline. Raised before any output is produced.
 */
class GeometryException : public std::exception
{
    std::string msg_;

public:
    explicit GeometryException(std::string_view error_msg) noexcept
        : msg_(fmt::format("Invalid geometry: {}", error_msg)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

/*!
 * A document holds no cut geometry, so it has no bounding box to place it by.
 */
class EmptyGeometryException : public std::exception
{
    std::string msg_;

public:
    explicit EmptyGeometryException(std::string_view document_name) noexcept
        : msg_(fmt::format("Document '{}' contains no cut geometry, its bounding box is undefined", document_name)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class SvgParseException : public std::exception
{
    std::string msg_;

public:
    SvgParseException(std::string_view document_name, std::string_view error_msg) noexcept
        : msg_(fmt::format("Failed to read SVG document '{}': {}", document_name, error_msg)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class SettingsException : public std::exception
{
    std::string msg_;

public:
    SettingsException(std::string_view key, std::string_view error_msg) noexcept
        : msg_(fmt::format("Setting '{}': {}", key, error_msg)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class FileWriteException : public std::exception
{
    std::string msg_;

public:
    explicit FileWriteException(const std::filesystem::path& path) noexcept
        : msg_(fmt::format("Failed to write '{}'", path.generic_string())){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class CommandLineException : public std::exception
{
    std::string msg_;

public:
    CommandLineException(std::string_view argument, std::string_view error_msg) noexcept
        : msg_(fmt::format("Invalid command line argument '{}': {}", argument, error_msg)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

} // namespace kerf::exceptions

#endif // UTILS_EXCEPTIONS_H
