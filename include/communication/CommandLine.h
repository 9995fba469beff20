// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef COMMUNICATION_COMMAND_LINE_H
#define COMMUNICATION_COMMAND_LINE_H

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <rapidjson/document.h> //Loading JSON documents to get settings from them.

#include "settings/Settings.h"

namespace kerf
{

enum class CommandType
{
    PANELS, //!< Write the panel drawings and the review page.
    NEST, //!< Lay the panel drawings out on the material sheets.
    ALL, //!< Both of the above.
    HELP,
};

/*!
 * \brief Interprets the command line arguments of the executable.
 *
 * Settings from JSON files and from -s arguments are collected in one container, meant to be placed on top of a preset.
 * The -s arguments win over JSON files regardless of their order on the command line.
 */
class CommandLine
{
public:
    /*!
     * \brief Parse the arguments passed to the application.
     * \param arguments All arguments, starting with the executable name.
     * \throws exceptions::CommandLineException on an unknown command or option.
     * \throws exceptions::SettingsException if a JSON file can't be read.
     */
    explicit CommandLine(const std::vector<std::string>& arguments);

    CommandType getCommand() const;

    const std::filesystem::path& getOutputDirectory() const;

    const std::string& getPreset() const;

    bool isVerbose() const;

    /*!
     * The settings given on the command line. Its parent is not set.
     */
    Settings& getSettings();

    /*!
     * \brief Load a JSON settings file.
     *
     * The file may name a preset to inherit from in "inherits" and holds its settings in "settings". A setting is either
     * a plain value or an object with a "default_value" or "value".
     * \param json_filename The file to read.
     * \param settings Where to store the settings.
     * \return The name of the inherited preset, or an empty string.
     */
    static std::string loadJSON(const std::filesystem::path& json_filename, Settings& settings);

    /*!
     * Load the settings from an already parsed JSON document.
     * \return The name of the inherited preset, or an empty string.
     */
    static std::string loadJSON(const rapidjson::Document& document, Settings& settings);

private:
    static void loadJSONSettings(const rapidjson::Value& element, Settings& settings);

    CommandType command_;
    std::filesystem::path output_directory_;
    std::string preset_;
    bool verbose_;
    Settings settings_;
};

} // namespace kerf

#endif // COMMUNICATION_COMMAND_LINE_H
