// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "communication/CommandLine.h"

#include <fstream>
#include <iterator>
#include <numeric> //For std::accumulate.
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/error/en.h>
#include <rapidjson/memorystream.h>
#include <spdlog/spdlog.h>

#include "settings/EnclosurePresets.h"
#include "utils/exceptions.h"

namespace kerf
{

namespace
{

bool jsonValue2Str(const rapidjson::Value& value, std::string& value_string)
{
    if (value.IsString())
    {
        value_string = value.GetString();
    }
    else if (value.IsTrue())
    {
        value_string = "true";
    }
    else if (value.IsFalse())
    {
        value_string = "false";
    }
    else if (value.IsInt64())
    {
        value_string = std::to_string(value.GetInt64());
    }
    else if (value.IsNumber())
    {
        value_string = fmt::format("{}", value.GetDouble());
    }
    else if (value.IsArray())
    {
        if (value.Empty())
        {
            value_string = "[]";
            return true;
        }
        std::string temp;
        if (! jsonValue2Str(value[0], temp))
        {
            return false;
        }
        bool converted_all = true;
        value_string = std::string("[")
                     + std::accumulate(
                           std::next(value.Begin()),
                           value.End(),
                           temp,
                           [&temp, &converted_all](std::string converted, const rapidjson::Value& next)
                           {
                               converted_all = jsonValue2Str(next, temp) && converted_all;
                               return std::move(converted) + "," + temp;
                           })
                     + std::string("]");
        return converted_all;
    }
    else
    {
        return false;
    }
    return true;
}

CommandType parseCommand(const std::string& command)
{
    if (command == "panels")
    {
        return CommandType::PANELS;
    }
    if (command == "nest")
    {
        return CommandType::NEST;
    }
    if (command == "all")
    {
        return CommandType::ALL;
    }
    if (command == "help" || command == "-h" || command == "--help")
    {
        return CommandType::HELP;
    }
    throw exceptions::CommandLineException(command, "unknown command, expected panels, nest, all or help");
}

} // namespace

CommandLine::CommandLine(const std::vector<std::string>& arguments)
    : command_(CommandType::HELP)
    , output_directory_("svg_output")
    , preset_(EnclosurePresets::default_preset)
    , verbose_(false)
{
    if (arguments.size() < 2)
    {
        return;
    }
    command_ = parseCommand(arguments[1]);

    std::vector<std::pair<std::string, std::string>> overrides;
    for (size_t argument_index = 2; argument_index < arguments.size(); argument_index++)
    {
        const std::string& argument = arguments[argument_index];
        if (argument.size() != 2 || argument[0] != '-')
        {
            throw exceptions::CommandLineException(argument, "unknown option");
        }

        // Every option except -v takes a value.
        auto next_value = [&]() -> const std::string&
        {
            argument_index++;
            if (argument_index >= arguments.size())
            {
                throw exceptions::CommandLineException(argument, "missing value");
            }
            return arguments[argument_index];
        };

        switch (argument[1])
        {
        case 'v':
        {
            verbose_ = true;
            break;
        }
        case 'o':
        {
            output_directory_ = next_value();
            break;
        }
        case 'p':
        {
            preset_ = next_value();
            break;
        }
        case 'j':
        {
            const std::string& json_file = next_value();
            if (std::string inherited = loadJSON(std::filesystem::path{ json_file }, settings_); ! inherited.empty())
            {
                preset_ = std::move(inherited);
            }
            break;
        }
        case 's':
        {
            // Parse the given setting and store it.
            const std::string& setting = next_value();
            const size_t value_position = setting.find('=');
            if (value_position == std::string::npos || value_position == 0)
            {
                throw exceptions::CommandLineException(setting, "expected <setting>=<value>");
            }
            overrides.emplace_back(setting.substr(0, value_position), setting.substr(value_position + 1));
            break;
        }
        default:
            throw exceptions::CommandLineException(argument, "unknown option");
        }
    }

    for (const auto& [key, value] : overrides)
    {
        settings_.add(key, value);
    }
}

CommandType CommandLine::getCommand() const
{
    return command_;
}

const std::filesystem::path& CommandLine::getOutputDirectory() const
{
    return output_directory_;
}

const std::string& CommandLine::getPreset() const
{
    return preset_;
}

bool CommandLine::isVerbose() const
{
    return verbose_;
}

Settings& CommandLine::getSettings()
{
    return settings_;
}

std::string CommandLine::loadJSON(const std::filesystem::path& json_filename, Settings& settings)
{
    std::ifstream file(json_filename, std::ios::binary);
    if (! file)
    {
        throw exceptions::SettingsException(json_filename.generic_string(), "couldn't open JSON file");
    }

    std::vector<char> read_buffer(std::istreambuf_iterator<char>(file), {});
    rapidjson::MemoryStream memory_stream(read_buffer.data(), read_buffer.size());

    rapidjson::Document json_document;
    json_document.ParseStream(memory_stream);
    if (json_document.HasParseError())
    {
        throw exceptions::SettingsException(
            json_filename.generic_string(),
            fmt::format("error parsing JSON (offset {}): {}", json_document.GetErrorOffset(), GetParseError_En(json_document.GetParseError())));
    }
    spdlog::debug("Loading settings from {}", json_filename.generic_string());
    return loadJSON(json_document, settings);
}

std::string CommandLine::loadJSON(const rapidjson::Document& document, Settings& settings)
{
    if (! document.IsObject())
    {
        throw exceptions::SettingsException("JSON document", "expected an object at the top level");
    }

    std::string inherited;
    if (document.HasMember("inherits"))
    {
        if (! document["inherits"].IsString())
        {
            throw exceptions::SettingsException("inherits", "expected the name of a preset");
        }
        inherited = document["inherits"].GetString();
    }

    if (document.HasMember("settings") && document["settings"].IsObject())
    {
        loadJSONSettings(document["settings"], settings);
    }
    return inherited;
}

void CommandLine::loadJSONSettings(const rapidjson::Value& element, Settings& settings)
{
    for (rapidjson::Value::ConstMemberIterator setting = element.MemberBegin(); setting != element.MemberEnd(); setting++)
    {
        const std::string name = setting->name.GetString();

        const rapidjson::Value* json_value = &setting->value;
        if (json_value->IsObject())
        {
            if (json_value->HasMember("default_value"))
            {
                json_value = &(*json_value)["default_value"];
            }
            else if (json_value->HasMember("value"))
            {
                json_value = &(*json_value)["value"];
            }
            else
            {
                spdlog::warn("JSON setting '{}' has no [default_]value!", name);
                continue;
            }
        }

        std::string value_string;
        if (! jsonValue2Str(*json_value, value_string))
        {
            throw exceptions::SettingsException(name, "unrecognized data type in JSON setting");
        }
        settings.add(name, value_string);
    }
}

} // namespace kerf
