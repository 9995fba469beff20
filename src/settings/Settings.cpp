// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h"

#include <algorithm>
#include <cmath>
#include <regex> // regex parsing for lists
#include <stdexcept>
#include <string> //Parsing strings (stod, stoul).

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/algorithm/unique.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>
#include <spdlog/spdlog.h>

#include "utils/Coord_t.h"
#include "utils/exceptions.h"

namespace kerf
{

Settings::Settings()
{
    parent_ = nullptr; // Needs to be properly initialised because we check against this if the parent is not set.
}

void Settings::add(const std::string& key, const std::string value)
{
    if (settings_.find(key) != settings_.end()) // Already exists.
    {
        settings_[key] = value;
    }
    else // New setting.
    {
        settings_.emplace(key, value);
    }
}

template<>
std::string Settings::get<std::string>(const std::string& key) const
{
    // If this settings base has a setting value for it, look that up.
    if (settings_.find(key) != settings_.end())
    {
        return settings_.at(key);
    }

    if (parent_)
    {
        return parent_->get<std::string>(key);
    }

    spdlog::error("Trying to retrieve setting with no value given: {}", key);
    throw exceptions::SettingsException(key, "no value given");
}

template<>
double Settings::get<double>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    try
    {
        size_t parsed_length = 0;
        const double result = std::stod(value, &parsed_length);
        if (value.find_first_not_of(" \t", parsed_length) != std::string::npos)
        {
            throw exceptions::SettingsException(key, fmt::format("trailing characters in '{}'", value));
        }
        return result;
    }
    catch (const std::invalid_argument&)
    {
        throw exceptions::SettingsException(key, fmt::format("'{}' is not a number", value));
    }
    catch (const std::out_of_range&)
    {
        throw exceptions::SettingsException(key, fmt::format("'{}' is out of range", value));
    }
}

template<>
size_t Settings::get<size_t>(const std::string& key) const
{
    const double value = get<double>(key);
    if (value < 0.0)
    {
        throw exceptions::SettingsException(key, "expected a non-negative count");
    }
    if (value != std::floor(value))
    {
        throw exceptions::SettingsException(key, fmt::format("expected a whole number, got {}", value));
    }
    return static_cast<size_t>(value);
}

template<>
bool Settings::get<bool>(const std::string& key) const
{
    const std::string& value = get<std::string>(key);
    if (value == "on" || value == "yes" || value == "true" || value == "True")
    {
        return true;
    }
    if (value == "off" || value == "no" || value == "false" || value == "False")
    {
        return false;
    }
    return get<double>(key) != 0.0;
}

template<>
coord_t Settings::get<coord_t>(const std::string& key) const
{
    return MM2INT(get<double>(key)); // The settings are all in millimetres, but we need to interpret them as microns.
}

template<>
std::vector<double> Settings::get<std::vector<double>>(const std::string& key) const
{
    const std::string& value_string = get<std::string>(key);

    std::vector<double> result;
    if (value_string.empty())
    {
        return result;
    }

    /* We're looking to match one or more floating point values separated by
     * commas and surrounded by square brackets. We are lenient here and make
     * the trailing bracket optional.
     */
    std::regex list_contents_regex(R"(\[([^\]]*)\]?)");
    std::smatch list_contents_match;
    if (std::regex_search(value_string, list_contents_match, list_contents_regex) && list_contents_match.size() > 1)
    {
        std::string elements = list_contents_match.str(1);
        std::regex element_regex(R"(\s*([+-]?[0-9]*\.?[0-9]+)\s*,?)");
        std::regex_token_iterator<std::string::iterator> rend; // Default constructor gets the end-of-sequence iterator.

        std::regex_token_iterator<std::string::iterator> match_iter(elements.begin(), elements.end(), element_regex, 1);
        while (match_iter != rend)
        {
            std::string value = *match_iter++;
            try
            {
                result.push_back(std::stod(value));
            }
            catch (const std::invalid_argument& e)
            {
                spdlog::error("Couldn't read floating point value ({}) in setting {}. Ignored.", value, key);
            }
        }
    }
    return result;
}

template<>
std::vector<coord_t> Settings::get<std::vector<coord_t>>(const std::string& key) const
{
    const std::vector<double> values_mm = get<std::vector<double>>(key);
    std::vector<coord_t> values;
    values.reserve(values_mm.size());
    for (double value : values_mm)
    {
        values.push_back(MM2INT(value));
    }
    return values;
}

std::string Settings::getAllSettingsString() const
{
    std::string result;
    for (const std::string& key : getKeys())
    {
        result += fmt::format(" -s {}=\"{}\"", key, get<std::string>(key));
    }
    return result;
}

bool Settings::has(const std::string& key) const
{
    return settings_.find(key) != settings_.end();
}

void Settings::setParent(const Settings* new_parent)
{
    parent_ = new_parent;
}

std::vector<std::string> Settings::getKeys() const
{
    std::vector<std::string> keys = ranges::views::keys(settings_) | ranges::to_vector;
    if (parent_)
    {
        const std::vector<std::string> parent_keys = parent_->getKeys();
        keys.insert(keys.end(), parent_keys.begin(), parent_keys.end());
    }
    ranges::sort(keys);
    keys.erase(ranges::unique(keys), keys.end());
    return keys;
}

} // namespace kerf
