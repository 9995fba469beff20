// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_ENCLOSURE_PRESETS_H
#define SETTINGS_ENCLOSURE_PRESETS_H

#include <string>
#include <string_view>
#include <vector>

#include "settings/Settings.h"

namespace kerf
{

/*!
 * \brief Named parameter sets for the enclosure.
 *
 * A preset is the root of a settings stack: it has a value for every key EnclosureConfig reads. User settings are put
 * in a child container so anything they do not mention falls through to the preset.
 */
class EnclosurePresets
{
public:
    static constexpr std::string_view default_preset = "nas4";

    /*!
     * Load the preset with the given name.
     * \throws exceptions::SettingsException if there is no such preset.
     */
    static Settings load(const std::string& name);

    static std::vector<std::string> names();

private:
    static void addCommon(Settings& settings);
};

} // namespace kerf

#endif // SETTINGS_ENCLOSURE_PRESETS_H
