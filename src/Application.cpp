// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "Application.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/dup_filter_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "communication/CommandLine.h"
#include "export/DxfExporter.h"
#include "nesting/Sheet.h"
#include "nesting/SheetPacker.h"
#include "panels/EnclosurePanels.h"
#include "panels/PanelFiles.h"
#include "panels/ReviewPage.h"
#include "settings/EnclosureConfig.h"
#include "settings/EnclosurePresets.h"

namespace kerf
{

Application::Application()
{
    auto dup_sink = std::make_shared<spdlog::sinks::dup_filter_sink_mt>(std::chrono::seconds{ 10 });
    auto base_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    dup_sink->add_sink(base_sink);

    spdlog::default_logger()->sinks()
        = std::vector<std::shared_ptr<spdlog::sinks::sink>>{ dup_sink }; // replace default_logger sinks with the duplicating filtering sink to avoid spamming

    if (auto spdlog_val = spdlog::details::os::getenv("KERF_ENGINE_LOG_LEVEL"); ! spdlog_val.empty())
    {
        spdlog::cfg::helpers::load_levels(spdlog_val);
    };
}

Application& Application::getInstance()
{
    static Application instance; // Constructs using the default constructor.
    return instance;
}

void Application::printHelp() const
{
    fmt::print("\n");
    fmt::print("usage:\n");
    fmt::print("kerf_engine help\n");
    fmt::print("\tShow this help message\n");
    fmt::print("\n");
    fmt::print("kerf_engine panels|nest|all [-v] [-o <directory>] [-p <preset>] [-j <settings.json>] [-s <settingkey>=<value>]\n");
    fmt::print("  panels\n\tWrite the panel drawings and {}.\n", panel_files::review_page);
    fmt::print("  nest\n\tRead the panel drawings back and lay them out on {} and {}, with DXF copies.\n", panel_files::sheet_3mm, panel_files::sheet_5mm);
    fmt::print("  all\n\tpanels, then nest.\n");
    fmt::print("  -v\n\tIncrease the verbose level (show debug messages).\n");
    fmt::print("  -o <directory>\n\tWrite the output into this directory (default svg_output). It is created if missing.\n");
    fmt::print("  -p <preset>\n\tStart from one of the presets {} (default {}).\n", EnclosurePresets::names(), EnclosurePresets::default_preset);
    fmt::print("  -j <settings.json>\n\tLoad settings from a JSON file: {{\"inherits\": <preset>, \"settings\": {{<key>: <value>}}}}.\n");
    fmt::print("  -s <setting>=<value>\n\tSet a setting to a value. These are applied after all JSON files.\n");
    fmt::print("\n");
    fmt::print("The log level can be set per logger with the environment variable KERF_ENGINE_LOG_LEVEL, e.g. KERF_ENGINE_LOG_LEVEL=debug.\n");
    fmt::print("\n");
}

void Application::printLicense() const
{
    fmt::print("\n");
    fmt::print("KerfEngine version {}\n", KERF_ENGINE_VERSION);
    fmt::print("Copyright (C) 2026 UltiMaker\n");
    fmt::print("\n");
    fmt::print("This program is free software: you can redistribute it and/or modify\n");
    fmt::print("it under the terms of the GNU Affero General Public License as published by\n");
    fmt::print("the Free Software Foundation, either version 3 of the License, or\n");
    fmt::print("(at your option) any later version.\n");
    fmt::print("\n");
    fmt::print("This program is distributed in the hope that it will be useful,\n");
    fmt::print("but WITHOUT ANY WARRANTY; without even the implied warranty of\n");
    fmt::print("MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the\n");
    fmt::print("GNU Affero General Public License for more details.\n");
    fmt::print("\n");
    fmt::print("You should have received a copy of the GNU Affero General Public License\n");
    fmt::print("along with this program.  If not, see <http://www.gnu.org/licenses/>.\n");
}

void Application::writePanels(const EnclosureConfig& config, const std::filesystem::path& output_directory) const
{
    spdlog::info("=== Generating SVG panels ===");
    const std::vector<Panel> panels = EnclosurePanels(config).generateAll();
    EnclosurePanels::write(panels, output_directory);
    ReviewPage(config).save(output_directory, panels);
}

void Application::nestPanels(const EnclosureConfig& config, const std::filesystem::path& output_directory) const
{
    spdlog::info("=== Nesting panels onto sheets ===");
    const SheetPacker packer(config);

    Sheet sheet_3mm = packer.pack3mmSheet(output_directory);
    const std::filesystem::path sheet_3mm_path = output_directory / panel_files::sheet_3mm;
    sheet_3mm.save(sheet_3mm_path);

    Sheet sheet_5mm = packer.pack5mmSheet(output_directory);
    const std::filesystem::path sheet_5mm_path = output_directory / panel_files::sheet_5mm;
    sheet_5mm.save(sheet_5mm_path);

    spdlog::info("=== Exporting DXF ===");
    for (const std::filesystem::path& sheet_path : { sheet_3mm_path, sheet_5mm_path })
    {
        DxfExporter::exportFile(sheet_path);
    }

    for (const Sheet* sheet : { &sheet_3mm, &sheet_5mm })
    {
        for (const std::string& warning : sheet->getWarnings())
        {
            spdlog::warn("Check before cutting: {}", warning);
        }
    }
}

void Application::run(const size_t argc, char** argv)
{
    const std::vector<std::string> arguments(argv, argv + argc);
    CommandLine command_line(arguments);

    if (command_line.getCommand() == CommandType::HELP)
    {
        printLicense();
        printHelp();
        return;
    }
    if (command_line.isVerbose())
    {
        spdlog::set_level(spdlog::level::debug);
    }

    const Settings preset = EnclosurePresets::load(command_line.getPreset());
    Settings& settings = command_line.getSettings();
    settings.setParent(&preset);
    spdlog::debug("Settings: {}", settings.getAllSettingsString());

    const EnclosureConfig config(settings);
    config.logSummary();

    const std::filesystem::path& output_directory = command_line.getOutputDirectory();
    std::filesystem::create_directories(output_directory);

    const CommandType command = command_line.getCommand();
    if (command == CommandType::PANELS || command == CommandType::ALL)
    {
        writePanels(config, output_directory);
    }
    if (command == CommandType::NEST || command == CommandType::ALL)
    {
        nestPanels(config, output_directory);
    }
    spdlog::info("=== Done! Output: {} ===", output_directory.generic_string());
}

} // namespace kerf
