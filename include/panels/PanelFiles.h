// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef PANELS_PANEL_FILES_H
#define PANELS_PANEL_FILES_H

#include <string_view>

namespace kerf::panel_files
{

constexpr std::string_view bottom = "01_bottom_panel.svg";
constexpr std::string_view top = "02_top_panel.svg";
constexpr std::string_view front = "03_front_panel.svg";
constexpr std::string_view back = "04_back_panel.svg";
constexpr std::string_view left_side = "05_left_side_panel.svg";
constexpr std::string_view right_side = "06_right_side_panel.svg";
constexpr std::string_view comb_rail = "07_drive_comb_rail.svg";
constexpr std::string_view fan_bracket = "09_fan_bracket.svg";

constexpr std::string_view review_page = "panel_review.html";

constexpr std::string_view sheet_3mm = "sheet_3mm.svg";
constexpr std::string_view sheet_5mm = "sheet_5mm.svg";

} // namespace kerf::panel_files

#endif // PANELS_PANEL_FILES_H
