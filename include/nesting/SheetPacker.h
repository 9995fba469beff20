// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef NESTING_SHEET_PACKER_H
#define NESTING_SHEET_PACKER_H

#include <filesystem>
#include <string_view>

#include "nesting/Sheet.h"

namespace kerf
{

struct EnclosureConfig;

/*!
 * \brief Lays the enclosure parts out on the two fabrication sheets.
 *
 * The layouts are fixed, tuned by hand for the default enclosure. They adapt to the part sizes but make no attempt to
 * find a better arrangement; a layout that outgrows the sheet is written anyway, with a warning.
 */
class SheetPacker
{
public:
    explicit SheetPacker(const EnclosureConfig& config);

    /*!
     * Front and back side by side, then the top panel turned a quarter. The back keeps its engraving.
     */
    Sheet pack3mmSheet(const PanelGeometry& front, const PanelGeometry& back, const PanelGeometry& top) const;

    /*!
     * Both side panels, then a column with the interleaved comb rails above the fan bracket, then the bottom panel
     * turned a quarter.
     */
    Sheet pack5mmSheet(const PanelGeometry& bottom, const PanelGeometry& left, const PanelGeometry& right, const PanelGeometry& comb, const PanelGeometry& fan) const;

    Sheet pack3mmSheet(const std::filesystem::path& panel_directory) const;

    Sheet pack5mmSheet(const std::filesystem::path& panel_directory) const;

    /*!
     * Two comb rails meshed into one part: the second rail is turned half a turn and slid along so that its teeth fall
     * between the teeth of the first.
     */
    PanelGeometry interleaveCombRails(const PanelGeometry& comb) const;

private:
    const EnclosureConfig& config_;

    PanelGeometry load(const std::filesystem::path& panel_directory, std::string_view file_name, bool keep_engrave = false) const;
};

} // namespace kerf

#endif // NESTING_SHEET_PACKER_H
