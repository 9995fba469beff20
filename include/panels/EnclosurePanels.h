// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef PANELS_ENCLOSURE_PANELS_H
#define PANELS_ENCLOSURE_PANELS_H

#include <filesystem>
#include <string>
#include <vector>

#include "shape/ShapeCanvas.h"

namespace kerf
{

struct EnclosureConfig;

enum class SideHand
{
    LEFT,
    RIGHT,
};

/*!
 * One part of the enclosure, ready to be written as a drawing.
 */
struct Panel
{
    std::string file_name;
    ShapeCanvas canvas;
};

/*!
 * \brief Builds the drawings of the eight enclosure parts.
 *
 * Panel coordinates run X to the right and Y downwards. The vertical panels map enclosure height onto panel Y with the
 * top of the enclosure at the top of the drawing.
 */
class EnclosurePanels
{
public:
    explicit EnclosurePanels(const EnclosureConfig& config);

    Panel bottomPanel() const;

    Panel topPanel() const;

    Panel frontPanel() const;

    Panel backPanel() const;

    Panel sidePanel(SideHand hand) const;

    Panel combRail() const;

    Panel fanBracket() const;

    /*!
     * All parts, in file name order.
     */
    std::vector<Panel> generateAll() const;

    /*!
     * Write every part into \p directory.
     *
     * \return The written files, in file name order.
     */
    std::vector<std::filesystem::path> writeAll(const std::filesystem::path& directory) const;

    static std::vector<std::filesystem::path> write(const std::vector<Panel>& panels, const std::filesystem::path& directory);

private:
    const EnclosureConfig& config_;

    //! Slots in a top or bottom panel for the side panel fingers.
    void addSideSlots(ShapeCanvas& canvas) const;

    //! Front and back panels start above the top panel surface.
    coord_t frontPanelY(coord_t z) const;

    coord_t sidePanelY(coord_t z) const;
};

} // namespace kerf

#endif // PANELS_ENCLOSURE_PANELS_H
