// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef PANELS_REVIEW_PAGE_H
#define PANELS_REVIEW_PAGE_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "panels/EnclosurePanels.h"

namespace kerf
{

struct EnclosureConfig;

/*!
 * \brief A single HTML page showing every panel drawing at print scale.
 *
 * Each drawing is preceded by a 100 mm ruler so the operator can check the printer scaling before using a print-out as a
 * template.
 */
class ReviewPage
{
public:
    explicit ReviewPage(const EnclosureConfig& config);

    std::string toHtml(std::vector<const Panel*> panels) const;

    /*!
     * Write the page into \p directory.
     *
     * \return The path of the written page.
     */
    std::filesystem::path save(const std::filesystem::path& directory, const std::vector<Panel>& panels) const;

    /*!
     * Heading for a panel drawing, e.g. "bottom panel" for "01_bottom_panel.svg".
     */
    static std::string heading(std::string_view file_name);

private:
    const EnclosureConfig& config_;
};

} // namespace kerf

#endif // PANELS_REVIEW_PAGE_H
