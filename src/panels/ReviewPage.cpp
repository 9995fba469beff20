// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "panels/ReviewPage.h"

#include <algorithm>
#include <cstdio>
#include <iterator>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>
#include <spdlog/spdlog.h>

#include "panels/PanelFiles.h"
#include "settings/EnclosureConfig.h"
#include "utils/exceptions.h"

namespace kerf
{

namespace
{

constexpr std::string_view ruler_svg = R"(<svg xmlns="http://www.w3.org/2000/svg" class="ruler"
      width="110mm" height="12mm" viewBox="0 0 110 12">
  <rect x="5" y="2" width="100" height="4" fill="none" stroke="#000" stroke-width="0.3"/>
  <line x1="5" y1="2" x2="5" y2="10" stroke="#000" stroke-width="0.3"/>
  <text x="5" y="11.5" font-size="2.5" font-family="monospace" text-anchor="middle">0</text>
  <line x1="15" y1="4" x2="15" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="25" y1="4" x2="25" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="35" y1="4" x2="35" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="45" y1="4" x2="45" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="55" y1="2" x2="55" y2="10" stroke="#000" stroke-width="0.3"/>
  <text x="55" y="11.5" font-size="2.5" font-family="monospace" text-anchor="middle">50</text>
  <line x1="65" y1="4" x2="65" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="75" y1="4" x2="75" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="85" y1="4" x2="85" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="95" y1="4" x2="95" y2="8" stroke="#000" stroke-width="0.2"/>
  <line x1="105" y1="2" x2="105" y2="10" stroke="#000" stroke-width="0.3"/>
  <text x="105" y="11.5" font-size="2.5" font-family="monospace" text-anchor="middle">100mm</text>
</svg>)";

constexpr std::string_view page_head = R"(<!DOCTYPE html>
<html><head><meta charset="utf-8">
<title>Pi5 NAS Enclosure - Panel Review</title>
<style>
  /* === Screen styles === */
  body { font-family: system-ui, sans-serif; background: #1a1a2e; color: #eee; margin: 2em; }
  h1 { color: #e94560; }
  .panel { background: #16213e; border: 1px solid #0f3460; border-radius: 8px;
           padding: 1.5em; margin: 1.5em 0; }
  .panel h2 { color: #e94560; margin-top: 0; }
  .panel svg:not(.ruler) { background: #fff; border: 1px solid #333; display: block; margin: 1em auto;
               max-width: 100%; height: auto; }
  .summary { background: #0f3460; padding: 1em; border-radius: 8px; margin-bottom: 2em; }
  .summary td { padding: 4px 12px; }
  .summary th { text-align: left; padding: 4px 12px; color: #e94560; }
  .ruler { display: none; }
  .print-note { display: none; }
  .print-btn { background: #e94560; color: #fff; border: none; padding: 10px 24px;
               border-radius: 6px; font-size: 1em; cursor: pointer; margin-bottom: 1em; }
  .print-btn:hover { background: #c73650; }

  /* === Print styles === */
  @media print {
    body { background: #fff; color: #000; margin: 0; padding: 5mm; }
    h1 { color: #000; font-size: 14pt; }
    .panel { background: #fff; border: none; padding: 0; margin: 0;
             page-break-inside: avoid; page-break-after: always; }
    .panel h2 { color: #000; font-size: 12pt; margin-bottom: 2mm; }
    .panel svg:not(.ruler) { border: none; margin: 0; background: #fff;
                 max-width: none; width: auto; height: auto; }
    .summary { background: #fff; border: 1px solid #ccc; }
    .summary th { color: #000; }
    .ruler { display: block; margin: 2mm 0; }
    .print-note { display: block; font-size: 9pt; color: #666; margin-bottom: 3mm; }
    .print-btn { display: none; }
  }
</style>
</head><body>
<h1>Pi5 NAS Acrylic Enclosure - Panel Review</h1>
<button class="print-btn" onclick="window.print()">Print at Actual Size</button>
<p class="print-note">Verify the ruler below measures exactly 100mm. If not, adjust print scale to 100%.</p>
)";

constexpr double mm_per_inch = 25.4;

} // namespace

ReviewPage::ReviewPage(const EnclosureConfig& config)
    : config_(config)
{
}

std::string ReviewPage::heading(std::string_view file_name)
{
    if (file_name.ends_with(".svg"))
    {
        file_name.remove_suffix(4);
    }
    const size_t name_start = file_name.find_first_not_of("0123456789_");
    std::string name(name_start == std::string_view::npos ? std::string_view() : file_name.substr(name_start));
    std::replace(name.begin(), name.end(), '_', ' ');
    return name;
}

std::string ReviewPage::toHtml(std::vector<const Panel*> panels) const
{
    ranges::sort(
        panels,
        [](const Panel* lhs, const Panel* rhs)
        {
            return lhs->file_name < rhs->file_name;
        });

    fmt::memory_buffer out;
    auto appender = std::back_inserter(out);
    fmt::format_to(appender, "{}{}\n", page_head, ruler_svg);
    fmt::format_to(appender, "<div class=\"summary\">\n<table>\n");
    fmt::format_to(
        appender,
        "<tr><th>Exterior</th><td>{:.0f} x {:.0f} x {:.0f} mm</td></tr>\n",
        INT2MM(config_.ext_x),
        INT2MM(config_.ext_y),
        INT2MM(config_.total_height));
    fmt::format_to(
        appender,
        "<tr><th>Interior</th><td>{} x {} mm</td></tr>\n",
        ShapeCanvas::formatMM(config_.interior_x),
        ShapeCanvas::formatMM(config_.interior_y));
    fmt::format_to(
        appender,
        "<tr><th>Total Height</th><td>{:.1f} mm ({:.1f} in)</td></tr>\n",
        INT2MM(config_.total_height),
        INT2MM(config_.total_height) / mm_per_inch);
    fmt::format_to(appender, "<tr><th>Drive Bottom Z</th><td>{:.1f} mm from bottom</td></tr>\n", INT2MM(config_.z_drive_bottom));
    fmt::format_to(appender, "<tr><th>Assembly</th><td>Vertical M4 rods (top/bottom only) + finger joint tabs (front/back into side)</td></tr>\n");
    fmt::format_to(appender, "<tr><th>Panels</th><td>{} SVG files</td></tr>\n", panels.size());
    fmt::format_to(appender, "</table>\n</div>\n");

    for (const Panel* panel : panels)
    {
        // The drawings are embedded inline, so their XML declaration has to go.
        std::string drawing = panel->canvas.toSvg();
        drawing.erase(0, drawing.find("<svg"));
        fmt::format_to(appender, "<div class=\"panel\">\n<h2>{}</h2>\n", heading(panel->file_name));
        fmt::format_to(appender, "<p class=\"print-note\">Verify ruler = 100mm. Print at 100% scale (no fit-to-page).</p>\n");
        fmt::format_to(appender, "{}\n{}</div>\n", ruler_svg, drawing);
    }
    fmt::format_to(appender, "</body></html>\n");
    return fmt::to_string(out);
}

std::filesystem::path ReviewPage::save(const std::filesystem::path& directory, const std::vector<Panel>& panels) const
{
    std::vector<const Panel*> panel_refs;
    panel_refs.reserve(panels.size());
    for (const Panel& panel : panels)
    {
        panel_refs.push_back(&panel);
    }
    const std::string page = toHtml(std::move(panel_refs));

    const std::filesystem::path file_path = directory / panel_files::review_page;
    std::FILE* out = std::fopen(file_path.string().c_str(), "w");
    if (out == nullptr)
    {
        throw exceptions::FileWriteException(file_path);
    }
    const size_t written = std::fwrite(page.data(), 1, page.size(), out);
    const bool closed = std::fclose(out) == 0;
    if (written != page.size() || ! closed)
    {
        throw exceptions::FileWriteException(file_path);
    }
    spdlog::info("  {}", panel_files::review_page);
    return file_path;
}

} // namespace kerf
