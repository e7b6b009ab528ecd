// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_layout.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gridboard {

class Config;

/// Everything the host persists for the dashboard: the preset name and the
/// ordered widget list.
struct LayoutConfiguration {
    std::string grid_size;
    std::vector<GridPlacement> widgets;
};

/// Translates between LayoutConfiguration and its persisted JSON form, and
/// owns the rules for fitting persisted rects onto a (possibly smaller) grid.
///
/// Persisted shape, stored under /dashboard_layout:
/// @code
/// {"grid_size": "12x12",
///  "widgets": [{"id": "totalHours", "kind": "totalHours", "enabled": true,
///               "rect": {"x": 0, "y": 0, "width": 3, "height": 2},
///               "settings": {"showTrend": true}}]}
/// @endcode
class DashboardLayoutConfig {
  public:
    static constexpr const char* CONFIG_PATH = "/dashboard_layout";
    static constexpr const char* LEGACY_CONFIG_PATH = "/dashboardLayout";

    explicit DashboardLayoutConfig(Config& config);

    /// Load the layout from config, migrating the legacy shape if present.
    /// A missing layout yields the default layout, which is persisted.
    /// @param preset_override grid to fit widgets onto instead of the saved one
    LayoutConfiguration load(const GridPreset* preset_override = nullptr);

    /// Write the layout into config and save the config file
    bool save(const LayoutConfiguration& layout);

    /// Replace the persisted layout with the stock one and return it
    LayoutConfiguration reset_to_defaults();

    /// Serialize verbatim, in order, including the preset name
    static nlohmann::json to_json(const LayoutConfiguration& layout);

    /// Parse a persisted layout. Malformed entries, duplicate ids and unknown
    /// kinds are dropped one by one; surviving rects are re-clamped onto the
    /// preset (the saved one unless preset_override is given).
    static LayoutConfiguration from_json(const nlohmann::json& j,
                                         const GridPreset* preset_override = nullptr);

    /// True for documents written by the previous dashboard
    /// ("gridSize" + widgets with "type" and "settings.gridPosition")
    static bool is_legacy_format(const nlohmann::json& j);

    /// Convert a legacy document to the current shape
    static nlohmann::json migrate_legacy(const nlohmann::json& legacy);

    /// Fit a rect for a kind onto a cols x rows grid: sizes are clamped to the
    /// kind's limits and the grid, then the origin is pulled in so the rect
    /// ends inside the grid. Returns nullopt if even the minimum size does not
    /// fit.
    static std::optional<CellRect> clamp_rect(WidgetKind kind, const CellRect& rect, int cols,
                                              int rows);

    /// Re-clamp every placement onto the preset. Placements that cannot fit
    /// are removed and logged. Returns the ids of the removed placements.
    static std::vector<std::string> reclamp(std::vector<GridPlacement>& placements,
                                            const GridPreset& preset);

    /// The stock dashboard on a 12x12 grid
    static LayoutConfiguration build_defaults();

  private:
    Config& config_;
};

} // namespace gridboard
