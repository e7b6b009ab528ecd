// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_geometry.h"
#include "widget_kind_registry.h"
#include "widget_settings.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gridboard {

/// A named grid size from the fixed preset table
struct GridPreset {
    const char* name;
    int cols;
    int rows;
};

/// A widget placement on the grid
struct GridPlacement {
    std::string id;
    WidgetKind kind;
    CellRect rect;
    WidgetSettings settings;
    bool enabled = true; // Disabled widgets are persisted but never placed or hit
};

/// Canonical collection of widget placements for the dashboard.
/// Handles the preset table, bounds/overlap predicates, rect updates and
/// free-position search for new widgets.
///
/// Overlap is tolerated by update(): gestures mutate the model on every move
/// and a widget may end up covering another. Only add() of a duplicate id or
/// an out-of-bounds rect is refused.
class GridLayout {
  public:
    /// All presets in menu order
    static const std::vector<GridPreset>& presets();

    /// Look up a preset by name ("12x12"). Returns nullptr if unknown.
    static const GridPreset* find_preset(std::string_view name);

    /// The preset used when none (or an unknown one) is configured: 12x12
    static const GridPreset& default_preset();

    /// Open-interval intersection: rects sharing only an edge do not overlap
    static bool overlaps(const CellRect& a, const CellRect& b);

    /// True if the rect has a positive size and lies inside [0,cols]x[0,rows]
    static bool in_bounds(const CellRect& rect, int cols, int rows);

    GridLayout();
    explicit GridLayout(const GridPreset& preset);

    const GridPreset& preset() const {
        return preset_;
    }
    int cols() const {
        return preset_.cols;
    }
    int rows() const {
        return preset_.rows;
    }

    /// Switch the grid dimensions. Placements are left untouched; callers
    /// re-clamp them (see DashboardLayoutConfig::reclamp).
    void set_preset(const GridPreset& preset);

    bool in_bounds(const CellRect& rect) const {
        return in_bounds(rect, cols(), rows());
    }

    /// Append a placement. Fails on duplicate id or out-of-bounds rect.
    bool add(GridPlacement placement);

    /// Remove a widget by ID. Returns true if found and removed.
    bool remove(const std::string& id);

    /// Replace the rect of a widget. Fails (no-op) for unknown ids and
    /// out-of-bounds rects; overlap is not checked.
    bool update(const std::string& id, const CellRect& rect);

    /// Enable or disable a widget. Returns false for unknown ids.
    bool set_enabled(const std::string& id, bool enabled);

    /// Replace the settings of a widget. Fails if the id is unknown or the
    /// settings belong to a different kind.
    bool set_settings(const std::string& id, const WidgetSettings& settings);

    const GridPlacement* find(const std::string& id) const;

    const std::vector<GridPlacement>& placements() const {
        return placements_;
    }

    void clear();

    /// True if rect overlaps any enabled placement other than ignore_id
    bool collides(const CellRect& rect, const std::string& ignore_id = {}) const;

    /// Find the first free position for a widget of the given size.
    /// Scans top-to-bottom, left-to-right (row-major order).
    std::optional<std::pair<int, int>> find_available(int width, int height) const;

    /// Position for a new widget: the preferred cell if it is in bounds and
    /// free, otherwise the first free cell in row-major order, otherwise (0,0)
    /// with overlap tolerated.
    std::pair<int, int> find_placement(int width, int height,
                                       std::optional<std::pair<int, int>> preferred = {}) const;

  private:
    GridPlacement* find_mutable(const std::string& id);

    GridPreset preset_;
    std::vector<GridPlacement> placements_;
};

} // namespace gridboard
