// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_layout.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gridboard {

// Grid presets: {name, cols, rows}. Index 3 (12x12) is the default.
static const std::vector<GridPreset> GRID_PRESETS = {
    {"6x8", 6, 8},     //
    {"8x10", 8, 10},   //
    {"10x12", 10, 12}, //
    {"12x12", 12, 12}, //
    {"12x16", 12, 16}, //
    {"16x20", 16, 20}, //
};

static constexpr size_t DEFAULT_PRESET_INDEX = 3;

// ---------------------------------------------------------------------------
// Static helpers
// ---------------------------------------------------------------------------

const std::vector<GridPreset>& GridLayout::presets() {
    return GRID_PRESETS;
}

const GridPreset* GridLayout::find_preset(std::string_view name) {
    auto it = std::find_if(GRID_PRESETS.begin(), GRID_PRESETS.end(),
                           [&name](const GridPreset& p) { return name == p.name; });
    return it != GRID_PRESETS.end() ? &*it : nullptr;
}

const GridPreset& GridLayout::default_preset() {
    return GRID_PRESETS[DEFAULT_PRESET_INDEX];
}

bool GridLayout::overlaps(const CellRect& a, const CellRect& b) {
    return a.x < b.x + b.width && a.x + a.width > b.x && a.y < b.y + b.height &&
           a.y + a.height > b.y;
}

bool GridLayout::in_bounds(const CellRect& rect, int cols, int rows) {
    if (rect.x < 0 || rect.y < 0 || rect.width <= 0 || rect.height <= 0)
        return false;
    return rect.x + rect.width <= cols && rect.y + rect.height <= rows;
}

// ---------------------------------------------------------------------------
// Instance methods
// ---------------------------------------------------------------------------

GridLayout::GridLayout() : preset_(default_preset()) {}

GridLayout::GridLayout(const GridPreset& preset) : preset_(preset) {}

void GridLayout::set_preset(const GridPreset& preset) {
    preset_ = preset;
}

GridPlacement* GridLayout::find_mutable(const std::string& id) {
    auto it = std::find_if(placements_.begin(), placements_.end(),
                           [&](const GridPlacement& p) { return p.id == id; });
    return it != placements_.end() ? &*it : nullptr;
}

const GridPlacement* GridLayout::find(const std::string& id) const {
    auto it = std::find_if(placements_.begin(), placements_.end(),
                           [&](const GridPlacement& p) { return p.id == id; });
    return it != placements_.end() ? &*it : nullptr;
}

bool GridLayout::add(GridPlacement placement) {
    if (find(placement.id)) {
        spdlog::debug("[GridLayout] cannot add '{}': id already present", placement.id);
        return false;
    }
    if (!in_bounds(placement.rect)) {
        spdlog::debug("[GridLayout] cannot add '{}' at ({},{}) span {}x{} in {}x{} grid",
                      placement.id, placement.rect.x, placement.rect.y, placement.rect.width,
                      placement.rect.height, cols(), rows());
        return false;
    }
    placements_.push_back(std::move(placement));
    return true;
}

bool GridLayout::remove(const std::string& id) {
    auto it = std::find_if(placements_.begin(), placements_.end(),
                           [&](const GridPlacement& p) { return p.id == id; });
    if (it == placements_.end())
        return false;
    placements_.erase(it);
    return true;
}

bool GridLayout::update(const std::string& id, const CellRect& rect) {
    auto* p = find_mutable(id);
    if (!p) {
        spdlog::debug("[GridLayout] update: unknown widget '{}'", id);
        return false;
    }
    if (!in_bounds(rect)) {
        spdlog::debug("[GridLayout] update: rejecting ({},{}) span {}x{} for '{}' in {}x{} grid",
                      rect.x, rect.y, rect.width, rect.height, id, cols(), rows());
        return false;
    }
    p->rect = rect;
    return true;
}

bool GridLayout::set_enabled(const std::string& id, bool enabled) {
    auto* p = find_mutable(id);
    if (!p)
        return false;
    p->enabled = enabled;
    return true;
}

bool GridLayout::set_settings(const std::string& id, const WidgetSettings& settings) {
    auto* p = find_mutable(id);
    if (!p)
        return false;
    if (!settings_match_kind(settings, p->kind)) {
        spdlog::warn("[GridLayout] settings for '{}' do not match its kind '{}'", id,
                     widget_kind_id(p->kind));
        return false;
    }
    p->settings = settings;
    return true;
}

void GridLayout::clear() {
    placements_.clear();
}

bool GridLayout::collides(const CellRect& rect, const std::string& ignore_id) const {
    return std::any_of(placements_.begin(), placements_.end(), [&](const GridPlacement& p) {
        return p.enabled && p.id != ignore_id && overlaps(rect, p.rect);
    });
}

std::optional<std::pair<int, int>> GridLayout::find_available(int width, int height) const {
    int ncols = cols();
    int nrows = rows();

    // Scan top-to-bottom, left-to-right
    for (int y = 0; y <= nrows - height; ++y) {
        for (int x = 0; x <= ncols - width; ++x) {
            if (!collides({x, y, width, height})) {
                return std::make_pair(x, y);
            }
        }
    }
    return std::nullopt;
}

std::pair<int, int> GridLayout::find_placement(int width, int height,
                                               std::optional<std::pair<int, int>> preferred) const {
    if (preferred) {
        CellRect rect{preferred->first, preferred->second, width, height};
        if (in_bounds(rect) && !collides(rect)) {
            return *preferred;
        }
        spdlog::debug("[GridLayout] preferred ({},{}) not free for {}x{}, scanning",
                      preferred->first, preferred->second, width, height);
    }

    if (auto pos = find_available(width, height)) {
        return *pos;
    }

    spdlog::warn("[GridLayout] no free {}x{} area in {}x{} grid, falling back to (0,0)", width,
                 height, cols(), rows());
    return {0, 0};
}

} // namespace gridboard
