// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dashboard_layout_config.h"

#include "config.h"
#include "widget_kind_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace gridboard {

DashboardLayoutConfig::DashboardLayoutConfig(Config& config) : config_(config) {}

LayoutConfiguration DashboardLayoutConfig::load(const GridPreset* preset_override) {
    auto saved = config_.get<json>(CONFIG_PATH, json());

    // Migration: the previous dashboard stored its layout under "dashboardLayout"
    if (!saved.is_object() && config_.exists(LEGACY_CONFIG_PATH)) {
        auto legacy = config_.get<json>(LEGACY_CONFIG_PATH, json());
        if (legacy.is_object()) {
            spdlog::info("[DashboardLayoutConfig] Migrating legacy dashboardLayout to {}",
                         CONFIG_PATH);
            saved = migrate_legacy(legacy);
            config_.set<json>(CONFIG_PATH, saved);
            config_.erase("dashboardLayout");
            if (!config_.save()) {
                spdlog::warn("[DashboardLayoutConfig] Migrated layout not persisted");
            }
        }
    } else if (saved.is_object() && is_legacy_format(saved)) {
        spdlog::info("[DashboardLayoutConfig] Converting legacy layout shape in place");
        saved = migrate_legacy(saved);
        config_.set<json>(CONFIG_PATH, saved);
        if (!config_.save()) {
            spdlog::warn("[DashboardLayoutConfig] Converted layout not persisted");
        }
    }

    if (!saved.is_object()) {
        spdlog::info("[DashboardLayoutConfig] No saved layout, using defaults");
        auto defaults = build_defaults();
        if (preset_override) {
            defaults.grid_size = preset_override->name;
            reclamp(defaults.widgets, *preset_override);
        }
        // Persist default grid positions for future launches
        if (!save(defaults)) {
            spdlog::warn("[DashboardLayoutConfig] Default layout not persisted");
        }
        return defaults;
    }

    return from_json(saved, preset_override);
}

bool DashboardLayoutConfig::save(const LayoutConfiguration& layout) {
    config_.set<json>(CONFIG_PATH, to_json(layout));
    return config_.save();
}

LayoutConfiguration DashboardLayoutConfig::reset_to_defaults() {
    spdlog::info("[DashboardLayoutConfig] Resetting layout to defaults");
    auto defaults = build_defaults();
    if (!save(defaults)) {
        spdlog::warn("[DashboardLayoutConfig] Default layout not persisted");
    }
    return defaults;
}

json DashboardLayoutConfig::to_json(const LayoutConfiguration& layout) {
    json widgets_array = json::array();
    for (const auto& p : layout.widgets) {
        json item = {{"id", p.id},
                     {"kind", widget_kind_id(p.kind)},
                     {"enabled", p.enabled},
                     {"rect",
                      {{"x", p.rect.x},
                       {"y", p.rect.y},
                       {"width", p.rect.width},
                       {"height", p.rect.height}}}};
        item["settings"] = settings_to_json(p.settings);
        widgets_array.push_back(std::move(item));
    }
    return {{"grid_size", layout.grid_size}, {"widgets", std::move(widgets_array)}};
}

// Read one required integer member. Returns false if missing or not an integer.
static bool read_int(const json& obj, const char* key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) {
        return false;
    }
    out = it->get<int>();
    return true;
}

static std::optional<GridPlacement> parse_entry(const json& item) {
    if (!item.is_object()) {
        spdlog::warn("[DashboardLayoutConfig] Skipping non-object widget entry");
        return std::nullopt;
    }

    // Validate field types before extraction
    auto id_it = item.find("id");
    auto kind_it = item.find("kind");
    auto rect_it = item.find("rect");
    if (id_it == item.end() || !id_it->is_string() || kind_it == item.end() ||
        !kind_it->is_string() || rect_it == item.end() || !rect_it->is_object()) {
        spdlog::warn("[DashboardLayoutConfig] Skipping malformed widget entry: {}",
                     item.dump());
        return std::nullopt;
    }

    std::string id = id_it->get<std::string>();
    if (id.empty()) {
        spdlog::warn("[DashboardLayoutConfig] Skipping widget entry with empty id");
        return std::nullopt;
    }

    auto kind = widget_kind_from_id(kind_it->get<std::string>());
    if (!kind) {
        spdlog::warn("[DashboardLayoutConfig] Dropping '{}': unknown kind '{}'", id,
                     kind_it->get<std::string>());
        return std::nullopt;
    }

    CellRect rect{};
    if (!read_int(*rect_it, "x", rect.x) || !read_int(*rect_it, "y", rect.y) ||
        !read_int(*rect_it, "width", rect.width) || !read_int(*rect_it, "height", rect.height)) {
        spdlog::warn("[DashboardLayoutConfig] Dropping '{}': incomplete rect", id);
        return std::nullopt;
    }

    bool enabled = true;
    auto en_it = item.find("enabled");
    if (en_it != item.end()) {
        if (!en_it->is_boolean()) {
            spdlog::warn("[DashboardLayoutConfig] Dropping '{}': 'enabled' is not a boolean", id);
            return std::nullopt;
        }
        enabled = en_it->get<bool>();
    }

    json settings_json = json::object();
    auto st_it = item.find("settings");
    if (st_it != item.end() && st_it->is_object()) {
        settings_json = *st_it;
    }

    return GridPlacement{id, *kind, rect, settings_from_json(*kind, settings_json), enabled};
}

LayoutConfiguration DashboardLayoutConfig::from_json(const json& j,
                                                     const GridPreset* preset_override) {
    LayoutConfiguration layout;

    const GridPreset* preset = preset_override;
    if (!preset) {
        std::string name;
        if (j.is_object() && j.contains("grid_size") && j["grid_size"].is_string()) {
            name = j["grid_size"].get<std::string>();
        }
        preset = GridLayout::find_preset(name);
        if (!preset) {
            spdlog::warn("[DashboardLayoutConfig] Unknown grid size '{}', using {}", name,
                         GridLayout::default_preset().name);
            preset = &GridLayout::default_preset();
        }
    }
    layout.grid_size = preset->name;

    if (!j.is_object() || !j.contains("widgets") || !j["widgets"].is_array()) {
        spdlog::warn("[DashboardLayoutConfig] Layout has no widget list");
        return layout;
    }

    std::set<std::string> seen_ids;
    for (const auto& item : j["widgets"]) {
        auto placement = parse_entry(item);
        if (!placement) {
            continue;
        }
        if (seen_ids.count(placement->id) > 0) {
            spdlog::warn("[DashboardLayoutConfig] Skipping duplicate widget ID: {}",
                         placement->id);
            continue;
        }
        seen_ids.insert(placement->id);
        layout.widgets.push_back(std::move(*placement));
    }

    reclamp(layout.widgets, *preset);

    spdlog::debug("[DashboardLayoutConfig] Loaded {} widgets on {}", layout.widgets.size(),
                  layout.grid_size);
    return layout;
}

bool DashboardLayoutConfig::is_legacy_format(const json& j) {
    if (!j.is_object()) {
        return false;
    }
    if (j.contains("gridSize")) {
        return true;
    }
    if (!j.contains("widgets") || !j["widgets"].is_array()) {
        return false;
    }
    return std::any_of(j["widgets"].begin(), j["widgets"].end(), [](const json& w) {
        return w.is_object() && w.contains("type") && !w.contains("kind");
    });
}

// Legacy documents were written by hand-rolled JS; tolerate any member type
static int legacy_int(const json& obj, const char* key, int fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    return static_cast<int>(std::clamp(it->get<double>(), -1e6, 1e6));
}

json DashboardLayoutConfig::migrate_legacy(const json& legacy) {
    json out = json::object();
    out["grid_size"] = GridLayout::default_preset().name;
    if (legacy.contains("gridSize") && legacy["gridSize"].is_string()) {
        out["grid_size"] = legacy["gridSize"];
    }

    json widgets = json::array();
    if (legacy.contains("widgets") && legacy["widgets"].is_array()) {
        for (const auto& w : legacy["widgets"]) {
            if (!w.is_object() || !w.contains("type") || !w["type"].is_string()) {
                spdlog::warn("[DashboardLayoutConfig] Legacy entry without type dropped");
                continue;
            }
            const auto* def = find_widget_kind_def(w["type"].get<std::string>());

            json entry = json::object();
            entry["id"] = w.contains("id") ? w["id"] : w["type"];
            entry["kind"] = w["type"];
            entry["enabled"] = true;
            if (w.contains("enabled") && w["enabled"].is_boolean()) {
                entry["enabled"] = w["enabled"];
            }

            // Position lived inside the free-form settings map
            json settings = json::object();
            if (w.contains("settings") && w["settings"].is_object()) {
                settings = w["settings"];
            }
            json pos = settings.contains("gridPosition") ? settings["gridPosition"] : json();
            settings.erase("gridPosition");

            int default_w = def ? def->default_size.width : 4;
            int default_h = def ? def->default_size.height : 3;
            entry["rect"] = {{"x", legacy_int(pos, "x", 0)},
                             {"y", legacy_int(pos, "y", 0)},
                             {"width", legacy_int(pos, "width", default_w)},
                             {"height", legacy_int(pos, "height", default_h)}};
            entry["settings"] = settings;
            widgets.push_back(std::move(entry));
        }
    }
    out["widgets"] = std::move(widgets);
    return out;
}

std::optional<CellRect> DashboardLayoutConfig::clamp_rect(WidgetKind kind, const CellRect& rect,
                                                          int cols, int rows) {
    const auto& def = widget_kind_def(kind);
    if (def.min_size.width > cols || def.min_size.height > rows) {
        return std::nullopt;
    }

    // Kind limits first, then the grid; min <= cols/rows was checked above
    CellSize size = clamp_to_kind(kind, {rect.width, rect.height});
    CellRect r;
    r.width = std::min(size.width, cols);
    r.height = std::min(size.height, rows);
    r.x = std::clamp(rect.x, 0, cols - r.width);
    r.y = std::clamp(rect.y, 0, rows - r.height);
    return r;
}

std::vector<std::string> DashboardLayoutConfig::reclamp(std::vector<GridPlacement>& placements,
                                                        const GridPreset& preset) {
    std::vector<std::string> dropped;
    auto it = placements.begin();
    while (it != placements.end()) {
        auto fitted = clamp_rect(it->kind, it->rect, preset.cols, preset.rows);
        if (!fitted) {
            spdlog::warn("[DashboardLayoutConfig] Dropping '{}': minimum size of '{}' does not "
                         "fit a {} grid",
                         it->id, widget_kind_id(it->kind), preset.name);
            dropped.push_back(it->id);
            it = placements.erase(it);
            continue;
        }
        if (*fitted != it->rect) {
            spdlog::debug("[DashboardLayoutConfig] '{}' re-clamped ({},{} {}x{}) -> ({},{} {}x{})",
                          it->id, it->rect.x, it->rect.y, it->rect.width, it->rect.height,
                          fitted->x, fitted->y, fitted->width, fitted->height);
            it->rect = *fitted;
        }
        ++it;
    }
    return dropped;
}

LayoutConfiguration DashboardLayoutConfig::build_defaults() {
    struct DefaultEntry {
        WidgetKind kind;
        CellRect rect;
    };
    // clang-format off
    static const DefaultEntry DEFAULTS[] = {
        {WidgetKind::TotalHours,        {0, 0, 3, 2}},
        {WidgetKind::ThisWeek,          {3, 0, 3, 2}},
        {WidgetKind::ContractProgress,  {6, 0, 3, 2}},
        {WidgetKind::Overtime,          {9, 0, 3, 2}},
        {WidgetKind::DailyHours,        {0, 2, 8, 4}},
        {WidgetKind::HoursDistribution, {8, 2, 4, 4}},
        {WidgetKind::PerformanceLegend, {0, 6, 12, 2}},
    };
    // clang-format on

    LayoutConfiguration layout;
    layout.grid_size = GridLayout::default_preset().name;
    for (const auto& d : DEFAULTS) {
        layout.widgets.push_back({widget_kind_id(d.kind), d.kind, d.rect, default_settings(d.kind),
                                  true});
    }
    // Host size overrides may make a stock rect illegal
    reclamp(layout.widgets, GridLayout::default_preset());
    return layout;
}

} // namespace gridboard
