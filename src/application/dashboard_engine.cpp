// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dashboard_engine.h"

#include "config.h"
#include "widget_kind_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace gridboard {

EngineSettings EngineSettings::from_config(const Config& config) {
    EngineSettings s;
    auto& sizing = s.sizing;

    float padding = config.get<float>("/grid/padding_px", sizing.padding_px);
    float gap = config.get<float>("/grid/gap_px", sizing.gap_px);
    float min_cell = config.get<float>("/grid/min_cell_size_px", sizing.min_cell_size_px);

    if (padding >= 0.0f) {
        sizing.padding_px = padding;
    } else {
        spdlog::warn("[DashboardEngine] Ignoring negative /grid/padding_px {}", padding);
    }
    if (gap >= 0.0f) {
        sizing.gap_px = gap;
    } else {
        spdlog::warn("[DashboardEngine] Ignoring negative /grid/gap_px {}", gap);
    }
    if (min_cell > 0.0f) {
        sizing.min_cell_size_px = min_cell;
    } else {
        spdlog::warn("[DashboardEngine] Ignoring non-positive /grid/min_cell_size_px {}",
                     min_cell);
    }
    return s;
}

DashboardEngine::DashboardEngine(EngineSettings settings) : settings_(settings) {
    edit_mode_.set_change_callback([this](const std::string& /*widget_id*/) { emit_change(); });
    rebuild_spec();
}

// ---------------------------------------------------------------------------
// State in/out
// ---------------------------------------------------------------------------

void DashboardEngine::load(const LayoutConfiguration& config) {
    const GridPreset* preset = GridLayout::find_preset(config.grid_size);
    if (!preset) {
        spdlog::warn("[DashboardEngine] Unknown grid size '{}', using {}", config.grid_size,
                     GridLayout::default_preset().name);
        preset = &GridLayout::default_preset();
    }

    edit_mode_.cancel();
    replace_placements(*preset, config.widgets);
    rebuild_spec();
    spdlog::debug("[DashboardEngine] Loaded {} widgets on {}", layout_.placements().size(),
                  layout_.preset().name);
}

LayoutConfiguration DashboardEngine::configuration() const {
    return {layout_.preset().name, layout_.placements()};
}

void DashboardEngine::replace_placements(const GridPreset& preset,
                                         std::vector<GridPlacement> placements) {
    DashboardLayoutConfig::reclamp(placements, preset);

    layout_.clear();
    layout_.set_preset(preset);
    for (auto& p : placements) {
        std::string id = p.id;
        if (!layout_.add(std::move(p))) {
            spdlog::warn("[DashboardEngine] Skipping widget '{}': duplicate id", id);
        }
    }

    if (edit_mode_.has_session() && !layout_.find(edit_mode_.session_widget())) {
        edit_mode_.handle_widget_removed(edit_mode_.session_widget());
    }
}

void DashboardEngine::emit_change() {
    if (change_cb_) {
        change_cb_(configuration());
    }
}

// ---------------------------------------------------------------------------
// Sizing
// ---------------------------------------------------------------------------

void DashboardEngine::rebuild_spec() {
    spec_ = make_grid_spec(container_w_, container_h_, layout_.cols(), layout_.rows(),
                           settings_.sizing);
}

void DashboardEngine::set_container_size(float width, float height) {
    container_w_ = std::max(width, 0.0f);
    container_h_ = std::max(height, 0.0f);
    rebuild_spec();
    spdlog::debug("[DashboardEngine] Container {}x{} -> cell {}px", container_w_, container_h_,
                  spec_.cell_size_px);
}

bool DashboardEngine::set_preset(std::string_view name) {
    const GridPreset* preset = GridLayout::find_preset(name);
    if (!preset) {
        spdlog::debug("[DashboardEngine] Unknown grid size '{}'", name);
        return false;
    }
    if (std::string_view(layout_.preset().name) == name) {
        return true;
    }

    spdlog::info("[DashboardEngine] Grid size {} -> {}", layout_.preset().name, preset->name);
    replace_placements(*preset, layout_.placements());
    rebuild_spec();
    emit_change();
    return true;
}

bool DashboardEngine::reclamp_widgets() {
    std::vector<GridPlacement> before = layout_.placements();
    GridPreset preset = layout_.preset();
    replace_placements(preset, before);

    const auto& after = layout_.placements();
    bool changed = after.size() != before.size();
    for (size_t i = 0; !changed && i < after.size(); ++i) {
        changed = after[i].rect != before[i].rect;
    }
    if (!changed) {
        return false;
    }

    spdlog::info("[DashboardEngine] Re-clamped to kind limits: {} of {} widgets kept",
                 after.size(), before.size());
    emit_change();
    return true;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

std::string DashboardEngine::next_id(WidgetKind kind) {
    std::string id;
    do {
        id = std::string(widget_kind_id(kind)) + "-" + std::to_string(++id_counter_);
    } while (layout_.find(id));
    return id;
}

std::optional<std::string> DashboardEngine::add_widget(std::string_view kind_name,
                                                       std::optional<CellPos> preferred,
                                                       std::optional<WidgetSettings> settings) {
    auto kind = widget_kind_from_id(kind_name);
    if (!kind) {
        throw std::invalid_argument("unknown widget kind: " + std::string(kind_name));
    }
    return add_widget(*kind, preferred, std::move(settings));
}

std::optional<std::string> DashboardEngine::add_widget(WidgetKind kind,
                                                       std::optional<CellPos> preferred,
                                                       std::optional<WidgetSettings> settings) {
    const auto& def = widget_kind_def(kind);
    if (settings && !settings_match_kind(*settings, kind)) {
        throw std::invalid_argument(std::string("settings do not belong to widget kind ") +
                                    def.id);
    }

    int ncols = layout_.cols();
    int nrows = layout_.rows();
    if (def.min_size.width > ncols || def.min_size.height > nrows) {
        spdlog::warn("[DashboardEngine] Cannot add '{}': minimum {}x{} exceeds {} grid", def.id,
                     def.min_size.width, def.min_size.height, layout_.preset().name);
        return std::nullopt;
    }

    int width = std::min(def.default_size.width, ncols);
    int height = std::min(def.default_size.height, nrows);
    auto [x, y] = layout_.find_placement(width, height, preferred);

    GridPlacement placement{next_id(kind), kind, {x, y, width, height},
                            settings ? *settings : default_settings(kind), true};
    std::string id = placement.id;
    if (!layout_.add(std::move(placement))) {
        spdlog::error("[DashboardEngine] Failed to add '{}' at ({},{})", id, x, y);
        return std::nullopt;
    }

    spdlog::info("[DashboardEngine] Added '{}' at ({},{}) span {}x{}", id, x, y, width, height);
    emit_change();
    return id;
}

bool DashboardEngine::remove_widget(const std::string& id) {
    if (!layout_.remove(id)) {
        spdlog::debug("[DashboardEngine] remove: unknown widget '{}'", id);
        return false;
    }
    edit_mode_.handle_widget_removed(id);
    spdlog::info("[DashboardEngine] Removed '{}'", id);
    emit_change();
    return true;
}

void DashboardEngine::reset() {
    edit_mode_.cancel();
    auto defaults = DashboardLayoutConfig::build_defaults();
    replace_placements(GridLayout::default_preset(), std::move(defaults.widgets));
    rebuild_spec();
    spdlog::info("[DashboardEngine] Layout reset to defaults");
    emit_change();
}

bool DashboardEngine::set_widget_enabled(const std::string& id, bool enabled) {
    const auto* p = layout_.find(id);
    if (!p) {
        spdlog::debug("[DashboardEngine] set_enabled: unknown widget '{}'", id);
        return false;
    }
    if (p->enabled == enabled) {
        return true;
    }
    layout_.set_enabled(id, enabled);
    if (!enabled) {
        edit_mode_.handle_widget_removed(id);
    }
    emit_change();
    return true;
}

bool DashboardEngine::update_widget_settings(const std::string& id,
                                             const WidgetSettings& settings) {
    if (!layout_.set_settings(id, settings)) {
        return false;
    }
    emit_change();
    return true;
}

// ---------------------------------------------------------------------------
// Edit mode and pointer input
// ---------------------------------------------------------------------------

void DashboardEngine::enter_edit_mode() {
    edit_mode_.enter(&layout_);
}

void DashboardEngine::exit_edit_mode() {
    edit_mode_.exit();
}

bool DashboardEngine::pointer_down(const std::string& id, GridEditMode::Gesture gesture, float x,
                                   float y, GridEditMode::ResizeHandle handle) {
    return edit_mode_.handle_pointer_down(id, gesture, x, y, spec_, handle);
}

bool DashboardEngine::pointer_move(float x, float y) {
    return edit_mode_.handle_pointer_move(x, y, spec_);
}

void DashboardEngine::pointer_up() {
    edit_mode_.handle_pointer_up();
}

void DashboardEngine::cancel_gesture() {
    edit_mode_.cancel();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<PixelRect> DashboardEngine::pixel_rect(const std::string& id) const {
    const auto* p = layout_.find(id);
    if (!p || !p->enabled) {
        return std::nullopt;
    }
    return cell_rect_to_pixel_rect(p->rect, spec_);
}

std::vector<std::pair<std::string, PixelRect>> DashboardEngine::pixel_rects() const {
    std::vector<std::pair<std::string, PixelRect>> out;
    out.reserve(layout_.placements().size());
    for (const auto& p : layout_.placements()) {
        if (p.enabled) {
            out.emplace_back(p.id, cell_rect_to_pixel_rect(p.rect, spec_));
        }
    }
    return out;
}

} // namespace gridboard
