// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file dashboard_engine.h
 * @brief Host-facing facade over the grid layout, sizing and edit gestures
 *
 * The host owns exactly one DashboardEngine. It holds the only writable
 * GridLayout, the GridEditMode session and the GridSpec resolved for the
 * current container size. Every committed mutation (move, resize, add,
 * remove, reset, preset change, settings change, enable toggle) is reported
 * through the change callback with the complete LayoutConfiguration, ready to
 * hand to DashboardLayoutConfig::save() or any other persistence.
 */

#pragma once

#include "dashboard_layout_config.h"
#include "grid_edit_mode.h"
#include "grid_layout.h"
#include "grid_sizing.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gridboard {

class Config;

struct EngineSettings {
    GridSizingSettings sizing;

    /**
     * @brief Read /grid/padding_px, /grid/gap_px and /grid/min_cell_size_px
     *
     * Missing keys keep their defaults. Negative padding or gap and a
     * non-positive minimum cell size are rejected with a warning.
     */
    static EngineSettings from_config(const Config& config);
};

class DashboardEngine {
  public:
    using ChangeCallback = std::function<void(const LayoutConfiguration&)>;
    using CellPos = std::pair<int, int>;

    explicit DashboardEngine(EngineSettings settings = {});

    DashboardEngine(const DashboardEngine&) = delete;
    DashboardEngine& operator=(const DashboardEngine&) = delete;

    void set_change_callback(ChangeCallback cb) {
        change_cb_ = std::move(cb);
    }

    /**
     * @brief Replace the whole layout with a host-supplied configuration
     *
     * An unknown preset name falls back to the default preset. Rects are
     * re-clamped onto the preset and widgets that cannot fit are dropped.
     * Any open gesture is cancelled. Does not invoke the change callback.
     */
    void load(const LayoutConfiguration& config);

    /// Snapshot of the current preset name and ordered widget list
    LayoutConfiguration configuration() const;

    const GridLayout& layout() const {
        return layout_;
    }

    const EngineSettings& settings() const {
        return settings_;
    }

    // -- Sizing --

    /// Recompute the GridSpec. An open gesture continues against the new spec.
    void set_container_size(float width, float height);

    const GridSpec& grid_spec() const {
        return spec_;
    }

    /// Switch presets, re-clamping every widget. Returns false for unknown names.
    bool set_preset(std::string_view name);

    /**
     * @brief Re-apply the registry's size limits to the current widgets
     *
     * Call after override_widget_kind_sizes() while a layout is loaded.
     * Sizes are clamped into the new [min, max] and widgets whose minimum no
     * longer fits the grid are dropped. Emits and returns true if anything
     * changed.
     */
    bool reclamp_widgets();

    // -- Commands --

    /**
     * @brief Add a widget of a kind at its default size (clamped to the grid)
     *
     * @param kind_name registry id such as "dailyHours"
     * @param preferred top-left cell to try first
     * @param settings initial settings (kind defaults when omitted)
     * @return new widget id "<kind>-<n>", or nullopt if the kind's minimum
     *         size does not fit the grid
     * @throws std::invalid_argument for an unknown kind name or settings of
     *         another kind
     */
    std::optional<std::string> add_widget(std::string_view kind_name,
                                          std::optional<CellPos> preferred = std::nullopt,
                                          std::optional<WidgetSettings> settings = std::nullopt);

    std::optional<std::string> add_widget(WidgetKind kind,
                                          std::optional<CellPos> preferred = std::nullopt,
                                          std::optional<WidgetSettings> settings = std::nullopt);

    /// Remove a widget. Closes a gesture open on it. Returns false if unknown.
    bool remove_widget(const std::string& id);

    /// Restore the stock seven-widget layout on the default preset
    void reset();

    bool set_widget_enabled(const std::string& id, bool enabled);

    /// Replace a widget's settings. Returns false for unknown ids or settings
    /// of another kind.
    bool update_widget_settings(const std::string& id, const WidgetSettings& settings);

    // -- Edit mode --

    void enter_edit_mode();
    void exit_edit_mode();

    bool is_edit_mode() const {
        return edit_mode_.is_active();
    }

    const GridEditMode& edit_mode() const {
        return edit_mode_;
    }

    // -- Pointer input (container-local pixels) --

    bool pointer_down(const std::string& id, GridEditMode::Gesture gesture, float x, float y,
                      GridEditMode::ResizeHandle handle = GridEditMode::ResizeHandle::BottomRight);
    bool pointer_move(float x, float y);
    void pointer_up();
    void cancel_gesture();

    // -- Queries --

    /// Pixel rect of an enabled widget, nullopt if unknown or disabled
    std::optional<PixelRect> pixel_rect(const std::string& id) const;

    /// Pixel rects of all enabled widgets, in layout order
    std::vector<std::pair<std::string, PixelRect>> pixel_rects() const;

  private:
    void rebuild_spec();
    void replace_placements(const GridPreset& preset, std::vector<GridPlacement> placements);
    void emit_change();
    std::string next_id(WidgetKind kind);

    EngineSettings settings_;
    GridLayout layout_;
    GridEditMode edit_mode_;
    ChangeCallback change_cb_;

    float container_w_ = 0.0f;
    float container_h_ = 0.0f;
    GridSpec spec_{};

    int id_counter_ = 0;
};

} // namespace gridboard
