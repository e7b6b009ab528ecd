// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dashboard_engine.h"

#include "lvgl/lvgl.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gridboard {

/// Binds a DashboardEngine to an LVGL container.
///
/// The container's direct children are the widget views, each named after its
/// widget id (lv_obj_set_name). The host forwards the container's size and
/// pointer events into the engine and re-positions every child from the
/// engine's pixel rects after each change. A press within CORNER_HIT_RADIUS of
/// a resizable widget's bottom-right corner starts a resize, anywhere else a
/// drag. Gestures are only accepted while the engine is in edit mode.
class LvglDashboardHost {
  public:
    static constexpr int CORNER_HIT_RADIUS = 24;

    explicit LvglDashboardHost(DashboardEngine& engine);
    ~LvglDashboardHost();

    LvglDashboardHost(const LvglDashboardHost&) = delete;
    LvglDashboardHost& operator=(const LvglDashboardHost&) = delete;

    /// Start listening on a container. Takes over the engine's change
    /// callback; use set_change_callback() to observe changes.
    void attach(lv_obj_t* container);

    /// Stop listening. Safe to call when not attached.
    void detach();

    lv_obj_t* container() const {
        return container_;
    }

    /// Forwarded after the children were re-positioned
    void set_change_callback(DashboardEngine::ChangeCallback cb) {
        change_cb_ = std::move(cb);
    }

    /// Position and show/hide every named child from the engine's state
    void sync_children();

    /// Fixed-pixel LVGL column template for a spec: one cell_size_px track
    /// per column, terminated by LV_GRID_TEMPLATE_LAST
    static std::vector<int32_t> make_col_dsc(const GridSpec& spec);

    /// Row counterpart of make_col_dsc()
    static std::vector<int32_t> make_row_dsc(const GridSpec& spec);

  private:
    static void on_event(lv_event_t* e);

    void handle_size_changed();
    void handle_pressed(lv_event_t* e);
    void handle_pressing();
    void handle_released();

    /// Direct child of the container that contains obj, or nullptr
    lv_obj_t* widget_view_for(lv_obj_t* obj) const;

    /// Active pointer in container-local pixels. False when no input device.
    bool pointer_local(float& x, float& y) const;

    DashboardEngine& engine_;
    lv_obj_t* container_ = nullptr;
    DashboardEngine::ChangeCallback change_cb_;
};

} // namespace gridboard
