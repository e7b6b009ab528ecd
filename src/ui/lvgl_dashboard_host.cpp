// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_dashboard_host.h"

#include "widget_kind_registry.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>

namespace gridboard {

LvglDashboardHost::LvglDashboardHost(DashboardEngine& engine) : engine_(engine) {}

LvglDashboardHost::~LvglDashboardHost() {
    detach();
}

void LvglDashboardHost::attach(lv_obj_t* container) {
    detach();
    if (!container) {
        spdlog::warn("[LvglDashboardHost] attach() without a container");
        return;
    }
    container_ = container;

    // Geometry includes the padding; children are placed from the outer edge
    lv_obj_set_style_pad_all(container_, 0, 0);
    lv_obj_set_layout(container_, LV_LAYOUT_NONE);

    lv_obj_add_event_cb(container_, on_event, LV_EVENT_SIZE_CHANGED, this);
    lv_obj_add_event_cb(container_, on_event, LV_EVENT_PRESSED, this);
    lv_obj_add_event_cb(container_, on_event, LV_EVENT_PRESSING, this);
    lv_obj_add_event_cb(container_, on_event, LV_EVENT_RELEASED, this);
    lv_obj_add_event_cb(container_, on_event, LV_EVENT_PRESS_LOST, this);
    lv_obj_add_event_cb(container_, on_event, LV_EVENT_DELETE, this);

    engine_.set_change_callback([this](const LayoutConfiguration& config) {
        sync_children();
        if (change_cb_) {
            change_cb_(config);
        }
    });

    handle_size_changed();
    spdlog::debug("[LvglDashboardHost] Attached to container with {} children",
                  lv_obj_get_child_count(container_));
}

void LvglDashboardHost::detach() {
    if (!container_) {
        return;
    }
    engine_.cancel_gesture();
    engine_.set_change_callback(nullptr);
    lv_obj_remove_event_cb_with_user_data(container_, on_event, this);
    container_ = nullptr;
    spdlog::debug("[LvglDashboardHost] Detached");
}

// ---------------------------------------------------------------------------
// Grid templates
// ---------------------------------------------------------------------------

std::vector<int32_t> LvglDashboardHost::make_col_dsc(const GridSpec& spec) {
    std::vector<int32_t> dsc;
    dsc.reserve(static_cast<size_t>(spec.cols) + 1);
    for (int i = 0; i < spec.cols; ++i) {
        dsc.push_back(static_cast<int32_t>(std::lround(spec.cell_size_px)));
    }
    dsc.push_back(LV_GRID_TEMPLATE_LAST);
    return dsc;
}

std::vector<int32_t> LvglDashboardHost::make_row_dsc(const GridSpec& spec) {
    std::vector<int32_t> dsc;
    dsc.reserve(static_cast<size_t>(spec.rows) + 1);
    for (int i = 0; i < spec.rows; ++i) {
        dsc.push_back(static_cast<int32_t>(std::lround(spec.cell_size_px)));
    }
    dsc.push_back(LV_GRID_TEMPLATE_LAST);
    return dsc;
}

// ---------------------------------------------------------------------------
// Child placement
// ---------------------------------------------------------------------------

void LvglDashboardHost::sync_children() {
    if (!container_) {
        return;
    }

    const auto& layout = engine_.layout();
    uint32_t count = lv_obj_get_child_count(container_);
    for (uint32_t i = 0; i < count; ++i) {
        lv_obj_t* child = lv_obj_get_child(container_, static_cast<int32_t>(i));
        const char* name = lv_obj_get_name(child);
        if (!name) {
            continue;
        }
        const auto* placement = layout.find(name);
        if (!placement) {
            continue;
        }

        // Pointer events on widget content must reach the container
        lv_obj_add_flag(child, LV_OBJ_FLAG_EVENT_BUBBLE);

        auto rect = engine_.pixel_rect(placement->id);
        if (!rect) {
            lv_obj_add_flag(child, LV_OBJ_FLAG_HIDDEN);
            continue;
        }
        lv_obj_remove_flag(child, LV_OBJ_FLAG_HIDDEN);
        lv_obj_set_pos(child, static_cast<int32_t>(std::lround(rect->left)),
                       static_cast<int32_t>(std::lround(rect->top)));
        lv_obj_set_size(child, static_cast<int32_t>(std::lround(rect->width)),
                        static_cast<int32_t>(std::lround(rect->height)));
    }

    auto [grid_w, grid_h] = grid_pixel_size(engine_.grid_spec());
    lv_obj_set_style_min_height(container_, static_cast<int32_t>(std::lround(grid_h)), 0);
    spdlog::trace("[LvglDashboardHost] Synced {} children, grid {}x{}px", count, grid_w, grid_h);
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void LvglDashboardHost::on_event(lv_event_t* e) {
    auto* self = static_cast<LvglDashboardHost*>(lv_event_get_user_data(e));
    if (!self) {
        return;
    }
    try {
        switch (lv_event_get_code(e)) {
        case LV_EVENT_SIZE_CHANGED:
            self->handle_size_changed();
            break;
        case LV_EVENT_PRESSED:
            self->handle_pressed(e);
            break;
        case LV_EVENT_PRESSING:
            self->handle_pressing();
            break;
        case LV_EVENT_RELEASED:
            self->handle_released();
            break;
        case LV_EVENT_PRESS_LOST:
            self->engine_.cancel_gesture();
            break;
        case LV_EVENT_DELETE:
            self->engine_.cancel_gesture();
            self->engine_.set_change_callback(nullptr);
            self->container_ = nullptr;
            break;
        default:
            break;
        }
    } catch (const std::exception& ex) {
        // Never let an exception unwind through LVGL's C event loop
        spdlog::error("[LvglDashboardHost] Event {} handler failed: {}",
                      static_cast<int>(lv_event_get_code(e)), ex.what());
    }
}

void LvglDashboardHost::handle_size_changed() {
    if (!container_) {
        return;
    }
    lv_obj_update_layout(container_);
    float w = static_cast<float>(lv_obj_get_width(container_));
    float h = static_cast<float>(lv_obj_get_height(container_));
    engine_.set_container_size(w, h);
    sync_children();
}

lv_obj_t* LvglDashboardHost::widget_view_for(lv_obj_t* obj) const {
    while (obj && obj != container_) {
        lv_obj_t* parent = lv_obj_get_parent(obj);
        if (parent == container_) {
            return obj;
        }
        obj = parent;
    }
    return nullptr;
}

bool LvglDashboardHost::pointer_local(float& x, float& y) const {
    lv_indev_t* indev = lv_indev_active();
    if (!indev || !container_) {
        return false;
    }
    lv_point_t pt;
    lv_indev_get_point(indev, &pt);
    lv_area_t area;
    lv_obj_get_coords(container_, &area);
    x = static_cast<float>(pt.x - area.x1);
    y = static_cast<float>(pt.y - area.y1);
    return true;
}

void LvglDashboardHost::handle_pressed(lv_event_t* e) {
    if (!engine_.is_edit_mode()) {
        return;
    }
    lv_obj_t* view = widget_view_for(static_cast<lv_obj_t*>(lv_event_get_target(e)));
    const char* name = view ? lv_obj_get_name(view) : nullptr;
    if (!name) {
        return;
    }
    const auto* placement = engine_.layout().find(name);
    if (!placement) {
        return;
    }

    lv_indev_t* indev = lv_indev_active();
    if (!indev) {
        return;
    }
    lv_point_t pt;
    lv_indev_get_point(indev, &pt);

    auto gesture = GridEditMode::Gesture::Move;
    lv_area_t view_area;
    lv_obj_get_coords(view, &view_area);
    int dx = pt.x - view_area.x2;
    int dy = pt.y - view_area.y2;
    if (dx * dx + dy * dy <= CORNER_HIT_RADIUS * CORNER_HIT_RADIUS &&
        widget_kind_def(placement->kind).is_resizable()) {
        gesture = GridEditMode::Gesture::Resize;
    }

    float x = 0.0f;
    float y = 0.0f;
    if (!pointer_local(x, y)) {
        return;
    }
    if (engine_.pointer_down(placement->id, gesture, x, y)) {
        // Keep the view on top while it moves over its neighbours
        lv_obj_move_foreground(view);
    }
}

void LvglDashboardHost::handle_pressing() {
    if (!engine_.edit_mode().has_session()) {
        return;
    }
    float x = 0.0f;
    float y = 0.0f;
    if (pointer_local(x, y)) {
        engine_.pointer_move(x, y);
    }
}

void LvglDashboardHost::handle_released() {
    if (engine_.edit_mode().has_session()) {
        engine_.pointer_up();
    }
}

} // namespace gridboard
