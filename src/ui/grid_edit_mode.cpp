// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_edit_mode.h"

#include "grid_layout.h"
#include "widget_kind_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gridboard {

static bool handle_changes_width(GridEditMode::ResizeHandle handle) {
    return handle != GridEditMode::ResizeHandle::Top &&
           handle != GridEditMode::ResizeHandle::Bottom;
}

static bool handle_changes_height(GridEditMode::ResizeHandle handle) {
    return handle != GridEditMode::ResizeHandle::Left &&
           handle != GridEditMode::ResizeHandle::Right;
}

static bool handle_on_left(GridEditMode::ResizeHandle handle) {
    return handle == GridEditMode::ResizeHandle::TopLeft ||
           handle == GridEditMode::ResizeHandle::Left ||
           handle == GridEditMode::ResizeHandle::BottomLeft;
}

static bool handle_on_top(GridEditMode::ResizeHandle handle) {
    return handle == GridEditMode::ResizeHandle::TopLeft ||
           handle == GridEditMode::ResizeHandle::Top ||
           handle == GridEditMode::ResizeHandle::TopRight;
}

void GridEditMode::enter(GridLayout* layout) {
    if (active_) {
        spdlog::debug("[GridEditMode] Already active, ignoring enter()");
        return;
    }
    active_ = true;
    layout_ = layout;
    spdlog::debug("[GridEditMode] Entered edit mode");
}

void GridEditMode::exit() {
    if (!active_) {
        return;
    }
    cancel();
    active_ = false;
    layout_ = nullptr;
    spdlog::debug("[GridEditMode] Exited edit mode");
}

void GridEditMode::reset_session() {
    state_ = State::Idle;
    session_ = Session{};
}

// ---------------------------------------------------------------------------
// Pure rect computation
// ---------------------------------------------------------------------------

CellRect GridEditMode::compute_drag_rect(const CellRect& current, int pointer_col, int pointer_row,
                                         int anchor_col, int anchor_row, int ncols, int nrows) {
    CellRect r = current;
    r.x = std::clamp(pointer_col - anchor_col, 0, std::max(ncols - current.width, 0));
    r.y = std::clamp(pointer_row - anchor_row, 0, std::max(nrows - current.height, 0));
    return r;
}

CellRect GridEditMode::compute_resize_rect(const CellRect& current, ResizeHandle handle,
                                           int pointer_col, int pointer_row, int min_w, int min_h,
                                           int max_w, int max_h, int ncols, int nrows) {
    CellRect r = current;
    if (handle_changes_width(handle)) {
        if (handle_on_left(handle)) {
            // Right edge stays put; the pointer cell becomes the new left column
            int right = current.x + current.width;
            int w = std::min(std::clamp(right - pointer_col, min_w, max_w), right);
            r.x = right - w;
            r.width = w;
        } else {
            int w = std::clamp(pointer_col - current.x + 1, min_w, max_w);
            r.width = std::min(w, ncols - current.x);
        }
    }
    if (handle_changes_height(handle)) {
        if (handle_on_top(handle)) {
            int bottom = current.y + current.height;
            int h = std::min(std::clamp(bottom - pointer_row, min_h, max_h), bottom);
            r.y = bottom - h;
            r.height = h;
        } else {
            int h = std::clamp(pointer_row - current.y + 1, min_h, max_h);
            r.height = std::min(h, nrows - current.y);
        }
    }
    return r;
}

// ---------------------------------------------------------------------------
// Gesture lifecycle
// ---------------------------------------------------------------------------

bool GridEditMode::handle_pointer_down(const std::string& widget_id, Gesture gesture, float px,
                                       float py, const GridSpec& spec, ResizeHandle handle) {
    if (!active_ || !layout_) {
        spdlog::trace("[GridEditMode] pointer_down on '{}' ignored: not in edit mode", widget_id);
        return false;
    }
    if (state_ != State::Idle) {
        spdlog::debug("[GridEditMode] pointer_down on '{}' ignored: gesture open on '{}'",
                      widget_id, session_.widget_id);
        return false;
    }

    const auto* placement = layout_->find(widget_id);
    if (!placement || !placement->enabled) {
        spdlog::debug("[GridEditMode] pointer_down: widget '{}' not on grid", widget_id);
        return false;
    }

    session_.widget_id = widget_id;
    if (gesture == Gesture::Move) {
        auto [col, row] = pixel_to_cell(px, py, spec);
        session_.anchor_col = col - placement->rect.x;
        session_.anchor_row = row - placement->rect.y;
        state_ = State::Dragging;
        spdlog::info("[GridEditMode] Drag started: widget '{}' from ({},{}) span {}x{}",
                     widget_id, placement->rect.x, placement->rect.y, placement->rect.width,
                     placement->rect.height);
    } else {
        session_.handle = handle;
        state_ = State::Resizing;
        spdlog::info("[GridEditMode] Resize started: widget '{}' at ({},{}) span {}x{}",
                     widget_id, placement->rect.x, placement->rect.y, placement->rect.width,
                     placement->rect.height);
    }
    return true;
}

bool GridEditMode::handle_pointer_move(float px, float py, const GridSpec& spec) {
    if (state_ == State::Idle || !layout_) {
        return false;
    }

    const auto* placement = layout_->find(session_.widget_id);
    if (!placement || !placement->enabled) {
        spdlog::debug("[GridEditMode] Widget '{}' vanished mid-gesture, cancelling",
                      session_.widget_id);
        reset_session();
        return false;
    }

    auto [col, row] = pixel_to_cell(px, py, spec);
    CellRect target;
    if (state_ == State::Dragging) {
        target = compute_drag_rect(placement->rect, col, row, session_.anchor_col,
                                   session_.anchor_row, spec.cols, spec.rows);
    } else {
        const auto& def = widget_kind_def(placement->kind);
        target = compute_resize_rect(placement->rect, session_.handle, col, row,
                                     def.min_size.width, def.min_size.height, def.max_size.width,
                                     def.max_size.height, spec.cols, spec.rows);
    }

    if (target == placement->rect) {
        return false;
    }

    // Copy: update() may invalidate the placement reference
    std::string id = session_.widget_id;
    if (!layout_->update(id, target)) {
        return false;
    }

    spdlog::trace("[GridEditMode] '{}' -> ({},{}) span {}x{}", id, target.x, target.y,
                  target.width, target.height);
    if (change_cb_) {
        change_cb_(id);
    }
    return true;
}

void GridEditMode::handle_pointer_up() {
    if (state_ == State::Idle) {
        return;
    }
    if (layout_) {
        if (const auto* p = layout_->find(session_.widget_id)) {
            spdlog::info("[GridEditMode] Gesture ended: '{}' at ({},{}) span {}x{}", p->id,
                         p->rect.x, p->rect.y, p->rect.width, p->rect.height);
        }
    }
    reset_session();
}

void GridEditMode::cancel() {
    if (state_ == State::Idle) {
        return;
    }
    spdlog::debug("[GridEditMode] Gesture on '{}' cancelled", session_.widget_id);
    reset_session();
}

void GridEditMode::handle_widget_removed(const std::string& widget_id) {
    if (state_ != State::Idle && session_.widget_id == widget_id) {
        cancel();
    }
}

} // namespace gridboard
