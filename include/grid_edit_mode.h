// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_geometry.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace gridboard {

class GridLayout;

/// Manages in-place grid editing for the dashboard.
/// Gates gestures on edit mode and runs the drag/resize state machine:
///
///   Idle --pointer_down(move)--> Dragging --pointer_up/cancel--> Idle
///   Idle --pointer_down(resize)--> Resizing --pointer_up/cancel--> Idle
///
/// Every pointer move resolves to grid cells, is clamped to the grid and to
/// the widget kind's size limits, and is applied to the layout immediately.
/// There is no separate commit step on release. Pixel coordinates are
/// container-local; the caller passes the GridSpec current at each event so
/// a container resize mid-gesture takes effect on the next move.
class GridEditMode {
  public:
    /// Called with the widget id after each applied rect change
    using ChangeCallback = std::function<void(const std::string&)>;

    enum class Gesture { Move, Resize };

    /// Which edge or corner of the widget the resize started from.
    /// The edge opposite the handle stays fixed; edge handles only change their
    /// own axis.
    enum class ResizeHandle {
        TopLeft,
        Top,
        TopRight,
        Left,
        Right,
        BottomLeft,
        Bottom,
        BottomRight
    };

    enum class State { Idle, Dragging, Resizing };

    GridEditMode() = default;
    ~GridEditMode() = default;

    GridEditMode(const GridEditMode&) = delete;
    GridEditMode& operator=(const GridEditMode&) = delete;
    GridEditMode(GridEditMode&&) = delete;
    GridEditMode& operator=(GridEditMode&&) = delete;

    /// Enter edit mode on a layout. Ignored if already active.
    void enter(GridLayout* layout);

    /// Leave edit mode. Cancels any open gesture.
    void exit();

    bool is_active() const {
        return active_;
    }

    void set_change_callback(ChangeCallback cb) {
        change_cb_ = std::move(cb);
    }

    State state() const {
        return state_;
    }

    bool has_session() const {
        return state_ != State::Idle;
    }

    /// Widget the open gesture refers to (empty when idle)
    const std::string& session_widget() const {
        return session_.widget_id;
    }

    /// Open a gesture on a widget. Returns false (and changes nothing) when
    /// edit mode is off, another gesture is open, or the widget is unknown or
    /// disabled.
    bool handle_pointer_down(const std::string& widget_id, Gesture gesture, float px, float py,
                             const GridSpec& spec,
                             ResizeHandle handle = ResizeHandle::BottomRight);

    /// Apply a pointer move to the open gesture. Returns true if the widget
    /// rect changed.
    bool handle_pointer_move(float px, float py, const GridSpec& spec);

    /// Close the open gesture. Changes already applied are kept.
    void handle_pointer_up();

    /// Abort the open gesture (no-op when idle)
    void cancel();

    /// Close the session if it refers to a widget that was just removed
    void handle_widget_removed(const std::string& widget_id);

    /// Target rect for a drag: pointer cell minus anchor, clamped so the
    /// whole widget stays on the grid.
    static CellRect compute_drag_rect(const CellRect& current, int pointer_col, int pointer_row,
                                      int anchor_col, int anchor_row, int ncols, int nrows);

    /// Target rect for a resize: the grabbed edge moves to span the pointer
    /// cell while the opposite edge stays fixed, clamped to [min, max] and to
    /// the grid.
    static CellRect compute_resize_rect(const CellRect& current, ResizeHandle handle,
                                        int pointer_col, int pointer_row, int min_w, int min_h,
                                        int max_w, int max_h, int ncols, int nrows);

  private:
    struct Session {
        std::string widget_id;
        int anchor_col = 0; // Pointer cell minus widget origin at press time
        int anchor_row = 0;
        ResizeHandle handle = ResizeHandle::BottomRight;
    };

    void reset_session();

    bool active_ = false;
    GridLayout* layout_ = nullptr;
    ChangeCallback change_cb_;

    State state_ = State::Idle;
    Session session_;
};

} // namespace gridboard
