// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <utility>

namespace gridboard {

/// Resolved grid for the current container size and preset.
/// cell_size_px is always derived by the sizing policy, never set by hand.
struct GridSpec {
    int cols;
    int rows;
    float cell_size_px;
    float gap_px;
    float padding_px;
};

/// A widget's occupied region in grid cells
struct CellRect {
    int x;
    int y;
    int width;
    int height;

    bool operator==(const CellRect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const CellRect& other) const {
        return !(*this == other);
    }
};

/// Container-local pixel rectangle
struct PixelRect {
    float left;
    float top;
    float width;
    float height;
};

/// Map container-local pixel coordinates to a grid cell (col, row).
/// Clamps to the valid cell range, so points in the padding or outside the
/// container resolve to the nearest edge cell.
std::pair<int, int> pixel_to_cell(float px, float py, const GridSpec& spec);

/// Map a cell rect to its container-local pixel rect (gaps between spanned
/// cells are part of the widget, the trailing gap is not).
PixelRect cell_rect_to_pixel_rect(const CellRect& rect, const GridSpec& spec);

/// Total pixel extent of the grid including padding on both sides
std::pair<float, float> grid_pixel_size(const GridSpec& spec);

} // namespace gridboard
