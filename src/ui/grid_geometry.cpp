// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_geometry.h"

#include <algorithm>
#include <cmath>

namespace gridboard {

// Clamp in float before the cast so huge or non-finite input cannot overflow int
static int clamp_cell_index(float cell, int count) {
    int last = std::max(count - 1, 0);
    if (!(cell > 0.0f)) {
        return 0; // Negative or NaN
    }
    if (cell >= static_cast<float>(last)) {
        return last;
    }
    return static_cast<int>(cell);
}

std::pair<int, int> pixel_to_cell(float px, float py, const GridSpec& spec) {
    float pitch = spec.cell_size_px + spec.gap_px;
    if (pitch <= 0.0f) {
        return {0, 0};
    }

    int col = clamp_cell_index(std::floor((px - spec.padding_px) / pitch), spec.cols);
    int row = clamp_cell_index(std::floor((py - spec.padding_px) / pitch), spec.rows);

    return {col, row};
}

PixelRect cell_rect_to_pixel_rect(const CellRect& rect, const GridSpec& spec) {
    float pitch = spec.cell_size_px + spec.gap_px;
    PixelRect out;
    out.left = spec.padding_px + static_cast<float>(rect.x) * pitch;
    out.top = spec.padding_px + static_cast<float>(rect.y) * pitch;
    out.width = static_cast<float>(rect.width) * spec.cell_size_px +
                static_cast<float>(rect.width - 1) * spec.gap_px;
    out.height = static_cast<float>(rect.height) * spec.cell_size_px +
                 static_cast<float>(rect.height - 1) * spec.gap_px;
    return out;
}

std::pair<float, float> grid_pixel_size(const GridSpec& spec) {
    float w = static_cast<float>(spec.cols) * spec.cell_size_px +
              static_cast<float>(spec.cols - 1) * spec.gap_px + 2.0f * spec.padding_px;
    float h = static_cast<float>(spec.rows) * spec.cell_size_px +
              static_cast<float>(spec.rows - 1) * spec.gap_px + 2.0f * spec.padding_px;
    return {w, h};
}

} // namespace gridboard
