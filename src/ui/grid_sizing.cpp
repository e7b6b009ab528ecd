// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_sizing.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace gridboard {

float compute_cell_size(float container_w, float container_h, int cols, int rows,
                        const GridSizingSettings& settings) {
    if (container_w <= 0.0f || container_h <= 0.0f || cols <= 0 || rows <= 0) {
        return std::round(settings.min_cell_size_px);
    }

    float available_w = container_w - 2.0f * settings.padding_px;
    float available_h = container_h - 2.0f * settings.padding_px;

    float from_w = (available_w - static_cast<float>(cols - 1) * settings.gap_px) /
                   static_cast<float>(cols);
    float from_h = (available_h - static_cast<float>(rows - 1) * settings.gap_px) /
                   static_cast<float>(rows);

    // Limiting axis wins; the other axis keeps slack instead of scrolling
    float size = std::min(from_w, from_h);

    // Round to avoid sub-pixel seams between cells
    return std::round(std::max(settings.min_cell_size_px, size));
}

GridSpec make_grid_spec(float container_w, float container_h, int cols, int rows,
                        const GridSizingSettings& settings) {
    GridSpec spec;
    spec.cols = cols;
    spec.rows = rows;
    spec.cell_size_px = compute_cell_size(container_w, container_h, cols, rows, settings);
    spec.gap_px = settings.gap_px;
    spec.padding_px = settings.padding_px;
    spdlog::trace("[GridSizing] {}x{} container {:.0f}x{:.0f} -> cell {:.0f}px", cols, rows,
                  container_w, container_h, spec.cell_size_px);
    return spec;
}

} // namespace gridboard
