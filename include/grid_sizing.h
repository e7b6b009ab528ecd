// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_geometry.h"

namespace gridboard {

/// Tunables for cell sizing. Loaded from the /grid section of the config.
struct GridSizingSettings {
    static constexpr float DEFAULT_MIN_CELL_SIZE_PX = 60.0f;
    static constexpr float DEFAULT_GAP_PX = 8.0f;
    static constexpr float DEFAULT_PADDING_PX = 16.0f;

    float min_cell_size_px = DEFAULT_MIN_CELL_SIZE_PX;
    float gap_px = DEFAULT_GAP_PX;
    float padding_px = DEFAULT_PADDING_PX; // Inset on each side of the container
};

/// Compute the square cell size that fits the whole grid into the container on
/// both axes. Never returns less than settings.min_cell_size_px. A container
/// that has not been measured yet (zero size) yields the minimum.
float compute_cell_size(float container_w, float container_h, int cols, int rows,
                        const GridSizingSettings& settings);

/// Build a complete GridSpec for a container size and preset dimensions
GridSpec make_grid_spec(float container_w, float container_h, int cols, int rows,
                        const GridSizingSettings& settings);

} // namespace gridboard
