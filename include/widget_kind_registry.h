// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace gridboard {

/// Every widget kind the dashboard knows how to host.
/// Enum order matches the registry table order.
enum class WidgetKind {
    TotalHours,
    ThisWeek,
    ContractProgress,
    Overtime,
    DailyHours,
    HoursDistribution,
    PerformanceLegend,
    WeeklyTrend,
    ContractTimeline,
    BreakTimeAnalysis,
};

/// Catalog grouping shown in the add-widget menu
enum class WidgetCategory { Stats, Charts, Tracking };

/// Width/height pair in grid cells
struct CellSize {
    int width;
    int height;

    bool operator==(const CellSize& other) const {
        return width == other.width && height == other.height;
    }
};

struct WidgetKindDef {
    WidgetKind kind;
    const char* id;           // Stable string for JSON config
    const char* display_name; // For the widget catalog
    const char* description;  // Short description for the widget catalog
    WidgetCategory category;
    CellSize default_size;
    CellSize min_size;
    CellSize max_size;

    bool is_resizable() const {
        return max_size.width > min_size.width || max_size.height > min_size.height;
    }
};

const std::vector<WidgetKindDef>& get_all_widget_kind_defs();

/// Look up a kind by its JSON id. Returns nullptr for unknown ids.
const WidgetKindDef* find_widget_kind_def(std::string_view id);

/// Look up a kind that must exist. Throws std::out_of_range if the table has
/// no entry for it (host/engine schema mismatch).
const WidgetKindDef& widget_kind_def(WidgetKind kind);

/// Parse a JSON id into a kind. Returns nullopt for unknown ids.
std::optional<WidgetKind> widget_kind_from_id(std::string_view id);

const char* widget_kind_id(WidgetKind kind);

size_t widget_kind_count();

/// Replace the default/min/max size triple of a kind with host-supplied values.
/// Returns false (and leaves the table untouched) if the triple is inconsistent:
/// sizes must be >= 1 and min <= default <= max on both axes.
/// Placements already held by a DashboardEngine keep their rects until
/// DashboardEngine::reclamp_widgets() or the next load or preset change.
bool override_widget_kind_sizes(WidgetKind kind, CellSize default_size, CellSize min_size,
                                CellSize max_size);

/// Restore the built-in size table (undoes every override).
void reset_widget_kind_sizes();

/// Clamp a desired size to the kind's min/max. Returns the clamped size.
CellSize clamp_to_kind(WidgetKind kind, CellSize desired);

} // namespace gridboard
