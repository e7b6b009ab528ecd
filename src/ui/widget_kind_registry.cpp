// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widget_kind_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gridboard {

// Vector order defines the catalog order and must follow the WidgetKind enum.
// clang-format off
static const std::vector<WidgetKindDef> s_builtin_defs = {
    //                                                                                                                                       default   min     max
    {WidgetKind::TotalHours,        "totalHours",        "Total Hours",         "Shows total time logged",        WidgetCategory::Stats,    {3, 2}, {2, 2}, {6, 3}},
    {WidgetKind::ThisWeek,          "thisWeek",          "This Week",           "Current week progress",          WidgetCategory::Stats,    {3, 2}, {2, 2}, {6, 3}},
    {WidgetKind::ContractProgress,  "contractProgress",  "Contract Progress",   "Shows contract completion",      WidgetCategory::Stats,    {3, 2}, {2, 2}, {6, 3}},
    {WidgetKind::Overtime,          "overtime",          "Overtime",            "Track overtime hours",           WidgetCategory::Stats,    {3, 2}, {2, 2}, {6, 3}},
    {WidgetKind::DailyHours,        "dailyHours",        "Daily Hours Chart",   "Bar chart of daily hours",       WidgetCategory::Charts,   {6, 4}, {4, 3}, {12, 8}},
    {WidgetKind::HoursDistribution, "hoursDistribution", "Hours Distribution",  "Pie chart of time distribution", WidgetCategory::Charts,   {4, 4}, {3, 3}, {8, 8}},
    {WidgetKind::PerformanceLegend, "performanceLegend", "Performance Legend",  "Shows performance indicators",   WidgetCategory::Tracking, {8, 2}, {4, 2}, {12, 3}},
    {WidgetKind::WeeklyTrend,       "weeklyTrend",       "Weekly Trend",        "Line chart of weekly patterns",  WidgetCategory::Charts,   {6, 3}, {4, 3}, {12, 6}},
    {WidgetKind::ContractTimeline,  "contractTimeline",  "Contract Timeline",   "Visual timeline of contracts",   WidgetCategory::Tracking, {12, 3}, {6, 2}, {12, 6}},
    {WidgetKind::BreakTimeAnalysis, "breakTimeAnalysis", "Break Time Analysis", "Analyze break patterns",         WidgetCategory::Tracking, {4, 3}, {3, 3}, {8, 6}},
};
// clang-format on

static std::vector<WidgetKindDef> s_widget_kind_defs = s_builtin_defs;

const std::vector<WidgetKindDef>& get_all_widget_kind_defs() {
    return s_widget_kind_defs;
}

const WidgetKindDef* find_widget_kind_def(std::string_view id) {
    auto it = std::find_if(s_widget_kind_defs.begin(), s_widget_kind_defs.end(),
                           [&id](const WidgetKindDef& def) { return id == def.id; });
    return it != s_widget_kind_defs.end() ? &*it : nullptr;
}

const WidgetKindDef& widget_kind_def(WidgetKind kind) {
    auto it = std::find_if(s_widget_kind_defs.begin(), s_widget_kind_defs.end(),
                           [kind](const WidgetKindDef& def) { return def.kind == kind; });
    if (it == s_widget_kind_defs.end()) {
        spdlog::error("[WidgetKindRegistry] No registry entry for kind {}",
                      static_cast<int>(kind));
        throw std::out_of_range("widget kind not registered: " +
                                std::to_string(static_cast<int>(kind)));
    }
    return *it;
}

std::optional<WidgetKind> widget_kind_from_id(std::string_view id) {
    const auto* def = find_widget_kind_def(id);
    if (!def) {
        return std::nullopt;
    }
    return def->kind;
}

const char* widget_kind_id(WidgetKind kind) {
    return widget_kind_def(kind).id;
}

size_t widget_kind_count() {
    return s_widget_kind_defs.size();
}

static bool valid_size(CellSize s) {
    return s.width >= 1 && s.height >= 1;
}

bool override_widget_kind_sizes(WidgetKind kind, CellSize default_size, CellSize min_size,
                                CellSize max_size) {
    if (!valid_size(default_size) || !valid_size(min_size) || !valid_size(max_size) ||
        min_size.width > default_size.width || min_size.height > default_size.height ||
        default_size.width > max_size.width || default_size.height > max_size.height) {
        spdlog::warn("[WidgetKindRegistry] Rejecting inconsistent size override for '{}'",
                     widget_kind_id(kind));
        return false;
    }

    for (auto& def : s_widget_kind_defs) {
        if (def.kind == kind) {
            def.default_size = default_size;
            def.min_size = min_size;
            def.max_size = max_size;
            spdlog::debug("[WidgetKindRegistry] '{}' sizes overridden: default {}x{} min {}x{} "
                          "max {}x{}",
                          def.id, default_size.width, default_size.height, min_size.width,
                          min_size.height, max_size.width, max_size.height);
            return true;
        }
    }
    spdlog::warn("[WidgetKindRegistry] Size override failed: kind {} not found",
                 static_cast<int>(kind));
    return false;
}

void reset_widget_kind_sizes() {
    s_widget_kind_defs = s_builtin_defs;
}

CellSize clamp_to_kind(WidgetKind kind, CellSize desired) {
    const auto& def = widget_kind_def(kind);
    return {std::clamp(desired.width, def.min_size.width, def.max_size.width),
            std::clamp(desired.height, def.min_size.height, def.max_size.height)};
}

} // namespace gridboard
