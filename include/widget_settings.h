// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file widget_settings.h
 * @brief Strongly typed per-kind widget settings
 *
 * Each widget kind carries its own settings struct. The variant index is tied
 * to the kind, so a placement can never hold settings meant for another kind.
 * JSON conversion is lenient per field: missing or mistyped values keep their
 * defaults and numeric ranges are clamped to what the settings UI allows.
 */

#pragma once

#include "widget_kind_registry.h"

#include <nlohmann/json.hpp>

#include <variant>

namespace gridboard {

enum class TimePeriod { Current, ThisWeek, ThisMonth, LastWeek, LastMonth };
enum class ProgressType { Time, Hours, Combined };
enum class DailyChartType { Bar, Line };
enum class DistributionChartType { Pie, Donut, Bar };
enum class DistributionGroupBy { Day, Week, Project, Contract };
enum class TimelineView { All, Active, Recent };
enum class AnalysisPeriod { Week, Month, Contract, Custom };

struct TotalHoursSettings {
    bool show_details = false;
    bool show_trend = true;
    TimePeriod time_period = TimePeriod::Current;
};

struct ThisWeekSettings {
    bool show_progress = true;
    bool show_target = true;
    bool show_remaining = false;
};

struct ContractProgressSettings {
    bool show_time_remaining = true;
    bool show_end_date = true;
    ProgressType progress_type = ProgressType::Time;
};

struct OvertimeSettings {
    static constexpr int MIN_ALERT_THRESHOLD = 1;
    static constexpr int MAX_ALERT_THRESHOLD = 20;

    int alert_threshold = 5; // hours
    bool show_weekly = true;
    bool show_monthly = false;
};

struct DailyHoursSettings {
    static constexpr int MIN_TIME_RANGE = 3;
    static constexpr int MAX_TIME_RANGE = 30;

    int time_range = 7; // days
    bool show_weekends = true;
    DailyChartType chart_type = DailyChartType::Bar;
    bool show_target_line = false;
};

struct HoursDistributionSettings {
    bool show_legend = true;
    bool show_percentages = true;
    DistributionChartType chart_type = DistributionChartType::Pie;
    DistributionGroupBy group_by = DistributionGroupBy::Day;
};

struct PerformanceLegendSettings {
    bool show_break_time_info = true;
    bool show_color_coding = true;
    bool compact_mode = false;
};

struct WeeklyTrendSettings {
    static constexpr int MIN_WEEK_COUNT = 4;
    static constexpr int MAX_WEEK_COUNT = 26;

    int week_count = 8;
    bool show_average = true;
    bool show_target = false;
};

struct ContractTimelineSettings {
    bool show_milestones = true;
    bool show_progress = true;
    TimelineView timeline_view = TimelineView::All;
};

struct BreakTimeAnalysisSettings {
    AnalysisPeriod analysis_period = AnalysisPeriod::Week;
    bool show_recommendations = true;
};

/// Alternatives are declared in WidgetKind order: index() == static_cast<size_t>(kind)
using WidgetSettings =
    std::variant<TotalHoursSettings, ThisWeekSettings, ContractProgressSettings, OvertimeSettings,
                 DailyHoursSettings, HoursDistributionSettings, PerformanceLegendSettings,
                 WeeklyTrendSettings, ContractTimelineSettings, BreakTimeAnalysisSettings>;

/// Default-constructed settings for a kind
WidgetSettings default_settings(WidgetKind kind);

/// Kind a settings value belongs to
WidgetKind settings_kind(const WidgetSettings& settings);

inline bool settings_match_kind(const WidgetSettings& settings, WidgetKind kind) {
    return settings_kind(settings) == kind;
}

/// Serialize to a flat JSON object (camelCase keys, enum values as strings)
nlohmann::json settings_to_json(const WidgetSettings& settings);

/// Parse settings for a kind. Non-object input yields the defaults.
WidgetSettings settings_from_json(WidgetKind kind, const nlohmann::json& j);

} // namespace gridboard
