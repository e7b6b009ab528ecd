// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widget_settings.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

namespace gridboard {

using json = nlohmann::json;

namespace {

template <typename E> struct EnumName {
    E value;
    const char* name;
};

// clang-format off
constexpr EnumName<TimePeriod> TIME_PERIOD_NAMES[] = {
    {TimePeriod::Current, "current"}, {TimePeriod::ThisWeek, "thisWeek"},
    {TimePeriod::ThisMonth, "thisMonth"}, {TimePeriod::LastWeek, "lastWeek"},
    {TimePeriod::LastMonth, "lastMonth"},
};
constexpr EnumName<ProgressType> PROGRESS_TYPE_NAMES[] = {
    {ProgressType::Time, "time"}, {ProgressType::Hours, "hours"},
    {ProgressType::Combined, "combined"},
};
constexpr EnumName<DailyChartType> DAILY_CHART_NAMES[] = {
    {DailyChartType::Bar, "bar"}, {DailyChartType::Line, "line"},
};
constexpr EnumName<DistributionChartType> DISTRIBUTION_CHART_NAMES[] = {
    {DistributionChartType::Pie, "pie"}, {DistributionChartType::Donut, "donut"},
    {DistributionChartType::Bar, "bar"},
};
constexpr EnumName<DistributionGroupBy> GROUP_BY_NAMES[] = {
    {DistributionGroupBy::Day, "day"}, {DistributionGroupBy::Week, "week"},
    {DistributionGroupBy::Project, "project"}, {DistributionGroupBy::Contract, "contract"},
};
constexpr EnumName<TimelineView> TIMELINE_VIEW_NAMES[] = {
    {TimelineView::All, "all"}, {TimelineView::Active, "active"},
    {TimelineView::Recent, "recent"},
};
constexpr EnumName<AnalysisPeriod> ANALYSIS_PERIOD_NAMES[] = {
    {AnalysisPeriod::Week, "week"}, {AnalysisPeriod::Month, "month"},
    {AnalysisPeriod::Contract, "contract"}, {AnalysisPeriod::Custom, "custom"},
};
// clang-format on

template <typename E, size_t N> const char* enum_to_string(E value, const EnumName<E> (&names)[N]) {
    for (const auto& n : names) {
        if (n.value == value) {
            return n.name;
        }
    }
    return names[0].name;
}

/// Read an enum field. Unknown strings keep the current value.
template <typename E, size_t N>
void read_enum(const json& j, const char* key, E& out, const EnumName<E> (&names)[N]) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return;
    }
    const auto& str = it->get_ref<const std::string&>();
    for (const auto& n : names) {
        if (str == n.name) {
            out = n.value;
            return;
        }
    }
    spdlog::debug("[WidgetSettings] Ignoring unknown value '{}' for '{}'", str, key);
}

void read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) {
        out = it->get<bool>();
    }
}

void read_int(const json& j, const char* key, int& out, int lo, int hi) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return;
    }
    // Sliders in the settings UI only produce integers, but accept 7.0 as 7
    double v = std::clamp(it->get<double>(), static_cast<double>(lo), static_cast<double>(hi));
    out = static_cast<int>(v);
}

template <typename T> T parse_settings(const json& j);

template <> TotalHoursSettings parse_settings(const json& j) {
    TotalHoursSettings s;
    read_bool(j, "showDetails", s.show_details);
    read_bool(j, "showTrend", s.show_trend);
    read_enum(j, "timePeriod", s.time_period, TIME_PERIOD_NAMES);
    return s;
}

template <> ThisWeekSettings parse_settings(const json& j) {
    ThisWeekSettings s;
    read_bool(j, "showProgress", s.show_progress);
    read_bool(j, "showTarget", s.show_target);
    read_bool(j, "showRemaining", s.show_remaining);
    return s;
}

template <> ContractProgressSettings parse_settings(const json& j) {
    ContractProgressSettings s;
    read_bool(j, "showTimeRemaining", s.show_time_remaining);
    read_bool(j, "showEndDate", s.show_end_date);
    read_enum(j, "progressType", s.progress_type, PROGRESS_TYPE_NAMES);
    return s;
}

template <> OvertimeSettings parse_settings(const json& j) {
    OvertimeSettings s;
    read_int(j, "alertThreshold", s.alert_threshold, OvertimeSettings::MIN_ALERT_THRESHOLD,
             OvertimeSettings::MAX_ALERT_THRESHOLD);
    read_bool(j, "showWeekly", s.show_weekly);
    read_bool(j, "showMonthly", s.show_monthly);
    return s;
}

template <> DailyHoursSettings parse_settings(const json& j) {
    DailyHoursSettings s;
    read_int(j, "timeRange", s.time_range, DailyHoursSettings::MIN_TIME_RANGE,
             DailyHoursSettings::MAX_TIME_RANGE);
    read_bool(j, "showWeekends", s.show_weekends);
    read_enum(j, "chartType", s.chart_type, DAILY_CHART_NAMES);
    read_bool(j, "showTargetLine", s.show_target_line);
    return s;
}

template <> HoursDistributionSettings parse_settings(const json& j) {
    HoursDistributionSettings s;
    read_bool(j, "showLegend", s.show_legend);
    read_bool(j, "showPercentages", s.show_percentages);
    read_enum(j, "chartType", s.chart_type, DISTRIBUTION_CHART_NAMES);
    read_enum(j, "groupBy", s.group_by, GROUP_BY_NAMES);
    return s;
}

template <> PerformanceLegendSettings parse_settings(const json& j) {
    PerformanceLegendSettings s;
    read_bool(j, "showBreakTimeInfo", s.show_break_time_info);
    read_bool(j, "showColorCoding", s.show_color_coding);
    read_bool(j, "compactMode", s.compact_mode);
    return s;
}

template <> WeeklyTrendSettings parse_settings(const json& j) {
    WeeklyTrendSettings s;
    read_int(j, "weekCount", s.week_count, WeeklyTrendSettings::MIN_WEEK_COUNT,
             WeeklyTrendSettings::MAX_WEEK_COUNT);
    read_bool(j, "showAverage", s.show_average);
    read_bool(j, "showTarget", s.show_target);
    return s;
}

template <> ContractTimelineSettings parse_settings(const json& j) {
    ContractTimelineSettings s;
    read_bool(j, "showMilestones", s.show_milestones);
    read_bool(j, "showProgress", s.show_progress);
    read_enum(j, "timelineView", s.timeline_view, TIMELINE_VIEW_NAMES);
    return s;
}

template <> BreakTimeAnalysisSettings parse_settings(const json& j) {
    BreakTimeAnalysisSettings s;
    read_enum(j, "analysisPeriod", s.analysis_period, ANALYSIS_PERIOD_NAMES);
    read_bool(j, "showRecommendations", s.show_recommendations);
    return s;
}

json to_json_impl(const TotalHoursSettings& s) {
    return {{"showDetails", s.show_details},
            {"showTrend", s.show_trend},
            {"timePeriod", enum_to_string(s.time_period, TIME_PERIOD_NAMES)}};
}

json to_json_impl(const ThisWeekSettings& s) {
    return {{"showProgress", s.show_progress},
            {"showTarget", s.show_target},
            {"showRemaining", s.show_remaining}};
}

json to_json_impl(const ContractProgressSettings& s) {
    return {{"showTimeRemaining", s.show_time_remaining},
            {"showEndDate", s.show_end_date},
            {"progressType", enum_to_string(s.progress_type, PROGRESS_TYPE_NAMES)}};
}

json to_json_impl(const OvertimeSettings& s) {
    return {{"alertThreshold", s.alert_threshold},
            {"showWeekly", s.show_weekly},
            {"showMonthly", s.show_monthly}};
}

json to_json_impl(const DailyHoursSettings& s) {
    return {{"timeRange", s.time_range},
            {"showWeekends", s.show_weekends},
            {"chartType", enum_to_string(s.chart_type, DAILY_CHART_NAMES)},
            {"showTargetLine", s.show_target_line}};
}

json to_json_impl(const HoursDistributionSettings& s) {
    return {{"showLegend", s.show_legend},
            {"showPercentages", s.show_percentages},
            {"chartType", enum_to_string(s.chart_type, DISTRIBUTION_CHART_NAMES)},
            {"groupBy", enum_to_string(s.group_by, GROUP_BY_NAMES)}};
}

json to_json_impl(const PerformanceLegendSettings& s) {
    return {{"showBreakTimeInfo", s.show_break_time_info},
            {"showColorCoding", s.show_color_coding},
            {"compactMode", s.compact_mode}};
}

json to_json_impl(const WeeklyTrendSettings& s) {
    return {{"weekCount", s.week_count},
            {"showAverage", s.show_average},
            {"showTarget", s.show_target}};
}

json to_json_impl(const ContractTimelineSettings& s) {
    return {{"showMilestones", s.show_milestones},
            {"showProgress", s.show_progress},
            {"timelineView", enum_to_string(s.timeline_view, TIMELINE_VIEW_NAMES)}};
}

json to_json_impl(const BreakTimeAnalysisSettings& s) {
    return {{"analysisPeriod", enum_to_string(s.analysis_period, ANALYSIS_PERIOD_NAMES)},
            {"showRecommendations", s.show_recommendations}};
}

/// Build the variant alternative at the kind's index
template <size_t I = 0> WidgetSettings settings_for_index(size_t index, const json& j) {
    if constexpr (I < std::variant_size_v<WidgetSettings>) {
        if (index == I) {
            using T = std::variant_alternative_t<I, WidgetSettings>;
            return WidgetSettings{std::in_place_index<I>, parse_settings<T>(j)};
        }
        return settings_for_index<I + 1>(index, j);
    } else {
        return WidgetSettings{};
    }
}

} // namespace

WidgetSettings default_settings(WidgetKind kind) {
    return settings_for_index(static_cast<size_t>(kind), json::object());
}

WidgetKind settings_kind(const WidgetSettings& settings) {
    return static_cast<WidgetKind>(settings.index());
}

json settings_to_json(const WidgetSettings& settings) {
    return std::visit([](const auto& s) { return to_json_impl(s); }, settings);
}

WidgetSettings settings_from_json(WidgetKind kind, const json& j) {
    if (!j.is_object()) {
        return default_settings(kind);
    }
    return settings_for_index(static_cast<size_t>(kind), j);
}

} // namespace gridboard
