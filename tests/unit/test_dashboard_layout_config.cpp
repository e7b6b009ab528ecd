// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "dashboard_layout_config.h"
#include "widget_kind_registry.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using namespace gridboard;

// ============================================================================
// Test fixture: access Config internals via friend declaration
// ============================================================================

namespace gridboard {
class DashboardLayoutConfigFixture {
  protected:
    Config config;
    DashboardLayoutConfig layout_config{config};

    ~DashboardLayoutConfigFixture() {
        reset_widget_kind_sizes();
    }

    void setup_empty_config() {
        config.data = json::object();
    }

    void setup_with_layout(const json& layout) {
        config.data = json::object();
        config.data["dashboard_layout"] = layout;
    }

    void setup_with_legacy_layout(const json& legacy) {
        config.data = json::object();
        config.data["dashboardLayout"] = legacy;
    }

    json& get_data() {
        return config.data;
    }
};
} // namespace gridboard

static const GridPlacement* find_widget(const LayoutConfiguration& layout, const std::string& id) {
    for (const auto& w : layout.widgets) {
        if (w.id == id) {
            return &w;
        }
    }
    return nullptr;
}

static json widget_json(const std::string& id, const std::string& kind, int x, int y, int w,
                        int h) {
    return {{"id", id},
            {"kind", kind},
            {"enabled", true},
            {"rect", {{"x", x}, {"y", y}, {"width", w}, {"height", h}}},
            {"settings", json::object()}};
}

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("DashboardLayoutConfig: default layout", "[layout_config][defaults]") {
    auto layout = DashboardLayoutConfig::build_defaults();
    CHECK(layout.grid_size == "12x12");
    REQUIRE(layout.widgets.size() == 7);

    const char* expected_ids[] = {"totalHours", "thisWeek",          "contractProgress",
                                  "overtime",   "dailyHours",        "hoursDistribution",
                                  "performanceLegend"};
    for (size_t i = 0; i < 7; ++i) {
        CHECK(layout.widgets[i].id == expected_ids[i]);
        CHECK(layout.widgets[i].enabled);
        CHECK(GridLayout::in_bounds(layout.widgets[i].rect, 12, 12));
        CHECK(settings_match_kind(layout.widgets[i].settings, layout.widgets[i].kind));
    }

    CHECK(find_widget(layout, "overtime")->rect == CellRect{9, 0, 3, 2});
    CHECK(find_widget(layout, "dailyHours")->rect == CellRect{0, 2, 8, 4});
    CHECK(find_widget(layout, "hoursDistribution")->rect == CellRect{8, 2, 4, 4});
    CHECK(find_widget(layout, "performanceLegend")->rect == CellRect{0, 6, 12, 2});
}

TEST_CASE("DashboardLayoutConfig: default layout has no overlaps", "[layout_config][defaults]") {
    auto layout = DashboardLayoutConfig::build_defaults();
    for (size_t i = 0; i < layout.widgets.size(); ++i) {
        for (size_t j = i + 1; j < layout.widgets.size(); ++j) {
            INFO(layout.widgets[i].id << " vs " << layout.widgets[j].id);
            CHECK_FALSE(GridLayout::overlaps(layout.widgets[i].rect, layout.widgets[j].rect));
        }
    }
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: missing layout yields persisted defaults",
                 "[layout_config][defaults]") {
    setup_empty_config();
    auto layout = layout_config.load();

    CHECK(layout.grid_size == "12x12");
    CHECK(layout.widgets.size() == 7);
    REQUIRE(get_data().contains("dashboard_layout"));
    CHECK(get_data()["dashboard_layout"]["widgets"].size() == 7);
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: reset_to_defaults overwrites the saved layout",
                 "[layout_config][defaults]") {
    setup_with_layout(
        {{"grid_size", "6x8"},
         {"widgets", json::array({widget_json("x", "overtime", 0, 0, 2, 2)})}});

    auto layout = layout_config.reset_to_defaults();
    CHECK(layout.grid_size == "12x12");
    CHECK(layout.widgets.size() == 7);
    CHECK(get_data()["dashboard_layout"]["grid_size"] == "12x12");
}

// ============================================================================
// Save / load
// ============================================================================

TEST_CASE_METHOD(DashboardLayoutConfigFixture, "DashboardLayoutConfig: save produces expected JSON",
                 "[layout_config][save]") {
    setup_empty_config();

    OvertimeSettings ot;
    ot.alert_threshold = 9;
    LayoutConfiguration layout{"8x10",
                               {{"ot-1", WidgetKind::Overtime, {1, 2, 3, 2}, ot, false}}};
    layout_config.save(layout);

    const auto& saved = get_data()["dashboard_layout"];
    CHECK(saved["grid_size"] == "8x10");
    REQUIRE(saved["widgets"].size() == 1);
    const auto& w = saved["widgets"][0];
    CHECK(w["id"] == "ot-1");
    CHECK(w["kind"] == "overtime");
    CHECK(w["enabled"] == false);
    CHECK(w["rect"]["x"] == 1);
    CHECK(w["rect"]["y"] == 2);
    CHECK(w["rect"]["width"] == 3);
    CHECK(w["rect"]["height"] == 2);
    CHECK(w["settings"]["alertThreshold"] == 9);
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: round trip keeps rects, order and settings",
                 "[layout_config][save]") {
    setup_empty_config();

    DailyHoursSettings daily;
    daily.time_range = 21;
    daily.chart_type = DailyChartType::Line;
    LayoutConfiguration layout{"12x16",
                               {{"b", WidgetKind::DailyHours, {0, 10, 8, 6}, daily, true},
                                {"a", WidgetKind::TotalHours, {9, 0, 3, 2},
                                 default_settings(WidgetKind::TotalHours), false}}};
    layout_config.save(layout);

    auto loaded = layout_config.load();
    CHECK(loaded.grid_size == "12x16");
    REQUIRE(loaded.widgets.size() == 2);
    CHECK(loaded.widgets[0].id == "b");
    CHECK(loaded.widgets[0].rect == CellRect{0, 10, 8, 6});
    auto s = std::get<DailyHoursSettings>(loaded.widgets[0].settings);
    CHECK(s.time_range == 21);
    CHECK(s.chart_type == DailyChartType::Line);
    CHECK(loaded.widgets[1].id == "a");
    CHECK(loaded.widgets[1].rect == CellRect{9, 0, 3, 2});
    CHECK_FALSE(loaded.widgets[1].enabled);
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: unknown grid size falls back to 12x12",
                 "[layout_config][load]") {
    setup_with_layout({{"grid_size", "99x99"},
                       {"widgets", json::array({widget_json("t", "totalHours", 0, 0, 3, 2)})}});
    auto layout = layout_config.load();
    CHECK(layout.grid_size == "12x12");
    CHECK(layout.widgets.size() == 1);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: corrupt entries are dropped individually",
                 "[layout_config][validation]") {
    json widgets = json::array();
    widgets.push_back(widget_json("good1", "totalHours", 0, 0, 3, 2));
    widgets.push_back("not an object");
    widgets.push_back(
        {{"kind", "overtime"}, {"rect", {{"x", 0}, {"y", 0}, {"width", 2}, {"height", 2}}}});
    widgets.push_back(widget_json("", "overtime", 0, 0, 2, 2));
    widgets.push_back(widget_json("alien", "stockTicker", 0, 0, 2, 2));
    widgets.push_back({{"id", "norect"}, {"kind", "overtime"}, {"rect", {{"x", 0}, {"y", 0}}}});
    auto bad_enabled = widget_json("flag", "overtime", 0, 0, 2, 2);
    bad_enabled["enabled"] = "yes";
    widgets.push_back(bad_enabled);
    widgets.push_back(widget_json("good1", "thisWeek", 5, 5, 3, 2)); // duplicate id
    widgets.push_back(widget_json("good2", "thisWeek", 3, 0, 3, 2));

    setup_with_layout({{"grid_size", "12x12"}, {"widgets", widgets}});
    auto layout = layout_config.load();

    REQUIRE(layout.widgets.size() == 2);
    CHECK(layout.widgets[0].id == "good1");
    CHECK(layout.widgets[0].kind == WidgetKind::TotalHours);
    CHECK(layout.widgets[1].id == "good2");
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: missing widget list yields an empty layout",
                 "[layout_config][validation]") {
    setup_with_layout({{"grid_size", "8x10"}});
    auto layout = layout_config.load();
    CHECK(layout.grid_size == "8x10");
    CHECK(layout.widgets.empty());
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: bad settings fields fall back to defaults",
                 "[layout_config][validation]") {
    auto w = widget_json("ot", "overtime", 0, 0, 3, 2);
    w["settings"] = {{"alertThreshold", "lots"}, {"showMonthly", true}};
    setup_with_layout({{"grid_size", "12x12"}, {"widgets", json::array({w})}});

    auto layout = layout_config.load();
    REQUIRE(layout.widgets.size() == 1);
    auto s = std::get<OvertimeSettings>(layout.widgets[0].settings);
    CHECK(s.alert_threshold == 5);
    CHECK(s.show_monthly);
}

// ============================================================================
// Re-clamping
// ============================================================================

TEST_CASE("DashboardLayoutConfig: clamp_rect", "[layout_config][clamp]") {
    SECTION("size clamped to kind limits") {
        auto r = DashboardLayoutConfig::clamp_rect(WidgetKind::TotalHours, {0, 0, 10, 1}, 12, 12);
        REQUIRE(r.has_value());
        CHECK(*r == CellRect{0, 0, 6, 2});
    }

    SECTION("origin pulled in so the rect ends inside the grid") {
        auto r = DashboardLayoutConfig::clamp_rect(WidgetKind::DailyHours, {10, 9, 8, 4}, 12, 12);
        REQUIRE(r.has_value());
        CHECK(*r == CellRect{4, 8, 8, 4});
    }

    SECTION("negative origin becomes zero") {
        auto r = DashboardLayoutConfig::clamp_rect(WidgetKind::Overtime, {-3, -1, 3, 2}, 6, 8);
        REQUIRE(r.has_value());
        CHECK(*r == CellRect{0, 0, 3, 2});
    }

    SECTION("size limited by the grid") {
        auto r =
            DashboardLayoutConfig::clamp_rect(WidgetKind::ContractTimeline, {0, 0, 12, 3}, 6, 8);
        REQUIRE(r.has_value());
        CHECK(*r == CellRect{0, 0, 6, 3});
    }

    SECTION("minimum larger than the grid") {
        CHECK_FALSE(
            DashboardLayoutConfig::clamp_rect(WidgetKind::ContractTimeline, {0, 0, 6, 2}, 5, 8)
                .has_value());
    }
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: clamp_rect follows registry size overrides",
                 "[layout_config][clamp]") {
    REQUIRE(override_widget_kind_sizes(WidgetKind::TotalHours, {3, 2}, {3, 2}, {4, 2}));

    auto big = DashboardLayoutConfig::clamp_rect(WidgetKind::TotalHours, {0, 0, 6, 3}, 12, 12);
    REQUIRE(big.has_value());
    CHECK(*big == CellRect{0, 0, 4, 2});

    auto small = DashboardLayoutConfig::clamp_rect(WidgetKind::TotalHours, {9, 0, 2, 2}, 12, 12);
    REQUIRE(small.has_value());
    CHECK(*small == CellRect{9, 0, 3, 2});
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: 12x12 layout loaded onto 6x8 stays in bounds",
                 "[layout_config][clamp]") {
    setup_empty_config();
    layout_config.save(DashboardLayoutConfig::build_defaults());

    const auto* small = GridLayout::find_preset("6x8");
    REQUIRE(small != nullptr);
    auto layout = layout_config.load(small);

    CHECK(layout.grid_size == "6x8");
    CHECK(layout.widgets.size() == 7);
    for (const auto& w : layout.widgets) {
        INFO("widget " << w.id);
        CHECK(GridLayout::in_bounds(w.rect, 6, 8));
        const auto& def = widget_kind_def(w.kind);
        CHECK(w.rect.width >= def.min_size.width);
        CHECK(w.rect.height >= def.min_size.height);
        CHECK(w.rect.width <= def.max_size.width);
        CHECK(w.rect.height <= def.max_size.height);
    }

    const auto* legend = find_widget(layout, "performanceLegend");
    REQUIRE(legend != nullptr);
    CHECK(legend->rect == CellRect{0, 6, 6, 2});
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: widget whose minimum cannot fit is dropped",
                 "[layout_config][clamp]") {
    // Host override makes the timeline too wide for 6 columns
    REQUIRE(override_widget_kind_sizes(WidgetKind::ContractTimeline, {12, 3}, {8, 2}, {12, 6}));

    setup_with_layout({{"grid_size", "12x12"},
                       {"widgets", json::array({widget_json("tl", "contractTimeline", 0, 0, 12, 3),
                                                widget_json("t", "totalHours", 0, 3, 3, 2)})}});
    auto layout = layout_config.load(GridLayout::find_preset("6x8"));

    REQUIRE(layout.widgets.size() == 1);
    CHECK(layout.widgets[0].id == "t");
}

TEST_CASE("DashboardLayoutConfig: reclamp reports dropped ids", "[layout_config][clamp]") {
    std::vector<GridPlacement> widgets = {
        {"tl", WidgetKind::ContractTimeline, {0, 0, 12, 3},
         default_settings(WidgetKind::ContractTimeline), true},
        {"t", WidgetKind::TotalHours, {10, 10, 3, 2}, default_settings(WidgetKind::TotalHours),
         true},
    };
    GridPreset tiny{"5x5", 5, 5};
    auto dropped = DashboardLayoutConfig::reclamp(widgets, tiny);

    REQUIRE(dropped.size() == 1);
    CHECK(dropped[0] == "tl");
    REQUIRE(widgets.size() == 1);
    CHECK(widgets[0].rect == CellRect{2, 3, 3, 2});
}

// ============================================================================
// Legacy migration
// ============================================================================

static json legacy_document() {
    return {{"gridSize", "8x10"},
            {"widgets",
             json::array({{{"id", "totalHours"},
                           {"type", "totalHours"},
                           {"enabled", true},
                           {"size", "medium"},
                           {"position", 0},
                           {"settings",
                            {{"gridPosition", {{"x", 1}, {"y", 1}, {"width", 3}, {"height", 2}}},
                             {"showTrend", false}}}},
                          {{"type", "dailyHours"},
                           {"enabled", false},
                           {"settings", json::object()}},
                          {{"id", "nope"}, {"settings", json::object()}}})}};
}

TEST_CASE("DashboardLayoutConfig: is_legacy_format", "[layout_config][migration]") {
    CHECK(DashboardLayoutConfig::is_legacy_format(legacy_document()));
    CHECK(DashboardLayoutConfig::is_legacy_format(
        {{"widgets", json::array({{{"type", "overtime"}}})}}));

    CHECK_FALSE(DashboardLayoutConfig::is_legacy_format(
        DashboardLayoutConfig::to_json(DashboardLayoutConfig::build_defaults())));
    CHECK_FALSE(DashboardLayoutConfig::is_legacy_format(json::array()));
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: legacy key is migrated and removed",
                 "[layout_config][migration]") {
    setup_with_legacy_layout(legacy_document());
    auto layout = layout_config.load();

    CHECK(layout.grid_size == "8x10");
    REQUIRE(layout.widgets.size() == 2);

    const auto* total = find_widget(layout, "totalHours");
    REQUIRE(total != nullptr);
    CHECK(total->rect == CellRect{1, 1, 3, 2});
    CHECK_FALSE(std::get<TotalHoursSettings>(total->settings).show_trend);

    // No id and no position: id from the type, default size at the origin
    const auto* daily = find_widget(layout, "dailyHours");
    REQUIRE(daily != nullptr);
    CHECK(daily->rect == CellRect{0, 0, 6, 4});
    CHECK_FALSE(daily->enabled);

    CHECK_FALSE(get_data().contains("dashboardLayout"));
    REQUIRE(get_data().contains("dashboard_layout"));
    CHECK_FALSE(DashboardLayoutConfig::is_legacy_format(get_data()["dashboard_layout"]));
    CHECK_FALSE(get_data()["dashboard_layout"]["widgets"][0]["settings"].contains("gridPosition"));
}

TEST_CASE_METHOD(DashboardLayoutConfigFixture,
                 "DashboardLayoutConfig: legacy shape under the current key is converted",
                 "[layout_config][migration]") {
    setup_with_layout(legacy_document());
    auto layout = layout_config.load();

    CHECK(layout.grid_size == "8x10");
    CHECK(layout.widgets.size() == 2);
    CHECK(get_data()["dashboard_layout"].contains("grid_size"));
    CHECK_FALSE(get_data()["dashboard_layout"].contains("gridSize"));
}

TEST_CASE("DashboardLayoutConfig: legacy positions of the wrong type use defaults",
          "[layout_config][migration]") {
    json legacy = {{"widgets",
                    json::array({{{"type", "overtime"},
                                  {"settings",
                                   {{"gridPosition",
                                     {{"x", "2"}, {"y", 4.0}, {"width", nullptr}}}}}}})}};
    auto migrated = DashboardLayoutConfig::migrate_legacy(legacy);
    CHECK(migrated["grid_size"] == "12x12");
    const auto& rect = migrated["widgets"][0]["rect"];
    CHECK(rect["x"] == 0);
    CHECK(rect["y"] == 4);
    CHECK(rect["width"] == 3);
    CHECK(rect["height"] == 2);
}
