// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_lvgl_dashboard_host.cpp
 * @brief Tests for the LVGL binding: grid templates and child placement
 *
 * Runs against a headless 800x480 display. Widget views are plain objects
 * named after their widget ids.
 */

#include "lvgl_dashboard_host.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace gridboard;

// Global LVGL initialization (only once per test run)
static bool g_lvgl_initialized = false;
static lv_display_t* g_display = nullptr;
static lv_color_t g_display_buf[800 * 10];

static void ensure_lvgl_init() {
    if (!g_lvgl_initialized) {
        lv_init();
        g_display = lv_display_create(800, 480);
        lv_display_set_buffers(g_display, g_display_buf, nullptr, sizeof(g_display_buf),
                               LV_DISPLAY_RENDER_MODE_PARTIAL);
        g_lvgl_initialized = true;
        spdlog::info("[Test] LVGL initialized with 800x480 display (once)");
    }
}

class LvglHostFixture {
  public:
    lv_obj_t* screen = nullptr;
    lv_obj_t* container = nullptr;
    DashboardEngine engine;

    LvglHostFixture() {
        ensure_lvgl_init();
        screen = lv_screen_active();
        lv_obj_clean(screen);

        container = lv_obj_create(screen);
        lv_obj_set_size(container, 840, 840);
    }

    ~LvglHostFixture() {
        if (screen) {
            lv_obj_clean(screen);
        }
    }

    lv_obj_t* add_view(const char* widget_id) {
        lv_obj_t* view = lv_obj_create(container);
        lv_obj_set_name(view, widget_id);
        return view;
    }

    void update_layout() {
        lv_obj_update_layout(screen);
    }
};

TEST_CASE("LvglDashboardHost: grid templates", "[lvgl_host]") {
    GridSpec spec{6, 8, 59.6f, 8.0f, 16.0f};

    auto cols = LvglDashboardHost::make_col_dsc(spec);
    REQUIRE(cols.size() == 7);
    for (size_t i = 0; i < 6; ++i) {
        CHECK(cols[i] == 60);
    }
    CHECK(cols.back() == LV_GRID_TEMPLATE_LAST);

    auto rows = LvglDashboardHost::make_row_dsc(spec);
    REQUIRE(rows.size() == 9);
    CHECK(rows.front() == 60);
    CHECK(rows.back() == LV_GRID_TEMPLATE_LAST);
}

TEST_CASE_METHOD(LvglHostFixture, "LvglDashboardHost: attach positions named children",
                 "[lvgl_host]") {
    LayoutConfiguration config{"12x12",
                               {{"a", WidgetKind::TotalHours, {1, 2, 3, 2},
                                 default_settings(WidgetKind::TotalHours), true},
                                {"b", WidgetKind::Overtime, {6, 0, 3, 2},
                                 default_settings(WidgetKind::Overtime), false}}};
    engine.load(config);

    lv_obj_t* a = add_view("a");
    lv_obj_t* b = add_view("b");
    lv_obj_t* stray = lv_obj_create(container);
    lv_obj_set_pos(stray, 5, 5);

    LvglDashboardHost host(engine);
    host.attach(container);
    update_layout();

    // 840px container: 60px cells, 8px gaps, 16px padding
    CHECK(engine.grid_spec().cell_size_px == 60.0f);
    CHECK(lv_obj_get_x(a) == 84);
    CHECK(lv_obj_get_y(a) == 152);
    CHECK(lv_obj_get_width(a) == 196);
    CHECK(lv_obj_get_height(a) == 128);
    CHECK_FALSE(lv_obj_has_flag(a, LV_OBJ_FLAG_HIDDEN));

    // Disabled widgets are hidden, unnamed children are left alone
    CHECK(lv_obj_has_flag(b, LV_OBJ_FLAG_HIDDEN));
    CHECK(lv_obj_get_x(stray) == 5);
}

TEST_CASE_METHOD(LvglHostFixture, "LvglDashboardHost: engine changes re-sync and forward",
                 "[lvgl_host]") {
    LayoutConfiguration config{"12x12",
                               {{"a", WidgetKind::TotalHours, {0, 0, 3, 2},
                                 default_settings(WidgetKind::TotalHours), true}}};
    engine.load(config);
    lv_obj_t* a = add_view("a");

    LvglDashboardHost host(engine);
    std::vector<LayoutConfiguration> forwarded;
    host.set_change_callback(
        [&forwarded](const LayoutConfiguration& c) { forwarded.push_back(c); });
    host.attach(container);

    REQUIRE(engine.set_widget_enabled("a", false));
    CHECK(lv_obj_has_flag(a, LV_OBJ_FLAG_HIDDEN));
    REQUIRE(forwarded.size() == 1);
    CHECK_FALSE(forwarded.back().widgets[0].enabled);

    REQUIRE(engine.set_widget_enabled("a", true));
    update_layout();
    CHECK_FALSE(lv_obj_has_flag(a, LV_OBJ_FLAG_HIDDEN));
    CHECK(lv_obj_get_x(a) == 16);
    CHECK(forwarded.size() == 2);
}

TEST_CASE_METHOD(LvglHostFixture, "LvglDashboardHost: detach releases the engine",
                 "[lvgl_host]") {
    LayoutConfiguration config{"12x12",
                               {{"a", WidgetKind::TotalHours, {0, 0, 3, 2},
                                 default_settings(WidgetKind::TotalHours), true}}};
    engine.load(config);
    lv_obj_t* a = add_view("a");

    int forwarded = 0;
    LvglDashboardHost host(engine);
    host.set_change_callback([&forwarded](const LayoutConfiguration&) { ++forwarded; });
    host.attach(container);
    REQUIRE(host.container() == container);

    host.detach();
    CHECK(host.container() == nullptr);

    REQUIRE(engine.set_widget_enabled("a", false));
    CHECK(forwarded == 0);
    CHECK_FALSE(lv_obj_has_flag(a, LV_OBJ_FLAG_HIDDEN));

    // Second detach is a no-op
    host.detach();
}

TEST_CASE_METHOD(LvglHostFixture, "LvglDashboardHost: container deletion detaches",
                 "[lvgl_host]") {
    LvglDashboardHost host(engine);
    host.attach(container);
    REQUIRE(host.container() == container);

    lv_obj_delete(container);
    container = nullptr;
    CHECK(host.container() == nullptr);
}
