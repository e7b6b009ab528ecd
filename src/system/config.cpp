// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace gridboard {

namespace fs = std::filesystem;

bool Config::load(const std::string& path) {
    path_ = path;
    data = json::object();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::info("[Config] No config at {}, starting empty", path);
        return true;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        spdlog::error("[Config] Cannot open {}", path);
        return false;
    }

    try {
        json parsed = json::parse(in);
        if (!parsed.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, ignoring it", path);
            return false;
        }
        data = std::move(parsed);
    } catch (const json::parse_error& e) {
        spdlog::error("[Config] Failed to parse {}: {}", path, e.what());
        return false;
    }

    spdlog::debug("[Config] Loaded {}", path);
    return true;
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::warn("[Config] save() without a path, nothing written");
        return false;
    }

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("[Config] Cannot create {}: {}", target.parent_path().string(),
                          ec.message());
            return false;
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            spdlog::error("[Config] Cannot write {}", tmp.string());
            return false;
        }
        out << data.dump(2) << '\n';
        if (!out.good()) {
            spdlog::error("[Config] Write to {} failed", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("[Config] Cannot replace {}: {}", path_, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    spdlog::trace("[Config] Saved {}", path_);
    return true;
}

bool Config::exists(const std::string& ptr) const {
    try {
        return data.contains(json::json_pointer(ptr));
    } catch (const json::exception& e) {
        spdlog::debug("[Config] exists('{}') failed: {}", ptr, e.what());
        return false;
    }
}

json& Config::get_json(const std::string& ptr) {
    if (ptr.empty()) {
        return data;
    }
    return data[json::json_pointer(ptr)];
}

bool Config::erase(const std::string& key) {
    return data.erase(key) > 0;
}

} // namespace gridboard
