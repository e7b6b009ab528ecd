// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace gridboard {

using json = nlohmann::json;

/// JSON document store addressed by JSON pointers ("/grid/gap_px").
/// This is the default persistence collaborator for the dashboard layout;
/// a host that persists elsewhere can use the layout's to_json/from_json
/// directly and never touch a file.
class Config {
  public:
    Config() = default;

    /// Read a JSON file. A missing file leaves an empty document and returns
    /// true; an unreadable or malformed file is logged, leaves an empty
    /// document and returns false. The path is remembered for save().
    bool load(const std::string& path);

    /// Write the document to the path given to load(). Written to a temp file
    /// and renamed so a crash never leaves a truncated config. Returns false
    /// (logged) on I/O failure or when no path is set.
    bool save();

    const std::string& path() const {
        return path_;
    }

    void set_path(const std::string& path) {
        path_ = path;
    }

    bool exists(const std::string& ptr) const;

    /// Value at ptr, or default_value if missing or of the wrong type
    template <typename T> T get(const std::string& ptr, const T& default_value) const {
        try {
            json::json_pointer jp(ptr);
            if (!data.contains(jp)) {
                return default_value;
            }
            return data.at(jp).get<T>();
        } catch (const json::exception& e) {
            spdlog::debug("[Config] get('{}') failed: {}", ptr, e.what());
            return default_value;
        }
    }

    template <typename T> void set(const std::string& ptr, const T& value) {
        data[json::json_pointer(ptr)] = value;
    }

    /// Mutable reference to the node at ptr (created as null if missing).
    /// An empty pointer refers to the whole document.
    json& get_json(const std::string& ptr);

    /// Remove a top-level key. Returns true if it existed.
    bool erase(const std::string& key);

  private:
    json data = json::object();
    std::string path_;

    friend class ConfigFixture;
    friend class DashboardLayoutConfigFixture;
};

} // namespace gridboard
