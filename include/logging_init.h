// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for the dashboard engine and its hosts
 *
 * Installs a colored console sink and, when a file path is configured, a
 * size-rotated file sink on the default logger. Every component logs through
 * the spdlog free functions with a "[Component]" prefix.
 */

#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace gridboard {

class Config;

namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file_path;                      // Empty = console only
    std::size_t max_file_size = 1024 * 1024;    // Bytes per rotated file
    std::size_t max_files = 3;
};

/**
 * @brief Build a LogConfig from the /log section of a Config
 *
 * Reads /log/level ("trace".."off") and /log/file. The GRIDBOARD_LOG_LEVEL
 * environment variable overrides the configured level.
 */
LogConfig log_config_from(const Config& config);

/**
 * @brief Parse a level name, falling back to info for unknown names
 */
spdlog::level::level_enum parse_level(const std::string& name);

/**
 * @brief Replace the default logger with the configured sinks
 *
 * Safe to call more than once; the last call wins. A file sink that cannot be
 * opened is reported on the console and skipped.
 */
void init_logging(const LogConfig& config);

} // namespace logging
} // namespace gridboard
