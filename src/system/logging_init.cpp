// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "config.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace gridboard {
namespace logging {

static constexpr const char* LOGGER_NAME = "gridboard";
static constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str() maps unknown names to off; only honor "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

LogConfig log_config_from(const Config& config) {
    LogConfig lc;
    lc.level = parse_level(config.get<std::string>("/log/level", "info"));
    lc.file_path = config.get<std::string>("/log/file", "");

    if (const char* env = std::getenv("GRIDBOARD_LOG_LEVEL")) {
        lc.level = parse_level(env);
    }
    return lc;
}

void init_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(LOG_PATTERN);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] Cannot open log file {}: {}", config.file_path, file_error);
    }

    spdlog::debug("[Logging] Initialized: level={} file='{}'",
                  spdlog::level::to_string_view(config.level), config.file_path);
}

} // namespace logging
} // namespace gridboard
