// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 *
 * This file is part of Facet, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <memory>
#include <syslog.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char* LOGGER_NAME = "facet";
constexpr const char* SYSLOG_SOCKET = "/dev/log";
constexpr size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024; // 5 MB
constexpr size_t LOG_FILE_MAX_FILES = 3;

} // anonymous namespace

namespace facet {
namespace logging {

LogTarget resolve_target(LogTarget target) {
    if (target != LogTarget::Auto) {
        return target;
    }
    if (access(SYSLOG_SOCKET, F_OK) == 0) {
        return LogTarget::Syslog;
    }
    return LogTarget::File;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget target = resolve_target(config.target);
    std::string file_path = config.file_path.empty() ? DEFAULT_LOG_FILE : config.file_path;

    try {
        switch (target) {
        case LogTarget::Syslog:
            sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(
                LOGGER_NAME, LOG_PID, LOG_USER, false));
            break;
        case LogTarget::File:
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES));
            break;
        case LogTarget::Console:
        case LogTarget::Auto:
            break;
        }
    } catch (const spdlog::spdlog_ex& e) {
        // System target unavailable; keep whatever sinks we have
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        auto fallback = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        fallback->warn("[Logging] Could not open {} target: {}", log_target_name(target),
                       e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(config.level);

    spdlog::debug("[Logging] Initialized: level={}, console={}, target={}",
                  spdlog::level::to_string_view(config.level), config.enable_console,
                  log_target_name(target));
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    if (verbosity <= 0)
        return spdlog::level::warn;
    if (verbosity == 1)
        return spdlog::level::info;
    if (verbosity == 2)
        return spdlog::level::debug;
    return spdlog::level::trace;
}

} // namespace logging
} // namespace facet
