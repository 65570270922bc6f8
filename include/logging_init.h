// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace facet {
namespace logging {

/**
 * @brief Log destination targets
 *
 * Auto picks the best available system target:
 * - Syslog if /dev/log exists
 * - Rotating file as fallback
 */
enum class LogTarget {
    Auto,   ///< Detect best available (default)
    Syslog, ///< Traditional syslog
    File,   ///< Rotating file log
    Console ///< Console only (disable system logging)
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;         ///< Console output (stderr, coloured)
    LogTarget target = LogTarget::Auto; ///< System log destination
    std::string file_path;              ///< Override file path (empty = /tmp/facet.log)
};

/// Default rotating log file location
constexpr const char* DEFAULT_LOG_FILE = "/tmp/facet.log";

/**
 * @brief Initialize logging subsystem
 *
 * Call once at startup before any log calls. Creates a multi-sink logger
 * that writes to both console (if enabled) and the selected system target,
 * and installs it as the spdlog default logger.
 *
 * @param config Logging configuration
 */
void init(const LogConfig& config);

/**
 * @brief Resolve Auto to a concrete target for this host
 *
 * Non-Auto targets are returned unchanged.
 */
LogTarget resolve_target(LogTarget target);

/**
 * @brief Parse log target from string
 *
 * @param str One of: "auto", "syslog", "file", "console"
 * @return Corresponding LogTarget enum value (Auto if unrecognized)
 */
LogTarget parse_log_target(const std::string& str);

/**
 * @brief Get string name for log target
 *
 * @param target LogTarget enum value
 * @return Human-readable name (e.g., "syslog", "file")
 */
const char* log_target_name(LogTarget target);

/**
 * @brief Map -v count to a level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
 */
spdlog::level::level_enum level_from_verbosity(int verbosity);

} // namespace logging
} // namespace facet
