// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_LOG_INIT_HPP
#define MPUPLOAD_LOG_INIT_HPP

#include <optional>
#include <string>

#include "mpupload_console_sink.hpp"
#include "mpupload_file_sink.hpp"
#include "mpupload_log_severity.hpp"

namespace mpupload {
namespace logging {

/**
 * Logging configuration for mpupload binaries.
 * File logging is off unless explicitly enabled.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig in place.
 *
 *   MPUPLOAD_LOG_LEVEL            - level for both sinks
 *   MPUPLOAD_LOG_CONSOLE_ENABLED  - "true"/"false"
 *   MPUPLOAD_LOG_FILE_ENABLED     - "true"/"false"
 *   MPUPLOAD_LOG_FILE_DIR         - log file directory
 *   MPUPLOAD_LOG_FORMAT           - file format, "json" or "text"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks on the Boost.Log core and register the
 * TimeStamp and ThreadID attributes.
 *
 * @return false if sinks are already installed; the new config is ignored
 */
bool init_logging(const LoggingConfig& config);

/**
 * Drain the async sinks and detach them from the core. Call before the
 * process exits so queued upload records reach the terminal and log file.
 * Safe to call when logging was never initialized.
 */
void shutdown_logging();

}  // namespace logging
}  // namespace mpupload

#endif  // MPUPLOAD_LOG_INIT_HPP
