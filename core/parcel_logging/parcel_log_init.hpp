// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_INIT_HPP
#define PARCEL_LOG_INIT_HPP

#include <optional>
#include <string>

#include "parcel_log_severity.hpp"
#include "parcel_log_sinks.hpp"

namespace parcel {
namespace logging {

/**
 * Sink selection and levels for the process.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", ignoring case.
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides in place.
 *
 *   PARCEL_LOG_LEVEL           - level for both sinks
 *   PARCEL_LOG_CONSOLE_LEVEL   - console sink level
 *   PARCEL_LOG_FILE_LEVEL      - file sink level
 *   PARCEL_LOG_FILE_DIR        - log file directory
 *   PARCEL_LOG_FORMAT          - file format ("json" or "text")
 *   PARCEL_LOG_FILE_ENABLED    - "true"/"false"
 *   PARCEL_LOG_CONSOLE_ENABLED - "true"/"false"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks, after applying the PARCEL_LOG_* environment
 * overrides on top of config. Calling it again while initialized is a no-op;
 * use reconfigure_logging() to swap settings.
 */
void init_logging(const LoggingConfig& config);

/**
 * LoggingConfig defaults (console at INFO with colors, no file sink), plus
 * environment overrides.
 */
void init_logging_default();

/**
 * Replace the installed sinks with ones built from config. Environment
 * overrides are applied as in init_logging().
 */
void reconfigure_logging(const LoggingConfig& config);

/**
 * Stop the async sinks, flushing pending records, and detach them.
 */
void shutdown_logging();

void flush_logging();

bool is_logging_initialized();

/**
 * Settings the installed sinks were built from, env overrides included.
 * std::nullopt while logging is not initialized.
 */
std::optional<LoggingConfig> active_logging_config();

}  // namespace logging
}  // namespace parcel

#endif  // PARCEL_LOG_INIT_HPP
