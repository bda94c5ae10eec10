// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "parcel_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "parcel_log_macros.hpp"

namespace parcel {
namespace logging {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return s;
}

std::optional<bool> parse_flag(const std::string& text) {
  const std::string value = lowercase(text);
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

// One PARCEL_LOG_* variable. Applied in table order, so the sink-specific
// levels come after PARCEL_LOG_LEVEL and win over it.
struct EnvOverride {
  const char* name;
  void (*apply)(LoggingConfig& config, const std::string& value);
};

void set_all_levels(LoggingConfig& config, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    config.console_level = *level;
    config.file_level = *level;
  }
}

void set_console_level(LoggingConfig& config, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    config.console_level = *level;
  }
}

void set_file_level(LoggingConfig& config, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    config.file_level = *level;
  }
}

void set_console_enabled(LoggingConfig& config, const std::string& value) {
  config.console_enabled = parse_flag(value).value_or(config.console_enabled);
}

void set_file_enabled(LoggingConfig& config, const std::string& value) {
  config.file_enabled = parse_flag(value).value_or(config.file_enabled);
}

void set_file_directory(LoggingConfig& config, const std::string& value) {
  config.file_config.directory = value;
}

void set_file_format(LoggingConfig& config, const std::string& value) {
  config.file_config.format_json = lowercase(value) == "json";
}

const EnvOverride kEnvOverrides[] = {
  {"PARCEL_LOG_LEVEL", &set_all_levels},
  {"PARCEL_LOG_CONSOLE_LEVEL", &set_console_level},
  {"PARCEL_LOG_CONSOLE_ENABLED", &set_console_enabled},
  {"PARCEL_LOG_FILE_LEVEL", &set_file_level},
  {"PARCEL_LOG_FILE_ENABLED", &set_file_enabled},
  {"PARCEL_LOG_FILE_DIR", &set_file_directory},
  {"PARCEL_LOG_FORMAT", &set_file_format},
};

// Detach a sink from the core, then drain its async queue
template <typename Sink>
void detach_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

/**
 * Owns the process-wide sinks and the settings they were built from.
 * All members are guarded by mutex_.
 */
class LoggingRuntime {
public:
  static LoggingRuntime& instance() {
    static LoggingRuntime runtime;
    return runtime;
  }

  void start(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
      return;
    }
    install(config);
  }

  void restart(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    uninstall();
    install(config);
  }

  void stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    uninstall();
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
      console_->flush();
    }
    if (file_) {
      file_->flush();
    }
  }

  std::optional<LoggingConfig> active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
  }

private:
  LoggingRuntime() = default;

  // Must be called with mutex_ held
  void install(const LoggingConfig& requested) {
    LoggingConfig effective = requested;
    apply_env_overrides(effective);

    std::call_once(attributes_once_, [] { boost::log::add_common_attributes(); });

    auto core = boost::log::core::get();
    if (effective.console_enabled) {
      console_ = create_console_sink(effective.console_level, effective.console_colors);
      core->add_sink(console_);
    }
    if (effective.file_enabled) {
      file_ = create_file_sink(effective.file_config, effective.file_level);
      core->add_sink(file_);
    }
    active_ = effective;
  }

  // Must be called with mutex_ held
  void uninstall() {
    detach_sink(console_);
    detach_sink(file_);
    active_.reset();
  }

  mutable std::mutex mutex_;
  std::once_flag attributes_once_;
  boost::shared_ptr<async_console_sink_t> console_;
  boost::shared_ptr<async_file_sink_t> file_;
  std::optional<LoggingConfig> active_;
};

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> kNames[] = {
    {"debug", severity_level::debug}, {"info", severity_level::info},
    {"warn", severity_level::warn},   {"warning", severity_level::warn},
    {"error", severity_level::error}, {"fatal", severity_level::fatal},
  };

  const std::string name = lowercase(level_str);
  for (const auto& entry : kNames) {
    if (name == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : kEnvOverrides) {
    const char* value = std::getenv(entry.name);
    if (value && *value != '\0') {
      entry.apply(config, value);
    }
  }
}

void init_logging(const LoggingConfig& config) { LoggingRuntime::instance().start(config); }

void init_logging_default() { init_logging(LoggingConfig{}); }

void reconfigure_logging(const LoggingConfig& config) {
  LoggingRuntime::instance().restart(config);
}

void shutdown_logging() { LoggingRuntime::instance().stop(); }

void flush_logging() { LoggingRuntime::instance().flush(); }

bool is_logging_initialized() { return LoggingRuntime::instance().active().has_value(); }

std::optional<LoggingConfig> active_logging_config() { return LoggingRuntime::instance().active(); }

}  // namespace logging
}  // namespace parcel
