// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mpupload_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <mutex>

#include "mpupload_log_macros.hpp"

namespace mpupload {
namespace logging {

namespace {

// Sinks installed by init_logging(). Guarded by mutex; a null pointer means
// the sink was disabled in the config.
struct InstalledSinks {
  std::mutex mutex;
  bool active = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
};

InstalledSinks& installed_sinks() {
  static InstalledSinks sinks;
  return sinks;
}

// Remove from the core first so no new record is queued, then drain.
template <typename SinkPtr>
void detach_and_drain(SinkPtr& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

std::string lowercase(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

// Value of an environment variable, treating unset and empty alike.
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

// "true/1/yes/on" and "false/0/no/off"; anything else leaves current alone.
void apply_env_switch(const char* name, bool& current) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  const std::string v = lowercase(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    current = true;
  } else if (v == "false" || v == "0" || v == "no" || v == "off") {
    current = false;
  }
}

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const struct {
    const char* name;
    severity_level level;
  } kLevels[] = {
    {"debug", severity_level::debug}, {"info", severity_level::info},
    {"warn", severity_level::warn},   {"warning", severity_level::warn},
    {"error", severity_level::error}, {"fatal", severity_level::fatal},
  };

  const std::string wanted = lowercase(level_str);
  const auto* match = std::find_if(std::begin(kLevels), std::end(kLevels), [&](const auto& e) {
    return wanted == e.name;
  });
  if (match == std::end(kLevels)) {
    return std::nullopt;
  }
  return match->level;
}

void apply_env_overrides(LoggingConfig& config) {
  if (const char* level_str = env_value("MPUPLOAD_LOG_LEVEL")) {
    if (auto level = parse_severity_level(level_str)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  apply_env_switch("MPUPLOAD_LOG_CONSOLE_ENABLED", config.console_enabled);
  apply_env_switch("MPUPLOAD_LOG_FILE_ENABLED", config.file_enabled);
  if (const char* dir = env_value("MPUPLOAD_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("MPUPLOAD_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(format) == "json";
  }
}

bool init_logging(const LoggingConfig& config) {
  auto& sinks = installed_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.active) {
    return false;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }
  sinks.active = true;
  return true;
}

void shutdown_logging() {
  auto& sinks = installed_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  detach_and_drain(sinks.console);
  detach_and_drain(sinks.file);
  sinks.active = false;
}

}  // namespace logging
}  // namespace mpupload
