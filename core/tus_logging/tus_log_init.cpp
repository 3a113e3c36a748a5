// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tus_log_init.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "tus_log_macros.hpp"

namespace tus {
namespace logging {

namespace {

struct LoggingState {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> attached;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::optional<bool> parse_bool(const std::string& s) {
  const std::string lower = boost::algorithm::to_lower_copy(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

void set_level(severity_level& target, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    target = *level;
  }
}

void set_flag(bool& target, const std::string& value) {
  if (auto flag = parse_bool(value)) {
    target = *flag;
  }
}

struct EnvOverride {
  const char* name;
  void (*apply)(LoggingConfig&, const std::string&);
};

// Applied in order, so the global level comes before the per-sink levels
const EnvOverride kEnvOverrides[] = {
  {"TUS_LOG_LEVEL",
   [](LoggingConfig& c, const std::string& v) {
     set_level(c.console.min_level, v);
     set_level(c.file_level, v);
   }},
  {"TUS_LOG_CONSOLE_LEVEL",
   [](LoggingConfig& c, const std::string& v) {
     set_level(c.console.min_level, v);
   }},
  {"TUS_LOG_CONSOLE_ENABLED",
   [](LoggingConfig& c, const std::string& v) {
     set_flag(c.console_enabled, v);
   }},
  {"TUS_LOG_CONSOLE_TIMESTAMPS",
   [](LoggingConfig& c, const std::string& v) {
     set_flag(c.console.timestamps, v);
   }},
  {"TUS_LOG_FILE_LEVEL",
   [](LoggingConfig& c, const std::string& v) {
     set_level(c.file_level, v);
   }},
  {"TUS_LOG_FILE_ENABLED",
   [](LoggingConfig& c, const std::string& v) {
     set_flag(c.file_enabled, v);
   }},
  {"TUS_LOG_FILE_DIR",
   [](LoggingConfig& c, const std::string& v) {
     c.file.directory = v;
   }},
  {"TUS_LOG_FORMAT",
   [](LoggingConfig& c, const std::string& v) {
     c.file.format_json = boost::algorithm::to_lower_copy(v) == "json";
   }},
};

template<typename Sink>
void drain(const boost::shared_ptr<Sink>& sink) {
  if (sink) {
    sink->stop();
    sink->flush();
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = boost::algorithm::to_lower_copy(level_str);
  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const EnvOverride& entry : kEnvOverrides) {
    const char* value = std::getenv(entry.name);
    if (value && value[0] != '\0') {
      entry.apply(config, value);
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    s.console = create_console_sink(config.console);
    core->add_sink(s.console);
    s.attached.push_back(s.console);
  }
  if (config.file_enabled) {
    s.file = create_file_sink(config.file, config.file_level);
    core->add_sink(s.file);
    s.attached.push_back(s.file);
  }

  s.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    return;
  }

  drain(s.console);
  drain(s.file);

  auto core = boost::log::core::get();
  for (auto& sink : s.attached) {
    core->remove_sink(sink);
  }
  s.attached.clear();
  s.console.reset();
  s.file.reset();
  s.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  boost::log::core::get()->add_sink(sink);
  s.attached.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  boost::log::core::get()->remove_sink(sink);
  s.attached.erase(std::remove(s.attached.begin(), s.attached.end(), sink), s.attached.end());
}

void flush_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.console) {
    s.console->flush();
  }
  if (s.file) {
    s.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

}  // namespace logging
}  // namespace tus
