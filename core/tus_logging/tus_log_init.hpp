// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_LOG_INIT_HPP
#define TUS_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "tus_console_sink.hpp"
#include "tus_file_sink.hpp"
#include "tus_log_severity.hpp"

namespace tus {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  ConsoleSinkConfig console;

  bool file_enabled = false;
  FileSinkConfig file;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a level name: debug, info, warn, warning, error or fatal
 * (case-insensitive). Returns std::nullopt for anything else.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 *   TUS_LOG_LEVEL              - both sinks; a sink-specific level wins
 *   TUS_LOG_CONSOLE_LEVEL      - console sink level
 *   TUS_LOG_CONSOLE_ENABLED    - "true"/"false", "1"/"0", "yes"/"no", "on"/"off"
 *   TUS_LOG_CONSOLE_TIMESTAMPS - same boolean forms
 *   TUS_LOG_FILE_LEVEL         - file sink level
 *   TUS_LOG_FILE_ENABLED       - same boolean forms
 *   TUS_LOG_FILE_DIR           - log file directory
 *   TUS_LOG_FORMAT             - file format, "json" or "text"
 *
 * Unparseable values leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call without shutdown_logging()
 * in between is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO, no file sink.
 */
void init_logging_default();

/**
 * Drain and detach every sink, including ones added with add_sink().
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * shutdown_logging() followed by init_logging() with config plus
 * environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace tus

#endif  // TUS_LOG_INIT_HPP
