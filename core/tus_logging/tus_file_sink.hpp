// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_FILE_SINK_HPP
#define TUS_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "tus_log_severity.hpp"

namespace tus {
namespace logging {

// Deeper queue than the console: a long upload at debug level logs in bursts
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/tus";
  std::string file_pattern = "tus_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = false;
};

/**
 * Create async file sink with size and time based rotation.
 *
 * When the configured directory cannot be created the sink writes to the
 * system temporary directory instead and says so on stderr.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Directory the file sink will actually write to for config.
 * Creates it when missing.
 */
std::string resolve_log_directory(const FileSinkConfig& config);

}  // namespace logging
}  // namespace tus

#endif  // TUS_FILE_SINK_HPP
