// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_CONSOLE_SINK_HPP
#define TUS_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "tus_log_severity.hpp"

namespace tus {
namespace logging {

/**
 * Async console sink with bounded queue.
 * Records are dropped on overflow so a slow terminal never stalls a transfer.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

struct ConsoleSinkConfig {
  severity_level min_level = severity_level::info;
  bool colors = true;
  bool timestamps = true;
};

/**
 * Create async console sink writing to std::clog, keeping stdout free for
 * command output.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  const ConsoleSinkConfig& config = ConsoleSinkConfig()
);

}  // namespace logging
}  // namespace tus

#endif  // TUS_CONSOLE_SINK_HPP
