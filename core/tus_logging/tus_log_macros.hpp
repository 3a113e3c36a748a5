// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_LOG_MACROS_HPP
#define TUS_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

#include "tus_log_severity.hpp"

namespace tus {
namespace logging {

typedef boost::log::sources::severity_logger<severity_level> logger_type;

/**
 * Get the process-wide logger instance.
 * Defined in tus_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured messages.
 * Usage: TUS_LOG_INFO("chunk acknowledged" << kv("offset", offset));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace tus

// Define TUS_LOG_COMPONENT before including this header to tag records
// with the emitting component.
#ifndef TUS_LOG_COMPONENT
#define TUS_LOG_COMPONENT "tus"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define TUS_LOG_ENABLE_DEBUG 0
#else
#define TUS_LOG_ENABLE_DEBUG 1
#endif

#define TUS_LOG_DEBUG(msg) \
  do { \
    if (TUS_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::tus::logging::get_logger(), ::tus::logging::severity_level::debug) \
        << "[" << TUS_LOG_COMPONENT << "] " << msg; \
    } \
  } while (0)

#define TUS_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::tus::logging::get_logger(), ::tus::logging::severity_level::info) \
      << "[" << TUS_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define TUS_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::tus::logging::get_logger(), ::tus::logging::severity_level::warn) \
      << "[" << TUS_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define TUS_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::tus::logging::get_logger(), ::tus::logging::severity_level::error) \
      << "[" << TUS_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define TUS_LOG_FATAL(msg) \
  do { \
    BOOST_LOG_SEV(::tus::logging::get_logger(), ::tus::logging::severity_level::fatal) \
      << "[" << TUS_LOG_COMPONENT << "] " << msg; \
  } while (0)

// Attach the resource locator to every record emitted in the enclosing scope.
// Usage: TUS_LOG_SCOPED_UPLOAD("/files/24e533e0");
#define TUS_LOG_SCOPED_UPLOAD(resource_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR( \
    "Resource", boost::log::attributes::constant<std::string>(resource_val) \
  )

// Attach the protocol verb of the request in flight.
#define TUS_LOG_SCOPED_OPERATION(op_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR( \
    "Operation", boost::log::attributes::constant<std::string>(op_val) \
  )

// Log every Nth occurrence at a given call site.
// Usage: TUS_LOG_DEBUG_EVERY_N(64, "chunk acknowledged" << kv("offset", offset));
#define TUS_LOG_DEBUG_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _tus_log_counter{0}; \
    if ((++_tus_log_counter % (n)) == 1) { \
      TUS_LOG_DEBUG(msg); \
    } \
  } while (0)

// Log at most once per period_ms at a given call site.
#define TUS_LOG_WARN_THROTTLE(period_ms, msg) \
  do { \
    static std::atomic<int64_t> _tus_log_last_ms{-1}; \
    const int64_t _tus_now_ms = std::chrono::duration_cast<std::chrono::milliseconds>( \
                                  std::chrono::steady_clock::now().time_since_epoch() \
                                ).count(); \
    int64_t _tus_prev_ms = _tus_log_last_ms.load(); \
    if ((_tus_prev_ms < 0 || _tus_now_ms - _tus_prev_ms >= (period_ms)) && \
        _tus_log_last_ms.compare_exchange_strong(_tus_prev_ms, _tus_now_ms)) { \
      TUS_LOG_WARN(msg); \
    } \
  } while (0)

#endif  // TUS_LOG_MACROS_HPP
