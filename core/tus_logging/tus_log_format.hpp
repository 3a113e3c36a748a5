// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_LOG_FORMAT_HPP
#define TUS_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

#include "tus_log_severity.hpp"

namespace tus {
namespace logging {

// Attribute names attached by the scoped macros in tus_log_macros.hpp
constexpr const char* RESOURCE_ATTR = "Resource";
constexpr const char* OPERATION_ATTR = "Operation";

/**
 * Options for the human readable record layout:
 *
 *   [2026-01-01 12:00:00.000000] [INFO] [upload_engine] Upload completed total=10 | PATCH /files/a
 */
struct TextFormatOptions {
  bool timestamps = true;
  bool colors = false;
};

/**
 * Write a record as one text line.
 * The trailer lists the operation and resource when either is attached.
 */
void format_text(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm,
  const TextFormatOptions& options
);

/**
 * Write a record as a single-line JSON object with keys
 * ts, level, msg, thread_id and, when attached, operation and resource.
 */
void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * ANSI color escape for a severity level ("" for unknown levels).
 */
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace tus

#endif  // TUS_LOG_FORMAT_HPP
