// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tus_log_format.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

namespace tus {
namespace logging {

namespace {

const char* const kResetColor = "\033[0m";

struct RecordContext {
  boost::log::value_ref<std::string> operation;
  boost::log::value_ref<std::string> resource;

  explicit RecordContext(boost::log::record_view const& rec)
      : operation(boost::log::extract<std::string>(OPERATION_ATTR, rec))
      , resource(boost::log::extract<std::string>(RESOURCE_ATTR, rec)) {}

  bool empty() const {
    return !operation && !resource;
  }
};

}  // namespace

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
    default:
      return "";
  }
}

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        // Remaining control characters, \b and \f included
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

void format_text(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm,
  const TextFormatOptions& options
) {
  if (options.timestamps) {
    auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    if (time_stamp) {
      strm << "[" << *time_stamp << "] ";
    }
  }

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    if (options.colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[boost::log::expressions::smessage];

  RecordContext context(rec);
  if (!context.empty()) {
    strm << " |";
    if (context.operation) {
      strm << " " << *context.operation;
    }
    if (context.resource) {
      strm << " " << *context.resource;
    }
  }
}

void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "\",\"level\":\"";
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"" << escape_json(rec[boost::log::expressions::smessage].get()) << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }

  RecordContext context(rec);
  if (context.operation) {
    strm << ",\"operation\":\"" << escape_json(*context.operation) << "\"";
  }
  if (context.resource) {
    strm << ",\"resource\":\"" << escape_json(*context.resource) << "\"";
  }
  strm << "}";
}

}  // namespace logging
}  // namespace tus
