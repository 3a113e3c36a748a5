// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_ERROR_HPP
#define TUS_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tus {
namespace client {

/**
 * Error classes reported by client operations.
 */
enum class ErrorCode {
  NONE,
  NOT_FOUND,        // Resource absent or access denied (not distinguished)
  SERVER_ERROR,     // Any other unexpected status; see Error::status_code
  PARSE_ERROR,      // Malformed or missing header, malformed base64
  OFFSET_MISMATCH,  // Server acknowledged an offset other than the one expected
  TRANSPORT_ERROR,  // The transport failed to complete the exchange
  IO_ERROR,         // Local stream read or seek failure
  CONFIG_ERROR,     // Invalid caller-supplied parameter
  CANCELLED         // Caller requested a stop
};

inline std::string errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NONE:
      return "none";
    case ErrorCode::NOT_FOUND:
      return "not_found";
    case ErrorCode::SERVER_ERROR:
      return "server_error";
    case ErrorCode::PARSE_ERROR:
      return "parse_error";
    case ErrorCode::OFFSET_MISMATCH:
      return "offset_mismatch";
    case ErrorCode::TRANSPORT_ERROR:
      return "transport_error";
    case ErrorCode::IO_ERROR:
      return "io_error";
    case ErrorCode::CONFIG_ERROR:
      return "config_error";
    case ErrorCode::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

/**
 * A failed operation. Only the fields relevant to the code are meaningful:
 * status_code for SERVER_ERROR, expected/actual offsets for OFFSET_MISMATCH.
 */
struct Error {
  ErrorCode code = ErrorCode::NONE;
  std::string message;
  int status_code = 0;
  uint64_t expected_offset = 0;
  uint64_t actual_offset = 0;

  static Error notFound(const std::string& message = "resource not found") {
    Error e;
    e.code = ErrorCode::NOT_FOUND;
    e.message = message;
    return e;
  }

  static Error serverError(int status) {
    Error e;
    e.code = ErrorCode::SERVER_ERROR;
    e.status_code = status;
    e.message = "unexpected status " + std::to_string(status);
    return e;
  }

  static Error parseError(const std::string& context) {
    Error e;
    e.code = ErrorCode::PARSE_ERROR;
    e.message = context;
    return e;
  }

  static Error offsetMismatch(uint64_t expected, uint64_t actual) {
    Error e;
    e.code = ErrorCode::OFFSET_MISMATCH;
    e.expected_offset = expected;
    e.actual_offset = actual;
    e.message =
      "server offset " + std::to_string(actual) + " != expected " + std::to_string(expected);
    return e;
  }

  static Error transport(const std::string& message) {
    Error e;
    e.code = ErrorCode::TRANSPORT_ERROR;
    e.message = message;
    return e;
  }

  static Error io(const std::string& message) {
    Error e;
    e.code = ErrorCode::IO_ERROR;
    e.message = message;
    return e;
  }

  static Error config(const std::string& message) {
    Error e;
    e.code = ErrorCode::CONFIG_ERROR;
    e.message = message;
    return e;
  }

  static Error cancelled() {
    Error e;
    e.code = ErrorCode::CANCELLED;
    e.message = "operation cancelled";
    return e;
  }

  std::string toString() const {
    return errorCodeToString(code) + ": " + message;
  }
};

/**
 * Outcome of an operation with no value.
 */
class Status {
public:
  Status() = default;

  static Status Ok() {
    return Status();
  }

  static Status Failure(Error error) {
    Status s;
    s.error_ = std::move(error);
    return s;
  }

  bool ok() const {
    return error_.code == ErrorCode::NONE;
  }

  const Error& error() const {
    return error_;
  }

  ErrorCode code() const {
    return error_.code;
  }

private:
  Error error_;
};

/**
 * Outcome of an operation producing a T. value() is only valid when ok().
 */
template<typename T>
class Result {
public:
  static Result Ok(T value) {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  static Result Failure(Error error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  bool ok() const {
    return value_.has_value();
  }

  const T& value() const {
    return *value_;
  }

  T& value() {
    return *value_;
  }

  const Error& error() const {
    return error_;
  }

  ErrorCode code() const {
    return error_.code;
  }

  Status status() const {
    return ok() ? Status::Ok() : Status::Failure(error_);
  }

private:
  Result() = default;

  std::optional<T> value_;
  Error error_;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_ERROR_HPP
