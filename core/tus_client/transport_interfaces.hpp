// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_TRANSPORT_INTERFACES_HPP
#define TUS_TRANSPORT_INTERFACES_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "header_utils.hpp"

namespace tus {
namespace client {

/**
 * Protocol operations, one per request kind
 */
enum class Operation {
  INSPECT,   // HEAD
  DISCOVER,  // OPTIONS
  CREATE,    // POST
  TRANSFER,  // PATCH
  DELETE     // DELETE
};

/**
 * HTTP verb used for an operation
 */
inline const char* operationToVerb(Operation operation) {
  switch (operation) {
    case Operation::INSPECT:
      return "HEAD";
    case Operation::DISCOVER:
      return "OPTIONS";
    case Operation::CREATE:
      return "POST";
    case Operation::TRANSFER:
      return "PATCH";
    case Operation::DELETE:
      return "DELETE";
    default:
      return "UNKNOWN";
  }
}

/**
 * One outgoing request.
 *
 * The body is borrowed: it points into the caller's chunk buffer and is only
 * valid until perform() returns. Transports must copy it if they need it
 * afterwards.
 */
struct TransportRequest {
  Operation operation = Operation::INSPECT;
  std::string url;  // Resource path or absolute URL
  HeaderMap headers;
  const char* body = nullptr;  // nullptr when the request has no body
  size_t body_size = 0;

  bool hasBody() const {
    return body != nullptr;
  }
};

struct TransportResponse {
  int status_code = 0;
  HeaderMap headers;
};

/**
 * Result of one exchange. A received response is a success even when its
 * status is an error status; success == false means no response was obtained.
 */
struct TransportResult {
  bool success;
  TransportResponse response;
  std::string error_message;

  static TransportResult Success(TransportResponse response) {
    return {true, std::move(response), ""};
  }

  static TransportResult Failure(const std::string& message) {
    return {false, TransportResponse{}, message};
  }
};

/**
 * Transport capability: performs exactly one request/response exchange.
 * Implementations must not retain TransportRequest::body past the call.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual TransportResult perform(const TransportRequest& request) = 0;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_TRANSPORT_INTERFACES_HPP
