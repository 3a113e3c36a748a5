// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_RESPONSE_INTERPRETER_HPP
#define TUS_RESPONSE_INTERPRETER_HPP

#include <cstdint>
#include <string>

#include "transport_interfaces.hpp"
#include "tus_error.hpp"
#include "tus_types.hpp"

namespace tus {
namespace client {

/**
 * HTTP status codes the protocol relies on
 */
namespace status {
constexpr int OK = 200;
constexpr int CREATED = 201;
constexpr int NO_CONTENT = 204;
constexpr int NOT_FOUND = 404;
constexpr int GONE = 410;
}  // namespace status

/**
 * Turns a raw (status, headers) response into the typed result of the
 * operation that produced it.
 *
 * Status rules:
 *   INSPECT   200/204 succeed; any other status is NOT_FOUND
 *   DISCOVER  200/204 succeed; otherwise SERVER_ERROR
 *   CREATE    201 only, with a Location header; otherwise SERVER_ERROR
 *   TRANSFER  204 only, with Upload-Offset equal to the expected offset
 *   DELETE    204 only
 * TRANSFER and DELETE report 404/410 as NOT_FOUND and everything else as
 * SERVER_ERROR.
 */
class ResponseInterpreter {
public:
  static Result<UploadInfo> interpretInspect(const TransportResponse& response);

  static Result<ServerInfo> interpretDiscover(const TransportResponse& response);

  /**
   * @return The new resource locator taken from the Location header
   */
  static Result<std::string> interpretCreate(const TransportResponse& response);

  /**
   * @param expected_offset Offset before the chunk plus the chunk length
   * @return The acknowledged offset (always equal to expected_offset)
   */
  static Result<uint64_t> interpretTransfer(
    const TransportResponse& response, uint64_t expected_offset
  );

  static Status interpretDelete(const TransportResponse& response);

  /**
   * Status used by TRANSFER and DELETE for a failed response
   */
  static Error errorForStatus(int status_code);
};

}  // namespace client
}  // namespace tus

#endif  // TUS_RESPONSE_INTERPRETER_HPP
