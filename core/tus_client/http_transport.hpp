// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_HTTP_TRANSPORT_HPP
#define TUS_HTTP_TRANSPORT_HPP

#include <chrono>
#include <optional>
#include <string>

#include "transport_interfaces.hpp"

namespace tus {
namespace client {

/**
 * HTTP transport settings
 */
struct HttpTransportConfig {
  std::string base_url;  // http(s)://host[:port][/path]
  std::chrono::seconds request_timeout{30};
  std::string user_agent = "tus-client/1.0";
  bool verify_tls = true;  // Verify the server certificate against the system CA store
};

/**
 * Components of an http or https URL
 */
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  bool use_ssl = false;
};

/**
 * HttpTransport performs each exchange over a fresh Boost.Beast connection,
 * plain TCP or TLS depending on the URL scheme.
 *
 * Resource locators may be absolute URLs or paths; paths are resolved
 * against the base URL ("/files/x" against the origin, "x" against the base
 * path). Response header names are lower-cased. Any connect, TLS or I/O
 * failure is reported as an unsuccessful TransportResult; HTTP error
 * statuses are not failures at this layer.
 */
class HttpTransport : public ITransport {
public:
  /**
   * @throws std::invalid_argument if the base URL is not an http(s) URL
   */
  explicit HttpTransport(HttpTransportConfig config);

  TransportResult perform(const TransportRequest& request) override;

  /**
   * Parse "http(s)://host[:port][/path]". Path defaults to "/".
   */
  static std::optional<ParsedUrl> parseUrl(const std::string& url);

  /**
   * Resolve a resource locator against the base URL
   */
  std::string resolve(const std::string& locator) const;

  const HttpTransportConfig& config() const {
    return config_;
  }

private:
  HttpTransportConfig config_;
  ParsedUrl base_;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_HTTP_TRANSPORT_HPP
