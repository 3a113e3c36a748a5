// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_transport.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <regex>
#include <stdexcept>

#define TUS_LOG_COMPONENT "http_transport"
#include <tus_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace tus {
namespace client {

namespace {

http::verb toBeastVerb(Operation operation) {
  switch (operation) {
    case Operation::INSPECT:
      return http::verb::head;
    case Operation::DISCOVER:
      return http::verb::options;
    case Operation::CREATE:
      return http::verb::post;
    case Operation::TRANSFER:
      return http::verb::patch;
    case Operation::DELETE:
      return http::verb::delete_;
    default:
      return http::verb::unknown;
  }
}

std::string hostHeader(const ParsedUrl& url) {
  const bool default_port =
    (url.use_ssl && url.port == "443") || (!url.use_ssl && url.port == "80");
  return default_port ? url.host : url.host + ":" + url.port;
}

// Write the request and read the response on an established stream.
template<typename Stream>
http::response<http::string_body> exchange(
  Stream& stream, http::request<http::string_body>& req, bool skip_body
) {
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  // HEAD responses announce a Content-Length but carry no body
  parser.skip(skip_body);
  http::read(stream, buffer, parser);
  return parser.release();
}

}  // namespace

HttpTransport::HttpTransport(HttpTransportConfig config)
    : config_(std::move(config)) {
  auto parsed = parseUrl(config_.base_url);
  if (!parsed) {
    throw std::invalid_argument("Invalid base URL: " + config_.base_url);
  }
  base_ = *parsed;
}

std::optional<ParsedUrl> HttpTransport::parseUrl(const std::string& url) {
  // Format: http(s)://host(:port)/path
  static const std::regex url_regex(R"(^(https?)://([^/:]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl parsed;
  parsed.scheme = boost::algorithm::to_lower_copy(match[1].str());
  parsed.host = match[2].str();
  parsed.path = match[4].str();
  if (parsed.path.empty()) {
    parsed.path = "/";
  } else if (parsed.path[0] != '/') {
    return std::nullopt;
  }

  parsed.use_ssl = parsed.scheme == "https";
  const std::string port = match[3].str();
  parsed.port = port.empty() ? (parsed.use_ssl ? "443" : "80") : port;
  return parsed;
}

std::string HttpTransport::resolve(const std::string& locator) const {
  if (locator.empty()) {
    return config_.base_url;
  }
  if (parseUrl(locator)) {
    return locator;
  }

  const std::string origin = base_.scheme + "://" + base_.host + ":" + base_.port;
  if (locator[0] == '/') {
    return origin + locator;
  }

  std::string base_path = base_.path;
  if (base_path.back() != '/') {
    base_path += '/';
  }
  return origin + base_path + locator;
}

TransportResult HttpTransport::perform(const TransportRequest& request) {
  TUS_LOG_SCOPED_OPERATION(operationToVerb(request.operation));
  const std::string url = resolve(request.url);
  auto target = parseUrl(url);
  if (!target) {
    return TransportResult::Failure("Invalid URL: " + url);
  }

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    http::request<http::string_body> req{toBeastVerb(request.operation), target->path, 11};
    req.set(http::field::host, hostHeader(*target));
    req.set(http::field::user_agent, config_.user_agent);
    for (const auto& header : request.headers) {
      req.set(header.first, header.second);
    }
    if (request.hasBody()) {
      req.body().assign(request.body, request.body_size);
    }
    req.prepare_payload();

    const bool skip_body = request.operation == Operation::INSPECT;
    http::response<http::string_body> res;

    if (target->use_ssl) {
      ssl::context ctx(ssl::context::tlsv12_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

      // SNI hostname, required by most servers
      if (!SSL_set_tlsext_host_name(stream.native_handle(), target->host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return TransportResult::Failure("SNI hostname failed: " + ec.message());
      }

      beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
      auto const results = resolver.resolve(target->host, target->port);
      beast::get_lowest_layer(stream).connect(results);
      stream.handshake(ssl::stream_base::client);

      res = exchange(stream, req, skip_body);

      beast::error_code ec;
      stream.shutdown(ec);
      // Peer may close without close_notify
      if (ec && ec != net::ssl::error::stream_truncated && ec != beast::errc::not_connected) {
        TUS_LOG_WARN_THROTTLE(5000, "SSL shutdown warning" << logging::kv("error", ec.message()));
      }
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(config_.request_timeout);
      auto const results = resolver.resolve(target->host, target->port);
      stream.connect(results);

      res = exchange(stream, req, skip_body);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        TUS_LOG_WARN_THROTTLE(5000, "Socket shutdown warning" << logging::kv("error", ec.message()));
      }
    }

    TransportResponse response;
    response.status_code = static_cast<int>(res.result_int());
    for (const auto& field : res.base()) {
      std::string name(field.name_string().data(), field.name_string().size());
      response.headers[boost::algorithm::to_lower_copy(name)] =
        std::string(field.value().data(), field.value().size());
    }

    TUS_LOG_DEBUG("HTTP exchange" << logging::kv("url", url) << logging::kv("status", response.status_code));
    return TransportResult::Success(std::move(response));

  } catch (const std::exception& e) {
    TUS_LOG_ERROR("HTTP request failed" << logging::kv("url", url) << logging::kv("error", e.what()));
    return TransportResult::Failure(std::string("HTTP request failed: ") + e.what());
  }
}

}  // namespace client
}  // namespace tus
