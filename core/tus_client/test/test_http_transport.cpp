// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for HttpTransport: URL handling and exchanges against a
 * loopback Beast server
 */

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <thread>

#include "http_transport.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace tus::client;

namespace {

/**
 * Accepts one connection, records the request, and replies with a
 * response produced by the handler.
 */
class LoopbackServer {
public:
  using Handler = std::function<void(const http::request<http::string_body>&, tcp::socket&)>;

  explicit LoopbackServer(Handler handler)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this, handler]() {
      beast::error_code ec;
      tcp::socket socket(ioc_);
      acceptor_.accept(socket, ec);
      if (ec) {
        return;
      }
      beast::flat_buffer buffer;
      http::read(socket, buffer, request_, ec);
      if (ec) {
        return;
      }
      handler(request_, socket);
      socket.shutdown(tcp::socket::shutdown_both, ec);
    });
  }

  ~LoopbackServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string baseUrl() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  // Valid once the exchange has finished
  const http::request<http::string_body>& request() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return request_;
  }

private:
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  http::request<http::string_body> request_;
  std::thread thread_;
};

HttpTransportConfig configFor(const std::string& base_url) {
  HttpTransportConfig config;
  config.base_url = base_url;
  config.request_timeout = std::chrono::seconds(5);
  return config;
}

}  // namespace

// ============================================================================
// URL handling
// ============================================================================

TEST(HttpTransportUrlTest, ParsesHttpUrl) {
  auto url = HttpTransport::parseUrl("http://example.com:8080/files/");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "http");
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port, "8080");
  EXPECT_EQ(url->path, "/files/");
  EXPECT_FALSE(url->use_ssl);
}

TEST(HttpTransportUrlTest, DefaultsPortAndPath) {
  auto http_url = HttpTransport::parseUrl("http://example.com");
  ASSERT_TRUE(http_url.has_value());
  EXPECT_EQ(http_url->port, "80");
  EXPECT_EQ(http_url->path, "/");

  auto https_url = HttpTransport::parseUrl("HTTPS://example.com/files");
  ASSERT_TRUE(https_url.has_value());
  EXPECT_EQ(https_url->scheme, "https");
  EXPECT_EQ(https_url->port, "443");
  EXPECT_TRUE(https_url->use_ssl);
}

TEST(HttpTransportUrlTest, RejectsMalformedUrls) {
  EXPECT_FALSE(HttpTransport::parseUrl("ftp://example.com/").has_value());
  EXPECT_FALSE(HttpTransport::parseUrl("example.com/files").has_value());
  EXPECT_FALSE(HttpTransport::parseUrl("http://").has_value());
  EXPECT_FALSE(HttpTransport::parseUrl("http://host:abc/").has_value());
}

TEST(HttpTransportUrlTest, InvalidBaseUrlThrows) {
  EXPECT_THROW(HttpTransport(configFor("not a url")), std::invalid_argument);
}

TEST(HttpTransportUrlTest, ResolvesLocators) {
  HttpTransport transport(configFor("http://tus.example.com/files"));

  EXPECT_EQ(transport.resolve(""), "http://tus.example.com/files");
  EXPECT_EQ(transport.resolve("/files/abc"), "http://tus.example.com:80/files/abc");
  EXPECT_EQ(transport.resolve("abc"), "http://tus.example.com:80/files/abc");
  EXPECT_EQ(transport.resolve("https://other.example.com/x"), "https://other.example.com/x");
}

// ============================================================================
// Exchanges
// ============================================================================

TEST(HttpTransportExchangeTest, PatchSendsBodyAndHeaders) {
  LoopbackServer server([](const http::request<http::string_body>& req, tcp::socket& socket) {
    http::response<http::string_body> res{http::status::no_content, 11};
    res.set("Upload-Offset", std::to_string(req.body().size()));
    res.set("Tus-Resumable", "1.0.0");
    res.prepare_payload();
    http::write(socket, res);
  });

  HttpTransport transport(configFor(server.baseUrl()));
  const std::string body = "hello chunk";

  TransportRequest request;
  request.operation = Operation::TRANSFER;
  request.url = "/files/abc";
  request.headers = {{"Upload-Offset", "0"}, {"Content-Type", "application/offset+octet-stream"}};
  request.body = body.data();
  request.body_size = body.size();

  TransportResult result = transport.perform(request);

  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.response.status_code, 204);
  // Response header names are lower-cased
  EXPECT_EQ(result.response.headers.at("upload-offset"), std::to_string(body.size()));
  EXPECT_EQ(result.response.headers.at("tus-resumable"), "1.0.0");

  const auto& received = server.request();
  EXPECT_EQ(received.method(), http::verb::patch);
  EXPECT_EQ(std::string(received.target()), "/files/abc");
  EXPECT_EQ(received.body(), body);
  EXPECT_EQ(std::string(received["Upload-Offset"]), "0");
  EXPECT_EQ(std::string(received["Content-Type"]), "application/offset+octet-stream");
}

TEST(HttpTransportExchangeTest, HeadResponseBodyIsSkipped) {
  LoopbackServer server([](const http::request<http::string_body>&, tcp::socket& socket) {
    // Content-Length describes the resource; a HEAD response carries no body
    http::response<http::empty_body> res{http::status::ok, 11};
    res.set(http::field::content_length, "1000");
    res.set("Upload-Offset", "10");
    res.set("Upload-Length", "1000");
    http::write(socket, res);
  });

  HttpTransport transport(configFor(server.baseUrl()));
  TransportRequest request;
  request.operation = Operation::INSPECT;
  request.url = "/files/abc";

  TransportResult result = transport.perform(request);

  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.response.status_code, 200);
  EXPECT_EQ(result.response.headers.at("upload-offset"), "10");
  EXPECT_EQ(server.request().method(), http::verb::head);
}

TEST(HttpTransportExchangeTest, ErrorStatusIsNotATransportFailure) {
  LoopbackServer server([](const http::request<http::string_body>&, tcp::socket& socket) {
    http::response<http::string_body> res{http::status::not_found, 11};
    res.prepare_payload();
    http::write(socket, res);
  });

  HttpTransport transport(configFor(server.baseUrl()));
  TransportRequest request;
  request.operation = Operation::DELETE;
  request.url = "/files/missing";

  TransportResult result = transport.perform(request);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.response.status_code, 404);
  EXPECT_EQ(server.request().method(), http::verb::delete_);
}

TEST(HttpTransportExchangeTest, UnreachableServerIsFailure) {
  // Bind then close a listener so the port is known to be free
  unsigned short port = 0;
  {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }

  HttpTransport transport(configFor("http://127.0.0.1:" + std::to_string(port)));
  TransportRequest request;
  request.operation = Operation::DISCOVER;
  request.url = "/files";

  TransportResult result = transport.perform(request);

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
}
