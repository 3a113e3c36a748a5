// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_CLIENT_HPP
#define TUS_CLIENT_HPP

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "header_utils.hpp"
#include "stream_interfaces.hpp"
#include "transport_interfaces.hpp"
#include "tus_error.hpp"
#include "tus_types.hpp"
#include "upload_engine.hpp"

namespace tus {
namespace client {

/**
 * Client-wide settings
 */
struct ClientConfig {
  uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  std::string protocol_version = "1.0.0";  // Sent as Tus-Resumable
  HeaderMap extra_headers;                 // Added to every request (Authorization, ...)
};

/**
 * TusClient exposes the protocol operations against an injected transport.
 *
 * Every call issues its requests through the transport and returns the
 * typed result or the first error encountered. Nothing is retained between
 * calls, so resuming an interrupted upload is a fresh upload() call.
 *
 * Thread safety: the client holds no mutable state; concurrent calls are
 * safe as long as the transport is.
 */
class TusClient {
public:
  explicit TusClient(std::shared_ptr<ITransport> transport, ClientConfig config = ClientConfig());

  /**
   * Inspect an upload resource (HEAD)
   */
  Result<UploadInfo> getInfo(const std::string& url);

  /**
   * Query server capabilities (OPTIONS)
   */
  Result<ServerInfo> getServerInfo(const std::string& url);

  /**
   * Create a resource of the given size (POST)
   *
   * @return Location of the new resource
   */
  Result<std::string> create(const std::string& url, uint64_t total_size);

  /**
   * Create a resource carrying metadata. Keys or values containing ':' or
   * ';' are rejected with CONFIG_ERROR before any request is issued.
   */
  Result<std::string> createWithMetadata(
    const std::string& url, uint64_t total_size, const Metadata& metadata
  );

  /**
   * Upload a stream using the configured chunk size.
   *
   * Inspects the resource first, seeks the stream to the server offset and
   * transfers the remainder. The total size comes from the server's
   * upload-length, or from the stream when the server does not report one.
   */
  Status upload(
    const std::string& url, std::unique_ptr<IUploadStream> stream,
    const UploadCallbacks& callbacks = UploadCallbacks()
  );

  Status uploadWithChunkSize(
    const std::string& url, std::unique_ptr<IUploadStream> stream, uint64_t chunk_size,
    const UploadCallbacks& callbacks = UploadCallbacks()
  );

  /**
   * Run upload() on a worker thread. The returned future owns everything
   * the upload needs; the client may be destroyed before it resolves.
   */
  std::future<Status> uploadAsync(
    const std::string& url, std::unique_ptr<IUploadStream> stream,
    std::optional<uint64_t> chunk_size = std::nullopt,
    UploadCallbacks callbacks = UploadCallbacks()
  );

  /**
   * Delete a resource (DELETE)
   */
  Status deleteUpload(const std::string& url);

  const ClientConfig& config() const {
    return config_;
  }

private:
  static Status runUpload(
    ITransport& transport, const ClientConfig& config, const std::string& url,
    std::unique_ptr<IUploadStream> stream, uint64_t chunk_size, const UploadCallbacks& callbacks
  );

  static HeaderMap baseHeaders(const ClientConfig& config);

  static Result<UploadInfo> inspect(
    ITransport& transport, const ClientConfig& config, const std::string& url
  );

  std::shared_ptr<ITransport> transport_;
  ClientConfig config_;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_CLIENT_HPP
