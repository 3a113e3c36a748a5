// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tus_client.hpp"

#include <stdexcept>
#include <utility>

#include "metadata_codec.hpp"
#include "response_interpreter.hpp"

#define TUS_LOG_COMPONENT "tus_client"
#include <tus_log_macros.hpp>

namespace tus {
namespace client {

namespace {

TransportRequest makeRequest(Operation operation, const std::string& url, HeaderMap headers) {
  TransportRequest request;
  request.operation = operation;
  request.url = url;
  request.headers = std::move(headers);
  return request;
}

}  // namespace

TusClient::TusClient(std::shared_ptr<ITransport> transport, ClientConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config)) {
  if (!transport_) {
    throw std::invalid_argument("TusClient requires a transport");
  }
}

HeaderMap TusClient::baseHeaders(const ClientConfig& config) {
  HeaderMap base = config.extra_headers;
  base[headers::TUS_RESUMABLE] = config.protocol_version;
  return base;
}

Result<UploadInfo> TusClient::inspect(
  ITransport& transport, const ClientConfig& config, const std::string& url
) {
  auto result = transport.perform(makeRequest(Operation::INSPECT, url, baseHeaders(config)));
  if (!result.success) {
    return Result<UploadInfo>::Failure(Error::transport(result.error_message));
  }
  return ResponseInterpreter::interpretInspect(result.response);
}

Result<UploadInfo> TusClient::getInfo(const std::string& url) {
  auto info = inspect(*transport_, config_, url);
  if (!info.ok()) {
    TUS_LOG_WARN("Inspect failed" << logging::kv("url", url) << logging::kv("error", info.error().toString()));
  }
  return info;
}

Result<ServerInfo> TusClient::getServerInfo(const std::string& url) {
  auto result = transport_->perform(makeRequest(Operation::DISCOVER, url, baseHeaders(config_)));
  if (!result.success) {
    return Result<ServerInfo>::Failure(Error::transport(result.error_message));
  }
  auto info = ResponseInterpreter::interpretDiscover(result.response);
  if (info.ok()) {
    TUS_LOG_DEBUG(
      "Server capabilities" << logging::kv("versions", info.value().supported_versions.size())
                            << logging::kv("extensions", info.value().extensions.size())
    );
  }
  return info;
}

Result<std::string> TusClient::create(const std::string& url, uint64_t total_size) {
  return createWithMetadata(url, total_size, Metadata());
}

Result<std::string> TusClient::createWithMetadata(
  const std::string& url, uint64_t total_size, const Metadata& metadata
) {
  std::string offending_key;
  if (!MetadataCodec::isEncodable(metadata, offending_key)) {
    return Result<std::string>::Failure(
      Error::config("metadata entry '" + offending_key + "' contains ':' or ';'")
    );
  }

  HeaderMap request_headers = baseHeaders(config_);
  request_headers[headers::UPLOAD_LENGTH] = std::to_string(total_size);
  if (!metadata.empty()) {
    request_headers[headers::UPLOAD_METADATA] = MetadataCodec::encode(metadata);
  }

  auto result =
    transport_->perform(makeRequest(Operation::CREATE, url, std::move(request_headers)));
  if (!result.success) {
    return Result<std::string>::Failure(Error::transport(result.error_message));
  }

  auto location = ResponseInterpreter::interpretCreate(result.response);
  if (location.ok()) {
    TUS_LOG_INFO(
      "Created upload" << logging::kv("location", location.value()) << logging::kv("size", total_size)
    );
  } else {
    TUS_LOG_WARN("Create failed" << logging::kv("url", url) << logging::kv("error", location.error().toString()));
  }
  return location;
}

Status TusClient::upload(
  const std::string& url, std::unique_ptr<IUploadStream> stream, const UploadCallbacks& callbacks
) {
  return runUpload(*transport_, config_, url, std::move(stream), config_.chunk_size, callbacks);
}

Status TusClient::uploadWithChunkSize(
  const std::string& url, std::unique_ptr<IUploadStream> stream, uint64_t chunk_size,
  const UploadCallbacks& callbacks
) {
  return runUpload(*transport_, config_, url, std::move(stream), chunk_size, callbacks);
}

std::future<Status> TusClient::uploadAsync(
  const std::string& url, std::unique_ptr<IUploadStream> stream,
  std::optional<uint64_t> chunk_size, UploadCallbacks callbacks
) {
  const uint64_t resolved_chunk = chunk_size.value_or(config_.chunk_size);
  return std::async(
    std::launch::async,
    [transport = transport_, config = config_, url, stream = std::move(stream), resolved_chunk,
     callbacks = std::move(callbacks)]() mutable {
      return runUpload(*transport, config, url, std::move(stream), resolved_chunk, callbacks);
    }
  );
}

Status TusClient::runUpload(
  ITransport& transport, const ClientConfig& config, const std::string& url,
  std::unique_ptr<IUploadStream> stream, uint64_t chunk_size, const UploadCallbacks& callbacks
) {
  if (!stream) {
    return Status::Failure(Error::config("upload stream is null"));
  }
  if (chunk_size == 0) {
    return Status::Failure(Error::config("chunk size must be greater than zero"));
  }
  if (callbacks.is_cancelled && callbacks.is_cancelled()) {
    return Status::Failure(Error::cancelled());
  }

  auto info = inspect(transport, config, url);
  if (!info.ok()) {
    TUS_LOG_WARN("Inspect before upload failed" << logging::kv("url", url)
                                                << logging::kv("error", info.error().toString()));
    return info.status();
  }

  uint64_t total_size = 0;
  if (info.value().total_size) {
    total_size = *info.value().total_size;
  } else if (auto stream_size = stream->size()) {
    total_size = *stream_size;
  } else {
    return Status::Failure(
      Error::io("server did not report upload-length and the stream size is unknown")
    );
  }

  const uint64_t start_offset = info.value().bytes_uploaded;
  if (start_offset > total_size) {
    return Status::Failure(Error::offsetMismatch(total_size, start_offset));
  }
  if (!stream->seek(start_offset)) {
    return Status::Failure(
      Error::io("failed to seek stream to offset " + std::to_string(start_offset))
    );
  }
  if (start_offset > 0) {
    TUS_LOG_INFO("Resuming upload" << logging::kv("url", url) << logging::kv("offset", start_offset)
                                   << logging::kv("total", total_size));
  }

  UploadSession session(url, std::move(stream), start_offset, total_size, chunk_size);
  UploadEngine engine(transport, baseHeaders(config));
  return engine.run(session, callbacks);
}

Status TusClient::deleteUpload(const std::string& url) {
  auto result = transport_->perform(makeRequest(Operation::DELETE, url, baseHeaders(config_)));
  if (!result.success) {
    return Status::Failure(Error::transport(result.error_message));
  }
  Status status = ResponseInterpreter::interpretDelete(result.response);
  if (status.ok()) {
    TUS_LOG_INFO("Deleted upload" << logging::kv("url", url));
  }
  return status;
}

}  // namespace client
}  // namespace tus
