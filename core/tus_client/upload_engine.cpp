// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_engine.hpp"

#include <algorithm>
#include <vector>

#include "response_interpreter.hpp"

#define TUS_LOG_COMPONENT "upload_engine"
#include <tus_log_macros.hpp>

namespace tus {
namespace client {

UploadSession::UploadSession(
  std::string url, std::unique_ptr<IUploadStream> stream, uint64_t start_offset,
  uint64_t total_size, uint64_t chunk_size
)
    : url_(std::move(url))
    , stream_(std::move(stream))
    , offset_(start_offset)
    , total_size_(total_size)
    , chunk_size_(chunk_size) {}

bool UploadSession::isValidTransition(UploadState from, UploadState to) {
  switch (from) {
    case UploadState::CREATED:
      return to == UploadState::TRANSFERRING;
    case UploadState::TRANSFERRING:
      return to == UploadState::COMPLETED || to == UploadState::FAILED;
    case UploadState::COMPLETED:
    case UploadState::FAILED:
      return false;
    default:
      return false;
  }
}

bool UploadSession::transitionTo(UploadState to, std::string& error_msg) {
  if (!isValidTransition(state_, to)) {
    error_msg = "invalid upload transition " + uploadStateToString(state_) + " -> " +
                uploadStateToString(to);
    return false;
  }
  state_ = to;
  return true;
}

void UploadSession::advance(uint64_t bytes) {
  offset_ += bytes;
  ++round_trips_;
}

UploadEngine::UploadEngine(ITransport& transport, HeaderMap base_headers)
    : transport_(transport)
    , base_headers_(std::move(base_headers)) {}

Status UploadEngine::fail(UploadSession& session, Error error) {
  std::string transition_error;
  if (!session.transitionTo(UploadState::FAILED, transition_error)) {
    TUS_LOG_ERROR(transition_error);
  }
  TUS_LOG_ERROR(
    "Upload failed" << logging::kv("offset", session.offset()) << logging::kv("total", session.totalSize())
                    << logging::kv("error", error.toString())
  );
  return Status::Failure(std::move(error));
}

Status UploadEngine::run(UploadSession& session, const UploadCallbacks& callbacks) {
  TUS_LOG_SCOPED_UPLOAD(session.url());

  if (session.chunkSize() == 0) {
    return Status::Failure(Error::config("chunk size must be greater than zero"));
  }
  if (session.offset() > session.totalSize()) {
    return Status::Failure(Error::config(
      "start offset " + std::to_string(session.offset()) + " exceeds total size " +
      std::to_string(session.totalSize())
    ));
  }

  std::string transition_error;
  if (!session.transitionTo(UploadState::TRANSFERRING, transition_error)) {
    return Status::Failure(Error::config(transition_error));
  }

  TUS_LOG_DEBUG(
    "Starting transfer" << logging::kv("offset", session.offset()) << logging::kv("total", session.totalSize())
                        << logging::kv("chunk_size", session.chunkSize())
  );

  auto cancelled = [&callbacks]() {
    return callbacks.is_cancelled && callbacks.is_cancelled();
  };

  const uint64_t remaining = session.totalSize() - session.offset();
  std::vector<char> buffer(static_cast<size_t>(std::min(session.chunkSize(), remaining)));

  while (session.offset() < session.totalSize()) {
    if (cancelled()) {
      return fail(session, Error::cancelled());
    }

    const uint64_t want = std::min<uint64_t>(buffer.size(), session.totalSize() - session.offset());
    std::streamsize n = session.stream().read(buffer.data(), static_cast<std::streamsize>(want));
    if (n < 0) {
      return fail(
        session, Error::io("stream read failed at offset " + std::to_string(session.offset()))
      );
    }
    if (n == 0) {
      return fail(
        session, Error::io(
                   "stream ended at offset " + std::to_string(session.offset()) +
                   " before total size " + std::to_string(session.totalSize())
                 )
      );
    }

    if (cancelled()) {
      return fail(session, Error::cancelled());
    }

    const uint64_t sent = static_cast<uint64_t>(n);
    TransportRequest request;
    request.operation = Operation::TRANSFER;
    request.url = session.url();
    request.headers = base_headers_;
    request.headers[headers::UPLOAD_OFFSET] = std::to_string(session.offset());
    request.headers[headers::CONTENT_TYPE] = headers::OFFSET_OCTET_STREAM;
    request.body = buffer.data();
    request.body_size = static_cast<size_t>(sent);

    TransportResult result = transport_.perform(request);
    if (!result.success) {
      return fail(session, Error::transport(result.error_message));
    }

    auto ack = ResponseInterpreter::interpretTransfer(result.response, session.offset() + sent);
    if (!ack.ok()) {
      return fail(session, ack.error());
    }

    session.advance(sent);
    TUS_LOG_DEBUG_EVERY_N(
      64, "Chunk acknowledged" << logging::kv("offset", session.offset())
                               << logging::kv("total", session.totalSize())
                               << logging::kv("round_trips", session.roundTrips())
    );

    if (callbacks.on_progress) {
      callbacks.on_progress(session.offset(), session.totalSize());
    }
  }

  if (!session.transitionTo(UploadState::COMPLETED, transition_error)) {
    return Status::Failure(Error::config(transition_error));
  }
  TUS_LOG_INFO(
    "Upload completed" << logging::kv("total", session.totalSize())
                       << logging::kv("round_trips", session.roundTrips())
  );
  return Status::Ok();
}

}  // namespace client
}  // namespace tus
