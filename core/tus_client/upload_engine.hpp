// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_UPLOAD_ENGINE_HPP
#define TUS_UPLOAD_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "header_utils.hpp"
#include "stream_interfaces.hpp"
#include "transport_interfaces.hpp"
#include "tus_error.hpp"

namespace tus {
namespace client {

/**
 * Chunk size used when the caller does not choose one (5 MiB)
 */
constexpr uint64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;

/**
 * UploadState of one upload session.
 *
 * State transitions:
 * - CREATED -> TRANSFERRING: run() accepted the session
 * - TRANSFERRING -> COMPLETED: offset reached the total size
 * - TRANSFERRING -> FAILED: first transport, parse, offset, I/O error or cancellation
 */
enum class UploadState { CREATED, TRANSFERRING, COMPLETED, FAILED };

inline std::string uploadStateToString(UploadState state) {
  switch (state) {
    case UploadState::CREATED:
      return "created";
    case UploadState::TRANSFERRING:
      return "transferring";
    case UploadState::COMPLETED:
      return "completed";
    case UploadState::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

/**
 * Progress callback type
 *
 * @param bytes_uploaded Offset acknowledged by the server
 * @param total_bytes Total upload size
 */
using ProgressCallback = std::function<void(uint64_t bytes_uploaded, uint64_t total_bytes)>;

/**
 * Optional hooks for one upload
 */
struct UploadCallbacks {
  ProgressCallback on_progress;        // After every acknowledged chunk
  std::function<bool()> is_cancelled;  // Polled before every stream read and request
};

/**
 * State of one chunked transfer. Owns the stream for its whole lifetime.
 */
class UploadSession {
public:
  UploadSession(
    std::string url, std::unique_ptr<IUploadStream> stream, uint64_t start_offset,
    uint64_t total_size, uint64_t chunk_size
  );

  // Non-copyable
  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  const std::string& url() const {
    return url_;
  }

  uint64_t offset() const {
    return offset_;
  }

  uint64_t totalSize() const {
    return total_size_;
  }

  uint64_t chunkSize() const {
    return chunk_size_;
  }

  UploadState state() const {
    return state_;
  }

  uint64_t roundTrips() const {
    return round_trips_;
  }

  IUploadStream& stream() {
    return *stream_;
  }

  /**
   * Check if a transition is allowed by the state machine
   */
  static bool isValidTransition(UploadState from, UploadState to);

  /**
   * Attempt a state transition.
   *
   * @param to The target state
   * @param error_msg Output error message if transition fails
   * @return true if transition was successful
   */
  bool transitionTo(UploadState to, std::string& error_msg);

  /**
   * Record an acknowledged chunk of the given length
   */
  void advance(uint64_t bytes);

private:
  std::string url_;
  std::unique_ptr<IUploadStream> stream_;
  uint64_t offset_;
  uint64_t total_size_;
  uint64_t chunk_size_;
  UploadState state_ = UploadState::CREATED;
  uint64_t round_trips_ = 0;
};

/**
 * UploadEngine drives a session from CREATED to COMPLETED or FAILED.
 *
 * Each round trip reads up to chunk size bytes from the stream, sends them
 * as one TRANSFER request tagged with the current offset, and advances the
 * offset once the server acknowledges exactly offset + bytes sent. Round
 * trips are strictly sequential and nothing is retried: the first error
 * fails the session. At most one chunk buffer is held at a time.
 *
 * The stream must already be positioned at the session's start offset.
 */
class UploadEngine {
public:
  /**
   * @param transport Transport used for every round trip
   * @param base_headers Headers added to every request (Tus-Resumable, auth, ...)
   */
  UploadEngine(ITransport& transport, HeaderMap base_headers);

  /**
   * Run the session to completion.
   *
   * A zero chunk size or a start offset beyond the total size is rejected
   * with CONFIG_ERROR and leaves the session in CREATED.
   */
  Status run(UploadSession& session, const UploadCallbacks& callbacks = {});

private:
  Status fail(UploadSession& session, Error error);

  ITransport& transport_;
  HeaderMap base_headers_;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_UPLOAD_ENGINE_HPP
