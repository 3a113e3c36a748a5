// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_STREAM_INTERFACES_HPP
#define TUS_STREAM_INTERFACES_HPP

#include <cstdint>
#include <ios>
#include <memory>
#include <optional>
#include <string>

namespace tus {
namespace client {

/**
 * Readable, seekable local byte source for an upload.
 * Allows substituting files, memory buffers or mocks.
 */
class IUploadStream {
public:
  virtual ~IUploadStream() = default;

  /**
   * Read up to size bytes at the current position
   *
   * @return Number of bytes read, 0 at end of stream, -1 on read failure
   */
  virtual std::streamsize read(char* buffer, std::streamsize size) = 0;

  /**
   * Position the stream at an absolute byte offset
   *
   * @return true if successful, false otherwise
   */
  virtual bool seek(uint64_t offset) = 0;

  /**
   * Total length of the stream in bytes, or std::nullopt if unknown
   */
  virtual std::optional<uint64_t> size() = 0;
};

/**
 * Factory interface for opening upload streams
 */
class IUploadStreamFactory {
public:
  virtual ~IUploadStreamFactory() = default;

  /**
   * Open a local file for reading
   *
   * @param path Path to the file
   * @return Unique pointer to the stream, or nullptr on failure
   */
  virtual std::unique_ptr<IUploadStream> open(const std::string& path) = 0;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_STREAM_INTERFACES_HPP
