// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_UPLOAD_STREAM_IMPL_HPP
#define TUS_UPLOAD_STREAM_IMPL_HPP

#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "stream_interfaces.hpp"

namespace tus {
namespace client {

/**
 * IUploadStream over a local file (std::ifstream, binary)
 */
class FileUploadStream : public IUploadStream {
public:
  explicit FileUploadStream(const std::string& path)
      : stream_(path, std::ios::binary) {}

  bool isOpen() const {
    return stream_.is_open() && stream_.good();
  }

  std::streamsize read(char* buffer, std::streamsize size) override {
    if (stream_.bad()) {
      return -1;
    }
    stream_.read(buffer, size);
    std::streamsize count = stream_.gcount();
    if (stream_.bad()) {
      return -1;
    }
    // A short read sets eof|fail; clear so a later seek() works
    if (stream_.eof()) {
      stream_.clear();
    }
    return count;
  }

  bool seek(uint64_t offset) override {
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    return !stream_.fail();
  }

  std::optional<uint64_t> size() override {
    std::streampos current = stream_.tellg();
    stream_.seekg(0, std::ios::end);
    std::streampos end = stream_.tellg();
    stream_.seekg(current);
    if (current == std::streampos(-1) || end == std::streampos(-1) || stream_.fail()) {
      stream_.clear();
      return std::nullopt;
    }
    return static_cast<uint64_t>(end);
  }

private:
  std::ifstream stream_;
};

/**
 * IUploadStream over an owned in-memory buffer
 */
class MemoryUploadStream : public IUploadStream {
public:
  explicit MemoryUploadStream(std::vector<char> data)
      : data_(std::move(data)) {}

  std::streamsize read(char* buffer, std::streamsize size) override {
    size_t available = data_.size() - position_;
    size_t count = std::min(available, static_cast<size_t>(size));
    if (count > 0) {
      std::memcpy(buffer, data_.data() + position_, count);
    }
    position_ += count;
    return static_cast<std::streamsize>(count);
  }

  bool seek(uint64_t offset) override {
    if (offset > data_.size()) {
      return false;
    }
    position_ = static_cast<size_t>(offset);
    return true;
  }

  std::optional<uint64_t> size() override {
    return static_cast<uint64_t>(data_.size());
  }

  uint64_t position() const {
    return position_;
  }

private:
  std::vector<char> data_;
  size_t position_ = 0;
};

/**
 * Default IUploadStreamFactory opening FileUploadStream instances
 */
class UploadStreamFactoryImpl : public IUploadStreamFactory {
public:
  std::unique_ptr<IUploadStream> open(const std::string& path) override {
    auto stream = std::make_unique<FileUploadStream>(path);
    if (!stream->isOpen()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace client
}  // namespace tus

#endif  // TUS_UPLOAD_STREAM_IMPL_HPP
