// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_TYPES_HPP
#define TUS_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tus {
namespace client {

/**
 * Upload metadata as carried in the Upload-Metadata header
 */
using Metadata = std::map<std::string, std::string>;

/**
 * Protocol capabilities a server may advertise in Tus-Extension
 */
enum class Extension {
  CREATION,
  CREATION_WITH_UPLOAD,
  CREATION_DEFER_LENGTH,
  EXPIRATION,
  CHECKSUM,
  TERMINATION,
  CONCATENATION
};

/**
 * Wire token of an extension ("creation", "termination", ...)
 */
inline std::string extensionToString(Extension extension) {
  switch (extension) {
    case Extension::CREATION:
      return "creation";
    case Extension::CREATION_WITH_UPLOAD:
      return "creation-with-upload";
    case Extension::CREATION_DEFER_LENGTH:
      return "creation-defer-length";
    case Extension::EXPIRATION:
      return "expiration";
    case Extension::CHECKSUM:
      return "checksum";
    case Extension::TERMINATION:
      return "termination";
    case Extension::CONCATENATION:
      return "concatenation";
    default:
      return "unknown";
  }
}

/**
 * Snapshot of one upload resource at inspection time
 */
struct UploadInfo {
  uint64_t bytes_uploaded = 0;
  std::optional<uint64_t> total_size;
  std::optional<Metadata> metadata;
};

/**
 * Server capabilities returned by a discovery request
 */
struct ServerInfo {
  std::vector<std::string> supported_versions;
  std::vector<Extension> extensions;
  std::optional<uint64_t> max_upload_size;
};

}  // namespace client
}  // namespace tus

#endif  // TUS_TYPES_HPP
