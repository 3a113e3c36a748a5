// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_HEADER_UTILS_HPP
#define TUS_HEADER_UTILS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tus {
namespace client {

/**
 * Header names and protocol constants
 */
namespace headers {
constexpr const char* TUS_RESUMABLE = "Tus-Resumable";
constexpr const char* TUS_VERSION = "Tus-Version";
constexpr const char* TUS_EXTENSION = "Tus-Extension";
constexpr const char* TUS_MAX_SIZE = "Tus-Max-Size";
constexpr const char* UPLOAD_OFFSET = "Upload-Offset";
constexpr const char* UPLOAD_LENGTH = "Upload-Length";
constexpr const char* UPLOAD_METADATA = "Upload-Metadata";
constexpr const char* LOCATION = "Location";
constexpr const char* CONTENT_TYPE = "Content-Type";

constexpr const char* OFFSET_OCTET_STREAM = "application/offset+octet-stream";
}  // namespace headers

/**
 * Header mapping. Lookups through findHeader() ignore case; names are kept
 * as given.
 */
using HeaderMap = std::map<std::string, std::string>;

/**
 * Case-insensitive header lookup
 */
std::optional<std::string> findHeader(const HeaderMap& headers, const std::string& name);

/**
 * Parse a decimal unsigned integer header value. Surrounding whitespace is
 * ignored; signs, empty values, trailing garbage and overflow are rejected.
 */
std::optional<uint64_t> parseUnsigned(const std::string& value);

/**
 * Split a comma-separated header value into whitespace-trimmed tokens.
 * Empty tokens are skipped.
 */
std::vector<std::string> splitList(const std::string& value);

}  // namespace client
}  // namespace tus

#endif  // TUS_HEADER_UTILS_HPP
