// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_METADATA_CODEC_HPP
#define TUS_METADATA_CODEC_HPP

#include <optional>
#include <string>

#include "tus_error.hpp"
#include "tus_types.hpp"

namespace tus {
namespace client {

/**
 * Codec for the Upload-Metadata header.
 *
 * Wire format: the entries are joined as "key:value" pairs separated by ';'
 * and the whole joined string is base64 encoded once.
 *
 *   {"name": "a.bin", "type": "raw"}  ->  base64("name:a.bin;type:raw")
 *
 * Decoding splits each segment on its first ':' and silently drops segments
 * without one, so a truncated trailing fragment does not fail the header.
 */
class MetadataCodec {
public:
  /**
   * Encode metadata into a header value. Keys and values must not contain
   * ':' or ';' (see isEncodable()).
   */
  static std::string encode(const Metadata& metadata);

  /**
   * Decode a header value. Fails with PARSE_ERROR only when the value is not
   * valid base64.
   */
  static Result<Metadata> decode(const std::string& header_value);

  /**
   * Check that every key and value can be represented on the wire
   *
   * @param offending_key Set to the first key that cannot be encoded
   */
  static bool isEncodable(const Metadata& metadata, std::string& offending_key);
};

/**
 * Standard base64 (RFC 4648, padded) helpers backed by OpenSSL
 */
std::string base64Encode(const std::string& data);

/**
 * @return Decoded bytes, or std::nullopt if data is not valid padded base64
 */
std::optional<std::string> base64Decode(const std::string& data);

}  // namespace client
}  // namespace tus

#endif  // TUS_METADATA_CODEC_HPP
