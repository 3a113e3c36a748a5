// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "metadata_codec.hpp"

#include <openssl/evp.h>

#include <boost/algorithm/string/trim.hpp>

#include <vector>

#define TUS_LOG_COMPONENT "metadata_codec"
#include <tus_log_macros.hpp>

namespace tus {
namespace client {

namespace {
const char kPairSeparator = ';';
const char kKeyValueSeparator = ':';

bool isBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '+' || c == '/';
}
}  // namespace

std::string base64Encode(const std::string& data) {
  if (data.empty()) {
    return "";
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(
    out.data(), reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size())
  );
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::optional<std::string> base64Decode(const std::string& data) {
  if (data.empty()) {
    return std::string();
  }
  if (data.size() % 4 != 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock tolerates embedded whitespace and misplaced padding, so
  // validate the alphabet first
  size_t padding = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    char c = data[i];
    if (c == '=') {
      if (i < data.size() - 2) {
        return std::nullopt;
      }
      ++padding;
    } else if (padding > 0 || !isBase64Char(c)) {
      return std::nullopt;
    }
  }

  std::vector<unsigned char> out(3 * (data.size() / 4) + 1);
  int written = EVP_DecodeBlock(
    out.data(), reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size())
  );
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts the bytes produced by padding as output
  return std::string(
    reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written) - padding
  );
}

std::string MetadataCodec::encode(const Metadata& metadata) {
  std::string joined;
  for (const auto& [key, value] : metadata) {
    if (!joined.empty()) {
      joined += kPairSeparator;
    }
    joined += key;
    joined += kKeyValueSeparator;
    joined += value;
  }
  return base64Encode(joined);
}

Result<Metadata> MetadataCodec::decode(const std::string& header_value) {
  auto decoded = base64Decode(boost::algorithm::trim_copy(header_value));
  if (!decoded) {
    return Result<Metadata>::Failure(Error::parseError("upload-metadata is not valid base64"));
  }

  Metadata metadata;
  size_t start = 0;
  while (start <= decoded->size()) {
    size_t end = decoded->find(kPairSeparator, start);
    if (end == std::string::npos) {
      end = decoded->size();
    }
    std::string segment = decoded->substr(start, end - start);
    start = end + 1;

    if (segment.empty()) {
      continue;
    }
    size_t colon = segment.find(kKeyValueSeparator);
    if (colon == std::string::npos) {
      TUS_LOG_DEBUG("Dropping metadata fragment without separator" << logging::kv("fragment", segment));
      continue;
    }
    metadata[segment.substr(0, colon)] = segment.substr(colon + 1);
  }

  return Result<Metadata>::Ok(std::move(metadata));
}

bool MetadataCodec::isEncodable(const Metadata& metadata, std::string& offending_key) {
  for (const auto& [key, value] : metadata) {
    if (key.find_first_of(":;") != std::string::npos ||
        value.find_first_of(":;") != std::string::npos) {
      offending_key = key;
      return false;
    }
  }
  return true;
}

}  // namespace client
}  // namespace tus
