// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "response_interpreter.hpp"

#include "extension_registry.hpp"
#include "header_utils.hpp"
#include "metadata_codec.hpp"

namespace tus {
namespace client {

namespace {

bool isOkOrNoContent(int status_code) {
  return status_code == status::OK || status_code == status::NO_CONTENT;
}

// Absent header -> std::nullopt; present but not numeric -> PARSE_ERROR
Result<std::optional<uint64_t>> optionalNumericHeader(
  const HeaderMap& headers, const char* name
) {
  auto raw = findHeader(headers, name);
  if (!raw) {
    return Result<std::optional<uint64_t>>::Ok(std::nullopt);
  }
  auto value = parseUnsigned(*raw);
  if (!value) {
    return Result<std::optional<uint64_t>>::Failure(
      Error::parseError(std::string(name) + " is not an unsigned integer: '" + *raw + "'")
    );
  }
  return Result<std::optional<uint64_t>>::Ok(value);
}

Result<uint64_t> requiredNumericHeader(const HeaderMap& headers, const char* name) {
  auto value = optionalNumericHeader(headers, name);
  if (!value.ok()) {
    return Result<uint64_t>::Failure(value.error());
  }
  if (!value.value()) {
    return Result<uint64_t>::Failure(Error::parseError(std::string("missing header ") + name));
  }
  return Result<uint64_t>::Ok(*value.value());
}

}  // namespace

Error ResponseInterpreter::errorForStatus(int status_code) {
  if (status_code == status::NOT_FOUND || status_code == status::GONE) {
    return Error::notFound("resource not found (status " + std::to_string(status_code) + ")");
  }
  return Error::serverError(status_code);
}

Result<UploadInfo> ResponseInterpreter::interpretInspect(const TransportResponse& response) {
  if (!isOkOrNoContent(response.status_code)) {
    // Forbidden, missing and server failures are all reported as NOT_FOUND
    return Result<UploadInfo>::Failure(
      Error::notFound("inspect returned status " + std::to_string(response.status_code))
    );
  }

  auto offset = requiredNumericHeader(response.headers, headers::UPLOAD_OFFSET);
  if (!offset.ok()) {
    return Result<UploadInfo>::Failure(offset.error());
  }
  auto length = optionalNumericHeader(response.headers, headers::UPLOAD_LENGTH);
  if (!length.ok()) {
    return Result<UploadInfo>::Failure(length.error());
  }

  UploadInfo info;
  info.bytes_uploaded = offset.value();
  info.total_size = length.value();

  if (info.total_size && info.bytes_uploaded > *info.total_size) {
    return Result<UploadInfo>::Failure(Error::parseError(
      "upload-offset " + std::to_string(info.bytes_uploaded) + " exceeds upload-length " +
      std::to_string(*info.total_size)
    ));
  }

  if (auto raw_metadata = findHeader(response.headers, headers::UPLOAD_METADATA)) {
    auto metadata = MetadataCodec::decode(*raw_metadata);
    if (!metadata.ok()) {
      return Result<UploadInfo>::Failure(metadata.error());
    }
    info.metadata = std::move(metadata.value());
  }

  return Result<UploadInfo>::Ok(std::move(info));
}

Result<ServerInfo> ResponseInterpreter::interpretDiscover(const TransportResponse& response) {
  if (!isOkOrNoContent(response.status_code)) {
    return Result<ServerInfo>::Failure(Error::serverError(response.status_code));
  }

  ServerInfo info;
  if (auto versions = findHeader(response.headers, headers::TUS_VERSION)) {
    info.supported_versions = splitList(*versions);
  }
  if (auto extensions = findHeader(response.headers, headers::TUS_EXTENSION)) {
    info.extensions = ExtensionRegistry::parse(*extensions);
  }

  auto max_size = optionalNumericHeader(response.headers, headers::TUS_MAX_SIZE);
  if (!max_size.ok()) {
    return Result<ServerInfo>::Failure(max_size.error());
  }
  info.max_upload_size = max_size.value();

  return Result<ServerInfo>::Ok(std::move(info));
}

Result<std::string> ResponseInterpreter::interpretCreate(const TransportResponse& response) {
  if (response.status_code != status::CREATED) {
    return Result<std::string>::Failure(Error::serverError(response.status_code));
  }

  auto location = findHeader(response.headers, headers::LOCATION);
  if (!location || location->empty()) {
    return Result<std::string>::Failure(Error::parseError("missing header Location"));
  }
  return Result<std::string>::Ok(*location);
}

Result<uint64_t> ResponseInterpreter::interpretTransfer(
  const TransportResponse& response, uint64_t expected_offset
) {
  if (response.status_code != status::NO_CONTENT) {
    return Result<uint64_t>::Failure(errorForStatus(response.status_code));
  }

  auto offset = requiredNumericHeader(response.headers, headers::UPLOAD_OFFSET);
  if (!offset.ok()) {
    return offset;
  }
  if (offset.value() != expected_offset) {
    return Result<uint64_t>::Failure(Error::offsetMismatch(expected_offset, offset.value()));
  }
  return offset;
}

Status ResponseInterpreter::interpretDelete(const TransportResponse& response) {
  if (response.status_code != status::NO_CONTENT) {
    return Status::Failure(errorForStatus(response.status_code));
  }
  return Status::Ok();
}

}  // namespace client
}  // namespace tus
