// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ResponseInterpreter status and header rules
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "metadata_codec.hpp"
#include "response_interpreter.hpp"

using namespace tus::client;

namespace {

TransportResponse makeResponse(int status, HeaderMap headers = HeaderMap()) {
  TransportResponse response;
  response.status_code = status;
  response.headers = std::move(headers);
  return response;
}

}  // namespace

// ============================================================================
// Inspect
// ============================================================================

TEST(InterpretInspectTest, ReportsOffsetLengthAndMetadata) {
  auto result = ResponseInterpreter::interpretInspect(makeResponse(
    204, {{"upload-length", "2345"},
          {"upload-offset", "1234"},
          {"upload-metadata", base64Encode("key_one:value_one;key_two:value_two;k")}}
  ));
  ASSERT_TRUE(result.ok()) << result.error().toString();

  const UploadInfo& info = result.value();
  EXPECT_EQ(info.bytes_uploaded, 1234u);
  ASSERT_TRUE(info.total_size.has_value());
  EXPECT_EQ(*info.total_size, 2345u);
  ASSERT_TRUE(info.metadata.has_value());
  EXPECT_EQ(info.metadata->size(), 2u);
  EXPECT_EQ(info.metadata->at("key_one"), "value_one");
  EXPECT_EQ(info.metadata->at("key_two"), "value_two");
}

TEST(InterpretInspectTest, AcceptsOkStatus) {
  auto result = ResponseInterpreter::interpretInspect(makeResponse(200, {{"Upload-Offset", "0"}}));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().bytes_uploaded, 0u);
  EXPECT_FALSE(result.value().total_size.has_value());
  EXPECT_FALSE(result.value().metadata.has_value());
}

TEST(InterpretInspectTest, AnyFailureStatusIsNotFound) {
  for (int status : {400, 403, 404, 410, 500, 503}) {
    auto result =
      ResponseInterpreter::interpretInspect(makeResponse(status, {{"upload-offset", "0"}}));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), ErrorCode::NOT_FOUND) << "status " << status;
  }
}

TEST(InterpretInspectTest, MissingOffsetIsParseError) {
  auto result = ResponseInterpreter::interpretInspect(makeResponse(204, {{"upload-length", "5"}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.code(), ErrorCode::PARSE_ERROR);
}

TEST(InterpretInspectTest, NonNumericHeadersAreParseErrors) {
  auto bad_offset =
    ResponseInterpreter::interpretInspect(makeResponse(204, {{"upload-offset", "abc"}}));
  EXPECT_EQ(bad_offset.code(), ErrorCode::PARSE_ERROR);

  auto bad_length = ResponseInterpreter::interpretInspect(
    makeResponse(204, {{"upload-offset", "1"}, {"upload-length", "-5"}})
  );
  EXPECT_EQ(bad_length.code(), ErrorCode::PARSE_ERROR);
}

TEST(InterpretInspectTest, OffsetBeyondLengthIsParseError) {
  auto result = ResponseInterpreter::interpretInspect(
    makeResponse(204, {{"upload-offset", "10"}, {"upload-length", "5"}})
  );
  EXPECT_EQ(result.code(), ErrorCode::PARSE_ERROR);
}

TEST(InterpretInspectTest, MalformedMetadataIsParseError) {
  auto result = ResponseInterpreter::interpretInspect(
    makeResponse(204, {{"upload-offset", "1"}, {"upload-metadata", "%%%"}})
  );
  EXPECT_EQ(result.code(), ErrorCode::PARSE_ERROR);
}

// ============================================================================
// Discover
// ============================================================================

TEST(InterpretDiscoverTest, ReportsVersionsExtensionsAndMaxSize) {
  auto result = ResponseInterpreter::interpretDiscover(makeResponse(
    204, {{"tus-version", "1.0.0,0.2.2"},
          {"tus-extension", "creation, termination"},
          {"tus-max-size", "12345"}}
  ));
  ASSERT_TRUE(result.ok());

  std::vector<std::string> versions{"1.0.0", "0.2.2"};
  std::vector<Extension> extensions{Extension::CREATION, Extension::TERMINATION};
  EXPECT_EQ(result.value().supported_versions, versions);
  EXPECT_EQ(result.value().extensions, extensions);
  ASSERT_TRUE(result.value().max_upload_size.has_value());
  EXPECT_EQ(*result.value().max_upload_size, 12345u);
}

TEST(InterpretDiscoverTest, HeadersAreOptional) {
  auto result = ResponseInterpreter::interpretDiscover(makeResponse(200));
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value().supported_versions.empty());
  EXPECT_TRUE(result.value().extensions.empty());
  EXPECT_FALSE(result.value().max_upload_size.has_value());
}

TEST(InterpretDiscoverTest, FailureStatusIsServerError) {
  auto result = ResponseInterpreter::interpretDiscover(makeResponse(405));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.code(), ErrorCode::SERVER_ERROR);
  EXPECT_EQ(result.error().status_code, 405);
}

TEST(InterpretDiscoverTest, NonNumericMaxSizeIsParseError) {
  auto result = ResponseInterpreter::interpretDiscover(makeResponse(204, {{"tus-max-size", "big"}}));
  EXPECT_EQ(result.code(), ErrorCode::PARSE_ERROR);
}

// ============================================================================
// Create
// ============================================================================

TEST(InterpretCreateTest, ReturnsLocation) {
  auto result =
    ResponseInterpreter::interpretCreate(makeResponse(201, {{"location", "/something_else"}}));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value(), "/something_else");
}

TEST(InterpretCreateTest, OnlyCreatedStatusSucceeds) {
  for (int status : {200, 204, 400, 500}) {
    auto result =
      ResponseInterpreter::interpretCreate(makeResponse(status, {{"location", "/files/a"}}));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), ErrorCode::SERVER_ERROR);
    EXPECT_EQ(result.error().status_code, status);
  }
}

TEST(InterpretCreateTest, MissingLocationIsParseError) {
  EXPECT_EQ(ResponseInterpreter::interpretCreate(makeResponse(201)).code(), ErrorCode::PARSE_ERROR);
  EXPECT_EQ(
    ResponseInterpreter::interpretCreate(makeResponse(201, {{"Location", ""}})).code(),
    ErrorCode::PARSE_ERROR
  );
}

// ============================================================================
// Transfer
// ============================================================================

TEST(InterpretTransferTest, AcceptsExpectedOffset) {
  auto result =
    ResponseInterpreter::interpretTransfer(makeResponse(204, {{"upload-offset", "100"}}), 100);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value(), 100u);
}

TEST(InterpretTransferTest, DifferentOffsetIsMismatch) {
  auto result =
    ResponseInterpreter::interpretTransfer(makeResponse(204, {{"upload-offset", "90"}}), 100);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.code(), ErrorCode::OFFSET_MISMATCH);
  EXPECT_EQ(result.error().expected_offset, 100u);
  EXPECT_EQ(result.error().actual_offset, 90u);
}

TEST(InterpretTransferTest, MissingOffsetIsParseError) {
  auto result = ResponseInterpreter::interpretTransfer(makeResponse(204), 100);
  EXPECT_EQ(result.code(), ErrorCode::PARSE_ERROR);
}

TEST(InterpretTransferTest, StatusMapping) {
  EXPECT_EQ(
    ResponseInterpreter::interpretTransfer(makeResponse(404), 1).code(), ErrorCode::NOT_FOUND
  );
  EXPECT_EQ(
    ResponseInterpreter::interpretTransfer(makeResponse(410), 1).code(), ErrorCode::NOT_FOUND
  );

  auto conflict = ResponseInterpreter::interpretTransfer(makeResponse(409), 1);
  EXPECT_EQ(conflict.code(), ErrorCode::SERVER_ERROR);
  EXPECT_EQ(conflict.error().status_code, 409);

  // Transfer success is exactly 204
  EXPECT_EQ(
    ResponseInterpreter::interpretTransfer(makeResponse(200, {{"upload-offset", "1"}}), 1).code(),
    ErrorCode::SERVER_ERROR
  );
}

// ============================================================================
// Delete
// ============================================================================

TEST(InterpretDeleteTest, NoContentSucceeds) {
  EXPECT_TRUE(ResponseInterpreter::interpretDelete(makeResponse(204)).ok());
}

TEST(InterpretDeleteTest, StatusMapping) {
  EXPECT_EQ(ResponseInterpreter::interpretDelete(makeResponse(404)).code(), ErrorCode::NOT_FOUND);
  EXPECT_EQ(ResponseInterpreter::interpretDelete(makeResponse(410)).code(), ErrorCode::NOT_FOUND);

  Status status = ResponseInterpreter::interpretDelete(makeResponse(500));
  EXPECT_EQ(status.code(), ErrorCode::SERVER_ERROR);
  EXPECT_EQ(status.error().status_code, 500);
}
