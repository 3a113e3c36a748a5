// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for UploadEngine and UploadSession
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "client_mocks.hpp"
#include "fake_transport.hpp"
#include "test_helpers.hpp"
#include "upload_engine.hpp"
#include "upload_stream_impl.hpp"

using namespace tus::client;
using namespace tus::client::test;
using ::testing::_;
using ::testing::Return;

namespace {

HeaderMap baseHeaders() {
  return {{"Tus-Resumable", "1.0.0"}};
}

}  // namespace

class UploadEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    data_ = makeTestData(TEST_STREAM_SIZE);
    transport_.status_code = 204;
  }

  UploadSession makeSession(uint64_t chunk_size, uint64_t start_offset = 0) {
    auto stream = std::make_unique<MemoryUploadStream>(data_);
    stream->seek(start_offset);
    return UploadSession("/files/abc", std::move(stream), start_offset, data_.size(), chunk_size);
  }

  std::vector<char> data_;
  FakeTransport transport_;
};

// ============================================================================
// Session state machine
// ============================================================================

TEST(UploadSessionTest, ValidTransitions) {
  EXPECT_TRUE(UploadSession::isValidTransition(UploadState::CREATED, UploadState::TRANSFERRING));
  EXPECT_TRUE(UploadSession::isValidTransition(UploadState::TRANSFERRING, UploadState::COMPLETED));
  EXPECT_TRUE(UploadSession::isValidTransition(UploadState::TRANSFERRING, UploadState::FAILED));
}

TEST(UploadSessionTest, InvalidTransitions) {
  EXPECT_FALSE(UploadSession::isValidTransition(UploadState::CREATED, UploadState::COMPLETED));
  EXPECT_FALSE(UploadSession::isValidTransition(UploadState::CREATED, UploadState::FAILED));
  EXPECT_FALSE(UploadSession::isValidTransition(UploadState::COMPLETED, UploadState::FAILED));
  EXPECT_FALSE(UploadSession::isValidTransition(UploadState::FAILED, UploadState::TRANSFERRING));
}

TEST(UploadSessionTest, TransitionReportsError) {
  UploadSession session("/f", std::make_unique<MemoryUploadStream>(std::vector<char>()), 0, 0, 1);
  std::string error;
  EXPECT_FALSE(session.transitionTo(UploadState::COMPLETED, error));
  EXPECT_EQ(error, "invalid upload transition created -> completed");
  EXPECT_EQ(session.state(), UploadState::CREATED);
}

TEST(UploadSessionTest, StateNames) {
  EXPECT_EQ(uploadStateToString(UploadState::CREATED), "created");
  EXPECT_EQ(uploadStateToString(UploadState::TRANSFERRING), "transferring");
  EXPECT_EQ(uploadStateToString(UploadState::COMPLETED), "completed");
  EXPECT_EQ(uploadStateToString(UploadState::FAILED), "failed");
}

// ============================================================================
// Successful transfers
// ============================================================================

TEST_F(UploadEngineTest, DefaultChunkSizeCompletes) {
  auto session = makeSession(DEFAULT_CHUNK_SIZE);
  UploadEngine engine(transport_, baseHeaders());

  Status status = engine.run(session);

  ASSERT_TRUE(status.ok()) << status.error().toString();
  EXPECT_EQ(session.state(), UploadState::COMPLETED);
  EXPECT_EQ(session.offset(), TEST_STREAM_SIZE);
  // Stream is smaller than one default chunk
  EXPECT_EQ(session.roundTrips(), 1u);
  EXPECT_EQ(transport_.received, std::string(data_.begin(), data_.end()));
}

TEST_F(UploadEngineTest, OddChunkSizeEndsWithPartialChunk) {
  auto session = makeSession(ODD_CHUNK_SIZE);
  UploadEngine engine(transport_, baseHeaders());

  std::vector<uint64_t> offsets;
  UploadCallbacks callbacks;
  callbacks.on_progress = [&offsets](uint64_t uploaded, uint64_t total) {
    EXPECT_EQ(total, TEST_STREAM_SIZE);
    offsets.push_back(uploaded);
  };

  Status status = engine.run(session, callbacks);

  ASSERT_TRUE(status.ok()) << status.error().toString();
  EXPECT_EQ(session.state(), UploadState::COMPLETED);
  EXPECT_EQ(session.offset(), TEST_STREAM_SIZE);

  // 781312 = 3 * 226395 + 102127
  std::vector<uint64_t> expected{
    ODD_CHUNK_SIZE, 2 * ODD_CHUNK_SIZE, 3 * ODD_CHUNK_SIZE, TEST_STREAM_SIZE
  };
  EXPECT_EQ(offsets, expected);

  ASSERT_EQ(transport_.requests.size(), 4u);
  EXPECT_EQ(transport_.requests.back().body_size, TEST_STREAM_SIZE - 3 * ODD_CHUNK_SIZE);
  EXPECT_EQ(transport_.received, std::string(data_.begin(), data_.end()));
}

TEST_F(UploadEngineTest, OffsetsStrictlyIncreaseByBytesSent) {
  auto session = makeSession(4096);
  UploadEngine engine(transport_, baseHeaders());

  ASSERT_TRUE(engine.run(session).ok());

  uint64_t expected_offset = 0;
  for (const auto& request : transport_.requests) {
    EXPECT_EQ(request.operation, Operation::TRANSFER);
    EXPECT_EQ(findHeader(request.headers, "Upload-Offset").value(), std::to_string(expected_offset));
    EXPECT_GT(request.body_size, 0u);
    expected_offset += request.body_size;
  }
  EXPECT_EQ(expected_offset, TEST_STREAM_SIZE);
}

TEST_F(UploadEngineTest, TransferRequestsCarryProtocolHeaders) {
  auto session = makeSession(DEFAULT_CHUNK_SIZE);
  UploadEngine engine(transport_, {{"Tus-Resumable", "1.0.0"}, {"Authorization", "Bearer t"}});

  ASSERT_TRUE(engine.run(session).ok());
  ASSERT_EQ(transport_.requests.size(), 1u);

  const auto& headers = transport_.requests[0].headers;
  EXPECT_EQ(transport_.requests[0].url, "/files/abc");
  EXPECT_EQ(findHeader(headers, "tus-resumable").value(), "1.0.0");
  EXPECT_EQ(findHeader(headers, "content-type").value(), "application/offset+octet-stream");
  EXPECT_EQ(findHeader(headers, "upload-offset").value(), "0");
  EXPECT_EQ(findHeader(headers, "authorization").value(), "Bearer t");
}

TEST_F(UploadEngineTest, ResumesFromStartOffset) {
  const uint64_t start = 300000;
  auto session = makeSession(ODD_CHUNK_SIZE, start);
  UploadEngine engine(transport_, baseHeaders());

  ASSERT_TRUE(engine.run(session).ok());
  EXPECT_EQ(session.offset(), TEST_STREAM_SIZE);
  EXPECT_EQ(findHeader(transport_.requests[0].headers, "upload-offset").value(), "300000");
  EXPECT_EQ(transport_.received, std::string(data_.begin() + start, data_.end()));
}

TEST_F(UploadEngineTest, AlreadyCompleteIssuesNoRequests) {
  auto session = makeSession(ODD_CHUNK_SIZE, TEST_STREAM_SIZE);
  UploadEngine engine(transport_, baseHeaders());

  ASSERT_TRUE(engine.run(session).ok());
  EXPECT_EQ(session.state(), UploadState::COMPLETED);
  EXPECT_TRUE(transport_.requests.empty());
}

// ============================================================================
// Configuration errors
// ============================================================================

TEST_F(UploadEngineTest, ZeroChunkSizeIsConfigError) {
  auto session = makeSession(0);
  UploadEngine engine(transport_, baseHeaders());

  Status status = engine.run(session);
  EXPECT_EQ(status.code(), ErrorCode::CONFIG_ERROR);
  EXPECT_EQ(session.state(), UploadState::CREATED);
  EXPECT_TRUE(transport_.requests.empty());
}

TEST_F(UploadEngineTest, StartBeyondTotalIsConfigError) {
  UploadSession session(
    "/files/abc", std::make_unique<MemoryUploadStream>(data_), TEST_STREAM_SIZE + 1,
    TEST_STREAM_SIZE, ODD_CHUNK_SIZE
  );
  UploadEngine engine(transport_, baseHeaders());

  EXPECT_EQ(engine.run(session).code(), ErrorCode::CONFIG_ERROR);
  EXPECT_EQ(session.state(), UploadState::CREATED);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(UploadEngineTest, StreamShorterThanTotalIsIoError) {
  UploadSession session(
    "/files/abc", std::make_unique<MemoryUploadStream>(makeTestData(1000)), 0, 5000, 400
  );
  UploadEngine engine(transport_, baseHeaders());

  Status status = engine.run(session);
  EXPECT_EQ(status.code(), ErrorCode::IO_ERROR);
  EXPECT_EQ(session.state(), UploadState::FAILED);
  EXPECT_EQ(session.offset(), 1000u);
  EXPECT_EQ(transport_.requests.size(), 3u);
}

TEST(UploadEngineMockTest, ReadFailureIsIoError) {
  MockTransport transport;
  auto stream = std::make_unique<MockUploadStream>();
  EXPECT_CALL(*stream, read(_, _)).WillOnce(Return(-1));
  EXPECT_CALL(transport, perform(_)).Times(0);

  UploadSession session("/files/abc", std::move(stream), 0, 100, 10);
  UploadEngine engine(transport, baseHeaders());

  EXPECT_EQ(engine.run(session).code(), ErrorCode::IO_ERROR);
  EXPECT_EQ(session.state(), UploadState::FAILED);
}

TEST(UploadEngineMockTest, OffsetMismatchStopsWithoutRetry) {
  MockTransport transport;
  EXPECT_CALL(transport, perform(_))
    .WillOnce(Return(respond(204, "Upload-Offset", "10")))
    .WillOnce(Return(respond(204, "Upload-Offset", "15")));

  UploadSession session(
    "/files/abc", std::make_unique<MemoryUploadStream>(makeTestData(100)), 0, 100, 10
  );
  UploadEngine engine(transport, baseHeaders());

  Status status = engine.run(session);
  ASSERT_EQ(status.code(), ErrorCode::OFFSET_MISMATCH);
  EXPECT_EQ(status.error().expected_offset, 20u);
  EXPECT_EQ(status.error().actual_offset, 15u);
  EXPECT_EQ(session.offset(), 10u);
  EXPECT_EQ(session.state(), UploadState::FAILED);
}

TEST(UploadEngineMockTest, TransportFailureIsSurfaced) {
  MockTransport transport;
  EXPECT_CALL(transport, perform(_))
    .WillOnce(Return(TransportResult::Failure("connection reset")));

  UploadSession session(
    "/files/abc", std::make_unique<MemoryUploadStream>(makeTestData(100)), 0, 100, 50
  );
  UploadEngine engine(transport, baseHeaders());

  Status status = engine.run(session);
  EXPECT_EQ(status.code(), ErrorCode::TRANSPORT_ERROR);
  EXPECT_EQ(status.error().message, "connection reset");
  EXPECT_EQ(session.state(), UploadState::FAILED);
  EXPECT_EQ(session.offset(), 0u);
}

TEST(UploadEngineMockTest, ServerStatusIsSurfaced) {
  MockTransport transport;
  EXPECT_CALL(transport, perform(_)).WillOnce(Return(respond(404)));

  UploadSession session(
    "/files/abc", std::make_unique<MemoryUploadStream>(makeTestData(100)), 0, 100, 50
  );
  UploadEngine engine(transport, baseHeaders());

  EXPECT_EQ(engine.run(session).code(), ErrorCode::NOT_FOUND);
}

TEST_F(UploadEngineTest, CancellationStopsBeforeNextRequest) {
  auto session = makeSession(ODD_CHUNK_SIZE);
  UploadEngine engine(transport_, baseHeaders());

  bool cancel = false;
  UploadCallbacks callbacks;
  callbacks.on_progress = [&cancel](uint64_t, uint64_t) { cancel = true; };
  callbacks.is_cancelled = [&cancel]() { return cancel; };

  Status status = engine.run(session, callbacks);
  EXPECT_EQ(status.code(), ErrorCode::CANCELLED);
  EXPECT_EQ(session.state(), UploadState::FAILED);
  EXPECT_EQ(session.offset(), ODD_CHUNK_SIZE);
  EXPECT_EQ(transport_.requests.size(), 1u);
}
