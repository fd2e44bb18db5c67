// Repository: Ferry
// Component: StreamControl service tests
// Purpose: Drives the gRPC handlers in-process (no channel) against scripted
//          collaborators.
// Copyright (c) 2025 Ferry

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "stream_service.h"
#include "ferry/provider/ProviderRegistry.hpp"
#include "ferry/session/StreamSessionFactory.hpp"
#include "DeterministicTimeSource.hpp"
#include "FakeContentValidator.hpp"
#include "FakeFetchTransport.hpp"
#include "WaitFor.hpp"

namespace ferry::v1 {
namespace {

using ferry::testing::DeterministicTimeSource;
using ferry::testing::FakeContentValidator;
using ferry::testing::FakeFetchTransport;
using ferry::testing::WaitFor;

class StreamServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto clock = std::make_shared<DeterministicTimeSource>(1'000'000);
    provider::RegistryConfig registry_config;
    registry_config.jitter_bound = 0.0;
    registry_ = std::make_shared<provider::ProviderRegistry>(
        std::vector<provider::ProviderSpec>{{"p0", "fake://p0/{content}/{height}"},
                                            {"p1", "fake://p1/{content}/{height}"},
                                            {"p2", "fake://p2/{content}/{height}"}},
        registry_config, clock);
    session::SessionConfig config;
    config.tick_interval_ms = 0;
    config.auto_quality = false;
    auto factory = std::make_shared<session::StreamSessionFactory>(
        registry_, transport_, validator_, quality::DefaultTierTable(), config, clock);
    service_ = std::make_unique<StreamControlImpl>(factory);
  }

  void TearDown() override { service_->Shutdown(); }

  std::string Open(const std::string& id = "") {
    OpenSessionRequest request;
    request.set_session_id(id);
    OpenSessionResponse response;
    EXPECT_TRUE(service_->OpenSession(nullptr, &request, &response).ok());
    return response.session_id();
  }

  grpc::Status Load(const std::string& id, const std::string& content,
                    CommandResponse* response) {
    LoadRequest request;
    request.set_session_id(id);
    request.set_content_id(content);
    return service_->Load(nullptr, &request, response);
  }

  SessionStatus Status(const std::string& id) {
    GetSessionStatusRequest request;
    request.set_session_id(id);
    SessionStatus status;
    EXPECT_TRUE(service_->GetSessionStatus(nullptr, &request, &status).ok());
    return status;
  }

  std::shared_ptr<provider::ProviderRegistry> registry_;
  std::shared_ptr<FakeFetchTransport> transport_ = std::make_shared<FakeFetchTransport>();
  std::shared_ptr<FakeContentValidator> validator_ = std::make_shared<FakeContentValidator>();
  std::unique_ptr<StreamControlImpl> service_;
};

TEST_F(StreamServiceTest, ReportsApiVersion) {
  ApiVersionRequest request;
  ApiVersion response;
  ASSERT_TRUE(service_->GetVersion(nullptr, &request, &response).ok());
  EXPECT_EQ(response.version(), "1.0.0");
}

TEST_F(StreamServiceTest, OpenSessionAssignsOrAcceptsIds) {
  EXPECT_EQ(Open(), "s1");
  EXPECT_EQ(Open("mine"), "mine");
  EXPECT_EQ(service_->SessionCount(), 2u);

  OpenSessionRequest request;
  request.set_session_id("mine");
  OpenSessionResponse response;
  EXPECT_EQ(service_->OpenSession(nullptr, &request, &response).error_code(),
            grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(service_->SessionCount(), 2u);
}

TEST_F(StreamServiceTest, UnknownSessionIsNotFound) {
  CommandResponse response;
  EXPECT_EQ(Load("nope", "c", &response).error_code(), grpc::StatusCode::NOT_FOUND);

  GetSessionStatusRequest request;
  request.set_session_id("nope");
  SessionStatus status;
  EXPECT_EQ(service_->GetSessionStatus(nullptr, &request, &status).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(StreamServiceTest, BadArgumentsAreRejected) {
  const std::string id = Open();
  CommandResponse response;
  EXPECT_EQ(Load(id, "", &response).error_code(), grpc::StatusCode::INVALID_ARGUMENT);

  SeekRequest seek;
  seek.set_session_id(id);
  seek.set_position_s(-1.0);
  EXPECT_EQ(service_->Seek(nullptr, &seek, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  ForceQualityRequest force;
  force.set_session_id(id);
  force.set_height(1440);
  EXPECT_EQ(service_->ForceQuality(nullptr, &force, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(StreamServiceTest, RejectedCommandIsFailedPrecondition) {
  const std::string id = Open();
  SeekRequest seek;
  seek.set_session_id(id);
  seek.set_position_s(10.0);
  CommandResponse response;
  const grpc::Status status = service_->Seek(nullptr, &seek, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.state(), SESSION_STATE_IDLE);
  EXPECT_EQ(response.message(), "Seek rejected in state Idle");
}

TEST_F(StreamServiceTest, LoadThenStatusReflectsPlayback) {
  const std::string id = Open();
  CommandResponse response;
  ASSERT_TRUE(Load(id, "c", &response).ok());
  EXPECT_TRUE(response.success());

  ASSERT_TRUE(WaitFor([&] { return Status(id).state() == SESSION_STATE_PLAYING; }));
  const SessionStatus status = Status(id);
  EXPECT_EQ(status.content_id(), "c");
  EXPECT_EQ(status.provider(), "p0");
  EXPECT_EQ(status.source_url(), "fake://p0/c/360");
  EXPECT_EQ(status.tier().height(), 360);
  EXPECT_EQ(status.generation(), 1u);
  EXPECT_DOUBLE_EQ(status.duration_s(), 120.0);
  EXPECT_GE(status.buffer_ahead_s(), 2.0);

  ForceQualityRequest force;
  force.set_session_id(id);
  force.set_height(720);
  ASSERT_TRUE(service_->ForceQuality(nullptr, &force, &response).ok());
  EXPECT_EQ(Status(id).tier().height(), 720);

  ReportPlaybackRequest playback;
  playback.set_session_id(id);
  playback.set_cursor_s(1.0);
  playback.mutable_decode_cost()->set_dropped_frames(3);
  ASSERT_TRUE(service_->ReportPlayback(nullptr, &playback, &response).ok());
  EXPECT_DOUBLE_EQ(Status(id).cursor_s(), 1.0);
}

TEST_F(StreamServiceTest, RejectedValidationReportsFailedState) {
  validator_->Reject("not media");
  const std::string id = Open();
  CommandResponse response;
  EXPECT_EQ(Load(id, "c", &response).error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(response.state(), SESSION_STATE_FAILED);

  const SessionStatus status = Status(id);
  ASSERT_EQ(status.recent_errors_size(), 1);
  EXPECT_EQ(status.recent_errors(0).kind(), ERROR_KIND_VALIDATION);
  EXPECT_EQ(status.recent_errors(0).context(), "not media");
  EXPECT_EQ(status.recent_errors(0).at_ms(), 1'000'000);
}

TEST_F(StreamServiceTest, RelayPublishesSequencedEvents) {
  const std::string id = Open();
  SessionEventRelay relay(id);
  auto subscriber = relay.Attach();
  relay.OnStateChanged(session::SessionState::kIdle, session::SessionState::kResolving);
  relay.OnBufferHealth(buffer::BufferHealth::kLow);
  relay.OnFatalError(session::SessionError{session::ErrorKind::kProviderExhausted, "p0", "x"});

  ASSERT_EQ(subscriber->events.size(), 3u);
  EXPECT_EQ(subscriber->events[0].sequence(), 1u);
  EXPECT_EQ(subscriber->events[0].session_id(), id);
  EXPECT_EQ(subscriber->events[0].state_changed().to(), SESSION_STATE_RESOLVING);
  EXPECT_EQ(subscriber->events[1].buffer_health().health(), BUFFER_HEALTH_LOW);
  EXPECT_EQ(subscriber->events[2].fatal_error().kind(), ERROR_KIND_PROVIDER_EXHAUSTED);
  EXPECT_EQ(relay.published(), 3u);

  relay.OnStateChanged(session::SessionState::kFailed, session::SessionState::kDisposed);
  EXPECT_TRUE(subscriber->closed);
  EXPECT_TRUE(relay.Attach()->closed);
}

TEST_F(StreamServiceTest, ProviderAdministration) {
  ListProvidersRequest list;
  ListProvidersResponse providers;
  ASSERT_TRUE(service_->ListProviders(nullptr, &list, &providers).ok());
  ASSERT_EQ(providers.providers_size(), 3);
  EXPECT_EQ(providers.providers(0).name(), "p0");
  EXPECT_DOUBLE_EQ(providers.providers(0).score(), 0.5);

  ProviderRequest request;
  CommandResponse response;
  request.set_name("missing");
  EXPECT_EQ(service_->DisableProvider(nullptr, &request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);

  request.set_name("p1");
  ASSERT_TRUE(service_->DisableProvider(nullptr, &request, &response).ok());
  EXPECT_TRUE(registry_->Get("p1")->manually_disabled);
  ASSERT_TRUE(service_->ReenableProvider(nullptr, &request, &response).ok());
  EXPECT_FALSE(registry_->Get("p1")->manually_disabled);
}

TEST_F(StreamServiceTest, DisposeRemovesTheSession) {
  const std::string id = Open();
  DisposeRequest request;
  request.set_session_id(id);
  CommandResponse response;
  ASSERT_TRUE(service_->Dispose(nullptr, &request, &response).ok());
  EXPECT_EQ(response.state(), SESSION_STATE_DISPOSED);
  EXPECT_EQ(service_->SessionCount(), 0u);
  EXPECT_EQ(service_->Dispose(nullptr, &request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

}  // namespace
}  // namespace ferry::v1
