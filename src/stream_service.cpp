// Repository: Ferry
// Component: StreamControl gRPC Service Implementation
// Purpose: Implements the StreamControl service over a StreamSessionFactory.
// Copyright (c) 2025 Ferry

#include "stream_service.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "ferry/util/Logger.hpp"

namespace ferry {
namespace v1 {

using ferry::util::Logger;

namespace {

constexpr char kApiVersion[] = "1.0.0";
// SubscribeEvents re-checks client cancellation at this period.
constexpr auto kSubscriberPollInterval = std::chrono::milliseconds(200);

QualityTier* FillTier(QualityTier* out, const quality::QualityTier& tier) {
  out->set_bitrate_bps(tier.bitrate_bps);
  out->set_height(tier.height);
  return out;
}

void FillError(v1::SessionError* out, const session::SessionError& error) {
  out->set_kind(ToProto(error.kind));
  out->set_provider(error.provider);
  out->set_context(error.context);
  out->set_at_ms(error.at_ms);
}

}  // namespace

SessionState ToProto(session::SessionState state) {
  switch (state) {
    case session::SessionState::kIdle: return SESSION_STATE_IDLE;
    case session::SessionState::kResolving: return SESSION_STATE_RESOLVING;
    case session::SessionState::kLoading: return SESSION_STATE_LOADING;
    case session::SessionState::kPlaying: return SESSION_STATE_PLAYING;
    case session::SessionState::kBuffering: return SESSION_STATE_BUFFERING;
    case session::SessionState::kRecovering: return SESSION_STATE_RECOVERING;
    case session::SessionState::kFailed: return SESSION_STATE_FAILED;
    case session::SessionState::kDisposed: return SESSION_STATE_DISPOSED;
  }
  return SESSION_STATE_UNSPECIFIED;
}

BufferHealth ToProto(buffer::BufferHealth health) {
  switch (health) {
    case buffer::BufferHealth::kHealthy: return BUFFER_HEALTH_HEALTHY;
    case buffer::BufferHealth::kLow: return BUFFER_HEALTH_LOW;
    case buffer::BufferHealth::kStalled: return BUFFER_HEALTH_STALLED;
  }
  return BUFFER_HEALTH_UNSPECIFIED;
}

ErrorKind ToProto(session::ErrorKind kind) {
  switch (kind) {
    case session::ErrorKind::kValidation: return ERROR_KIND_VALIDATION;
    case session::ErrorKind::kFetchTransient: return ERROR_KIND_FETCH_TRANSIENT;
    case session::ErrorKind::kFetchFatal: return ERROR_KIND_FETCH_FATAL;
    case session::ErrorKind::kStallTimeout: return ERROR_KIND_STALL_TIMEOUT;
    case session::ErrorKind::kProviderExhausted: return ERROR_KIND_PROVIDER_EXHAUSTED;
  }
  return ERROR_KIND_UNSPECIFIED;
}

// =============================================================================
// SessionEventRelay
// =============================================================================

SessionEventRelay::SessionEventRelay(std::string session_id)
    : session_id_(std::move(session_id)) {}

std::shared_ptr<SessionEventRelay::Subscriber> SessionEventRelay::Attach() {
  auto subscriber = std::make_shared<Subscriber>();
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    subscriber->closed = true;
  } else {
    subscribers_.push_back(subscriber);
  }
  return subscriber;
}

void SessionEventRelay::Detach(const std::shared_ptr<Subscriber>& subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscriber),
                     subscribers_.end());
}

void SessionEventRelay::Close() {
  std::vector<std::shared_ptr<Subscriber>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    subscribers.swap(subscribers_);
  }
  for (auto& s : subscribers) {
    {
      std::lock_guard<std::mutex> lock(s->mutex);
      s->closed = true;
    }
    s->cv.notify_all();
  }
}

void SessionEventRelay::Publish(SessionEvent event) {
  event.set_session_id(session_id_);
  event.set_sequence(sequence_.fetch_add(1, std::memory_order_acq_rel) + 1);
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& s : subscribers_) {
    {
      std::lock_guard<std::mutex> sub_lock(s->mutex);
      s->events.push_back(event);
    }
    s->cv.notify_one();
  }
}

void SessionEventRelay::OnStateChanged(session::SessionState from,
                                       session::SessionState to) {
  SessionEvent event;
  auto* payload = event.mutable_state_changed();
  payload->set_from(ToProto(from));
  payload->set_to(ToProto(to));
  Publish(std::move(event));
  if (to == session::SessionState::kDisposed) Close();
}

void SessionEventRelay::OnSourceChanged(const session::SourceChange& change) {
  SessionEvent event;
  auto* payload = event.mutable_source_changed();
  payload->set_provider(change.provider);
  payload->set_url(change.url);
  payload->set_cursor_s(change.cursor_s);
  Publish(std::move(event));
}

void SessionEventRelay::OnQualityChanged(const quality::QualityTier& tier) {
  SessionEvent event;
  FillTier(event.mutable_quality_changed()->mutable_tier(), tier);
  Publish(std::move(event));
}

void SessionEventRelay::OnBufferHealth(buffer::BufferHealth health) {
  SessionEvent event;
  event.mutable_buffer_health()->set_health(ToProto(health));
  Publish(std::move(event));
}

void SessionEventRelay::OnRecoverableError(const session::SessionError& error) {
  SessionEvent event;
  FillError(event.mutable_recoverable_error(), error);
  Publish(std::move(event));
}

void SessionEventRelay::OnFatalError(const session::SessionError& error) {
  SessionEvent event;
  FillError(event.mutable_fatal_error(), error);
  Publish(std::move(event));
}

// =============================================================================
// StreamControlImpl
// =============================================================================

StreamControlImpl::StreamControlImpl(
    std::shared_ptr<session::StreamSessionFactory> factory)
    : factory_(std::move(factory)) {}

StreamControlImpl::~StreamControlImpl() { Shutdown(); }

void StreamControlImpl::Shutdown() {
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [id, entry] : sessions) {
    entry->session->Dispose();
    entry->relay->Close();
  }
}

size_t StreamControlImpl::SessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

std::shared_ptr<StreamControlImpl::SessionEntry> StreamControlImpl::Find(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

grpc::Status StreamControlImpl::Finish(bool ok, const std::string& what,
                                       const session::StreamSession& session,
                                       CommandResponse* response) {
  const session::SessionState state = session.state();
  response->set_success(ok);
  response->set_state(ToProto(state));
  if (ok) {
    response->set_message(what + " accepted");
    return grpc::Status::OK;
  }
  const std::string message =
      what + " rejected in state " + session::ToString(state);
  response->set_message(message);
  return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, message);
}

#define FERRY_FIND_SESSION_OR_RETURN(entry, id)                              \
  auto entry = Find(id);                                                     \
  if (!entry) {                                                              \
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "session not found: " + \
                                                         (id));              \
  }

grpc::Status StreamControlImpl::OpenSession(grpc::ServerContext* context,
                                            const OpenSessionRequest* request,
                                            OpenSessionResponse* response) {
  (void)context;
  std::string session_id = request->session_id();
  auto entry = std::make_shared<SessionEntry>();
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (session_id.empty()) {
      do {
        session_id = "s" + std::to_string(next_session_++);
      } while (sessions_.count(session_id) > 0);
    } else if (sessions_.count(session_id) > 0) {
      return grpc::Status(grpc::StatusCode::ALREADY_EXISTS,
                          "session already exists: " + session_id);
    }
    entry->relay = std::make_shared<SessionEventRelay>(session_id);
    entry->session = factory_->Create(session_id, entry->relay);
    sessions_[session_id] = entry;
  }
  Logger::Info("[OpenSession] session=" + session_id);
  response->set_session_id(session_id);
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::Load(grpc::ServerContext* context,
                                     const LoadRequest* request,
                                     CommandResponse* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  if (request->content_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "content_id is empty");
  }
  Logger::Info("[Load] session=" + request->session_id() +
               " content=" + request->content_id());
  // Blocks through validation.
  const bool ok = entry->session->Load(request->content_id());
  return Finish(ok, "Load", *entry->session, response);
}

grpc::Status StreamControlImpl::Seek(grpc::ServerContext* context,
                                     const SeekRequest* request,
                                     CommandResponse* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  if (request->position_s() < 0.0) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "position_s is negative");
  }
  const bool ok = entry->session->Seek(request->position_s());
  return Finish(ok, "Seek", *entry->session, response);
}

grpc::Status StreamControlImpl::ReportPlayback(grpc::ServerContext* context,
                                               const ReportPlaybackRequest* request,
                                               CommandResponse* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  auto& session = *entry->session;
  if (request->has_decode_cost()) {
    const auto& c = request->decode_cost();
    session.ReportDecodeCost(
        quality::DecodeCost{c.complexity(), c.motion(), c.dropped_frames()});
  }
  const bool ok = session.UpdatePlayback(request->cursor_s());
  if (ok && request->waiting()) session.ReportStall();
  return Finish(ok, "ReportPlayback", session, response);
}

grpc::Status StreamControlImpl::SetAutoQuality(grpc::ServerContext* context,
                                               const SetAutoQualityRequest* request,
                                               CommandResponse* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  const bool ok = entry->session->SetAutoQuality(request->enabled());
  return Finish(ok, "SetAutoQuality", *entry->session, response);
}

grpc::Status StreamControlImpl::ForceQuality(grpc::ServerContext* context,
                                             const ForceQualityRequest* request,
                                             CommandResponse* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  const auto& tiers = factory_->tiers();
  auto it = std::find_if(tiers.begin(), tiers.end(), [&](const quality::QualityTier& t) {
    return t.height == request->height();
  });
  if (it == tiers.end()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "no tier with height " + std::to_string(request->height()));
  }
  const bool ok = entry->session->ForceQuality(*it);
  return Finish(ok, "ForceQuality", *entry->session, response);
}

grpc::Status StreamControlImpl::Dispose(grpc::ServerContext* context,
                                        const DisposeRequest* request,
                                        CommandResponse* response) {
  (void)context;
  std::shared_ptr<SessionEntry> entry;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(request->session_id());
    if (it == sessions_.end()) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "session not found: " + request->session_id());
    }
    entry = it->second;
    sessions_.erase(it);
  }
  entry->session->Dispose();
  entry->relay->Close();
  Logger::Info("[Dispose] session=" + request->session_id());
  return Finish(true, "Dispose", *entry->session, response);
}

grpc::Status StreamControlImpl::GetSessionStatus(grpc::ServerContext* context,
                                                 const GetSessionStatusRequest* request,
                                                 SessionStatus* response) {
  (void)context;
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  const auto& session = *entry->session;
  const session::ContentHandle handle = session.Handle();
  response->set_session_id(request->session_id());
  response->set_state(ToProto(session.state()));
  response->set_content_id(handle.content_id);
  response->set_provider(handle.provider);
  response->set_source_url(handle.source_url);
  FillTier(response->mutable_tier(), handle.tier);
  response->set_cursor_s(handle.cursor_s);
  response->set_buffer_ahead_s(session.BufferAheadSeconds());
  response->set_bandwidth_bps(session.BandwidthEstimateBps());
  response->set_generation(handle.generation);
  response->set_duration_s(handle.info.duration_s);
  for (const auto& error : session.RecentErrors()) {
    FillError(response->add_recent_errors(), error);
  }
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::ListProviders(grpc::ServerContext* context,
                                              const ListProvidersRequest* request,
                                              ListProvidersResponse* response) {
  (void)context;
  (void)request;
  for (const auto& p : factory_->registry()->Snapshot()) {
    auto* info = response->add_providers();
    info->set_name(p.name);
    info->set_endpoint_template(p.endpoint_template);
    info->set_score(p.score);
    info->set_consecutive_failures(p.consecutive_failures);
    info->set_cooldown_until_ms(p.cooldown_until_ms);
    info->set_manually_disabled(p.manually_disabled);
    info->set_success_total(p.success_total);
    info->set_failure_total(p.failure_total);
  }
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::DisableProvider(grpc::ServerContext* context,
                                                const ProviderRequest* request,
                                                CommandResponse* response) {
  (void)context;
  const bool ok = factory_->registry()->Disable(request->name());
  response->set_success(ok);
  if (!ok) {
    response->set_message("provider not found: " + request->name());
    return grpc::Status(grpc::StatusCode::NOT_FOUND, response->message());
  }
  response->set_message("provider disabled");
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::ReenableProvider(grpc::ServerContext* context,
                                                 const ProviderRequest* request,
                                                 CommandResponse* response) {
  (void)context;
  const bool ok = factory_->registry()->Reenable(request->name());
  response->set_success(ok);
  if (!ok) {
    response->set_message("provider not found: " + request->name());
    return grpc::Status(grpc::StatusCode::NOT_FOUND, response->message());
  }
  response->set_message("provider re-enabled");
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::GetVersion(grpc::ServerContext* context,
                                           const ApiVersionRequest* request,
                                           ApiVersion* response) {
  (void)context;
  (void)request;
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::SubscribeEvents(grpc::ServerContext* context,
                                                const SubscribeEventsRequest* request,
                                                grpc::ServerWriter<SessionEvent>* writer) {
  FERRY_FIND_SESSION_OR_RETURN(entry, request->session_id());
  auto subscriber = entry->relay->Attach();
  Logger::Info("[SubscribeEvents] attached session=" + request->session_id());

  bool cancelled = false;
  while (true) {
    if (context->IsCancelled()) {
      cancelled = true;
      break;
    }
    std::deque<SessionEvent> batch;
    bool closed = false;
    {
      std::unique_lock<std::mutex> lock(subscriber->mutex);
      subscriber->cv.wait_for(lock, kSubscriberPollInterval, [&] {
        return !subscriber->events.empty() || subscriber->closed;
      });
      batch.swap(subscriber->events);
      closed = subscriber->closed;
    }
    bool write_failed = false;
    for (const auto& event : batch) {
      if (!writer->Write(event)) {
        write_failed = true;
        break;
      }
    }
    if (write_failed) {
      cancelled = true;
      break;
    }
    if (closed) break;
  }

  entry->relay->Detach(subscriber);
  Logger::Info("[SubscribeEvents] detached session=" + request->session_id());
  if (cancelled) {
    return grpc::Status(grpc::StatusCode::CANCELLED, "subscriber went away");
  }
  return grpc::Status::OK;
}

#undef FERRY_FIND_SESSION_OR_RETURN

}  // namespace v1
}  // namespace ferry
