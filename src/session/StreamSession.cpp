// Repository: Ferry
// Component: StreamSession Implementation
// Purpose: Load/seek/recovery state machine over the delivery components.
// Copyright (c) 2025 Ferry

#include "ferry/session/StreamSession.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

#include "ferry/provider/Provider.hpp"
#include "ferry/util/Logger.hpp"

namespace ferry::session {

using ferry::buffer::BufferHealth;
using ferry::buffer::TimeRange;
using ferry::fetch::Chunk;
using ferry::fetch::ChunkStatus;
using ferry::fetch::FetchError;
using ferry::fetch::FetchErrorKind;
using ferry::fetch::FetchRequest;
using ferry::fetch::RequestId;
using ferry::quality::QualityTier;
using ferry::util::Logger;

const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::kIdle: return "Idle";
    case SessionState::kResolving: return "Resolving";
    case SessionState::kLoading: return "Loading";
    case SessionState::kPlaying: return "Playing";
    case SessionState::kBuffering: return "Buffering";
    case SessionState::kRecovering: return "Recovering";
    case SessionState::kFailed: return "Failed";
    case SessionState::kDisposed: return "Disposed";
  }
  return "Unknown";
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation: return "validation";
    case ErrorKind::kFetchTransient: return "fetch_transient";
    case ErrorKind::kFetchFatal: return "fetch_fatal";
    case ErrorKind::kStallTimeout: return "stall_timeout";
    case ErrorKind::kProviderExhausted: return "provider_exhausted";
  }
  return "unknown";
}

StreamSession::StreamSession(std::string session_id,
                             std::shared_ptr<provider::ProviderRegistry> registry,
                             std::shared_ptr<fetch::IFetchTransport> transport,
                             std::shared_ptr<IContentValidator> validator,
                             std::vector<QualityTier> tiers,
                             SessionConfig config,
                             std::shared_ptr<time::ITimeSource> clock,
                             std::shared_ptr<ISessionListener> listener)
    : session_id_(std::move(session_id)),
      registry_(std::move(registry)),
      validator_(std::move(validator)),
      listener_(std::move(listener)),
      config_(config),
      clock_(std::move(clock)),
      fetcher_(std::make_unique<fetch::SegmentFetcher>(std::move(transport),
                                                       config.fetcher, clock_)),
      tracker_(config.buffer, clock_),
      advisor_(std::move(tiers), config.quality, clock_) {
  if (!registry_) {
    throw std::invalid_argument("StreamSession: provider registry is required");
  }
  advisor_.SetAutoQuality(config_.auto_quality);
  handle_.tier = advisor_.current();
  if (config_.tick_interval_ms > 0) {
    ticker_ = std::thread(&StreamSession::TickerLoop, this);
  }
}

StreamSession::~StreamSession() {
  Dispose();
  if (ticker_.joinable()) {
    if (ticker_.get_id() == std::this_thread::get_id()) {
      ticker_.detach();
    } else {
      ticker_.join();
    }
  }
}

// =============================================================================
// Commands
// =============================================================================

bool StreamSession::Load(const std::string& content_id) {
  uint64_t generation = 0;
  std::string probe_url;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kDisposed) {
      Logger::Warn("[StreamSession] Load rejected: session disposed session=" + session_id_);
      return false;
    }
    ResetForLoadLocked();
    handle_ = ContentHandle{};
    handle_.content_id = content_id;
    handle_.tier = advisor_.current();
    handle_.generation = ++generation_;
    generation = handle_.generation;
    TransitionLocked(SessionState::kResolving);

    if (content_id.empty()) {
      FailLocked(ErrorKind::kValidation, "empty content id");
    } else {
      auto ranked = registry_->Rank({}, last_good_provider_);
      handle_.provider = ranked.front().name;
      probe_url = ResolveUrlLocked(handle_.provider, advisor_.tiers().front());
    }
  }
  DrainEvents();
  if (content_id.empty()) return false;

  std::ostringstream oss;
  oss << "[StreamSession] RESOLVING session=" << session_id_
      << " content=" << content_id << " probe_url=" << probe_url;
  Logger::Info(oss.str());

  ValidationResult result;
  if (validator_) {
    result = validator_->Validate(content_id, probe_url);
  } else {
    result.ok = true;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kResolving || handle_.generation != generation) {
      Logger::Info("[StreamSession] Load superseded session=" + session_id_ +
                   " content=" + content_id);
      return false;
    }
    if (!result.ok) {
      FailLocked(ErrorKind::kValidation, result.reason);
    } else {
      const int64_t now = clock_->NowMs();
      handle_.info = result.info;
      const QualityTier tier =
          advisor_.auto_quality()
              ? advisor_.SelectInitial(fetcher_->BandwidthBps(), config_.initial_tier_height)
              : advisor_.current();
      handle_.tier = tier;
      tracker_.SetContent(result.info.duration_s, tier.BytesPerSecond(),
                          RenditionSizeLocked(tier));

      // Scores may have moved while validating.
      auto ranked = registry_->Rank(fatal_providers_, last_good_provider_);
      handle_.provider = ranked.front().name;
      handle_.source_url = ResolveUrlLocked(handle_.provider, tier);

      TransitionLocked(SessionState::kLoading);
      Event q;
      q.type = Event::Type::kQuality;
      q.tier = tier;
      EmitLocked(std::move(q));
      Event s;
      s.type = Event::Type::kSource;
      s.source = SourceChange{handle_.provider, handle_.source_url, handle_.cursor_s};
      EmitLocked(std::move(s));

      EvaluateLocked(now);
      PumpLocked(now);
    }
  }
  DrainEvents();
  return result.ok;
}

bool StreamSession::Seek(double to_s) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ActiveLocked()) {
      Logger::Warn(std::string("[StreamSession] Seek rejected state=") + ToString(state_) +
                   " session=" + session_id_);
      return false;
    }
    double target = std::max(0.0, to_s);
    if (tracker_.duration() > 0.0) target = std::min(target, tracker_.duration());
    handle_.cursor_s = target;
    tracker_.BeginSeek(target);

    const double lead_end = target + config_.buffer.optimal_s;
    CancelInflightLocked([target, lead_end](const InflightFetch& f) {
      return f.end_s <= target || f.start_s >= lead_end;
    });

    std::ostringstream oss;
    oss << "[StreamSession] SEEK session=" << session_id_ << " to_s=" << target
        << " inflight=" << inflight_.size();
    Logger::Info(oss.str());

    const int64_t now = clock_->NowMs();
    EvaluateLocked(now);
    PumpLocked(now);
  }
  DrainEvents();
  return true;
}

bool StreamSession::UpdatePlayback(double cursor_s) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ActiveLocked()) return false;
    double cursor = std::max(0.0, cursor_s);
    if (tracker_.duration() > 0.0) cursor = std::min(cursor, tracker_.duration());
    handle_.cursor_s = cursor;
    const int64_t now = clock_->NowMs();
    EvaluateLocked(now);
    PumpLocked(now);
    EvictLocked();
  }
  DrainEvents();
  return true;
}

void StreamSession::ReportStall() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ActiveLocked()) return;
    Logger::Debug("[StreamSession] STALL_REPORTED session=" + session_id_);
    const int64_t now = clock_->NowMs();
    EvaluateLocked(now);
    PumpLocked(now);
  }
  DrainEvents();
}

void StreamSession::ReportDecodeCost(const quality::DecodeCost& cost) {
  std::lock_guard<std::mutex> lock(mutex_);
  decode_cost_ = cost;
}

bool StreamSession::SetAutoQuality(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::kDisposed) return false;
  advisor_.SetAutoQuality(enabled);
  Logger::Info(std::string("[StreamSession] AUTO_QUALITY session=") + session_id_ +
               " enabled=" + (enabled ? "1" : "0"));
  return true;
}

bool StreamSession::ForceQuality(const QualityTier& tier) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kDisposed) return false;
    if (!advisor_.ForceTier(tier)) return false;
    const QualityTier pinned = advisor_.current();
    if (pinned != handle_.tier) {
      if (ActiveLocked()) {
        ApplyTierLocked(pinned, "forced");
      } else {
        handle_.tier = pinned;
      }
    }
  }
  DrainEvents();
  return true;
}

void StreamSession::Dispose() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kDisposed) return;
    // Late completions carry the old generation and are dropped.
    handle_.generation = ++generation_;
    inflight_.clear();
    TransitionLocked(SessionState::kDisposed);
  }
  {
    std::lock_guard<std::mutex> lock(ticker_mutex_);
    ticker_stop_ = true;
  }
  ticker_cv_.notify_all();
  DrainEvents();

  if (ticker_.joinable() && ticker_.get_id() != std::this_thread::get_id()) {
    ticker_.join();
  }
  fetcher_->Shutdown();
  Logger::Info("[StreamSession] DISPOSED session=" + session_id_);
}

void StreamSession::Tick() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ActiveLocked()) return;
    const int64_t now = clock_->NowMs();
    EvaluateLocked(now);
    PumpLocked(now);
  }
  DrainEvents();
}

// =============================================================================
// Accessors
// =============================================================================

SessionState StreamSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

ContentHandle StreamSession::Handle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_;
}

double StreamSession::BufferAheadSeconds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracker_.BufferAhead(handle_.cursor_s);
}

double StreamSession::BandwidthEstimateBps() const {
  return fetcher_->BandwidthBps();
}

std::vector<SessionError> StreamSession::RecentErrors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<SessionError>(recent_errors_.begin(), recent_errors_.end());
}

// =============================================================================
// State machine internals (mutex_ held)
// =============================================================================

bool StreamSession::ActiveLocked() const {
  return state_ == SessionState::kLoading || state_ == SessionState::kPlaying ||
         state_ == SessionState::kBuffering || state_ == SessionState::kRecovering;
}

void StreamSession::TransitionLocked(SessionState to) {
  if (state_ == to) return;
  const SessionState from = state_;
  state_ = to;
  std::ostringstream oss;
  oss << "[StreamSession] STATE session=" << session_id_
      << " from=" << ToString(from) << " to=" << ToString(to)
      << " content=" << handle_.content_id
      << " provider=" << handle_.provider
      << " cursor_s=" << handle_.cursor_s;
  Logger::Info(oss.str());
  Event e;
  e.type = Event::Type::kState;
  e.from = from;
  e.to = to;
  EmitLocked(std::move(e));
}

void StreamSession::ResetForLoadLocked() {
  CancelInflightLocked([](const InflightFetch&) { return true; });
  tracker_.Reset();
  last_health_.reset();
  fatal_providers_.clear();
  failed_attempts_ = 0;
  retry_not_before_ms_ = 0;
  recovery_tried_.clear();
  recovery_switches_ = 0;
  recovery_deadline_ms_ = 0;
}

void StreamSession::PumpLocked(int64_t now_ms) {
  if (!ActiveLocked()) return;
  if (now_ms < retry_not_before_ms_) return;

  while (true) {
    auto window = tracker_.NeedsFetch(handle_.cursor_s);
    if (!window) break;

    FetchRequest req;
    req.provider = handle_.provider;
    req.url = handle_.source_url;
    req.content_id = handle_.content_id;
    req.rendition = handle_.tier.height;
    req.range = window->bytes;
    req.start_s = window->start_s;
    req.end_s = window->end_s;
    req.high_priority = tracker_.BufferAhead(handle_.cursor_s) < config_.buffer.minimum_s;

    const uint64_t generation = handle_.generation;
    const RequestId id = fetcher_->Submit(
        std::move(req),
        [this, generation](RequestId rid, std::shared_ptr<const Chunk> chunk,
                           std::optional<FetchError> error) {
          OnFetchComplete(generation, rid, std::move(chunk), std::move(error));
        });
    if (id == 0) break;
    tracker_.MarkRequested(window->start_s, window->end_s);
    inflight_[id] = InflightFetch{window->start_s, window->end_s, handle_.provider};
  }
}

void StreamSession::EvaluateLocked(int64_t now_ms) {
  if (!ActiveLocked()) return;
  const double cursor = handle_.cursor_s;
  const bool stall_signal = tracker_.PollStall(cursor);
  const BufferHealth health = tracker_.Health(cursor);
  if (!last_health_ || *last_health_ != health) {
    last_health_ = health;
    Event e;
    e.type = Event::Type::kHealth;
    e.health = health;
    EmitLocked(std::move(e));
  }

  const double ahead = tracker_.BufferAhead(cursor);
  const bool playable = ahead >= config_.buffer.minimum_s || health == BufferHealth::kHealthy;

  switch (state_) {
    case SessionState::kLoading:
      if (playable) {
        TransitionLocked(SessionState::kPlaying);
      } else if (stall_signal) {
        EnterRecoveryLocked(now_ms);
      }
      break;
    case SessionState::kPlaying:
      if (!playable) TransitionLocked(SessionState::kBuffering);
      break;
    case SessionState::kBuffering:
      if (playable) {
        TransitionLocked(SessionState::kPlaying);
      } else if (stall_signal) {
        EnterRecoveryLocked(now_ms);
      }
      break;
    case SessionState::kRecovering:
      if (playable) {
        std::ostringstream oss;
        oss << "[StreamSession] RECOVERED session=" << session_id_
            << " provider=" << handle_.provider
            << " switches=" << recovery_switches_;
        Logger::Info(oss.str());
        recovery_tried_.clear();
        recovery_switches_ = 0;
        TransitionLocked(SessionState::kPlaying);
      } else if (now_ms >= recovery_deadline_ms_) {
        registry_->ReportOutcome(handle_.provider, false);
        NextRecoveryCandidateLocked(now_ms);
      }
      break;
    default:
      break;
  }

  // A provider switch in progress suppresses quality re-resolution.
  if (state_ == SessionState::kPlaying || state_ == SessionState::kBuffering) {
    ApplyQualityLocked(health);
  }
}

void StreamSession::ApplyQualityLocked(BufferHealth health) {
  if (!advisor_.auto_quality()) return;
  const QualityTier next =
      advisor_.Recommend(fetcher_->BandwidthBps(), health, decode_cost_);
  if (next != handle_.tier) {
    ApplyTierLocked(next, "auto");
  }
}

void StreamSession::ApplyTierLocked(const QualityTier& tier, const char* reason) {
  std::ostringstream oss;
  oss << "[StreamSession] QUALITY session=" << session_id_
      << " from=" << handle_.tier.Label() << " to=" << tier.Label()
      << " reason=" << reason << " cursor_s=" << handle_.cursor_s;
  Logger::Info(oss.str());

  handle_.tier = tier;
  tracker_.SetRendition(tier.BytesPerSecond(), RenditionSizeLocked(tier));
  handle_.source_url = ResolveUrlLocked(handle_.provider, tier);

  Event q;
  q.type = Event::Type::kQuality;
  q.tier = tier;
  EmitLocked(std::move(q));
  Event s;
  s.type = Event::Type::kSource;
  s.source = SourceChange{handle_.provider, handle_.source_url, handle_.cursor_s};
  EmitLocked(std::move(s));
}

void StreamSession::EvictLocked() {
  tracker_.Evict(handle_.cursor_s);
  const int64_t keep_from =
      tracker_.ByteOffsetAt(handle_.cursor_s - config_.buffer.retention_s);
  fetcher_->Evict(handle_.content_id, keep_from, config_.buffer.max_bytes);
}

void StreamSession::EnterRecoveryLocked(int64_t now_ms) {
  std::ostringstream ctx;
  ctx << "no data at cursor_s=" << handle_.cursor_s << " for "
      << config_.buffer.stall_timeout_ms << "ms";
  Logger::Warn("[StreamSession] STALL session=" + session_id_ +
               " provider=" + handle_.provider + " " + ctx.str());

  Event e;
  e.type = Event::Type::kRecoverable;
  e.error = SessionError{ErrorKind::kStallTimeout, handle_.provider, ctx.str()};
  EmitLocked(std::move(e));

  registry_->ReportOutcome(handle_.provider, false);
  recovery_tried_.clear();
  recovery_tried_.insert(handle_.provider);
  recovery_switches_ = 0;
  TransitionLocked(SessionState::kRecovering);
  NextRecoveryCandidateLocked(now_ms);
}

void StreamSession::NextRecoveryCandidateLocked(int64_t now_ms) {
  if (recovery_switches_ >= config_.max_provider_retries) {
    std::ostringstream oss;
    oss << "recovery exhausted after " << recovery_switches_ << " provider switches";
    FailLocked(ErrorKind::kProviderExhausted, oss.str());
    return;
  }
  std::set<std::string> excluding = recovery_tried_;
  excluding.insert(fatal_providers_.begin(), fatal_providers_.end());
  auto ranked = registry_->Rank(excluding);
  if (ranked.empty()) {
    FailLocked(ErrorKind::kProviderExhausted, "no untried provider left for recovery");
    return;
  }
  const std::string next = ranked.front().name;
  recovery_tried_.insert(next);
  ++recovery_switches_;
  SwitchProviderLocked(next, "stall_recovery");
  recovery_deadline_ms_ = now_ms + config_.recovery_window_ms;
  retry_not_before_ms_ = 0;
  PumpLocked(now_ms);
}

void StreamSession::SwitchProviderLocked(const std::string& next, const char* reason) {
  const std::string prev = handle_.provider;
  handle_.provider = next;
  handle_.source_url = ResolveUrlLocked(next, handle_.tier);
  // Work bound to the old provider frees its slots for the new one.
  CancelInflightLocked([&prev](const InflightFetch& f) { return f.provider == prev; });

  std::ostringstream oss;
  oss << "[StreamSession] SOURCE_SWITCH session=" << session_id_
      << " from=" << prev << " to=" << next
      << " reason=" << reason << " cursor_s=" << handle_.cursor_s;
  Logger::Info(oss.str());

  Event e;
  e.type = Event::Type::kSource;
  e.source = SourceChange{handle_.provider, handle_.source_url, handle_.cursor_s};
  EmitLocked(std::move(e));
}

void StreamSession::HandleFetchFailureLocked(const InflightFetch& fetch,
                                             const FetchError& error,
                                             int64_t now_ms) {
  RecordErrorLocked(SessionError{error.kind == FetchErrorKind::kFatal
                                     ? ErrorKind::kFetchFatal
                                     : ErrorKind::kFetchTransient,
                                 fetch.provider, error.message});
  if (error.kind == FetchErrorKind::kFatal) {
    fatal_providers_.insert(fetch.provider);
    Logger::Warn("[StreamSession] CONTENT_ABSENT session=" + session_id_ +
                 " provider=" + fetch.provider + " content=" + handle_.content_id +
                 " detail=\"" + error.message + "\"");
  }
  // Stale failure from a provider already switched away from.
  if (fetch.provider != handle_.provider) return;

  if (state_ == SessionState::kRecovering) {
    NextRecoveryCandidateLocked(now_ms);
    return;
  }

  ++failed_attempts_;
  const int bound = (config_.max_provider_retries + 1) *
                    static_cast<int>(registry_->size());
  if (failed_attempts_ >= bound) {
    std::ostringstream oss;
    oss << failed_attempts_ << " failed fetches without progress, last: "
        << error.message;
    FailLocked(ErrorKind::kProviderExhausted, oss.str());
    return;
  }
  auto ranked = registry_->Rank(fatal_providers_, last_good_provider_);
  if (ranked.empty()) {
    FailLocked(ErrorKind::kProviderExhausted,
               "content absent at every provider: " + error.message);
    return;
  }
  if (ranked.front().name != handle_.provider) {
    SwitchProviderLocked(ranked.front().name, "fetch_failure");
  }
  retry_not_before_ms_ = now_ms + config_.retry_delay_ms;
}

void StreamSession::FailLocked(ErrorKind kind, const std::string& context) {
  std::ostringstream oss;
  oss << "[StreamSession] FAILED session=" << session_id_
      << " kind=" << ToString(kind)
      << " content=" << handle_.content_id
      << " provider=" << handle_.provider
      << " context=\"" << context << "\"";
  Logger::Error(oss.str());

  CancelInflightLocked([](const InflightFetch&) { return true; });
  TransitionLocked(SessionState::kFailed);
  Event e;
  e.type = Event::Type::kFatal;
  e.error = SessionError{kind, handle_.provider, context};
  EmitLocked(std::move(e));
}

void StreamSession::RecordErrorLocked(SessionError error) {
  if (config_.recent_error_limit == 0) return;
  error.at_ms = clock_->NowMs();
  recent_errors_.push_back(std::move(error));
  while (recent_errors_.size() > config_.recent_error_limit) {
    recent_errors_.pop_front();
  }
}

int64_t StreamSession::RenditionSizeLocked(const QualityTier& tier) const {
  const int64_t probed = handle_.info.size_bytes;
  if (probed <= 0) return 0;
  const QualityTier& probe_tier = advisor_.tiers().front();
  if (tier == probe_tier || probe_tier.bitrate_bps <= 0) return probed;
  return static_cast<int64_t>(static_cast<double>(probed) * tier.bitrate_bps /
                              probe_tier.bitrate_bps);
}

void StreamSession::CancelInflightLocked(
    const std::function<bool(const InflightFetch&)>& pred) {
  for (auto it = inflight_.begin(); it != inflight_.end();) {
    if (pred(it->second)) {
      fetcher_->Cancel(it->first);
      tracker_.ReleaseRequested(it->second.start_s, it->second.end_s);
      it = inflight_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string StreamSession::ResolveUrlLocked(const std::string& provider,
                                            const QualityTier& tier) const {
  auto state = registry_->Get(provider);
  if (!state) return {};
  return provider::ResolveEndpoint(state->endpoint_template, handle_.content_id,
                                   tier.height, tier.bitrate_bps);
}

// =============================================================================
// Fetch completion (fetcher worker thread)
// =============================================================================

void StreamSession::OnFetchComplete(uint64_t generation, RequestId id,
                                    std::shared_ptr<const Chunk> chunk,
                                    std::optional<FetchError> error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kDisposed || generation != handle_.generation) return;
    auto it = inflight_.find(id);
    if (it == inflight_.end()) return;  // cancelled by seek/switch
    const InflightFetch fetch = it->second;
    inflight_.erase(it);
    tracker_.ReleaseRequested(fetch.start_s, fetch.end_s);
    const int64_t now = clock_->NowMs();

    if (chunk->status == ChunkStatus::kAborted) {
      PumpLocked(now);
    } else if (error && error->kind == FetchErrorKind::kPastEnd) {
      // The rendition is shorter than its duration suggests.
      std::ostringstream oss;
      oss << "[StreamSession] CONTENT_END session=" << session_id_
          << " provider=" << fetch.provider << " end_s=" << fetch.start_s
          << " detail=\"" << error->message << "\"";
      Logger::Info(oss.str());
      tracker_.CapContentEnd(fetch.start_s);
      EvaluateLocked(now);
      PumpLocked(now);
    } else if (error) {
      registry_->ReportOutcome(fetch.provider, false);
      HandleFetchFailureLocked(fetch, *error, now);
      PumpLocked(now);
    } else {
      if (!chunk->from_cache) {
        registry_->ReportOutcome(fetch.provider, true);
        last_good_provider_ = fetch.provider;
      }
      failed_attempts_ = 0;
      tracker_.Observe(handle_.cursor_s,
                       {TimeRange{fetch.start_s, fetch.end_s, chunk->size, now}});
      EvictLocked();
      EvaluateLocked(now);
      PumpLocked(now);
    }
  }
  DrainEvents();
}

// =============================================================================
// Notification delivery
// =============================================================================

void StreamSession::EmitLocked(Event event) {
  if (event.type == Event::Type::kRecoverable || event.type == Event::Type::kFatal) {
    RecordErrorLocked(event.error);
  }
  pending_events_.push_back(std::move(event));
}

void StreamSession::DrainEvents() {
  std::unique_lock<std::mutex> lock(mutex_);
  // The active dispatcher picks up whatever is queued behind it.
  if (dispatching_) return;
  dispatching_ = true;
  while (!pending_events_.empty()) {
    std::vector<Event> batch;
    batch.swap(pending_events_);
    lock.unlock();
    for (const auto& e : batch) Deliver(e);
    lock.lock();
  }
  dispatching_ = false;
}

void StreamSession::Deliver(const Event& event) {
  if (!listener_) return;
  switch (event.type) {
    case Event::Type::kState:
      listener_->OnStateChanged(event.from, event.to);
      break;
    case Event::Type::kSource:
      listener_->OnSourceChanged(event.source);
      break;
    case Event::Type::kQuality:
      listener_->OnQualityChanged(event.tier);
      break;
    case Event::Type::kHealth:
      listener_->OnBufferHealth(event.health);
      break;
    case Event::Type::kRecoverable:
      listener_->OnRecoverableError(event.error);
      break;
    case Event::Type::kFatal:
      listener_->OnFatalError(event.error);
      break;
  }
}

void StreamSession::TickerLoop() {
  std::unique_lock<std::mutex> lock(ticker_mutex_);
  while (!ticker_stop_) {
    ticker_cv_.wait_for(lock, std::chrono::milliseconds(config_.tick_interval_ms),
                        [this] { return ticker_stop_; });
    if (ticker_stop_) break;
    lock.unlock();
    Tick();
    lock.lock();
  }
}

}  // namespace ferry::session
