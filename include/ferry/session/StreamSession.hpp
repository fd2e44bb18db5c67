// Repository: Ferry
// Component: StreamSession
// Purpose: Orchestrator state machine tying provider ranking, segment
//          fetching, buffer tracking and quality advice together. The single
//          surface the presentation layer talks to.
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_STREAM_SESSION_HPP_
#define FERRY_SESSION_STREAM_SESSION_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "ferry/buffer/BufferTracker.hpp"
#include "ferry/fetch/IFetchTransport.hpp"
#include "ferry/fetch/SegmentFetcher.hpp"
#include "ferry/provider/ProviderRegistry.hpp"
#include "ferry/quality/QualityAdvisor.hpp"
#include "ferry/session/IContentValidator.hpp"
#include "ferry/session/ISessionListener.hpp"
#include "ferry/session/SessionTypes.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::session {

// One content handle at a time.
//
//   Idle -> Load -> Resolving -> Loading -> Playing <-> Buffering
//   Buffering --stall timeout--> Recovering --buffer >= minimum--> Playing
//   Recovering --switch budget exhausted--> Failed
//   any --Dispose--> Disposed
//
// Commands return false (and log) when the current state rejects them.
// All state lives under mutex_; notifications are queued under it and
// delivered after it is released.
class StreamSession {
 public:
  StreamSession(std::string session_id,
                std::shared_ptr<provider::ProviderRegistry> registry,
                std::shared_ptr<fetch::IFetchTransport> transport,
                std::shared_ptr<IContentValidator> validator,
                std::vector<quality::QualityTier> tiers,
                SessionConfig config,
                std::shared_ptr<time::ITimeSource> clock,
                std::shared_ptr<ISessionListener> listener);
  ~StreamSession();

  StreamSession(const StreamSession&) = delete;
  StreamSession& operator=(const StreamSession&) = delete;

  // Validates synchronously (outside the lock), then starts filling the
  // buffer. Supersedes any current content. Returns false on rejection or
  // validation failure (the latter also moves the session to Failed).
  bool Load(const std::string& content_id);
  bool Seek(double to_s);
  // Observed playback position from the presentation layer.
  bool UpdatePlayback(double cursor_s);
  // Presentation-side "waiting" event: re-evaluates buffer health now.
  void ReportStall();
  void ReportDecodeCost(const quality::DecodeCost& cost);
  bool SetAutoQuality(bool enabled);
  bool ForceQuality(const quality::QualityTier& tier);
  // Idempotent; safe from any state.
  void Dispose();

  // Evaluates timers (stall, recovery window, retry delay) and quality.
  // Driven by the internal ticker when tick_interval_ms > 0.
  void Tick();

  [[nodiscard]] SessionState state() const;
  [[nodiscard]] ContentHandle Handle() const;
  [[nodiscard]] double BufferAheadSeconds() const;
  [[nodiscard]] double BandwidthEstimateBps() const;
  // Fetch failures, stalls and fatal errors, oldest first, at most
  // recent_error_limit. Survives Load.
  [[nodiscard]] std::vector<SessionError> RecentErrors() const;
  [[nodiscard]] const std::string& session_id() const { return session_id_; }

 private:
  struct InflightFetch {
    double start_s = 0.0;
    double end_s = 0.0;
    std::string provider;
  };

  struct Event {
    enum class Type { kState, kSource, kQuality, kHealth, kRecoverable, kFatal };
    Type type = Type::kState;
    SessionState from = SessionState::kIdle;
    SessionState to = SessionState::kIdle;
    SourceChange source;
    quality::QualityTier tier;
    buffer::BufferHealth health = buffer::BufferHealth::kHealthy;
    SessionError error;
  };

  bool ActiveLocked() const;
  void TransitionLocked(SessionState to);
  void EmitLocked(Event event);
  void DrainEvents();
  void Deliver(const Event& event);

  void ResetForLoadLocked();
  void PumpLocked(int64_t now_ms);
  void EvaluateLocked(int64_t now_ms);
  void ApplyQualityLocked(buffer::BufferHealth health);
  void ApplyTierLocked(const quality::QualityTier& tier, const char* reason);
  void EvictLocked();

  void EnterRecoveryLocked(int64_t now_ms);
  void NextRecoveryCandidateLocked(int64_t now_ms);
  void SwitchProviderLocked(const std::string& next, const char* reason);
  void HandleFetchFailureLocked(const InflightFetch& fetch,
                                const fetch::FetchError& error,
                                int64_t now_ms);
  void FailLocked(ErrorKind kind, const std::string& context);
  void RecordErrorLocked(SessionError error);
  // Byte length of `tier`'s rendition, scaled from the probed (lowest) tier.
  // 0 when the probe reported no size.
  int64_t RenditionSizeLocked(const quality::QualityTier& tier) const;
  void CancelInflightLocked(const std::function<bool(const InflightFetch&)>& pred);

  void OnFetchComplete(uint64_t generation, fetch::RequestId id,
                       std::shared_ptr<const fetch::Chunk> chunk,
                       std::optional<fetch::FetchError> error);

  std::string ResolveUrlLocked(const std::string& provider,
                               const quality::QualityTier& tier) const;
  void TickerLoop();

  const std::string session_id_;
  std::shared_ptr<provider::ProviderRegistry> registry_;
  std::shared_ptr<IContentValidator> validator_;
  std::shared_ptr<ISessionListener> listener_;
  const SessionConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;
  std::unique_ptr<fetch::SegmentFetcher> fetcher_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::kIdle;
  ContentHandle handle_;
  uint64_t generation_ = 0;
  buffer::BufferTracker tracker_;
  quality::QualityAdvisor advisor_;
  std::optional<buffer::BufferHealth> last_health_;
  std::optional<quality::DecodeCost> decode_cost_;

  std::unordered_map<fetch::RequestId, InflightFetch> inflight_;
  // Providers that answered "not here" for the current content.
  std::set<std::string> fatal_providers_;
  std::optional<std::string> last_good_provider_;
  int failed_attempts_ = 0;
  int64_t retry_not_before_ms_ = 0;

  // Current recovery episode.
  std::set<std::string> recovery_tried_;
  int recovery_switches_ = 0;
  int64_t recovery_deadline_ms_ = 0;

  std::deque<SessionError> recent_errors_;

  std::vector<Event> pending_events_;
  bool dispatching_ = false;

  std::mutex ticker_mutex_;
  std::condition_variable ticker_cv_;
  bool ticker_stop_ = false;
  std::thread ticker_;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_STREAM_SESSION_HPP_
