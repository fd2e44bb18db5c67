// Repository: Ferry
// Component: StreamSession types
// Purpose: Session state, configuration, content handle and the typed
//          notification payloads.
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_SESSION_TYPES_HPP_
#define FERRY_SESSION_SESSION_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "ferry/buffer/BufferTracker.hpp"
#include "ferry/fetch/SegmentFetcher.hpp"
#include "ferry/quality/QualityAdvisor.hpp"
#include "ferry/quality/QualityTier.hpp"

namespace ferry::session {

enum class SessionState {
  kIdle = 0,
  kResolving = 1,
  kLoading = 2,
  kPlaying = 3,
  kBuffering = 4,
  kRecovering = 5,
  kFailed = 6,
  kDisposed = 7,
};

const char* ToString(SessionState state);

enum class ErrorKind {
  kValidation,
  kFetchTransient,
  kFetchFatal,
  kStallTimeout,
  kProviderExhausted,
};

const char* ToString(ErrorKind kind);

struct SessionError {
  ErrorKind kind = ErrorKind::kValidation;
  std::string provider;
  std::string context;
  int64_t at_ms = 0;  // session clock; set when recorded
};

struct ContentInfo {
  double duration_s = 0.0;   // <= 0 unknown
  int64_t size_bytes = -1;   // -1 unknown
  std::string mime_type;
};

struct ContentHandle {
  std::string content_id;
  std::string provider;
  quality::QualityTier tier;
  double cursor_s = 0.0;
  std::string source_url;
  uint64_t generation = 0;
  ContentInfo info;
};

struct SourceChange {
  std::string provider;
  std::string url;
  double cursor_s = 0.0;
};

struct SessionConfig {
  buffer::BufferConfig buffer;
  fetch::FetcherConfig fetcher;
  quality::QualityConfig quality;

  // Provider switches per stall episode before Failed.
  int max_provider_retries = 3;
  int64_t recovery_window_ms = 1500;
  int64_t retry_delay_ms = 1000;
  // 0: the embedder drives Tick().
  int64_t tick_interval_ms = 250;
  bool auto_quality = true;
  // Starting tier when no bandwidth estimate exists; 0 = lowest.
  int initial_tier_height = 0;
  // Recent errors kept for status queries, oldest dropped first.
  size_t recent_error_limit = 100;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_SESSION_TYPES_HPP_
