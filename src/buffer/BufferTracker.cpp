// Repository: Ferry
// Component: BufferTracker
// Purpose: Playable content ahead of the cursor, buffer health, stall
//          debounce, next-fetch window and byte-budget eviction.
// Copyright (c) 2025 Ferry

#include "ferry/buffer/BufferTracker.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "ferry/util/Logger.hpp"

namespace ferry::buffer {

using ferry::util::Logger;

namespace {

constexpr double kSpanEpsilonS = 1e-6;

}  // namespace

const char* ToString(BufferHealth health) {
  switch (health) {
    case BufferHealth::kHealthy: return "healthy";
    case BufferHealth::kLow: return "low";
    case BufferHealth::kStalled: return "stalled";
  }
  return "unknown";
}

BufferTracker::BufferTracker(BufferConfig config,
                             std::shared_ptr<time::ITimeSource> clock)
    : config_(config), clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("BufferTracker: time source is required");
  }
  if (config_.segment_duration_s <= 0.0) {
    throw std::invalid_argument("BufferTracker: segment_duration_s must be > 0");
  }
}

void BufferTracker::SetContent(double duration_s, double bytes_per_second,
                               int64_t size_bytes) {
  duration_s_ = duration_s > 0.0 ? duration_s : 0.0;
  SetRendition(bytes_per_second, size_bytes);
}

void BufferTracker::SetRendition(double bytes_per_second, int64_t size_bytes) {
  bytes_per_second_ = bytes_per_second;
  size_bytes_ = size_bytes > 0 ? size_bytes : 0;
}

void BufferTracker::CapContentEnd(double end_s) {
  const double cap = std::max(0.0, end_s);
  if (!end_cap_s_ || cap < *end_cap_s_) {
    end_cap_s_ = cap;
    Logger::Info("[BufferTracker] CONTENT_END_CAPPED end_s=" + std::to_string(cap));
  }
}

double BufferTracker::ContentEnd() const {
  double end = duration_s_;
  if (size_bytes_ > 0 && bytes_per_second_ > 0.0) {
    const double by_size = static_cast<double>(size_bytes_) / bytes_per_second_;
    end = end > 0.0 ? std::min(end, by_size) : by_size;
  }
  if (end_cap_s_) {
    end = end > 0.0 ? std::min(end, *end_cap_s_) : *end_cap_s_;
  }
  return end;
}

void BufferTracker::Reset() {
  ranges_.Clear();
  requested_.clear();
  duration_s_ = 0.0;
  bytes_per_second_ = 0.0;
  size_bytes_ = 0;
  end_cap_s_.reset();
  seeking_ = false;
  seek_started_ms_ = 0;
  stall_since_ms_.reset();
  stall_signalled_ = false;
}

bool BufferTracker::AtContentEnd(double t) const {
  if (end_cap_s_ && t >= *end_cap_s_ - BufferRange::kEdgeToleranceS) return true;
  const double end = ContentEnd();
  return end > 0.0 && t >= end - BufferRange::kEdgeToleranceS;
}

void BufferTracker::Observe(double cursor, const std::vector<TimeRange>& new_ranges) {
  for (const auto& r : new_ranges) {
    ranges_.Merge(r);
  }
  UpdateSeekGrace(cursor);
}

BufferHealth BufferTracker::Health(double cursor) const {
  if (AtContentEnd(cursor)) return BufferHealth::kHealthy;
  auto idx = ranges_.IndexAt(cursor);
  if (!idx) {
    return seeking_ ? BufferHealth::kLow : BufferHealth::kStalled;
  }
  const TimeRange& r = ranges_.ranges()[*idx];
  if (AtContentEnd(r.end_s)) return BufferHealth::kHealthy;
  return r.end_s - cursor >= config_.optimal_s ? BufferHealth::kHealthy
                                               : BufferHealth::kLow;
}

double BufferTracker::BufferAhead(double cursor) const {
  return ranges_.AheadOf(cursor);
}

void BufferTracker::BeginSeek(double target_s) {
  seeking_ = true;
  seek_started_ms_ = clock_->NowMs();
  stall_since_ms_.reset();
  stall_signalled_ = false;
  std::ostringstream oss;
  oss << "[BufferTracker] SEEK target_s=" << target_s
      << " covered=" << (ranges_.Covers(target_s) ? 1 : 0);
  Logger::Debug(oss.str());
  UpdateSeekGrace(target_s);
}

void BufferTracker::UpdateSeekGrace(double cursor) {
  if (!seeking_) return;
  const bool covered = ranges_.Covers(cursor) || AtContentEnd(cursor);
  const bool expired = clock_->NowMs() - seek_started_ms_ >= config_.stall_timeout_ms;
  if (covered || expired) {
    seeking_ = false;
    if (expired && !covered) {
      Logger::Debug("[BufferTracker] SEEK_GRACE_EXPIRED cursor=" + std::to_string(cursor));
    }
  }
}

bool BufferTracker::PollStall(double cursor) {
  UpdateSeekGrace(cursor);
  if (Health(cursor) != BufferHealth::kStalled) {
    stall_since_ms_.reset();
    stall_signalled_ = false;
    return false;
  }
  const int64_t now = clock_->NowMs();
  if (!stall_since_ms_) {
    stall_since_ms_ = now;
    Logger::Debug("[BufferTracker] STALL_EPISODE_START cursor=" + std::to_string(cursor));
  }
  if (!stall_signalled_ && now - *stall_since_ms_ >= config_.stall_timeout_ms) {
    stall_signalled_ = true;
    std::ostringstream oss;
    oss << "[BufferTracker] STALL_TIMEOUT cursor=" << cursor
        << " stalled_ms=" << (now - *stall_since_ms_);
    Logger::Info(oss.str());
    return true;
  }
  return false;
}

int64_t BufferTracker::ByteOffsetAt(double t) const {
  if (t <= 0.0 || bytes_per_second_ <= 0.0) return 0;
  return static_cast<int64_t>(std::llround(t * bytes_per_second_));
}

std::optional<FetchWindow> BufferTracker::NeedsFetch(double cursor) const {
  if (bytes_per_second_ <= 0.0) return std::nullopt;
  if (requested_.size() >= config_.inflight_limit) return std::nullopt;

  // Buffer edge: walk contiguous buffered ranges and in-flight spans.
  double edge = cursor;
  if (auto idx = ranges_.IndexAt(cursor)) {
    edge = std::max(edge, ranges_.ranges()[*idx].end_s);
  }
  bool progressed = true;
  while (progressed) {
    progressed = false;
    for (const auto& r : ranges_.ranges()) {
      if (r.start_s <= edge + kSpanEpsilonS && r.end_s > edge) {
        edge = r.end_s;
        progressed = true;
      }
    }
    for (const auto& q : requested_) {
      if (q.first <= edge + kSpanEpsilonS && q.second > edge) {
        edge = q.second;
        progressed = true;
      }
    }
  }

  if (edge - cursor >= config_.optimal_s) return std::nullopt;
  const double content_end = ContentEnd();
  const bool bounded = content_end > 0.0 || end_cap_s_.has_value();
  if (bounded && edge >= content_end - kSpanEpsilonS) return std::nullopt;

  const double seg = config_.segment_duration_s;
  double end = (std::floor(edge / seg + kSpanEpsilonS) + 1.0) * seg;
  if (bounded) end = std::min(end, content_end);
  for (const auto& r : ranges_.ranges()) {
    if (r.start_s > edge && r.start_s < end) end = r.start_s;
  }
  for (const auto& q : requested_) {
    if (q.first > edge && q.first < end) end = q.first;
  }
  if (end - edge < kSpanEpsilonS) return std::nullopt;

  FetchWindow window;
  window.start_s = edge;
  window.end_s = end;
  window.bytes.offset = ByteOffsetAt(edge);
  int64_t end_byte = ByteOffsetAt(end);
  if (size_bytes_ > 0) {
    if (window.bytes.offset >= size_bytes_) return std::nullopt;
    end_byte = std::min(end_byte, size_bytes_);
  }
  window.bytes.length = end_byte - window.bytes.offset;
  if (window.bytes.length <= 0) return std::nullopt;
  return window;
}

void BufferTracker::MarkRequested(double start_s, double end_s) {
  requested_.emplace_back(start_s, end_s);
}

void BufferTracker::ReleaseRequested(double start_s, double end_s) {
  auto it = std::find(requested_.begin(), requested_.end(),
                      std::make_pair(start_s, end_s));
  if (it != requested_.end()) requested_.erase(it);
}

size_t BufferTracker::Evict(double cursor) {
  const double horizon = cursor - config_.retention_s;
  size_t dropped = 0;
  while (ranges_.TotalBytes() > config_.max_bytes) {
    std::optional<size_t> victim;
    const auto& rs = ranges_.ranges();
    for (size_t i = 0; i < rs.size(); ++i) {
      if (rs[i].Contains(cursor)) continue;
      if (rs[i].end_s > horizon) continue;
      if (!victim || rs[i].filled_at_ms < rs[*victim].filled_at_ms) {
        victim = i;
      }
    }
    if (!victim) break;
    std::ostringstream oss;
    oss << "[BufferTracker] EVICT start_s=" << rs[*victim].start_s
        << " end_s=" << rs[*victim].end_s
        << " bytes=" << rs[*victim].bytes;
    Logger::Debug(oss.str());
    ranges_.EraseAt(*victim);
    ++dropped;
  }
  return dropped;
}

}  // namespace ferry::buffer
