// Repository: Ferry
// Component: BufferTracker
// Purpose: Playable content ahead of the cursor, buffer health, stall
//          debounce, next-fetch window and byte-budget eviction.
// Copyright (c) 2025 Ferry

#ifndef FERRY_BUFFER_BUFFER_TRACKER_HPP_
#define FERRY_BUFFER_BUFFER_TRACKER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "ferry/buffer/BufferRange.hpp"
#include "ferry/fetch/IFetchTransport.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::buffer {

enum class BufferHealth { kHealthy, kLow, kStalled };

const char* ToString(BufferHealth health);

struct BufferConfig {
  double minimum_s = 2.0;
  double optimal_s = 10.0;
  int64_t stall_timeout_ms = 5000;
  int64_t max_bytes = 50LL * 1024 * 1024;
  double retention_s = 30.0;
  double segment_duration_s = 2.0;
  size_t inflight_limit = 3;
};

// A span to request next: seconds plus the byte range that carries them.
struct FetchWindow {
  double start_s = 0.0;
  double end_s = 0.0;
  fetch::ByteRange bytes;
};

// Not thread-safe. StreamSession owns one and serializes every call under
// its own mutex.
class BufferTracker {
 public:
  BufferTracker(BufferConfig config, std::shared_ptr<time::ITimeSource> clock);

  // duration_s <= 0 means unknown length (no end clamp). size_bytes is the
  // byte length of the current rendition, 0 when unknown. A rendition
  // smaller than duration x rate ends early: fetch windows never reach past
  // size_bytes and the content end moves to the last byte's position.
  void SetContent(double duration_s, double bytes_per_second, int64_t size_bytes = 0);
  void SetRendition(double bytes_per_second, int64_t size_bytes);

  // The rendition ends at end_s regardless of duration and size (a provider
  // refused a range starting there). Kept across rendition changes.
  void CapContentEnd(double end_s);

  // Merges fetched spans and re-checks the seek grace at `cursor`.
  void Observe(double cursor, const std::vector<TimeRange>& new_ranges);

  [[nodiscard]] BufferHealth Health(double cursor) const;
  [[nodiscard]] double BufferAhead(double cursor) const;

  // Call on every evaluation. True exactly once per stall episode, after
  // Stalled has persisted for stall_timeout_ms outside a seek. The episode
  // ends when Health() is no longer Stalled.
  bool PollStall(double cursor);

  // While seeking, "no data at the cursor" reads as Low. The grace ends when
  // data covers the cursor or after stall_timeout_ms.
  void BeginSeek(double target_s);
  [[nodiscard]] bool Seeking() const { return seeking_; }

  [[nodiscard]] std::optional<FetchWindow> NeedsFetch(double cursor) const;
  void MarkRequested(double start_s, double end_s);
  void ReleaseRequested(double start_s, double end_s);
  [[nodiscard]] size_t RequestedCount() const { return requested_.size(); }

  // Drops whole ranges ending at or before cursor - retention_s, oldest
  // first, while TotalBytes() exceeds max_bytes. Never touches the range at
  // the cursor. Returns the number of ranges dropped.
  size_t Evict(double cursor);

  // Byte offset of a playback position at the current rate.
  [[nodiscard]] int64_t ByteOffsetAt(double t) const;

  void Reset();

  [[nodiscard]] const BufferRange& ranges() const { return ranges_; }
  [[nodiscard]] const BufferConfig& config() const { return config_; }
  [[nodiscard]] double duration() const { return duration_s_; }
  [[nodiscard]] int64_t size_bytes() const { return size_bytes_; }

  // Playable end in seconds: the least of duration, size / rate and the cap.
  // 0 when unknown.
  [[nodiscard]] double ContentEnd() const;

 private:
  bool AtContentEnd(double t) const;
  void UpdateSeekGrace(double cursor);

  const BufferConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;

  BufferRange ranges_;
  std::vector<std::pair<double, double>> requested_;

  double duration_s_ = 0.0;
  double bytes_per_second_ = 0.0;
  int64_t size_bytes_ = 0;
  std::optional<double> end_cap_s_;

  bool seeking_ = false;
  int64_t seek_started_ms_ = 0;

  std::optional<int64_t> stall_since_ms_;
  bool stall_signalled_ = false;
};

}  // namespace ferry::buffer

#endif  // FERRY_BUFFER_BUFFER_TRACKER_HPP_
