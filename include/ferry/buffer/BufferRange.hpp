// Repository: Ferry
// Component: BufferRange
// Purpose: Sorted, disjoint set of fetched playback intervals [start, end).
// Copyright (c) 2025 Ferry

#ifndef FERRY_BUFFER_BUFFER_RANGE_HPP_
#define FERRY_BUFFER_BUFFER_RANGE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ferry::buffer {

struct TimeRange {
  double start_s = 0.0;
  double end_s = 0.0;
  int64_t bytes = 0;
  int64_t filled_at_ms = 0;  // earliest fill time of any merged part

  double duration() const { return end_s - start_s; }
  bool Contains(double t) const { return t >= start_s && t < end_s; }
};

// Merge() is idempotent and order-independent in the intervals it produces:
// overlapping or touching intervals coalesce. Bytes are added only for the
// part of a new interval not already covered.
class BufferRange {
 public:
  // Gap a cursor may sit in front of a range and still count as "at" it.
  static constexpr double kEdgeToleranceS = 0.05;

  void Merge(const TimeRange& range);

  [[nodiscard]] const std::vector<TimeRange>& ranges() const { return ranges_; }
  [[nodiscard]] bool empty() const { return ranges_.empty(); }

  // Index of the range containing t, or of the range starting within
  // kEdgeToleranceS after t.
  [[nodiscard]] std::optional<size_t> IndexAt(double t) const;
  [[nodiscard]] bool Covers(double t) const { return IndexAt(t).has_value(); }

  // Contiguous seconds from `cursor` to the nearest gap; 0 in a gap.
  [[nodiscard]] double AheadOf(double cursor) const;

  [[nodiscard]] int64_t TotalBytes() const;

  void EraseAt(size_t index);
  void Clear() { ranges_.clear(); }

  // Compares intervals only.
  bool SameIntervals(const BufferRange& other) const;

 private:
  std::vector<TimeRange> ranges_;
};

}  // namespace ferry::buffer

#endif  // FERRY_BUFFER_BUFFER_RANGE_HPP_
