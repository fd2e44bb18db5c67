// Repository: Ferry
// Component: BufferRange
// Copyright (c) 2025 Ferry

#include "ferry/buffer/BufferRange.hpp"

#include <algorithm>
#include <cmath>

namespace ferry::buffer {

namespace {

constexpr double kTouchEpsilonS = 1e-9;

}  // namespace

void BufferRange::Merge(const TimeRange& range) {
  if (!(range.end_s > range.start_s)) return;

  // Part of `range` not already covered decides how many bytes are new.
  double uncovered = range.duration();
  for (const auto& r : ranges_) {
    const double lo = std::max(r.start_s, range.start_s);
    const double hi = std::min(r.end_s, range.end_s);
    if (hi > lo) uncovered -= (hi - lo);
  }
  uncovered = std::max(0.0, uncovered);

  TimeRange merged = range;
  merged.bytes = static_cast<int64_t>(
      std::llround(static_cast<double>(range.bytes) * uncovered / range.duration()));

  std::vector<TimeRange> out;
  out.reserve(ranges_.size() + 1);
  for (const auto& r : ranges_) {
    const bool touches = r.start_s <= merged.end_s + kTouchEpsilonS &&
                         r.end_s >= merged.start_s - kTouchEpsilonS;
    if (touches) {
      merged.start_s = std::min(merged.start_s, r.start_s);
      merged.end_s = std::max(merged.end_s, r.end_s);
      merged.bytes += r.bytes;
      merged.filled_at_ms = std::min(merged.filled_at_ms, r.filled_at_ms);
    } else {
      out.push_back(r);
    }
  }
  auto pos = std::lower_bound(out.begin(), out.end(), merged.start_s,
                              [](const TimeRange& r, double start) {
                                return r.start_s < start;
                              });
  out.insert(pos, merged);
  ranges_.swap(out);
}

std::optional<size_t> BufferRange::IndexAt(double t) const {
  for (size_t i = 0; i < ranges_.size(); ++i) {
    const auto& r = ranges_[i];
    if (r.Contains(t)) return i;
    if (r.start_s > t && r.start_s - t <= kEdgeToleranceS) return i;
    if (r.start_s > t) break;
  }
  return std::nullopt;
}

double BufferRange::AheadOf(double cursor) const {
  auto idx = IndexAt(cursor);
  if (!idx) return 0.0;
  return std::max(0.0, ranges_[*idx].end_s - cursor);
}

int64_t BufferRange::TotalBytes() const {
  int64_t total = 0;
  for (const auto& r : ranges_) total += r.bytes;
  return total;
}

void BufferRange::EraseAt(size_t index) {
  if (index < ranges_.size()) {
    ranges_.erase(ranges_.begin() + static_cast<std::ptrdiff_t>(index));
  }
}

bool BufferRange::SameIntervals(const BufferRange& other) const {
  if (ranges_.size() != other.ranges_.size()) return false;
  for (size_t i = 0; i < ranges_.size(); ++i) {
    if (ranges_[i].start_s != other.ranges_[i].start_s ||
        ranges_[i].end_s != other.ranges_[i].end_s) {
      return false;
    }
  }
  return true;
}

}  // namespace ferry::buffer
