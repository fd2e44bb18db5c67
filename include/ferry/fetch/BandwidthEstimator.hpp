// Repository: Ferry
// Component: BandwidthEstimator
// Purpose: Exponentially smoothed throughput over the last K completions.
// Copyright (c) 2025 Ferry

#ifndef FERRY_FETCH_BANDWIDTH_ESTIMATOR_HPP_
#define FERRY_FETCH_BANDWIDTH_ESTIMATOR_HPP_

#include <cstddef>
#include <cstdint>

namespace ferry::fetch {

// EWMA with alpha = 2 / (K + 1), the usual span-K smoothing. The first
// sample seeds the estimate. Not thread-safe; SegmentFetcher guards it.
class BandwidthEstimator {
 public:
  explicit BandwidthEstimator(size_t window = 5);

  // elapsed_ms <= 0 is treated as 1 ms.
  void AddSample(int64_t bytes, int64_t elapsed_ms);

  // Bits per second; 0 before the first sample.
  [[nodiscard]] double EstimateBps() const { return estimate_bps_; }
  [[nodiscard]] size_t samples() const { return samples_; }

  void Reset();

 private:
  double alpha_;
  double estimate_bps_ = 0.0;
  size_t samples_ = 0;
};

}  // namespace ferry::fetch

#endif  // FERRY_FETCH_BANDWIDTH_ESTIMATOR_HPP_
