// Repository: Ferry
// Component: BandwidthEstimator
// Copyright (c) 2025 Ferry

#include "ferry/fetch/BandwidthEstimator.hpp"

namespace ferry::fetch {

BandwidthEstimator::BandwidthEstimator(size_t window)
    : alpha_(2.0 / (static_cast<double>(window == 0 ? 1 : window) + 1.0)) {}

void BandwidthEstimator::AddSample(int64_t bytes, int64_t elapsed_ms) {
  if (bytes <= 0) return;
  if (elapsed_ms <= 0) elapsed_ms = 1;
  const double sample_bps =
      static_cast<double>(bytes) * 8.0 * 1000.0 / static_cast<double>(elapsed_ms);
  if (samples_ == 0) {
    estimate_bps_ = sample_bps;
  } else {
    estimate_bps_ = alpha_ * sample_bps + (1.0 - alpha_) * estimate_bps_;
  }
  ++samples_;
}

void BandwidthEstimator::Reset() {
  estimate_bps_ = 0.0;
  samples_ = 0;
}

}  // namespace ferry::fetch
