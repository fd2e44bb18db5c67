// Repository: Ferry
// Component: QualityAdvisor
// Copyright (c) 2025 Ferry

#include "ferry/quality/QualityAdvisor.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "ferry/util/Logger.hpp"

namespace ferry::quality {

using ferry::buffer::BufferHealth;
using ferry::util::Logger;

namespace {

double Clamp01(double v) {
  if (!(v >= 0.0)) return 0.0;
  return v > 1.0 ? 1.0 : v;
}

}  // namespace

double DecodePenalty(const DecodeCost& cost) {
  const double complexity = Clamp01(cost.complexity);
  const double motion = Clamp01(cost.motion);
  const double drops = std::min(std::max(cost.dropped_frames, 0) / 100.0, 0.5);
  return (1.0 - 0.5 * complexity) * (1.0 - 0.3 * motion) * (1.0 - drops);
}

QualityAdvisor::QualityAdvisor(std::vector<QualityTier> tiers,
                               QualityConfig config,
                               std::shared_ptr<time::ITimeSource> clock)
    : tiers_(NormalizeTierTable(std::move(tiers))),
      config_(config),
      clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("QualityAdvisor: time source is required");
  }
}

size_t QualityAdvisor::FitIndex(double effective_bps) const {
  const double budget = effective_bps * config_.headroom;
  size_t best = 0;
  for (size_t i = 0; i < tiers_.size(); ++i) {
    if (static_cast<double>(tiers_[i].bitrate_bps) <= budget) best = i;
  }
  return best;
}

void QualityAdvisor::SwitchToLocked(size_t index, int64_t now_ms, const char* reason) {
  std::ostringstream oss;
  oss << "[QualityAdvisor] SWITCH from=" << tiers_[current_].Label()
      << " to=" << tiers_[index].Label()
      << " reason=" << reason;
  Logger::Info(oss.str());
  current_ = index;
  has_switched_ = true;
  last_switch_ms_ = now_ms;
  ++switch_count_;
}

QualityTier QualityAdvisor::SelectInitial(double bandwidth_bps, int preferred_height) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = 0;
  if (bandwidth_bps > 0.0) {
    current_ = FitIndex(bandwidth_bps);
  } else {
    for (size_t i = 0; i < tiers_.size(); ++i) {
      if (tiers_[i].height == preferred_height) current_ = i;
    }
  }
  has_switched_ = false;
  low_latched_ = false;
  return tiers_[current_];
}

QualityTier QualityAdvisor::Recommend(double bandwidth_bps,
                                      BufferHealth health,
                                      const std::optional<DecodeCost>& cost) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!auto_) return tiers_[current_];
  const int64_t now = clock_->NowMs();

  if (health == BufferHealth::kHealthy) {
    low_latched_ = false;
  } else {
    if (!low_latched_) {
      low_latched_ = true;
      if (current_ > 0) {
        SwitchToLocked(current_ - 1, now, "buffer_low");
      }
    }
    return tiers_[current_];
  }

  if (bandwidth_bps <= 0.0) return tiers_[current_];

  const double effective = bandwidth_bps * (cost ? DecodePenalty(*cost) : 1.0);
  const size_t target = FitIndex(effective);
  if (target == current_) return tiers_[current_];
  if (has_switched_ && now - last_switch_ms_ < config_.min_switch_interval_ms) {
    return tiers_[current_];
  }
  SwitchToLocked(target, now, target > current_ ? "bandwidth_up" : "bandwidth_down");
  return tiers_[current_];
}

bool QualityAdvisor::ForceTier(const QualityTier& tier) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < tiers_.size(); ++i) {
    if (tiers_[i].height == tier.height) {
      auto_ = false;
      if (i != current_) {
        SwitchToLocked(i, clock_->NowMs(), "forced");
      }
      return true;
    }
  }
  Logger::Warn("[QualityAdvisor] ForceTier unknown tier=" + tier.Label());
  return false;
}

void QualityAdvisor::SetAutoQuality(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_ = enabled;
  if (enabled) low_latched_ = false;
}

bool QualityAdvisor::auto_quality() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auto_;
}

QualityTier QualityAdvisor::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tiers_[current_];
}

uint64_t QualityAdvisor::switch_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return switch_count_;
}

}  // namespace ferry::quality
