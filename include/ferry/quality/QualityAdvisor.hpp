// Repository: Ferry
// Component: QualityAdvisor
// Purpose: Tier recommendation from bandwidth, buffer health and decode
//          cost, with a minimum switch interval and forced downgrades
//          under buffer pressure.
// Copyright (c) 2025 Ferry

#ifndef FERRY_QUALITY_QUALITY_ADVISOR_HPP_
#define FERRY_QUALITY_QUALITY_ADVISOR_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "ferry/buffer/BufferTracker.hpp"
#include "ferry/quality/QualityTier.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::quality {

// Frame analysis reported by the presentation layer. All fields optional in
// effect: zeros mean no penalty.
struct DecodeCost {
  double complexity = 0.0;   // [0,1]
  double motion = 0.0;       // [0,1]
  int dropped_frames = 0;    // per reporting window
};

// (1 - 0.5*complexity) * (1 - 0.3*motion) * (1 - min(drops/100, 0.5))
double DecodePenalty(const DecodeCost& cost);

struct QualityConfig {
  double headroom = 0.8;
  int64_t min_switch_interval_ms = 5000;
};

class QualityAdvisor {
 public:
  // Throws std::invalid_argument on an invalid tier table.
  QualityAdvisor(std::vector<QualityTier> tiers,
                 QualityConfig config,
                 std::shared_ptr<time::ITimeSource> clock);

  // Sets the starting tier without counting it as a switch. Picks the tier
  // that fits bandwidth_bps, or the tier of preferred_height (lowest tier
  // when 0) if there is no estimate yet.
  QualityTier SelectInitial(double bandwidth_bps, int preferred_height = 0);

  // Returns the tier that should be active now.
  //  - Low (or Stalled) health: one forced one-step downgrade per episode,
  //    bypassing the switch interval. No upgrades until health is Healthy.
  //  - Otherwise the highest tier with bitrate <= headroom * effective
  //    bandwidth, applied only if no switch happened within the interval.
  //  - bandwidth_bps <= 0: hold.
  QualityTier Recommend(double bandwidth_bps,
                        buffer::BufferHealth health,
                        const std::optional<DecodeCost>& cost = std::nullopt);

  // Pins a tier (matched by height) and disables adaptation. False if the
  // table has no such tier.
  bool ForceTier(const QualityTier& tier);
  void SetAutoQuality(bool enabled);

  [[nodiscard]] bool auto_quality() const;
  [[nodiscard]] QualityTier current() const;
  [[nodiscard]] uint64_t switch_count() const;
  [[nodiscard]] const std::vector<QualityTier>& tiers() const { return tiers_; }

 private:
  size_t FitIndex(double effective_bps) const;
  void SwitchToLocked(size_t index, int64_t now_ms, const char* reason);

  const std::vector<QualityTier> tiers_;
  const QualityConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;

  mutable std::mutex mutex_;
  size_t current_ = 0;
  bool auto_ = true;
  bool has_switched_ = false;
  int64_t last_switch_ms_ = 0;
  bool low_latched_ = false;
  uint64_t switch_count_ = 0;
};

}  // namespace ferry::quality

#endif  // FERRY_QUALITY_QUALITY_ADVISOR_HPP_
