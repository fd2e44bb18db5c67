// Repository: Ferry
// Component: Quality tier table
// Copyright (c) 2025 Ferry

#ifndef FERRY_QUALITY_QUALITY_TIER_HPP_
#define FERRY_QUALITY_QUALITY_TIER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::quality {

struct QualityTier {
  int64_t bitrate_bps = 0;
  int height = 0;

  std::string Label() const { return std::to_string(height) + "p"; }
  double BytesPerSecond() const { return static_cast<double>(bitrate_bps) / 8.0; }

  bool operator==(const QualityTier& o) const {
    return bitrate_bps == o.bitrate_bps && height == o.height;
  }
  bool operator!=(const QualityTier& o) const { return !(*this == o); }
};

// 360p/400k, 480p/800k, 720p/1.5M, 1080p/3M.
std::vector<QualityTier> DefaultTierTable();

// Sorts ascending by bitrate. Throws std::invalid_argument if empty, if a
// bitrate or height is not positive, or if two tiers share a height.
std::vector<QualityTier> NormalizeTierTable(std::vector<QualityTier> tiers);

}  // namespace ferry::quality

#endif  // FERRY_QUALITY_QUALITY_TIER_HPP_
