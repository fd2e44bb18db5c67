// Repository: Ferry
// Component: Quality tier table
// Copyright (c) 2025 Ferry

#include "ferry/quality/QualityTier.hpp"

#include <algorithm>
#include <stdexcept>

namespace ferry::quality {

std::vector<QualityTier> DefaultTierTable() {
  return {
      {400'000, 360},
      {800'000, 480},
      {1'500'000, 720},
      {3'000'000, 1080},
  };
}

std::vector<QualityTier> NormalizeTierTable(std::vector<QualityTier> tiers) {
  if (tiers.empty()) {
    throw std::invalid_argument("quality tier table is empty");
  }
  for (const auto& t : tiers) {
    if (t.bitrate_bps <= 0 || t.height <= 0) {
      throw std::invalid_argument("quality tier " + t.Label() +
                                  " has a non-positive bitrate or height");
    }
  }
  std::sort(tiers.begin(), tiers.end(), [](const QualityTier& a, const QualityTier& b) {
    return a.bitrate_bps < b.bitrate_bps;
  });
  for (size_t i = 1; i < tiers.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (tiers[i].height == tiers[j].height) {
        throw std::invalid_argument("duplicate quality tier " + tiers[i].Label());
      }
    }
  }
  return tiers;
}

}  // namespace ferry::quality
