// Repository: Ferry
// Component: Provider model
// Purpose: Static provider identity plus the mutable reliability state the
//          registry keeps for it.
// Copyright (c) 2025 Ferry

#ifndef FERRY_PROVIDER_PROVIDER_HPP_
#define FERRY_PROVIDER_PROVIDER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::provider {

// Identity loaded from configuration. endpoint_template placeholders:
//   {content}  content identifier
//   {height}   vertical resolution of the requested tier
//   {bitrate}  target bitrate of the requested tier (bits/s)
struct ProviderSpec {
  std::string name;
  std::string endpoint_template;
};

struct ProviderState {
  std::string name;
  std::string endpoint_template;

  double score = 0.5;                // in [0,1]
  int consecutive_failures = 0;
  int64_t cooldown_until_ms = 0;     // excluded from Rank() while now < this
  int64_t disabled_at_ms = -1;       // last disable/cooldown entry, -1 = never
  bool manually_disabled = false;

  uint64_t success_total = 0;
  uint64_t failure_total = 0;
  int64_t updated_ms = 0;            // last-write-wins key for persistence
};

// Default public gateway list.
std::vector<ProviderSpec> DefaultProviders();

// Expands endpoint_template for one content id at one tier.
std::string ResolveEndpoint(const std::string& endpoint_template,
                            const std::string& content_id,
                            int height,
                            int64_t bitrate_bps);

}  // namespace ferry::provider

#endif  // FERRY_PROVIDER_PROVIDER_HPP_
