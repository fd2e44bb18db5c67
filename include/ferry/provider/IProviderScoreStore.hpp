// Repository: Ferry
// Component: Provider score persistence seam
// Copyright (c) 2025 Ferry

#ifndef FERRY_PROVIDER_I_PROVIDER_SCORE_STORE_HPP_
#define FERRY_PROVIDER_I_PROVIDER_SCORE_STORE_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::provider {

struct ProviderScoreEntry {
  std::string name;
  double score = 0.0;
  int64_t updated_ms = 0;
};

// Key-value table keyed by provider name. Implementations apply
// last-write-wins by updated_ms when entries for the same name meet.
class IProviderScoreStore {
 public:
  virtual ~IProviderScoreStore() = default;

  virtual std::vector<ProviderScoreEntry> Load() = 0;
  virtual void Save(const std::vector<ProviderScoreEntry>& entries) = 0;
};

}  // namespace ferry::provider

#endif  // FERRY_PROVIDER_I_PROVIDER_SCORE_STORE_HPP_
