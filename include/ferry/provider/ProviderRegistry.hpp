// Repository: Ferry
// Component: ProviderRegistry
// Purpose: Candidate content sources with persisted reliability scores.
//          Ranked selection, score updates, cooldown and explicit
//          disable/re-enable overrides.
// Copyright (c) 2025 Ferry

#ifndef FERRY_PROVIDER_PROVIDER_REGISTRY_HPP_
#define FERRY_PROVIDER_PROVIDER_REGISTRY_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "ferry/provider/IProviderScoreStore.hpp"
#include "ferry/provider/Provider.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::provider {

struct RegistryConfig {
  double initial_score = 0.5;
  double success_gain = 0.1;
  // Failure: score *= failure_decay ^ consecutive_failures.
  double failure_decay = 0.8;
  double disable_threshold = 0.1;
  int retry_budget = 3;
  int64_t cooldown_ms = 5000;
  // Upper bound of the uniform tie-break jitter added to scores in Rank().
  double jitter_bound = 0.02;
  // 0 seeds from std::random_device.
  uint32_t jitter_seed = 0;
};

// ProviderRegistry is shared by every session of a process. All methods are
// thread-safe; each score update is a single read-modify-write under mutex_.
class ProviderRegistry {
 public:
  // Throws std::invalid_argument on an empty or duplicate provider list.
  ProviderRegistry(std::vector<ProviderSpec> specs,
                   RegistryConfig config,
                   std::shared_ptr<time::ITimeSource> clock,
                   std::shared_ptr<IProviderScoreStore> store = nullptr);

  ProviderRegistry(const ProviderRegistry&) = delete;
  ProviderRegistry& operator=(const ProviderRegistry&) = delete;

  // Eligible providers (not in cooldown, not disabled) best first. The
  // preferred provider gets the full jitter bound as a tie-break bonus.
  // When no provider outside `excluding` is eligible, returns the single
  // least-recently-disabled one. Empty only if every provider is excluded.
  std::vector<ProviderState> Rank(
      const std::set<std::string>& excluding,
      const std::optional<std::string>& preferred = std::nullopt);

  // Returns false for an unknown provider.
  bool ReportOutcome(const std::string& name, bool success);

  bool Disable(const std::string& name);
  bool Reenable(const std::string& name);

  [[nodiscard]] std::optional<ProviderState> Get(const std::string& name) const;
  [[nodiscard]] std::vector<ProviderState> Snapshot() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] const RegistryConfig& config() const { return config_; }

 private:
  ProviderState* FindLocked(const std::string& name);
  bool EligibleLocked(const ProviderState& p, int64_t now_ms) const;
  void EnterCooldownLocked(ProviderState& p, int64_t now_ms,
                           const char* reason);
  void LoadScoresLocked();
  void SaveScoresLocked();

  const RegistryConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;
  std::shared_ptr<IProviderScoreStore> store_;

  mutable std::mutex mutex_;
  std::vector<ProviderState> providers_;  // configuration order
  std::mt19937 rng_;
};

}  // namespace ferry::provider

#endif  // FERRY_PROVIDER_PROVIDER_REGISTRY_HPP_
