// Repository: Ferry
// Component: ProviderRegistry
// Purpose: Ranked provider selection and reliability scoring.
// Copyright (c) 2025 Ferry

#include "ferry/provider/ProviderRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "ferry/util/Logger.hpp"

namespace ferry::provider {

using ferry::util::Logger;

namespace {

double Clamp01(double v) {
  if (!(v >= 0.0)) return 0.0;  // also maps NaN to 0
  return v > 1.0 ? 1.0 : v;
}

}  // namespace

ProviderRegistry::ProviderRegistry(std::vector<ProviderSpec> specs,
                                   RegistryConfig config,
                                   std::shared_ptr<time::ITimeSource> clock,
                                   std::shared_ptr<IProviderScoreStore> store)
    : config_(config),
      clock_(std::move(clock)),
      store_(std::move(store)),
      rng_(config.jitter_seed != 0 ? config.jitter_seed
                                   : std::random_device{}()) {
  if (specs.empty()) {
    throw std::invalid_argument("ProviderRegistry: no providers configured");
  }
  if (!clock_) {
    throw std::invalid_argument("ProviderRegistry: time source is required");
  }
  for (auto& spec : specs) {
    if (spec.name.empty()) {
      throw std::invalid_argument("ProviderRegistry: provider with empty name");
    }
    for (const auto& existing : providers_) {
      if (existing.name == spec.name) {
        throw std::invalid_argument("ProviderRegistry: duplicate provider " +
                                    spec.name);
      }
    }
    ProviderState state;
    state.name = std::move(spec.name);
    state.endpoint_template = std::move(spec.endpoint_template);
    state.score = Clamp01(config_.initial_score);
    providers_.push_back(std::move(state));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  LoadScoresLocked();
}

ProviderState* ProviderRegistry::FindLocked(const std::string& name) {
  for (auto& p : providers_) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

bool ProviderRegistry::EligibleLocked(const ProviderState& p,
                                      int64_t now_ms) const {
  if (p.manually_disabled) return false;
  if (now_ms < p.cooldown_until_ms) return false;
  // Below threshold with an expired cooldown: eligible again on probation.
  return true;
}

void ProviderRegistry::EnterCooldownLocked(ProviderState& p, int64_t now_ms,
                                           const char* reason) {
  p.cooldown_until_ms = std::max(p.cooldown_until_ms, now_ms + config_.cooldown_ms);
  p.disabled_at_ms = now_ms;
  std::ostringstream oss;
  oss << "[ProviderRegistry] COOLDOWN provider=" << p.name
      << " reason=" << reason
      << " score=" << p.score
      << " consecutive_failures=" << p.consecutive_failures
      << " until_ms=" << p.cooldown_until_ms;
  Logger::Warn(oss.str());
}

std::vector<ProviderState> ProviderRegistry::Rank(
    const std::set<std::string>& excluding,
    const std::optional<std::string>& preferred) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = clock_->NowMs();

  struct Keyed {
    double key;
    const ProviderState* p;
  };
  std::vector<Keyed> eligible;
  std::uniform_real_distribution<double> jitter(0.0, config_.jitter_bound);
  for (const auto& p : providers_) {
    if (excluding.count(p.name) != 0) continue;
    if (!EligibleLocked(p, now)) continue;
    double key = p.score;
    if (config_.jitter_bound > 0.0) {
      key += jitter(rng_);
    }
    // Full bound: the preferred provider wins every exact tie.
    if (preferred && *preferred == p.name) {
      key += config_.jitter_bound;
    }
    eligible.push_back({key, &p});
  }

  std::vector<ProviderState> out;
  if (!eligible.empty()) {
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const Keyed& a, const Keyed& b) { return a.key > b.key; });
    out.reserve(eligible.size());
    for (const auto& k : eligible) out.push_back(*k.p);
    return out;
  }

  // Last resort: least-recently-disabled provider outside `excluding`.
  const ProviderState* fallback = nullptr;
  for (const auto& p : providers_) {
    if (excluding.count(p.name) != 0) continue;
    if (fallback == nullptr || p.disabled_at_ms < fallback->disabled_at_ms) {
      fallback = &p;
    }
  }
  if (fallback != nullptr) {
    std::ostringstream oss;
    oss << "[ProviderRegistry] LAST_RESORT provider=" << fallback->name
        << " disabled_at_ms=" << fallback->disabled_at_ms;
    Logger::Warn(oss.str());
    out.push_back(*fallback);
  }
  return out;
}

bool ProviderRegistry::ReportOutcome(const std::string& name, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProviderState* p = FindLocked(name);
  if (p == nullptr) {
    Logger::Warn("[ProviderRegistry] ReportOutcome for unknown provider=" + name);
    return false;
  }
  const int64_t now = clock_->NowMs();

  if (success) {
    p->score = Clamp01(p->score + (1.0 - p->score) * config_.success_gain);
    p->consecutive_failures = 0;
    ++p->success_total;
  } else {
    ++p->consecutive_failures;
    ++p->failure_total;
    p->score = Clamp01(p->score *
                       std::pow(config_.failure_decay, p->consecutive_failures));
    if (p->consecutive_failures > config_.retry_budget) {
      EnterCooldownLocked(*p, now, "retry_budget");
    } else if (p->score < config_.disable_threshold) {
      EnterCooldownLocked(*p, now, "score_below_threshold");
    }
  }
  p->updated_ms = now;

  std::ostringstream oss;
  oss << "[ProviderRegistry] OUTCOME provider=" << name
      << " success=" << (success ? 1 : 0)
      << " score=" << p->score
      << " consecutive_failures=" << p->consecutive_failures;
  Logger::Debug(oss.str());

  SaveScoresLocked();
  return true;
}

bool ProviderRegistry::Disable(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProviderState* p = FindLocked(name);
  if (p == nullptr) return false;
  const int64_t now = clock_->NowMs();
  p->manually_disabled = true;
  p->disabled_at_ms = now;
  p->updated_ms = now;
  Logger::Info("[ProviderRegistry] DISABLED provider=" + name);
  return true;
}

bool ProviderRegistry::Reenable(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProviderState* p = FindLocked(name);
  if (p == nullptr) return false;
  p->manually_disabled = false;
  p->cooldown_until_ms = 0;
  p->consecutive_failures = 0;
  if (p->score < config_.disable_threshold) {
    p->score = config_.disable_threshold;
  }
  p->updated_ms = clock_->NowMs();
  Logger::Info("[ProviderRegistry] REENABLED provider=" + name);
  SaveScoresLocked();
  return true;
}

std::optional<ProviderState> ProviderRegistry::Get(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& p : providers_) {
    if (p.name == name) return p;
  }
  return std::nullopt;
}

std::vector<ProviderState> ProviderRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return providers_;
}

size_t ProviderRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return providers_.size();
}

// Persisted entries for names no longer configured are ignored. A loaded
// score below the threshold starts in cooldown like a live one would.
void ProviderRegistry::LoadScoresLocked() {
  if (!store_) return;
  const int64_t now = clock_->NowMs();
  size_t applied = 0;
  for (const auto& entry : store_->Load()) {
    ProviderState* p = FindLocked(entry.name);
    if (p == nullptr) continue;
    if (entry.updated_ms < p->updated_ms) continue;
    p->score = Clamp01(entry.score);
    p->updated_ms = entry.updated_ms;
    if (p->score < config_.disable_threshold) {
      EnterCooldownLocked(*p, now, "persisted_score_below_threshold");
    }
    ++applied;
  }
  std::ostringstream oss;
  oss << "[ProviderRegistry] LOADED_SCORES applied=" << applied
      << " providers=" << providers_.size();
  Logger::Info(oss.str());
}

// The store must not call back into the registry from Save().
void ProviderRegistry::SaveScoresLocked() {
  if (!store_) return;
  std::vector<ProviderScoreEntry> entries;
  entries.reserve(providers_.size());
  for (const auto& p : providers_) {
    entries.push_back({p.name, p.score, p.updated_ms});
  }
  store_->Save(entries);
}

}  // namespace ferry::provider
