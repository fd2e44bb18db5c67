// Repository: Ferry
// Component: ProviderRegistry contract tests
// Purpose: Score bounds, decay/gain, retry-budget cooldown, ranking and the
//          last-resort rule.
// Copyright (c) 2025 Ferry

#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "ferry/provider/ProviderRegistry.hpp"
#include "DeterministicTimeSource.hpp"
#include "InMemoryScoreStore.hpp"

namespace ferry::provider {
namespace {

using ferry::testing::DeterministicTimeSource;
using ferry::testing::InMemoryScoreStore;

std::vector<ProviderSpec> MakeSpecs(int n) {
  std::vector<ProviderSpec> specs;
  for (int i = 0; i < n; ++i) {
    const std::string name = "p" + std::to_string(i);
    specs.push_back({name, "fake://" + name + "/{content}"});
  }
  return specs;
}

RegistryConfig NoJitter() {
  RegistryConfig config;
  config.jitter_bound = 0.0;
  return config;
}

std::vector<std::string> Names(const std::vector<ProviderState>& ranked) {
  std::vector<std::string> out;
  for (const auto& p : ranked) out.push_back(p.name);
  return out;
}

class ProviderRegistryContractTest : public ::testing::Test {
 protected:
  std::shared_ptr<DeterministicTimeSource> clock_ =
      std::make_shared<DeterministicTimeSource>(1'000'000);
};

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

TEST_F(ProviderRegistryContractTest, RejectsEmptyOrDuplicateProviderList) {
  EXPECT_THROW(ProviderRegistry({}, NoJitter(), clock_), std::invalid_argument);
  std::vector<ProviderSpec> dup = {{"a", "x"}, {"a", "y"}};
  EXPECT_THROW(ProviderRegistry(dup, NoJitter(), clock_), std::invalid_argument);
  EXPECT_THROW(ProviderRegistry(MakeSpecs(2), NoJitter(), nullptr),
               std::invalid_argument);
}

TEST_F(ProviderRegistryContractTest, StartsAtInitialScoreInConfigurationOrder) {
  ProviderRegistry registry(MakeSpecs(3), NoJitter(), clock_);
  auto snapshot = registry.Snapshot();
  ASSERT_EQ(snapshot.size(), 3u);
  for (const auto& p : snapshot) {
    EXPECT_DOUBLE_EQ(p.score, 0.5);
    EXPECT_EQ(p.consecutive_failures, 0);
  }
  EXPECT_EQ(Names(registry.Rank({})),
            (std::vector<std::string>{"p0", "p1", "p2"}));
}

// -----------------------------------------------------------------------------
// Score updates
// -----------------------------------------------------------------------------

TEST_F(ProviderRegistryContractTest, SuccessNudgesScoreTowardOne) {
  ProviderRegistry registry(MakeSpecs(1), NoJitter(), clock_);
  ASSERT_TRUE(registry.ReportOutcome("p0", true));
  EXPECT_NEAR(registry.Get("p0")->score, 0.55, 1e-12);
  ASSERT_TRUE(registry.ReportOutcome("p0", true));
  EXPECT_NEAR(registry.Get("p0")->score, 0.595, 1e-12);
}

TEST_F(ProviderRegistryContractTest, FailureDecayCompoundsWithStreak) {
  ProviderRegistry registry(MakeSpecs(1), NoJitter(), clock_);
  registry.ReportOutcome("p0", false);
  EXPECT_NEAR(registry.Get("p0")->score, 0.4, 1e-12);
  registry.ReportOutcome("p0", false);
  EXPECT_NEAR(registry.Get("p0")->score, 0.4 * 0.64, 1e-12);
  EXPECT_EQ(registry.Get("p0")->consecutive_failures, 2);

  // A success ends the streak; the next failure is a plain decay again.
  registry.ReportOutcome("p0", true);
  EXPECT_EQ(registry.Get("p0")->consecutive_failures, 0);
  const double before = registry.Get("p0")->score;
  registry.ReportOutcome("p0", false);
  EXPECT_NEAR(registry.Get("p0")->score, before * 0.8, 1e-12);
}

TEST_F(ProviderRegistryContractTest, ScoreStaysWithinUnitInterval) {
  RegistryConfig config = NoJitter();
  config.success_gain = 0.9;
  config.failure_decay = 0.5;
  ProviderRegistry registry(MakeSpecs(2), config, clock_);

  std::mt19937 rng(1234);
  std::bernoulli_distribution coin(0.5);
  for (int i = 0; i < 2000; ++i) {
    const std::string name = (i % 2 == 0) ? "p0" : "p1";
    registry.ReportOutcome(name, coin(rng));
    clock_->AdvanceMs(10);
    for (const auto& p : registry.Snapshot()) {
      ASSERT_GE(p.score, 0.0) << "iteration " << i;
      ASSERT_LE(p.score, 1.0) << "iteration " << i;
    }
  }
}

TEST_F(ProviderRegistryContractTest, UnknownProviderIsReportedAsFalse) {
  ProviderRegistry registry(MakeSpecs(1), NoJitter(), clock_);
  EXPECT_FALSE(registry.ReportOutcome("nope", false));
  EXPECT_FALSE(registry.Disable("nope"));
  EXPECT_FALSE(registry.Reenable("nope"));
  EXPECT_FALSE(registry.Get("nope").has_value());
}

// -----------------------------------------------------------------------------
// Cooldown
// -----------------------------------------------------------------------------

TEST_F(ProviderRegistryContractTest, RetryBudgetExceededExcludesUntilCooldownExpires) {
  RegistryConfig config = NoJitter();
  config.initial_score = 1.0;
  config.failure_decay = 0.95;
  config.retry_budget = 3;
  config.cooldown_ms = 5000;
  ProviderRegistry registry(MakeSpecs(2), config, clock_);

  for (int i = 0; i < 3; ++i) registry.ReportOutcome("p0", false);
  EXPECT_EQ(Names(registry.Rank({}))[0], "p0") << "within budget: still eligible";

  registry.ReportOutcome("p0", false);
  auto p0 = registry.Get("p0");
  ASSERT_TRUE(p0.has_value());
  EXPECT_EQ(p0->consecutive_failures, 4);
  // Score is still well above the threshold: the budget alone excludes it.
  EXPECT_GT(p0->score, 0.5);
  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p1"});

  clock_->AdvanceMs(4999);
  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p1"});
  clock_->AdvanceMs(1);
  auto ranked = Names(registry.Rank({}));
  EXPECT_EQ(ranked.size(), 2u);
}

TEST_F(ProviderRegistryContractTest, ScoreBelowThresholdEntersCooldown) {
  RegistryConfig config = NoJitter();
  config.initial_score = 0.12;
  ProviderRegistry registry(MakeSpecs(2), config, clock_);

  registry.ReportOutcome("p0", false);
  auto p0 = registry.Get("p0");
  ASSERT_TRUE(p0.has_value());
  EXPECT_LT(p0->score, config.disable_threshold);
  EXPECT_EQ(p0->disabled_at_ms, clock_->NowMs());
  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p1"});

  // Probation after the window.
  clock_->AdvanceMs(config.cooldown_ms);
  EXPECT_EQ(registry.Rank({}).size(), 2u);
}

// -----------------------------------------------------------------------------
// Ranking
// -----------------------------------------------------------------------------

TEST_F(ProviderRegistryContractTest, TopProviderTimingOutTwiceLosesFirstPlace) {
  auto store = std::make_shared<InMemoryScoreStore>(std::vector<ProviderScoreEntry>{
      {"p0", 0.9, 1}, {"p1", 0.5, 1}, {"p2", 0.5, 1}});
  ProviderRegistry registry(MakeSpecs(3), NoJitter(), clock_, store);
  ASSERT_EQ(Names(registry.Rank({}))[0], "p0");

  registry.ReportOutcome("p0", false);
  registry.ReportOutcome("p0", false);

  const double p0 = registry.Get("p0")->score;
  EXPECT_LT(p0, registry.Get("p1")->score);
  EXPECT_LT(p0, registry.Get("p2")->score);
  auto ranked = Names(registry.Rank({}));
  EXPECT_NE(ranked[0], "p0");
  EXPECT_EQ(ranked.back(), "p0");
}

TEST_F(ProviderRegistryContractTest, RankHonorsExclusions) {
  ProviderRegistry registry(MakeSpecs(3), NoJitter(), clock_);
  EXPECT_EQ(Names(registry.Rank({"p0", "p2"})), std::vector<std::string>{"p1"});
  EXPECT_TRUE(registry.Rank({"p0", "p1", "p2"}).empty());
}

TEST_F(ProviderRegistryContractTest, AllDisabledReturnsLeastRecentlyDisabled) {
  ProviderRegistry registry(MakeSpecs(3), NoJitter(), clock_);
  registry.Disable("p1");
  clock_->AdvanceMs(100);
  registry.Disable("p0");
  clock_->AdvanceMs(100);
  registry.Disable("p2");

  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p1"});
  EXPECT_EQ(Names(registry.Rank({"p1"})), std::vector<std::string>{"p0"});
}

TEST_F(ProviderRegistryContractTest, ReenableRestoresEligibility) {
  RegistryConfig config = NoJitter();
  config.initial_score = 0.05;
  ProviderRegistry registry(MakeSpecs(2), config, clock_);
  registry.Disable("p0");
  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p1"});

  ASSERT_TRUE(registry.Reenable("p0"));
  auto p0 = registry.Get("p0");
  EXPECT_FALSE(p0->manually_disabled);
  EXPECT_DOUBLE_EQ(p0->score, config.disable_threshold);
  EXPECT_EQ(registry.Rank({}).size(), 2u);
}

TEST_F(ProviderRegistryContractTest, PreferredProviderNeverBeatsAClearlyBetterOne) {
  RegistryConfig config;
  config.jitter_bound = 0.02;
  config.jitter_seed = 7;
  auto store = std::make_shared<InMemoryScoreStore>(std::vector<ProviderScoreEntry>{
      {"p0", 0.9, 1}, {"p1", 0.5, 1}});
  ProviderRegistry registry(MakeSpecs(2), config, clock_, store);
  for (int i = 0; i < 200; ++i) {
    EXPECT_EQ(registry.Rank({}, std::string("p1"))[0].name, "p0");
  }
}

TEST_F(ProviderRegistryContractTest, PreferredProviderWinsExactTies) {
  RegistryConfig config;
  config.jitter_bound = 0.02;
  config.jitter_seed = 11;
  auto store = std::make_shared<InMemoryScoreStore>(std::vector<ProviderScoreEntry>{
      {"p0", 0.5, 1}, {"p1", 0.5, 1}, {"p2", 0.5, 1}});
  ProviderRegistry registry(MakeSpecs(3), config, clock_, store);
  for (int i = 0; i < 200; ++i) {
    EXPECT_EQ(registry.Rank({}, std::string("p2"))[0].name, "p2");
  }
}

TEST_F(ProviderRegistryContractTest, JitterOnlyReordersNearTies) {
  RegistryConfig config;
  config.jitter_bound = 0.02;
  config.jitter_seed = 99;
  auto store = std::make_shared<InMemoryScoreStore>(std::vector<ProviderScoreEntry>{
      {"p0", 0.50, 1}, {"p1", 0.50, 1}, {"p2", 0.20, 1}});
  ProviderRegistry registry(MakeSpecs(3), config, clock_, store);

  std::set<std::string> leaders;
  for (int i = 0; i < 200; ++i) {
    auto ranked = Names(registry.Rank({}));
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[2], "p2");
    leaders.insert(ranked[0]);
  }
  EXPECT_EQ(leaders, (std::set<std::string>{"p0", "p1"}));
}

// -----------------------------------------------------------------------------
// Persistence hooks
// -----------------------------------------------------------------------------

TEST_F(ProviderRegistryContractTest, EveryUpdateIsSavedAndLoadIsLastWriteWins) {
  auto store = std::make_shared<InMemoryScoreStore>(std::vector<ProviderScoreEntry>{
      {"p0", 0.8, 10}, {"p0", 0.3, 5}, {"unknown", 0.9, 10}, {"p1", 0.05, 10}});
  ProviderRegistry registry(MakeSpecs(2), NoJitter(), clock_, store);

  EXPECT_DOUBLE_EQ(registry.Get("p0")->score, 0.8);
  // A persisted score under the threshold starts in cooldown.
  EXPECT_EQ(Names(registry.Rank({})), std::vector<std::string>{"p0"});

  const int before = store->saves();
  registry.ReportOutcome("p0", true);
  EXPECT_EQ(store->saves(), before + 1);
  auto saved = store->Load();
  ASSERT_EQ(saved.size(), 2u);
  EXPECT_EQ(saved[0].name, "p0");
  EXPECT_NEAR(saved[0].score, 0.82, 1e-12);
  EXPECT_EQ(saved[0].updated_ms, clock_->NowMs());
}

}  // namespace
}  // namespace ferry::provider
