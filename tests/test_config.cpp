// Repository: Ferry
// Component: Daemon configuration tests
// Copyright (c) 2025 Ferry

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "ferry/config/FerryConfig.hpp"

namespace ferry::config {
namespace {

FerryConfig Parse(const std::string& text) {
  std::istringstream in(text);
  return ParseConfig(in, "test.conf");
}

std::string ErrorOf(const std::string& text) {
  try {
    Parse(text);
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return {};
}

TEST(FerryConfigTest, DefaultsAreValid) {
  const FerryConfig config = DefaultConfig();
  EXPECT_NO_THROW(ValidateConfig(config));
  EXPECT_EQ(config.listen_address, "0.0.0.0:50071");
  EXPECT_EQ(config.providers.size(), 5u);
  EXPECT_EQ(config.tiers.size(), 4u);
  EXPECT_DOUBLE_EQ(config.registry.initial_score, 0.5);
  EXPECT_DOUBLE_EQ(config.session.buffer.optimal_s, 10.0);
  EXPECT_EQ(config.session.fetcher.concurrency_limit, 3u);
}

TEST(FerryConfigTest, EmptyInputYieldsDefaults) {
  const FerryConfig config = Parse("# nothing here\n\n   \n");
  EXPECT_EQ(config.providers.size(), 5u);
  EXPECT_EQ(config.user_agent, "ferry/1.0");
}

TEST(FerryConfigTest, DottedKeysReachComponentFields) {
  const FerryConfig config = Parse(
      "listen_address = 127.0.0.1:6000\n"
      "registry.failure_decay = 0.7   # harsher\n"
      "registry.cooldown_ms=2000\n"
      "buffer.optimal_s = 20\n"
      "buffer.inflight_limit = 4\n"
      "fetcher.concurrency_limit = 5\n"
      "quality.headroom = 0.9\n"
      "session.auto_quality = off\n"
      "session.initial_tier_height = 720\n"
      "probe.validity_ms = 0\n");
  EXPECT_EQ(config.listen_address, "127.0.0.1:6000");
  EXPECT_DOUBLE_EQ(config.registry.failure_decay, 0.7);
  EXPECT_EQ(config.registry.cooldown_ms, 2000);
  EXPECT_DOUBLE_EQ(config.session.buffer.optimal_s, 20.0);
  EXPECT_EQ(config.session.buffer.inflight_limit, 4u);
  EXPECT_EQ(config.session.fetcher.concurrency_limit, 5u);
  EXPECT_DOUBLE_EQ(config.session.quality.headroom, 0.9);
  EXPECT_FALSE(config.session.auto_quality);
  EXPECT_EQ(config.session.initial_tier_height, 720);
  EXPECT_EQ(config.probe.validity_ms, 0);
}

TEST(FerryConfigTest, ProviderAndTierLinesReplaceTheDefaults) {
  const FerryConfig config = Parse(
      "provider = local | http://127.0.0.1:8080/ipfs/{content}\n"
      "provider = backup|http://10.0.0.2/{content}\n"
      "tier = 3000000:1080\n"
      "tier = 600000:360\n");
  ASSERT_EQ(config.providers.size(), 2u);
  EXPECT_EQ(config.providers[0].name, "local");
  EXPECT_EQ(config.providers[0].endpoint_template, "http://127.0.0.1:8080/ipfs/{content}");
  EXPECT_EQ(config.providers[1].name, "backup");
  ASSERT_EQ(config.tiers.size(), 2u);
  EXPECT_EQ(config.tiers[0].height, 360);
  EXPECT_EQ(config.tiers[1].height, 1080);
}

TEST(FerryConfigTest, ErrorsNameTheLine) {
  EXPECT_EQ(ErrorOf("listen_address = a:1\nno_equals_here\n"),
            "test.conf:2: expected key=value");
  EXPECT_EQ(ErrorOf("bogus.key = 1\n"), "test.conf:1: unknown config key: bogus.key");
  EXPECT_EQ(ErrorOf("\nbuffer.optimal_s = fast\n"),
            "test.conf:2: bad value for buffer.optimal_s: 'fast'");
  EXPECT_EQ(ErrorOf("session.auto_quality = maybe\n"),
            "test.conf:1: bad value for session.auto_quality: 'maybe'");
  EXPECT_EQ(ErrorOf("provider = missing-bar\n"),
            "test.conf:1: bad value for provider: 'missing-bar'");
  EXPECT_EQ(ErrorOf("tier = 400000\n"), "test.conf:1: bad value for tier: '400000'");
}

TEST(FerryConfigTest, InconsistentValuesAreRejected) {
  EXPECT_EQ(ErrorOf("buffer.minimum_s = 12\n"),
            "invalid config: buffer.minimum_s exceeds buffer.optimal_s");
  EXPECT_EQ(ErrorOf("registry.failure_decay = 0\n"),
            "invalid config: registry.failure_decay outside (0,1]");
  EXPECT_EQ(ErrorOf("fetcher.concurrency_limit = 0\n"),
            "invalid config: fetcher.concurrency_limit is zero");
  EXPECT_EQ(ErrorOf("provider = a|x/{content}\nprovider = a|y/{content}\n"),
            "invalid config: duplicate provider a");
  EXPECT_NE(ErrorOf("tier = 400000:360\ntier = 800000:360\n").find("duplicate quality tier"),
            std::string::npos);
}

TEST(FerryConfigTest, MissingFileIsARuntimeError) {
  EXPECT_THROW(LoadConfigFile("/nonexistent/ferry.conf"), std::runtime_error);
}

}  // namespace
}  // namespace ferry::config
