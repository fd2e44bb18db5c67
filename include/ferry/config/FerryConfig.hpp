// Repository: Ferry
// Component: Daemon configuration
// Purpose: Aggregates component configs, provider list and tier table;
//          parses key=value config files.
// Copyright (c) 2025 Ferry

#ifndef FERRY_CONFIG_FERRY_CONFIG_HPP_
#define FERRY_CONFIG_FERRY_CONFIG_HPP_

#include <istream>
#include <string>
#include <vector>

#include "ferry/provider/Provider.hpp"
#include "ferry/provider/ProviderRegistry.hpp"
#include "ferry/quality/QualityTier.hpp"
#include "ferry/session/MediaProbeValidator.hpp"
#include "ferry/session/SessionTypes.hpp"

namespace ferry::config {

struct FerryConfig {
  std::string listen_address = "0.0.0.0:50071";
  // Empty: scores are not persisted.
  std::string score_store_dir;
  std::string user_agent = "ferry/1.0";
  std::vector<provider::ProviderSpec> providers;
  std::vector<quality::QualityTier> tiers;
  provider::RegistryConfig registry;
  session::SessionConfig session;
  session::ProbeConfig probe;
};

// Built-in gateways and tier table with component defaults.
FerryConfig DefaultConfig();

// Applies one setting. Dotted keys address component fields
// ("buffer.optimal_s", "registry.failure_decay", ...). "provider" takes
// "name|template" and "tier" takes "bitrate:height"; both append.
// Throws std::invalid_argument on an unknown key or unparseable value.
void ApplyConfigValue(FerryConfig& config, const std::string& key,
                      const std::string& value);

// Reads key=value lines on top of DefaultConfig(). Blank lines and '#'
// comments are skipped. The first provider (tier) line replaces the default
// list instead of appending to it. The result is validated.
// Throws std::invalid_argument with "<origin>:<line>" on a bad line.
FerryConfig ParseConfig(std::istream& in, const std::string& origin);

// Throws std::runtime_error if the file cannot be opened.
FerryConfig LoadConfigFile(const std::string& path);

// Throws std::invalid_argument naming the first inconsistent value.
void ValidateConfig(const FerryConfig& config);

}  // namespace ferry::config

#endif  // FERRY_CONFIG_FERRY_CONFIG_HPP_
