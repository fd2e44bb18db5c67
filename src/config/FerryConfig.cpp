// Repository: Ferry
// Component: Daemon configuration
// Copyright (c) 2025 Ferry

#include "ferry/config/FerryConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace ferry::config {

namespace {

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

[[noreturn]] void BadValue(const std::string& key, const std::string& value) {
  throw std::invalid_argument("bad value for " + key + ": '" + value + "'");
}

double ParseDouble(const std::string& key, const std::string& value) {
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(value.c_str(), &end);
  if (value.empty() || errno != 0 || end != value.c_str() + value.size()) {
    BadValue(key, value);
  }
  return v;
}

int64_t ParseInt(const std::string& key, const std::string& value) {
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(value.c_str(), &end, 10);
  if (value.empty() || errno != 0 || end != value.c_str() + value.size()) {
    BadValue(key, value);
  }
  return static_cast<int64_t>(v);
}

size_t ParseCount(const std::string& key, const std::string& value) {
  const int64_t v = ParseInt(key, value);
  if (v < 0) BadValue(key, value);
  return static_cast<size_t>(v);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  BadValue(key, value);
}

provider::ProviderSpec ParseProvider(const std::string& value) {
  const size_t bar = value.find('|');
  if (bar == std::string::npos) BadValue("provider", value);
  provider::ProviderSpec spec;
  spec.name = Trim(value.substr(0, bar));
  spec.endpoint_template = Trim(value.substr(bar + 1));
  if (spec.name.empty() || spec.endpoint_template.empty()) BadValue("provider", value);
  return spec;
}

quality::QualityTier ParseTier(const std::string& value) {
  const size_t colon = value.find(':');
  if (colon == std::string::npos) BadValue("tier", value);
  quality::QualityTier tier;
  tier.bitrate_bps = ParseInt("tier", Trim(value.substr(0, colon)));
  tier.height = static_cast<int>(ParseInt("tier", Trim(value.substr(colon + 1))));
  return tier;
}

using Setter = std::function<void(FerryConfig&, const std::string& key,
                                  const std::string& value)>;

const std::unordered_map<std::string, Setter>& Setters() {
  static const std::unordered_map<std::string, Setter> kSetters = {
      {"listen_address", [](FerryConfig& c, const std::string&, const std::string& v) {
         c.listen_address = v;
       }},
      {"score_store_dir", [](FerryConfig& c, const std::string&, const std::string& v) {
         c.score_store_dir = v;
       }},
      {"user_agent", [](FerryConfig& c, const std::string&, const std::string& v) {
         c.user_agent = v;
       }},

      // Provider registry
      {"registry.initial_score", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.initial_score = ParseDouble(k, v);
       }},
      {"registry.success_gain", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.success_gain = ParseDouble(k, v);
       }},
      {"registry.failure_decay", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.failure_decay = ParseDouble(k, v);
       }},
      {"registry.disable_threshold", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.disable_threshold = ParseDouble(k, v);
       }},
      {"registry.retry_budget", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.retry_budget = static_cast<int>(ParseInt(k, v));
       }},
      {"registry.cooldown_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.cooldown_ms = ParseInt(k, v);
       }},
      {"registry.jitter_bound", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.jitter_bound = ParseDouble(k, v);
       }},
      {"registry.jitter_seed", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.registry.jitter_seed = static_cast<uint32_t>(ParseCount(k, v));
       }},

      // Buffer
      {"buffer.minimum_s", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.minimum_s = ParseDouble(k, v);
       }},
      {"buffer.optimal_s", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.optimal_s = ParseDouble(k, v);
       }},
      {"buffer.stall_timeout_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.stall_timeout_ms = ParseInt(k, v);
       }},
      {"buffer.max_bytes", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.max_bytes = ParseInt(k, v);
       }},
      {"buffer.retention_s", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.retention_s = ParseDouble(k, v);
       }},
      {"buffer.segment_duration_s", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.segment_duration_s = ParseDouble(k, v);
       }},
      {"buffer.inflight_limit", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.buffer.inflight_limit = ParseCount(k, v);
       }},

      // Fetcher
      {"fetcher.concurrency_limit", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.fetcher.concurrency_limit = ParseCount(k, v);
       }},
      {"fetcher.request_timeout_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.fetcher.request_timeout_ms = ParseInt(k, v);
       }},
      {"fetcher.bandwidth_window", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.fetcher.bandwidth_window = ParseCount(k, v);
       }},

      // Quality
      {"quality.headroom", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.quality.headroom = ParseDouble(k, v);
       }},
      {"quality.min_switch_interval_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.quality.min_switch_interval_ms = ParseInt(k, v);
       }},

      // Session
      {"session.max_provider_retries", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.max_provider_retries = static_cast<int>(ParseInt(k, v));
       }},
      {"session.recovery_window_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.recovery_window_ms = ParseInt(k, v);
       }},
      {"session.retry_delay_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.retry_delay_ms = ParseInt(k, v);
       }},
      {"session.tick_interval_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.tick_interval_ms = ParseInt(k, v);
       }},
      {"session.auto_quality", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.auto_quality = ParseBool(k, v);
       }},
      {"session.initial_tier_height", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.session.initial_tier_height = static_cast<int>(ParseInt(k, v));
       }},

      // Validation probe
      {"probe.timeout_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.probe.probe_timeout_ms = ParseInt(k, v);
       }},
      {"probe.validity_ms", [](FerryConfig& c, const std::string& k, const std::string& v) {
         c.probe.validity_ms = ParseInt(k, v);
       }},
  };
  return kSetters;
}

void Require(bool ok, const std::string& what) {
  if (!ok) throw std::invalid_argument("invalid config: " + what);
}

}  // namespace

FerryConfig DefaultConfig() {
  FerryConfig config;
  config.providers = provider::DefaultProviders();
  config.tiers = quality::DefaultTierTable();
  return config;
}

void ApplyConfigValue(FerryConfig& config, const std::string& key,
                      const std::string& value) {
  if (key == "provider") {
    config.providers.push_back(ParseProvider(value));
    return;
  }
  if (key == "tier") {
    config.tiers.push_back(ParseTier(value));
    return;
  }
  const auto& setters = Setters();
  auto it = setters.find(key);
  if (it == setters.end()) {
    throw std::invalid_argument("unknown config key: " + key);
  }
  it->second(config, key, value);
}

FerryConfig ParseConfig(std::istream& in, const std::string& origin) {
  FerryConfig config = DefaultConfig();
  bool providers_seen = false;
  bool tiers_seen = false;

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = Trim(line);
    if (line.empty()) continue;

    const size_t eq = line.find('=');
    std::ostringstream where;
    where << origin << ":" << line_no << ": ";
    if (eq == std::string::npos) {
      throw std::invalid_argument(where.str() + "expected key=value");
    }
    const std::string key = Trim(line.substr(0, eq));
    const std::string value = Trim(line.substr(eq + 1));

    if (key == "provider" && !providers_seen) {
      config.providers.clear();
      providers_seen = true;
    } else if (key == "tier" && !tiers_seen) {
      config.tiers.clear();
      tiers_seen = true;
    }
    try {
      ApplyConfigValue(config, key, value);
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument(where.str() + e.what());
    }
  }

  ValidateConfig(config);
  config.tiers = quality::NormalizeTierTable(std::move(config.tiers));
  return config;
}

FerryConfig LoadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  return ParseConfig(in, path);
}

void ValidateConfig(const FerryConfig& config) {
  Require(!config.listen_address.empty(), "listen_address is empty");
  Require(!config.providers.empty(), "no providers");
  for (size_t i = 0; i < config.providers.size(); ++i) {
    for (size_t j = i + 1; j < config.providers.size(); ++j) {
      Require(config.providers[i].name != config.providers[j].name,
              "duplicate provider " + config.providers[i].name);
    }
  }
  try {
    quality::NormalizeTierTable(config.tiers);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(std::string("invalid config: ") + e.what());
  }

  const auto& r = config.registry;
  Require(r.initial_score >= 0.0 && r.initial_score <= 1.0,
          "registry.initial_score outside [0,1]");
  Require(r.success_gain >= 0.0 && r.success_gain <= 1.0,
          "registry.success_gain outside [0,1]");
  Require(r.failure_decay > 0.0 && r.failure_decay <= 1.0,
          "registry.failure_decay outside (0,1]");
  Require(r.disable_threshold >= 0.0 && r.disable_threshold < 1.0,
          "registry.disable_threshold outside [0,1)");
  Require(r.retry_budget >= 0, "registry.retry_budget is negative");
  Require(r.cooldown_ms >= 0, "registry.cooldown_ms is negative");
  Require(r.jitter_bound >= 0.0, "registry.jitter_bound is negative");

  const auto& b = config.session.buffer;
  Require(b.minimum_s > 0.0, "buffer.minimum_s must be positive");
  Require(b.minimum_s <= b.optimal_s, "buffer.minimum_s exceeds buffer.optimal_s");
  Require(b.stall_timeout_ms > 0, "buffer.stall_timeout_ms must be positive");
  Require(b.max_bytes > 0, "buffer.max_bytes must be positive");
  Require(b.retention_s >= 0.0, "buffer.retention_s is negative");
  Require(b.segment_duration_s > 0.0, "buffer.segment_duration_s must be positive");
  Require(b.inflight_limit > 0, "buffer.inflight_limit is zero");

  const auto& f = config.session.fetcher;
  Require(f.concurrency_limit > 0, "fetcher.concurrency_limit is zero");
  Require(f.request_timeout_ms > 0, "fetcher.request_timeout_ms must be positive");
  Require(f.bandwidth_window > 0, "fetcher.bandwidth_window is zero");

  const auto& q = config.session.quality;
  Require(q.headroom > 0.0 && q.headroom <= 1.0, "quality.headroom outside (0,1]");
  Require(q.min_switch_interval_ms >= 0, "quality.min_switch_interval_ms is negative");

  const auto& s = config.session;
  Require(s.max_provider_retries >= 0, "session.max_provider_retries is negative");
  Require(s.recovery_window_ms > 0, "session.recovery_window_ms must be positive");
  Require(s.retry_delay_ms >= 0, "session.retry_delay_ms is negative");
  Require(s.tick_interval_ms >= 0, "session.tick_interval_ms is negative");

  Require(config.probe.probe_timeout_ms > 0, "probe.timeout_ms must be positive");
  Require(config.probe.validity_ms >= 0, "probe.validity_ms is negative");
}

}  // namespace ferry::config
