// Repository: Ferry
// Component: Provider model
// Copyright (c) 2025 Ferry

#include "ferry/provider/Provider.hpp"

namespace ferry::provider {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

std::vector<ProviderSpec> DefaultProviders() {
  return {
      {"ipfs.io", "https://ipfs.io/ipfs/{content}"},
      {"algonode.xyz", "https://ipfs.algonode.xyz/ipfs/{content}"},
      {"eth.aragon.network", "https://ipfs.eth.aragon.network/ipfs/{content}"},
      {"dweb.link", "https://{content}.ipfs.dweb.link"},
      {"flk-ipfs.xyz", "https://{content}.ipfs.flk-ipfs.xyz"},
  };
}

std::string ResolveEndpoint(const std::string& endpoint_template,
                            const std::string& content_id,
                            int height,
                            int64_t bitrate_bps) {
  std::string url = endpoint_template;
  ReplaceAll(url, "{content}", content_id);
  ReplaceAll(url, "{height}", std::to_string(height));
  ReplaceAll(url, "{bitrate}", std::to_string(bitrate_bps));
  return url;
}

}  // namespace ferry::provider
