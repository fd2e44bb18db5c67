// Repository: Ferry
// Component: StreamSessionFactory Implementation
// Copyright (c) 2025 Ferry

#include "ferry/session/StreamSessionFactory.hpp"

#include <stdexcept>

#include "ferry/util/Logger.hpp"

namespace ferry::session {

StreamSessionFactory::StreamSessionFactory(
    std::shared_ptr<provider::ProviderRegistry> registry,
    std::shared_ptr<fetch::IFetchTransport> transport,
    std::shared_ptr<IContentValidator> validator,
    std::vector<quality::QualityTier> tiers,
    SessionConfig config,
    std::shared_ptr<time::ITimeSource> clock)
    : registry_(std::move(registry)),
      transport_(std::move(transport)),
      validator_(std::move(validator)),
      tiers_(quality::NormalizeTierTable(std::move(tiers))),
      config_(config),
      clock_(std::move(clock)) {
  if (!registry_ || !transport_ || !clock_) {
    throw std::invalid_argument(
        "StreamSessionFactory: missing collaborator");
  }
}

std::unique_ptr<StreamSession> StreamSessionFactory::Create(
    const std::string& session_id, std::shared_ptr<ISessionListener> listener) const {
  util::Logger::Info("[StreamSessionFactory] CREATE session=" + session_id);
  return std::make_unique<StreamSession>(session_id, registry_, transport_, validator_,
                                         tiers_, config_, clock_, std::move(listener));
}

}  // namespace ferry::session
