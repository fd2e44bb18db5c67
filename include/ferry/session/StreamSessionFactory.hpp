// Repository: Ferry
// Component: StreamSessionFactory
// Purpose: Builds independent sessions over one shared provider registry.
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_STREAM_SESSION_FACTORY_HPP_
#define FERRY_SESSION_STREAM_SESSION_FACTORY_HPP_

#include <memory>
#include <string>
#include <vector>

#include "ferry/fetch/IFetchTransport.hpp"
#include "ferry/provider/ProviderRegistry.hpp"
#include "ferry/quality/QualityTier.hpp"
#include "ferry/session/IContentValidator.hpp"
#include "ferry/session/ISessionListener.hpp"
#include "ferry/session/SessionTypes.hpp"
#include "ferry/session/StreamSession.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::session {

// The registry (and its score table) is the only state sessions share; each
// session gets its own fetcher, buffer tracker and quality advisor.
class StreamSessionFactory {
 public:
  // Throws std::invalid_argument on a missing collaborator or an invalid
  // tier table. validator may be null (content is then accepted unprobed).
  StreamSessionFactory(std::shared_ptr<provider::ProviderRegistry> registry,
                       std::shared_ptr<fetch::IFetchTransport> transport,
                       std::shared_ptr<IContentValidator> validator,
                       std::vector<quality::QualityTier> tiers,
                       SessionConfig config,
                       std::shared_ptr<time::ITimeSource> clock);

  std::unique_ptr<StreamSession> Create(const std::string& session_id,
                                        std::shared_ptr<ISessionListener> listener) const;

  const std::shared_ptr<provider::ProviderRegistry>& registry() const { return registry_; }
  const std::vector<quality::QualityTier>& tiers() const { return tiers_; }
  const SessionConfig& config() const { return config_; }

 private:
  std::shared_ptr<provider::ProviderRegistry> registry_;
  std::shared_ptr<fetch::IFetchTransport> transport_;
  std::shared_ptr<IContentValidator> validator_;
  std::vector<quality::QualityTier> tiers_;
  SessionConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_STREAM_SESSION_FACTORY_HPP_
