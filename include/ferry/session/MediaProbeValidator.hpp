// Repository: Ferry
// Component: MediaProbeValidator
// Purpose: Resolving-state validator that probes content through libavformat
//          and caches accepted content ids for a validity window.
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_MEDIA_PROBE_VALIDATOR_HPP_
#define FERRY_SESSION_MEDIA_PROBE_VALIDATOR_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "ferry/session/IContentValidator.hpp"
#include "ferry/session/IValidatedContentStore.hpp"
#include "ferry/session/ValidatedContentCache.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::session {

struct ProbeConfig {
  int64_t probe_timeout_ms = 10000;
  // Accepted content stays valid this long without re-probing.
  int64_t validity_ms = 48LL * 60 * 60 * 1000;
};

// Accepts a content id if it is well-formed and the probe URL opens as media
// carrying at least one video stream. Rejections are not cached. With a
// store, accepted ids survive restarts; `clock` must then be a wall clock.
class MediaProbeValidator : public IContentValidator {
 public:
  MediaProbeValidator(ProbeConfig config, std::shared_ptr<time::ITimeSource> clock,
                      std::shared_ptr<IValidatedContentStore> store = nullptr);

  ValidationResult Validate(const std::string& content_id,
                            const std::string& probe_url) override;

  // Content ids are opaque tokens: ASCII letters, digits, '-' and '_'.
  static bool IsWellFormedId(const std::string& content_id);

  size_t CachedCount() const;

 private:
  ValidationResult Probe(const std::string& probe_url) const;

  const ProbeConfig config_;
  ValidatedContentCache cache_;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_MEDIA_PROBE_VALIDATOR_HPP_
