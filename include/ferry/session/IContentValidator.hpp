// Repository: Ferry
// Component: Content validation seam
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_I_CONTENT_VALIDATOR_HPP_
#define FERRY_SESSION_I_CONTENT_VALIDATOR_HPP_

#include <string>

#include "ferry/session/SessionTypes.hpp"

namespace ferry::session {

struct ValidationResult {
  bool ok = false;
  std::string reason;
  ContentInfo info;
};

// Decides whether a content id names playable media. A rejection is final
// for the content; switching providers does not help.
class IContentValidator {
 public:
  virtual ~IContentValidator() = default;

  // probe_url: the content at the top-ranked provider, lowest tier.
  virtual ValidationResult Validate(const std::string& content_id,
                                    const std::string& probe_url) = 0;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_I_CONTENT_VALIDATOR_HPP_
