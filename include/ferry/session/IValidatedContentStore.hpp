// Repository: Ferry
// Component: Validated content persistence seam
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_I_VALIDATED_CONTENT_STORE_HPP_
#define FERRY_SESSION_I_VALIDATED_CONTENT_STORE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "ferry/session/SessionTypes.hpp"

namespace ferry::session {

struct ValidatedContentEntry {
  std::string content_id;
  ContentInfo info;
  int64_t validated_ms = 0;  // wall clock, epoch milliseconds
};

// Table keyed by content id. Save() replaces the whole table.
class IValidatedContentStore {
 public:
  virtual ~IValidatedContentStore() = default;

  virtual std::vector<ValidatedContentEntry> Load() = 0;
  virtual void Save(const std::vector<ValidatedContentEntry>& entries) = 0;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_I_VALIDATED_CONTENT_STORE_HPP_
