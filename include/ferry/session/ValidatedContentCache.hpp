// Repository: Ferry
// Component: ValidatedContentCache
// Purpose: Content ids that passed validation, kept for a validity window and
//          optionally persisted across restarts.
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_VALIDATED_CONTENT_CACHE_HPP_
#define FERRY_SESSION_VALIDATED_CONTENT_CACHE_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ferry/session/IValidatedContentStore.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::session {

// Entries older than validity_ms are dropped when the table is loaded and
// whenever an entry is added; a lookup never returns one. With a store, the
// table is read once at construction and written back after every change.
// Timestamps come from `clock`, which must be a wall clock when a store is
// attached.
class ValidatedContentCache {
 public:
  ValidatedContentCache(int64_t validity_ms, std::shared_ptr<time::ITimeSource> clock,
                        std::shared_ptr<IValidatedContentStore> store = nullptr);

  [[nodiscard]] std::optional<ContentInfo> Lookup(const std::string& content_id) const;
  void Insert(const std::string& content_id, const ContentInfo& info);

  [[nodiscard]] size_t size() const;

 private:
  // Returns the number of entries dropped.
  size_t PurgeExpiredLocked(int64_t now_ms);
  void SaveLocked();

  const int64_t validity_ms_;
  std::shared_ptr<time::ITimeSource> clock_;
  std::shared_ptr<IValidatedContentStore> store_;

  mutable std::mutex mutex_;
  std::map<std::string, ValidatedContentEntry> entries_;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_VALIDATED_CONTENT_CACHE_HPP_
