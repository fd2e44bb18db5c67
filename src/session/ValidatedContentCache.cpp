// Repository: Ferry
// Component: ValidatedContentCache
// Purpose: Content ids that passed validation, kept for a validity window and
//          optionally persisted across restarts.
// Copyright (c) 2025 Ferry

#include "ferry/session/ValidatedContentCache.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

#include "ferry/util/Logger.hpp"

namespace ferry::session {

using ferry::util::Logger;

ValidatedContentCache::ValidatedContentCache(int64_t validity_ms,
                                             std::shared_ptr<time::ITimeSource> clock,
                                             std::shared_ptr<IValidatedContentStore> store)
    : validity_ms_(validity_ms), clock_(std::move(clock)), store_(std::move(store)) {
  if (!clock_) {
    throw std::invalid_argument("ValidatedContentCache: time source is required");
  }
  if (!store_) return;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : store_->Load()) {
    auto it = entries_.find(entry.content_id);
    if (it == entries_.end() || entry.validated_ms >= it->second.validated_ms) {
      entries_[entry.content_id] = std::move(entry);
    }
  }
  const size_t loaded = entries_.size();
  const size_t expired = PurgeExpiredLocked(clock_->NowMs());
  if (expired > 0) SaveLocked();

  std::ostringstream oss;
  oss << "[ValidatedContentCache] LOADED entries=" << entries_.size()
      << " expired=" << expired << " read=" << loaded;
  Logger::Info(oss.str());
}

std::optional<ContentInfo> ValidatedContentCache::Lookup(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(content_id);
  if (it == entries_.end()) return std::nullopt;
  if (clock_->NowMs() - it->second.validated_ms >= validity_ms_) return std::nullopt;
  return it->second.info;
}

void ValidatedContentCache::Insert(const std::string& content_id, const ContentInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = clock_->NowMs();
  PurgeExpiredLocked(now);
  entries_[content_id] = ValidatedContentEntry{content_id, info, now};
  SaveLocked();
}

size_t ValidatedContentCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t ValidatedContentCache::PurgeExpiredLocked(int64_t now_ms) {
  size_t dropped = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now_ms - it->second.validated_ms >= validity_ms_) {
      it = entries_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  if (dropped > 0) {
    Logger::Debug("[ValidatedContentCache] PURGED expired=" + std::to_string(dropped));
  }
  return dropped;
}

void ValidatedContentCache::SaveLocked() {
  if (!store_) return;
  std::vector<ValidatedContentEntry> table;
  table.reserve(entries_.size());
  for (const auto& kv : entries_) table.push_back(kv.second);
  store_->Save(table);
}

}  // namespace ferry::session
