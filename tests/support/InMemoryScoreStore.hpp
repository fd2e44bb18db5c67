#pragma once

#include <mutex>
#include <vector>

#include "ferry/provider/IProviderScoreStore.hpp"

namespace ferry::testing {

class InMemoryScoreStore : public provider::IProviderScoreStore {
 public:
  InMemoryScoreStore() = default;
  explicit InMemoryScoreStore(std::vector<provider::ProviderScoreEntry> initial)
      : entries_(std::move(initial)) {}

  std::vector<provider::ProviderScoreEntry> Load() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  void Save(const std::vector<provider::ProviderScoreEntry>& entries) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = entries;
    ++saves_;
  }

  int saves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<provider::ProviderScoreEntry> entries_;
  int saves_ = 0;
};

}  // namespace ferry::testing
