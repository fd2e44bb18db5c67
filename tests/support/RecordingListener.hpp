#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "ferry/session/ISessionListener.hpp"

namespace ferry::testing {

// Records every notification. Optional hook runs on state changes (used to
// call back into the session from inside a notification).
class RecordingListener : public session::ISessionListener {
 public:
  using StateHook = std::function<void(session::SessionState, session::SessionState)>;

  void SetStateHook(StateHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
  }

  void OnStateChanged(session::SessionState from, session::SessionState to) override {
    StateHook hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      states_.emplace_back(from, to);
      hook = hook_;
    }
    if (hook) hook(from, to);
  }

  void OnSourceChanged(const session::SourceChange& change) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_.push_back(change);
  }

  void OnQualityChanged(const quality::QualityTier& tier) override {
    std::lock_guard<std::mutex> lock(mutex_);
    tiers_.push_back(tier);
  }

  void OnBufferHealth(buffer::BufferHealth health) override {
    std::lock_guard<std::mutex> lock(mutex_);
    healths_.push_back(health);
  }

  void OnRecoverableError(const session::SessionError& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    recoverable_.push_back(error);
  }

  void OnFatalError(const session::SessionError& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    fatal_.push_back(error);
  }

  // States entered, in order.
  std::vector<session::SessionState> StatePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<session::SessionState> out;
    for (const auto& t : states_) out.push_back(t.second);
    return out;
  }

  bool Entered(session::SessionState state) const {
    for (auto s : StatePath()) {
      if (s == state) return true;
    }
    return false;
  }

  // SourceChanged notifications that moved to a different provider.
  int ProviderSwitches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int switches = 0;
    for (size_t i = 1; i < sources_.size(); ++i) {
      if (sources_[i].provider != sources_[i - 1].provider) ++switches;
    }
    return switches;
  }

  std::vector<session::SourceChange> Sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_;
  }

  std::vector<quality::QualityTier> Tiers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiers_;
  }

  std::vector<buffer::BufferHealth> Healths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healths_;
  }

  std::vector<session::SessionError> Recoverable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recoverable_;
  }

  std::vector<session::SessionError> Fatal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatal_;
  }

 private:
  mutable std::mutex mutex_;
  StateHook hook_;
  std::vector<std::pair<session::SessionState, session::SessionState>> states_;
  std::vector<session::SourceChange> sources_;
  std::vector<quality::QualityTier> tiers_;
  std::vector<buffer::BufferHealth> healths_;
  std::vector<session::SessionError> recoverable_;
  std::vector<session::SessionError> fatal_;
};

}  // namespace ferry::testing
