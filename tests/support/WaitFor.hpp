#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace ferry::testing {

// Polls `pred` in real time; fetch completions arrive on worker threads.
inline bool WaitFor(const std::function<bool()>& pred, int timeout_ms = 3000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace ferry::testing
