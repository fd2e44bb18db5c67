#pragma once
#include "ferry/time/ITimeSource.hpp"
#include <chrono>

namespace ferry::time {

// Epoch milliseconds. For timestamps that must stay meaningful across
// restarts; not monotonic.
class WallClockTimeSource : public ITimeSource {
public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace ferry::time
