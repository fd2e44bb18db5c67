#pragma once
#include <cstdint>

namespace ferry::time {

// Monotonic millisecond clock. All cooldowns, stall windows and switch
// intervals are measured against this so tests can drive time by hand.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

}  // namespace ferry::time
