#pragma once
#include "ferry/time/ITimeSource.hpp"
#include <chrono>

namespace ferry::time {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace ferry::time
