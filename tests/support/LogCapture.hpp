#pragma once

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

#include "ferry/util/Logger.hpp"

namespace ferry::testing {

// Installs Logger sinks for its lifetime and keeps every captured line.
class LogCapture {
 public:
  LogCapture() {
    util::Logger::SetInfoSink([this](const std::string& line) { Append(line); });
    util::Logger::SetWarnSink([this](const std::string& line) { Append(line); });
    util::Logger::SetErrorSink([this](const std::string& line) { Append(line); });
  }

  ~LogCapture() {
    util::Logger::SetInfoSink(nullptr);
    util::Logger::SetWarnSink(nullptr);
    util::Logger::SetErrorSink(nullptr);
  }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  bool Contains(const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
      return line.find(fragment) != std::string::npos;
    });
  }

 private:
  void Append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
  }

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

}  // namespace ferry::testing
