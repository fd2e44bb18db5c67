#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "ferry/session/IContentValidator.hpp"

namespace ferry::testing {

class FakeContentValidator : public session::IContentValidator {
 public:
  explicit FakeContentValidator(double duration_s = 120.0) {
    result_.ok = true;
    result_.info.duration_s = duration_s;
    result_.info.mime_type = "video/mp4";
  }

  void SetSizeBytes(int64_t size_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_.info.size_bytes = size_bytes;
  }

  void Reject(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_.ok = false;
    result_.reason = reason;
  }

  session::ValidationResult Validate(const std::string& content_id,
                                     const std::string& probe_url) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    last_content_id_ = content_id;
    last_probe_url_ = probe_url;
    return result_;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::string last_probe_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_probe_url_;
  }

 private:
  mutable std::mutex mutex_;
  session::ValidationResult result_;
  int calls_ = 0;
  std::string last_content_id_;
  std::string last_probe_url_;
};

}  // namespace ferry::testing
