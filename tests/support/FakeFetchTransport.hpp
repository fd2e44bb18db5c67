#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ferry/fetch/IFetchTransport.hpp"

namespace ferry::testing {

// Scripted transport. Providers are addressed by URL host: endpoint
// templates in tests look like "fake://p0/{content}".
class FakeFetchTransport : public fetch::IFetchTransport {
 public:
  enum class Mode {
    kOk,           // 206 with exactly the requested bytes
    kTimeout,      // transport timeout
    kNotFound,     // HTTP 404
    kServerError,  // HTTP 503
    kHtml,         // 206 but text/html (gateway error page)
    kHang,         // blocks until the request is cancelled
  };

  struct Seen {
    std::string provider;
    std::string url;
    fetch::ByteRange range;
  };

  static std::string ProviderOf(const std::string& url) {
    const std::string scheme = "fake://";
    if (url.compare(0, scheme.size(), scheme) != 0) return url;
    const size_t slash = url.find('/', scheme.size());
    return url.substr(scheme.size(), slash == std::string::npos ? std::string::npos
                                                                : slash - scheme.size());
  }

  // Mode used once the provider's script is exhausted.
  void SetMode(const std::string& provider, Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaults_[provider] = mode;
  }

  // Every rendition is `size` bytes long: ranges starting at or past it get
  // 416 and ranges crossing it are cut short. -1 (default) is unbounded.
  void SetResourceSize(int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    resource_size_ = size;
  }

  // Largest byte offset any request asked for; -1 before the first.
  int64_t MaxRequestedOffset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t max = -1;
    for (const auto& s : seen_) max = std::max(max, s.range.offset);
    return max;
  }

  // Next `count` requests to `provider` get `mode`, ahead of the default.
  void Script(const std::string& provider, Mode mode, int count = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < count; ++i) scripts_[provider].push_back(mode);
  }

  int RequestCount(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto& s : seen_) {
      if (s.provider == provider) ++n;
    }
    return n;
  }

  int TotalRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(seen_.size());
  }

  std::vector<Seen> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

  int Active() const { return active_.load(); }
  int MaxActive() const { return max_active_.load(); }

  fetch::TransportResponse Get(const fetch::TransportRequest& request,
                               const std::atomic<bool>& cancelled) override {
    Mode mode = Mode::kOk;
    int64_t resource_size = -1;
    const std::string provider = ProviderOf(request.url);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto& script = scripts_[provider];
      if (!script.empty()) {
        mode = script.front();
        script.pop_front();
      } else {
        auto it = defaults_.find(provider);
        if (it != defaults_.end()) mode = it->second;
      }
      seen_.push_back(Seen{provider, request.url, request.range});
      resource_size = resource_size_;
    }

    const int now_active = ++active_;
    int prev = max_active_.load();
    while (now_active > prev && !max_active_.compare_exchange_weak(prev, now_active)) {
    }

    fetch::TransportResponse response;
    if (mode == Mode::kOk && resource_size >= 0 && request.range.offset >= resource_size) {
      response.status = fetch::TransportStatus::kHttpError;
      response.http_status = 416;
      response.detail = "range not satisfiable";
      --active_;
      return response;
    }
    int64_t length = request.range.length;
    if (resource_size >= 0) {
      length = std::min(length, resource_size - request.range.offset);
      response.total_size = resource_size;
    }
    switch (mode) {
      case Mode::kOk:
      case Mode::kHtml:
        response.status = fetch::TransportStatus::kOk;
        response.http_status = 206;
        response.partial_content = true;
        response.content_type = mode == Mode::kOk ? "video/mp4" : "text/html";
        response.body.resize(static_cast<size_t>(length));
        for (size_t i = 0; i < response.body.size(); ++i) {
          response.body[i] = static_cast<uint8_t>((request.range.offset + i) & 0xff);
        }
        break;
      case Mode::kTimeout:
        response.status = fetch::TransportStatus::kTimeout;
        response.detail = "timed out";
        break;
      case Mode::kNotFound:
        response.status = fetch::TransportStatus::kHttpError;
        response.http_status = 404;
        response.detail = "not found";
        break;
      case Mode::kServerError:
        response.status = fetch::TransportStatus::kHttpError;
        response.http_status = 503;
        response.detail = "service unavailable";
        break;
      case Mode::kHang:
        while (!cancelled.load(std::memory_order_acquire)) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        response.status = fetch::TransportStatus::kAborted;
        break;
    }
    --active_;
    return response;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Mode> defaults_;
  std::map<std::string, std::deque<Mode>> scripts_;
  std::vector<Seen> seen_;
  int64_t resource_size_ = -1;
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
};

}  // namespace ferry::testing
