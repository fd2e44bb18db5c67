// Repository: Ferry
// Component: SegmentFetcher Implementation
// Purpose: Slot-bounded worker pool over IFetchTransport.
// Copyright (c) 2025 Ferry

#include "ferry/fetch/SegmentFetcher.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>
#include <stdexcept>

#include "ferry/util/Logger.hpp"

namespace ferry::fetch {

using ferry::util::Logger;

SegmentFetcher::SegmentFetcher(std::shared_ptr<IFetchTransport> transport,
                               FetcherConfig config,
                               std::shared_ptr<time::ITimeSource> clock)
    : transport_(std::move(transport)),
      config_(config),
      clock_(std::move(clock)),
      bandwidth_(config.bandwidth_window) {
  if (!transport_ || !clock_) {
    throw std::invalid_argument("SegmentFetcher: transport and clock are required");
  }
  if (config_.concurrency_limit == 0) {
    throw std::invalid_argument("SegmentFetcher: concurrency_limit must be > 0");
  }
  const size_t threads = config_.concurrency_limit * 2;
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&SegmentFetcher::WorkerLoop, this);
  }
}

SegmentFetcher::~SegmentFetcher() {
  Shutdown();
  for (auto& t : workers_) {
    // Only the calling worker can still be joinable here.
    if (t.joinable()) t.detach();
  }
}

RequestId SegmentFetcher::Submit(FetchRequest request, CompletionFn done) {
  RequestId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      Logger::Warn("[SegmentFetcher] Submit rejected after shutdown url=" + request.url);
      return 0;
    }
    id = next_id_++;
    Job job;
    job.id = id;
    job.request = std::move(request);
    job.done = std::move(done);
    job.cancelled = std::make_shared<std::atomic<bool>>(false);
    InsertQueuedLocked(std::move(job));
    EnsureWorkerLocked();
  }
  work_cv_.notify_one();
  return id;
}

FetchResult SegmentFetcher::Fetch(FetchRequest request) {
  auto promise = std::make_shared<std::promise<FetchResult>>();
  auto future = promise->get_future();
  RequestId id = Submit(std::move(request),
                        [promise](RequestId, std::shared_ptr<const Chunk> chunk,
                                  std::optional<FetchError> error) {
                          promise->set_value(FetchResult{std::move(chunk), std::move(error)});
                        });
  if (id == 0) {
    auto chunk = std::make_shared<Chunk>();
    chunk->status = ChunkStatus::kAborted;
    return FetchResult{chunk, std::nullopt};
  }
  return future.get();
}

// Every worker may be unwinding a cancelled transfer while slots are free.
// Adds one worker when nothing is idle but work could start.
void SegmentFetcher::EnsureWorkerLocked() {
  if (shutdown_ || busy_workers_ < workers_.size()) return;
  const bool startable = !aborted_.empty() ||
                         (!queue_.empty() && active_.size() < config_.concurrency_limit);
  if (!startable) return;
  workers_.emplace_back(&SegmentFetcher::WorkerLoop, this);
  std::ostringstream oss;
  oss << "[SegmentFetcher] POOL_GROW workers=" << workers_.size()
      << " busy=" << busy_workers_ << " active=" << active_.size();
  Logger::Debug(oss.str());
}

size_t SegmentFetcher::WorkerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

void SegmentFetcher::InsertQueuedLocked(Job job) {
  if (!job.request.high_priority) {
    queue_.push_back(std::move(job));
    return;
  }
  // After the last queued high-priority job, ahead of every normal one.
  auto it = std::find_if(queue_.begin(), queue_.end(),
                         [](const Job& j) { return !j.request.high_priority; });
  queue_.insert(it, std::move(job));
}

bool SegmentFetcher::Cancel(RequestId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto qit = std::find_if(queue_.begin(), queue_.end(),
                            [id](const Job& j) { return j.id == id; });
    if (qit != queue_.end()) {
      qit->cancelled->store(true, std::memory_order_release);
      aborted_.push_back(std::move(*qit));
      queue_.erase(qit);
    } else {
      auto ait = active_.find(id);
      if (ait == active_.end()) return false;
      ait->second->store(true, std::memory_order_release);
      active_.erase(ait);  // slot is free from here on
    }
    EnsureWorkerLocked();
  }
  work_cv_.notify_all();
  Logger::Debug("[SegmentFetcher] CANCEL request_id=" + std::to_string(id));
  return true;
}

size_t SegmentFetcher::CancelAll() {
  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& job : queue_) {
      job.cancelled->store(true, std::memory_order_release);
      aborted_.push_back(std::move(job));
      ++count;
    }
    queue_.clear();
    for (auto& kv : active_) {
      kv.second->store(true, std::memory_order_release);
      ++count;
    }
    active_.clear();
    EnsureWorkerLocked();
  }
  work_cv_.notify_all();
  return count;
}

size_t SegmentFetcher::InFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

size_t SegmentFetcher::Queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

double SegmentFetcher::BandwidthBps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bandwidth_.EstimateBps();
}

std::shared_ptr<const Chunk> SegmentFetcher::Cached(const ChunkKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  return it == cache_.end() ? nullptr : it->second;
}

int64_t SegmentFetcher::CachedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_bytes_;
}

size_t SegmentFetcher::Evict(const std::string& content_id,
                             int64_t keep_from_offset, int64_t max_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_bytes_ <= max_bytes) return 0;

  // Chunks of other content go first: the session has moved on from them.
  using CacheIt = std::map<ChunkKey, std::shared_ptr<const Chunk>>::iterator;
  std::vector<CacheIt> stale;
  std::vector<CacheIt> behind;
  for (auto it = cache_.begin(); it != cache_.end(); ++it) {
    if (it->first.content_id != content_id) {
      stale.push_back(it);
    } else if (it->second->range.end() <= keep_from_offset) {
      behind.push_back(it);
    }
  }
  auto oldest_first = [](const CacheIt& a, const CacheIt& b) {
    return a->second->completed_at_ms < b->second->completed_at_ms;
  };
  std::sort(stale.begin(), stale.end(), oldest_first);
  std::sort(behind.begin(), behind.end(), oldest_first);

  size_t evicted = 0;
  size_t evicted_stale = 0;
  for (auto* group : {&stale, &behind}) {
    for (auto& it : *group) {
      if (cache_bytes_ <= max_bytes) break;
      cache_bytes_ -= it->second->size;
      cache_.erase(it);
      ++evicted;
      if (group == &stale) ++evicted_stale;
    }
  }
  if (evicted > 0) {
    std::ostringstream oss;
    oss << "[SegmentFetcher] EVICT content=" << content_id
        << " chunks=" << evicted << " other_content=" << evicted_stale
        << " cached_bytes=" << cache_bytes_;
    Logger::Debug(oss.str());
  }
  return evicted;
}

bool SegmentFetcher::IdleLocked() const {
  return queue_.empty() && active_.empty() && aborted_.empty() &&
         busy_workers_ == 0;
}

bool SegmentFetcher::WaitForIdle(int64_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [this] { return IdleLocked(); });
}

void SegmentFetcher::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shutdown_) {
      shutdown_ = true;
      for (auto& job : queue_) {
        job.cancelled->store(true, std::memory_order_release);
        aborted_.push_back(std::move(job));
      }
      queue_.clear();
      for (auto& kv : active_) {
        kv.second->store(true, std::memory_order_release);
      }
      active_.clear();
    }
  }
  work_cv_.notify_all();
  const auto self = std::this_thread::get_id();
  for (auto& t : workers_) {
    if (t.joinable() && t.get_id() != self) t.join();
  }
}

// =============================================================================
// WorkerLoop
// =============================================================================

void SegmentFetcher::WorkerLoop() {
  while (true) {
    Job job;
    bool deliver_abort = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_ || !aborted_.empty() ||
               (!queue_.empty() && active_.size() < config_.concurrency_limit);
      });
      if (!aborted_.empty()) {
        job = std::move(aborted_.front());
        aborted_.pop_front();
        deliver_abort = true;
      } else if (shutdown_) {
        break;
      } else {
        job = std::move(queue_.front());
        queue_.pop_front();
        active_[job.id] = job.cancelled;
      }
      ++busy_workers_;
    }

    if (deliver_abort) {
      DeliverAborted(job);
    } else {
      Run(job);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --busy_workers_;
      if (IdleLocked()) idle_cv_.notify_all();
    }
  }
}

void SegmentFetcher::DeliverAborted(Job& job) {
  auto chunk = std::make_shared<Chunk>();
  chunk->key = ChunkKey{job.request.content_id, job.request.rendition,
                        job.request.range.offset};
  chunk->status = ChunkStatus::kAborted;
  chunk->provider = job.request.provider;
  chunk->range = job.request.range;
  chunk->start_s = job.request.start_s;
  chunk->end_s = job.request.end_s;
  if (job.done) job.done(job.id, chunk, std::nullopt);
}

void SegmentFetcher::Run(Job& job) {
  const FetchRequest& req = job.request;
  const ChunkKey key{req.content_id, req.rendition, req.range.offset};

  std::shared_ptr<const Chunk> hit;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second->range == req.range) {
      if (PayloadCrc32(it->second->payload) == it->second->crc32) {
        hit = it->second;
      } else {
        Logger::Warn("[SegmentFetcher] CACHE_CRC_MISMATCH content=" + key.content_id +
                     " offset=" + std::to_string(key.offset));
        cache_bytes_ -= it->second->size;
        cache_.erase(it);
      }
    }
    if (hit) active_.erase(job.id);
  }
  if (hit) {
    work_cv_.notify_all();
    auto copy = std::make_shared<Chunk>(*hit);
    copy->from_cache = true;
    copy->start_s = req.start_s;
    copy->end_s = req.end_s;
    if (job.done) job.done(job.id, copy, std::nullopt);
    return;
  }

  const int64_t started_ms = clock_->NowMs();
  TransportRequest treq;
  treq.url = req.url;
  treq.range = req.range;
  treq.timeout_ms = config_.request_timeout_ms;
  TransportResponse resp = transport_->Get(treq, *job.cancelled);
  const int64_t now_ms = clock_->NowMs();

  const bool aborted = job.cancelled->load(std::memory_order_acquire) ||
                       resp.status == TransportStatus::kAborted;
  std::optional<FetchError> error;
  if (!aborted) error = ClassifyResponse(resp, req.range);

  auto chunk = std::make_shared<Chunk>();
  chunk->key = key;
  chunk->provider = req.provider;
  chunk->range = req.range;
  chunk->start_s = req.start_s;
  chunk->end_s = req.end_s;
  chunk->elapsed_ms = now_ms - started_ms;
  chunk->completed_at_ms = now_ms;
  chunk->mime_type = resp.content_type;

  if (aborted) {
    chunk->status = ChunkStatus::kAborted;
  } else if (error) {
    chunk->status = ChunkStatus::kFailed;
  } else {
    chunk->status = ChunkStatus::kLoaded;
    chunk->payload = std::move(resp.body);
    chunk->size = static_cast<int64_t>(chunk->payload.size());
    chunk->crc32 = PayloadCrc32(chunk->payload);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(job.id);  // no-op when Cancel() already released the slot
    if (chunk->status == ChunkStatus::kLoaded) {
      bandwidth_.AddSample(chunk->size, chunk->elapsed_ms);
      auto it = cache_.find(key);
      if (it != cache_.end()) cache_bytes_ -= it->second->size;
      cache_[key] = chunk;
      cache_bytes_ += chunk->size;
    }
  }
  work_cv_.notify_all();

  std::ostringstream oss;
  oss << "[SegmentFetcher] COMPLETE request_id=" << job.id
      << " provider=" << req.provider
      << " offset=" << req.range.offset
      << " length=" << req.range.length
      << " status=" << ToString(chunk->status)
      << " elapsed_ms=" << chunk->elapsed_ms;
  if (error) {
    oss << " error=" << ToString(error->kind) << " detail=\"" << error->message << "\"";
    Logger::Warn(oss.str());
  } else {
    Logger::Debug(oss.str());
  }

  if (job.done) job.done(job.id, chunk, error);
}

}  // namespace ferry::fetch
