// Repository: Ferry
// Component: SegmentFetcher
// Purpose: Concurrent, cancellable byte-range fetches with bounded in-flight
//          slots, priority queueing, a content-addressed chunk cache, and a
//          smoothed bandwidth estimate.
// Copyright (c) 2025 Ferry

#ifndef FERRY_FETCH_SEGMENT_FETCHER_HPP_
#define FERRY_FETCH_SEGMENT_FETCHER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "ferry/fetch/BandwidthEstimator.hpp"
#include "ferry/fetch/FetchTypes.hpp"
#include "ferry/fetch/IFetchTransport.hpp"
#include "ferry/time/ITimeSource.hpp"

namespace ferry::fetch {

struct FetcherConfig {
  size_t concurrency_limit = 3;
  int64_t request_timeout_ms = 10000;
  size_t bandwidth_window = 5;
};

struct FetchRequest {
  std::string provider;
  std::string url;
  std::string content_id;
  int rendition = 0;
  ByteRange range;
  // Playback span the bytes cover; carried through to the chunk.
  double start_s = 0.0;
  double end_s = 0.0;
  bool high_priority = false;
};

using RequestId = uint64_t;

// Invoked exactly once per accepted request, on a fetcher worker thread and
// never while the fetcher lock is held. A cancelled request completes with
// status kAborted and no error.
using CompletionFn = std::function<void(RequestId,
                                        std::shared_ptr<const Chunk>,
                                        std::optional<FetchError>)>;

struct FetchResult {
  std::shared_ptr<const Chunk> chunk;
  std::optional<FetchError> error;
};

// Per-session worker pool.
//
// At most concurrency_limit requests hold a slot. Cancel() of an in-flight
// request releases its slot immediately while its worker is still unwinding
// the transfer. The pool starts at 2 x limit threads and adds one whenever
// every thread is busy and a queued request could take a free slot, so it
// peaks at limit + the number of transfers unwinding at once. Threads are
// joined at Shutdown().
class SegmentFetcher {
 public:
  SegmentFetcher(std::shared_ptr<IFetchTransport> transport,
                 FetcherConfig config,
                 std::shared_ptr<time::ITimeSource> clock);
  ~SegmentFetcher();

  SegmentFetcher(const SegmentFetcher&) = delete;
  SegmentFetcher& operator=(const SegmentFetcher&) = delete;

  // Queues a request. High-priority requests go ahead of queued normal ones
  // (FIFO within a priority) but never preempt in-flight work.
  // Returns 0 after Shutdown().
  RequestId Submit(FetchRequest request, CompletionFn done);

  // Blocking convenience over Submit(). Not callable from a CompletionFn.
  FetchResult Fetch(FetchRequest request);

  // Returns false if the request already completed (or is unknown).
  bool Cancel(RequestId id);
  size_t CancelAll();

  [[nodiscard]] size_t InFlight() const;
  [[nodiscard]] size_t Queued() const;

  // Bits per second; 0 until a network transfer completed.
  [[nodiscard]] double BandwidthBps() const;

  [[nodiscard]] std::shared_ptr<const Chunk> Cached(const ChunkKey& key) const;
  [[nodiscard]] int64_t CachedBytes() const;
  [[nodiscard]] size_t WorkerCount() const;

  // Brings the cache to at most max_bytes. Chunks of any other content id go
  // first, then chunks of content_id lying wholly before keep_from_offset;
  // oldest completion first within each group. Returns the number dropped.
  size_t Evict(const std::string& content_id, int64_t keep_from_offset,
               int64_t max_bytes);

  // Waits (real time) until nothing is queued, running, or awaiting delivery.
  bool WaitForIdle(int64_t timeout_ms);

  // Cancels everything, delivers pending aborts, joins workers. Idempotent.
  void Shutdown();

 private:
  struct Job {
    RequestId id = 0;
    FetchRequest request;
    CompletionFn done;
    std::shared_ptr<std::atomic<bool>> cancelled;
  };

  void WorkerLoop();
  void Run(Job& job);
  void DeliverAborted(Job& job);
  void InsertQueuedLocked(Job job);
  void EnsureWorkerLocked();
  bool IdleLocked() const;

  std::shared_ptr<IFetchTransport> transport_;
  const FetcherConfig config_;
  std::shared_ptr<time::ITimeSource> clock_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;

  std::deque<Job> queue_;
  std::deque<Job> aborted_;
  // Requests holding a concurrency slot.
  std::unordered_map<RequestId, std::shared_ptr<std::atomic<bool>>> active_;
  size_t busy_workers_ = 0;
  RequestId next_id_ = 1;
  bool shutdown_ = false;

  BandwidthEstimator bandwidth_;
  std::map<ChunkKey, std::shared_ptr<const Chunk>> cache_;
  int64_t cache_bytes_ = 0;

  std::vector<std::thread> workers_;
};

}  // namespace ferry::fetch

#endif  // FERRY_FETCH_SEGMENT_FETCHER_HPP_
