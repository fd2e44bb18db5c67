// Repository: Ferry
// Component: StreamControl gRPC Service Implementation
// Purpose: Implements the StreamControl service over a StreamSessionFactory.
// Copyright (c) 2025 Ferry

#ifndef FERRY_STREAM_SERVICE_H_
#define FERRY_STREAM_SERVICE_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "ferry/session/ISessionListener.hpp"
#include "ferry/session/StreamSession.hpp"
#include "ferry/session/StreamSessionFactory.hpp"
#include "ferry/v1/stream_control.grpc.pb.h"
#include "ferry/v1/stream_control.pb.h"

namespace ferry {
namespace v1 {

// Converts session notifications to SessionEvent messages and fans them out
// to every SubscribeEvents stream attached to the session.
class SessionEventRelay : public session::ISessionListener {
 public:
  struct Subscriber {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<SessionEvent> events;
    bool closed = false;
  };

  explicit SessionEventRelay(std::string session_id);

  std::shared_ptr<Subscriber> Attach();
  void Detach(const std::shared_ptr<Subscriber>& subscriber);
  // Wakes every subscriber with closed=true; later Attach() calls return
  // already-closed subscribers.
  void Close();

  void OnStateChanged(session::SessionState from, session::SessionState to) override;
  void OnSourceChanged(const session::SourceChange& change) override;
  void OnQualityChanged(const quality::QualityTier& tier) override;
  void OnBufferHealth(buffer::BufferHealth health) override;
  void OnRecoverableError(const session::SessionError& error) override;
  void OnFatalError(const session::SessionError& error) override;

  uint64_t published() const { return sequence_.load(std::memory_order_acquire); }

 private:
  void Publish(SessionEvent event);

  const std::string session_id_;
  std::atomic<uint64_t> sequence_{0};
  std::mutex mutex_;
  std::vector<std::shared_ptr<Subscriber>> subscribers_;
  bool closed_ = false;
};

// StreamControlImpl implements the gRPC service defined in stream_control.proto.
// A thin adapter: each RPC resolves the session and delegates to it.
class StreamControlImpl final : public StreamControl::Service {
 public:
  explicit StreamControlImpl(std::shared_ptr<session::StreamSessionFactory> factory);
  ~StreamControlImpl() override;

  StreamControlImpl(const StreamControlImpl&) = delete;
  StreamControlImpl& operator=(const StreamControlImpl&) = delete;

  grpc::Status OpenSession(grpc::ServerContext* context,
                           const OpenSessionRequest* request,
                           OpenSessionResponse* response) override;

  grpc::Status Load(grpc::ServerContext* context,
                    const LoadRequest* request,
                    CommandResponse* response) override;

  grpc::Status Seek(grpc::ServerContext* context,
                    const SeekRequest* request,
                    CommandResponse* response) override;

  grpc::Status ReportPlayback(grpc::ServerContext* context,
                              const ReportPlaybackRequest* request,
                              CommandResponse* response) override;

  grpc::Status SetAutoQuality(grpc::ServerContext* context,
                              const SetAutoQualityRequest* request,
                              CommandResponse* response) override;

  grpc::Status ForceQuality(grpc::ServerContext* context,
                            const ForceQualityRequest* request,
                            CommandResponse* response) override;

  grpc::Status Dispose(grpc::ServerContext* context,
                       const DisposeRequest* request,
                       CommandResponse* response) override;

  grpc::Status GetSessionStatus(grpc::ServerContext* context,
                                const GetSessionStatusRequest* request,
                                SessionStatus* response) override;

  grpc::Status ListProviders(grpc::ServerContext* context,
                             const ListProvidersRequest* request,
                             ListProvidersResponse* response) override;

  grpc::Status DisableProvider(grpc::ServerContext* context,
                               const ProviderRequest* request,
                               CommandResponse* response) override;

  grpc::Status ReenableProvider(grpc::ServerContext* context,
                                const ProviderRequest* request,
                                CommandResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

  grpc::Status SubscribeEvents(grpc::ServerContext* context,
                               const SubscribeEventsRequest* request,
                               grpc::ServerWriter<SessionEvent>* writer) override;

  // Disposes every session; pending SubscribeEvents streams end.
  void Shutdown();

  size_t SessionCount() const;

 private:
  struct SessionEntry {
    std::shared_ptr<SessionEventRelay> relay;
    std::shared_ptr<session::StreamSession> session;
  };

  std::shared_ptr<SessionEntry> Find(const std::string& session_id) const;
  // Fills success/message/state; FAILED_PRECONDITION when !ok.
  static grpc::Status Finish(bool ok, const std::string& what,
                             const session::StreamSession& session,
                             CommandResponse* response);

  std::shared_ptr<session::StreamSessionFactory> factory_;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
  uint64_t next_session_ = 1;
};

// Wire conversions, shared with tests.
SessionState ToProto(session::SessionState state);
BufferHealth ToProto(buffer::BufferHealth health);
ErrorKind ToProto(session::ErrorKind kind);

}  // namespace v1
}  // namespace ferry

#endif  // FERRY_STREAM_SERVICE_H_
