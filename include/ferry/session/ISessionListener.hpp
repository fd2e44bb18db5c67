// Repository: Ferry
// Component: Session notification interface
// Copyright (c) 2025 Ferry

#ifndef FERRY_SESSION_I_SESSION_LISTENER_HPP_
#define FERRY_SESSION_I_SESSION_LISTENER_HPP_

#include "ferry/buffer/BufferTracker.hpp"
#include "ferry/quality/QualityTier.hpp"
#include "ferry/session/SessionTypes.hpp"

namespace ferry::session {

// Delivered in production order, one dispatcher at a time, never while the
// session lock is held. Listeners may call back into the session.
class ISessionListener {
 public:
  virtual ~ISessionListener() = default;

  virtual void OnStateChanged(SessionState from, SessionState to) {
    (void)from;
    (void)to;
  }
  virtual void OnSourceChanged(const SourceChange& change) = 0;
  virtual void OnQualityChanged(const quality::QualityTier& tier) = 0;
  virtual void OnBufferHealth(buffer::BufferHealth health) = 0;
  virtual void OnRecoverableError(const SessionError& error) = 0;
  virtual void OnFatalError(const SessionError& error) = 0;
};

}  // namespace ferry::session

#endif  // FERRY_SESSION_I_SESSION_LISTENER_HPP_
