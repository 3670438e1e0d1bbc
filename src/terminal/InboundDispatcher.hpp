#ifndef __RT_INBOUND_DISPATCHER__
#define __RT_INBOUND_DISPATCHER__

#include "Headers.hpp"
#include "StreamListeners.hpp"
#include "StreamState.hpp"

namespace rt {
/**
 * @brief Lifecycle hooks the dispatcher drives on its owning stream.
 */
class DispatchTarget {
 public:
  virtual ~DispatchTarget() {}

  /** @brief The agent acknowledged registration. */
  virtual void markSessionReady(const string& remoteSessionId) = 0;
  /** @brief The agent ended the session. */
  virtual void closeFromRemote(const string& reason) = 0;
  /** @brief The far end probed liveness and expects a heartbeat. */
  virtual void answerPing() = 0;
  virtual StreamState currentState() const = 0;
};

/**
 * @brief Routes each inbound message to the stream or to the caller's
 * handlers according to its payload.
 */
class InboundDispatcher {
 public:
  InboundDispatcher(DispatchTarget* _target, StreamListeners* _listeners)
      : target(_target), listeners(_listeners) {}

  void dispatch(const InboundMessage& message);

 protected:
  DispatchTarget* target;
  StreamListeners* listeners;
};
}  // namespace rt

#endif  // __RT_INBOUND_DISPATCHER__
