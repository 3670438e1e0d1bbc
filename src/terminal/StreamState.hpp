#ifndef __RT_STREAM_STATE__
#define __RT_STREAM_STATE__

#include "Headers.hpp"

namespace rt {
/**
 * @brief Lifecycle of one TerminalStream.
 *
 * Idle -> Connecting -> Registering -> Connected -> Closing -> Closed, with
 * Error reachable from any non-terminal state.  Reconnecting is reserved.
 */
enum class StreamState {
  Idle,
  Connecting,
  Registering,
  Connected,
  Reconnecting,
  Closing,
  Closed,
  Error
};

string stateName(StreamState state);

inline bool isTerminalState(StreamState state) {
  return state == StreamState::Closed || state == StreamState::Error;
}

inline ostream& operator<<(ostream& os, StreamState state) {
  return os << stateName(state);
}

/**
 * @brief Monotonic counters for one stream instance.  Safe to update from the
 * pump and receiver threads concurrently.
 */
class StreamMetrics {
 public:
  struct Snapshot {
    int64_t bytesSent = 0;
    int64_t bytesReceived = 0;
    int64_t messagesSent = 0;
    int64_t messagesReceived = 0;
    int64_t keepalivesSent = 0;
    int64_t reconnectAttempts = 0;
    int64_t errors = 0;
  };

  StreamMetrics()
      : bytesSent(0),
        bytesReceived(0),
        messagesSent(0),
        messagesReceived(0),
        keepalivesSent(0),
        reconnectAttempts(0),
        errors(0) {}

  void recordSent(size_t bytes) {
    bytesSent += bytes;
    messagesSent++;
  }
  void recordReceived(size_t bytes) {
    bytesReceived += bytes;
    messagesReceived++;
  }
  void recordKeepalive() { keepalivesSent++; }
  void recordReconnect() { reconnectAttempts++; }
  void recordError() { errors++; }

  Snapshot snapshot() const;

 protected:
  atomic<int64_t> bytesSent;
  atomic<int64_t> bytesReceived;
  atomic<int64_t> messagesSent;
  atomic<int64_t> messagesReceived;
  atomic<int64_t> keepalivesSent;
  atomic<int64_t> reconnectAttempts;
  atomic<int64_t> errors;
};
}  // namespace rt

#endif  // __RT_STREAM_STATE__
