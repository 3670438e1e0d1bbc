#include "StreamState.hpp"

namespace rt {
string stateName(StreamState state) {
  switch (state) {
    case StreamState::Idle:
      return "idle";
    case StreamState::Connecting:
      return "connecting";
    case StreamState::Registering:
      return "registering";
    case StreamState::Connected:
      return "connected";
    case StreamState::Reconnecting:
      return "reconnecting";
    case StreamState::Closing:
      return "closing";
    case StreamState::Closed:
      return "closed";
    case StreamState::Error:
      return "error";
  }
  return "unknown";
}

StreamMetrics::Snapshot StreamMetrics::snapshot() const {
  Snapshot s;
  s.bytesSent = bytesSent;
  s.bytesReceived = bytesReceived;
  s.messagesSent = messagesSent;
  s.messagesReceived = messagesReceived;
  s.keepalivesSent = keepalivesSent;
  s.reconnectAttempts = reconnectAttempts;
  s.errors = errors;
  return s;
}
}  // namespace rt
