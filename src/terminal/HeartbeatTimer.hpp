#ifndef __RT_HEARTBEAT_TIMER__
#define __RT_HEARTBEAT_TIMER__

#include "Headers.hpp"

namespace rt {
/**
 * @brief Tracks the idle gap on the outbound side of a stream.
 *
 * The pump waits for at most remaining() and sends a heartbeat once
 * expired(); any write calls touch().
 */
class HeartbeatTimer {
 public:
  explicit HeartbeatTimer(std::chrono::milliseconds _interval)
      : interval(_interval), lastActivity(std::chrono::steady_clock::now()) {}

  void touch() { lastActivity = std::chrono::steady_clock::now(); }

  std::chrono::milliseconds remaining() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - lastActivity);
    if (elapsed >= interval) {
      return std::chrono::milliseconds(0);
    }
    return interval - elapsed;
  }

  bool expired() const { return remaining().count() == 0; }

  std::chrono::milliseconds getInterval() const { return interval; }

 protected:
  std::chrono::milliseconds interval;
  std::chrono::steady_clock::time_point lastActivity;
};
}  // namespace rt

#endif  // __RT_HEARTBEAT_TIMER__
