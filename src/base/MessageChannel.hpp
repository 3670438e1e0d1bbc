#ifndef __RT_MESSAGE_CHANNEL__
#define __RT_MESSAGE_CHANNEL__

#include "Errors.hpp"
#include "Headers.hpp"

namespace rt {
/**
 * @brief Bounded FIFO between one producer side and one consumer loop.
 *
 * A full channel makes push() wait up to its timeout and then throw
 * QueueFullError, so backpressure reaches the caller instead of growing
 * memory.  close() stops new pushes; items already queued are still handed
 * out by pop() so a final message (detach notice) can be flushed.
 */
template <typename T>
class MessageChannel {
 public:
  enum class PopResult { ITEM, TIMEOUT, CLOSED };

  explicit MessageChannel(size_t _capacity) : capacity(_capacity), closed(false) {
    if (capacity == 0) {
      throw ConfigurationError("MessageChannel capacity must be positive");
    }
  }

  /**
   * @return false when the channel was closed before the item got in.
   * @throws QueueFullError when no room appeared within `timeout`.
   */
  bool push(T item, std::chrono::milliseconds timeout) {
    unique_lock<mutex> guard(channelMutex);
    bool hasRoom = notFull.wait_for(guard, timeout, [this] {
      return closed || items.size() < capacity;
    });
    if (closed) {
      return false;
    }
    if (!hasRoom) {
      throw QueueFullError();
    }
    items.push_back(std::move(item));
    notEmpty.notify_one();
    return true;
  }

  PopResult pop(T* out, std::chrono::milliseconds timeout) {
    unique_lock<mutex> guard(channelMutex);
    notEmpty.wait_for(guard, timeout,
                      [this] { return closed || !items.empty(); });
    if (!items.empty()) {
      *out = std::move(items.front());
      items.pop_front();
      notFull.notify_one();
      return PopResult::ITEM;
    }
    return closed ? PopResult::CLOSED : PopResult::TIMEOUT;
  }

  void close() {
    lock_guard<mutex> guard(channelMutex);
    closed = true;
    notEmpty.notify_all();
    notFull.notify_all();
  }

  // Drops anything queued and reopens the channel
  void reset() {
    lock_guard<mutex> guard(channelMutex);
    items.clear();
    closed = false;
  }

  size_t size() const {
    lock_guard<mutex> guard(channelMutex);
    return items.size();
  }

  bool isClosed() const {
    lock_guard<mutex> guard(channelMutex);
    return closed;
  }

  size_t getCapacity() const { return capacity; }

 protected:
  const size_t capacity;
  bool closed;
  deque<T> items;
  mutable mutex channelMutex;
  condition_variable notEmpty;
  condition_variable notFull;
};
}  // namespace rt

#endif  // __RT_MESSAGE_CHANNEL__
