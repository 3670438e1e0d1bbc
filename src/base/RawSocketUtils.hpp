#ifndef __RT_RAW_SOCKET_UTILS__
#define __RT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace rt {
/**
 * @brief Blocking helpers for plain descriptors (tty, pipes, stdio) that do
 * not go through a SocketHandler.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for input and returns whatever is
   * available, at most `maxBytes`.
   * @return nullopt on end of file, an empty string when nothing arrived.
   */
  static optional<string> readAvailable(int fd, size_t maxBytes,
                                        int timeoutMs);
};
}  // namespace rt
#endif  // __RT_RAW_SOCKET_UTILS__
