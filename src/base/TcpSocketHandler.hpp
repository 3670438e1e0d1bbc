#ifndef __RT_TCP_SOCKET_HANDLER__
#define __RT_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace rt {
/**
 * @brief Client side IPv4/IPv6 sockets used to reach the relay.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int _connectTimeoutSeconds = 3);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * relay.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  recursive_mutex mutex;
  int connectTimeoutSeconds;

  /** @return A connected descriptor, or -1 when this address fails. */
  int connectTo(const addrinfo* address, const SocketEndpoint& endpoint);

  /**
   * @brief Adds TCP_NODELAY on top of the generic socket setup.
   */
  virtual void initSocket(int fd);
};
}  // namespace rt

#endif  // __RT_TCP_SOCKET_HANDLER__
