#ifndef __RT_PIPE_SOCKET_HANDLER__
#define __RT_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace rt {
/**
 * @brief Connects to a co-located agent over a UNIX domain socket.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket path named by the endpoint.
   */
  virtual int connect(const SocketEndpoint& endpoint);
};
}  // namespace rt

#endif  // __RT_PIPE_SOCKET_HANDLER__
