#ifndef __RT_SOCKET_ENDPOINT__
#define __RT_SOCKET_ENDPOINT__

#include <ostream>
#include <string>

namespace rt {
/**
 * @brief A host/port pair for the relay, or a filesystem path (port -1) for
 * the local agent socket.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(const std::string &_name) : name(_name), port(-1) {}

  SocketEndpoint(const std::string &_name, int _port)
      : name(_name), port(_port) {}

  const std::string &getName() const { return name; }

  int getPort() const { return port; }

  bool isUnixPath() const { return port < 0; }

 protected:
  std::string name;
  int port;
};

inline std::ostream &operator<<(std::ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace rt

#endif  // __RT_SOCKET_ENDPOINT__
