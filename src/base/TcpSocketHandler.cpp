#include "TcpSocketHandler.hpp"

namespace rt {
namespace {
struct AddrInfoDeleter {
  void operator()(addrinfo* info) const { freeaddrinfo(info); }
};
typedef std::unique_ptr<addrinfo, AddrInfoDeleter> AddrInfoList;
}  // namespace

TcpSocketHandler::TcpSocketHandler(int _connectTimeoutSeconds)
    : connectTimeoutSeconds(_connectTimeoutSeconds) {}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(mutex);
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);

  // Pick up resolv.conf changes between reconnects
  ::res_init();
  addrinfo* rawResults = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(),
                       to_string(endpoint.getPort()).c_str(), &hints,
                       &rawResults);
  AddrInfoList results(rawResults);
  if (rc != 0) {
    LOG(ERROR) << "Cannot resolve relay " << endpoint << ": "
               << gai_strerror(rc);
    return -1;
  }

  for (addrinfo* candidate = results.get(); candidate != NULL;
       candidate = candidate->ai_next) {
    int sockFd = connectTo(candidate, endpoint);
    if (sockFd != -1) {
      addToActiveSockets(sockFd);
      initSocket(sockFd);
      LOG(INFO) << "Connected to relay " << endpoint << " on fd " << sockFd;
      return sockFd;
    }
  }
  LOG(ERROR) << "No address of relay " << endpoint << " accepted a connection";
  return -1;
}

int TcpSocketHandler::connectTo(const addrinfo* address,
                                const SocketEndpoint& endpoint) {
  int sockFd =
      ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd == -1) {
    VLOG(1) << "socket() failed: " << strerror(errno);
    return -1;
  }
  // The connect itself runs non-blocking so connectTimeoutSeconds holds
  int opts = fcntl(sockFd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(sockFd, F_SETFL, opts | O_NONBLOCK));

  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1 &&
      errno != EINPROGRESS) {
    VLOG(1) << "connect() to " << endpoint << " failed: " << strerror(errno);
    ::close(sockFd);
    return -1;
  }
  if (!finishConnect(sockFd, endpoint, connectTimeoutSeconds)) {
    ::close(sockFd);
    return -1;
  }
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  // Keystrokes go out unbatched
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char*)&flag, sizeof(int)));
}
}  // namespace rt
