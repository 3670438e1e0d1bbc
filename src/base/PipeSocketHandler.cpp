#include "PipeSocketHandler.hpp"

namespace rt {
PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.getName();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(sockaddr_un));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = errno;
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    ::shutdown(sockFd, SHUT_RDWR);
    FATAL_FAIL(::close(sockFd));
    errno = localErrno;
    return -1;
  }

  if (!finishConnect(sockFd, endpoint, 3)) {
    FATAL_FAIL(::close(sockFd));
    return -1;
  }
  LOG(INFO) << "Connected to endpoint " << endpoint;
  addToActiveSockets(sockFd);
  return sockFd;
}
}  // namespace rt
