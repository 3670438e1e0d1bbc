#include "RawSocketUtils.hpp"

namespace rt {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      STERROR << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

optional<string> RawSocketUtils::readAvailable(int fd, size_t maxBytes,
                                               int timeoutMs) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAvailable");
  }
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int n = select(fd + 1, &rfd, NULL, NULL, &tv);
  if (n < 0) {
    if (errno == EINTR) {
      return string();
    }
    throw std::runtime_error(string("select failed: ") + strerror(errno));
  }
  if (n == 0 || !FD_ISSET(fd, &rfd)) {
    return string();
  }
  string buf(maxBytes, '\0');
  ssize_t rc = ::read(fd, &buf[0], maxBytes);
  if (rc < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return string();
    }
    throw std::runtime_error(string("read failed: ") + strerror(errno));
  }
  if (rc == 0) {
    return nullopt;
  }
  buf.resize(rc);
  return buf;
}
}  // namespace rt
