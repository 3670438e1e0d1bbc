#ifndef __RT_ERRORS__
#define __RT_ERRORS__

#include <stdexcept>
#include <string>

namespace rt {
/**
 * @brief Wrong setup that retrying cannot fix (non-streaming transport used
 * for a stream, missing credential, invalid config values).
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

/** @brief A stream operation that needs the Connected state. */
class NotConnectedError : public std::runtime_error {
 public:
  explicit NotConnectedError(const std::string& what = "Stream not connected")
      : std::runtime_error(what) {}
};

/** @brief An operation invoked from a lifecycle state that does not allow it. */
class InvalidStateError : public std::runtime_error {
 public:
  explicit InvalidStateError(const std::string& what)
      : std::runtime_error(what) {}
};

/** @brief A protocol level deadline elapsed. */
class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Socket, handshake or channel failure. */
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& what)
      : std::runtime_error(what) {}
};

/** @brief The outbound queue stayed full for longer than the put timeout. */
class QueueFullError : public std::runtime_error {
 public:
  explicit QueueFullError(const std::string& what = "Message queue full")
      : std::runtime_error(what) {}
};

/** @brief The remote end answered a call with an error. */
class RemoteCallError : public std::runtime_error {
 public:
  explicit RemoteCallError(const std::string& what)
      : std::runtime_error(what) {}
};

/** @brief A file transfer gave up after exhausting its retries. */
class TransferError : public std::runtime_error {
 public:
  explicit TransferError(const std::string& what)
      : std::runtime_error(what) {}
};
}  // namespace rt

#endif  // __RT_ERRORS__
