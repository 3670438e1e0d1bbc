#ifndef __RT_SESSION_RPC__
#define __RT_SESSION_RPC__

#include "Headers.hpp"
#include "Transport.hpp"

namespace rt {
/**
 * @brief Typed request/response calls against one remote terminal session.
 *
 * Used where no live stream exists: marker-protocol execution and file
 * transfer.  Each method maps one RpcRequest variant and throws
 * RemoteCallError when the remote end reports an error.
 */
class SessionRpc {
 public:
  SessionRpc(shared_ptr<Transport> _transport, const string& _sessionId,
             std::chrono::milliseconds _defaultTimeout =
                 std::chrono::seconds(30));

  /** @brief Writes raw bytes into the session's shell input. */
  void sendInput(const string& data);
  /**
   * @brief Fetches the tail of the session's output buffer.
   * @param limit Maximum number of bytes returned.
   */
  string getOutput(int64_t limit, int64_t offset = 0);
  /**
   * @brief Reads `length` bytes at `offset`; a short or empty result means
   * end of file or a relay hiccup.
   */
  string readFile(const string& path, int64_t offset, int64_t length,
                  std::chrono::milliseconds timeout);
  vector<FileEntry> listDirectory(const string& path);
  FileEntry fileInfo(const string& path);
  void deleteFile(const string& path);

  const string& getSessionId() const { return sessionId; }
  shared_ptr<Transport> getTransport() const { return transport; }

 protected:
  RpcResponse invoke(RpcRequest* request, std::chrono::milliseconds timeout);

  shared_ptr<Transport> transport;
  string sessionId;
  std::chrono::milliseconds defaultTimeout;
};
}  // namespace rt

#endif  // __RT_SESSION_RPC__
