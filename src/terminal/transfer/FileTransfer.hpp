#ifndef __RT_FILE_TRANSFER__
#define __RT_FILE_TRANSFER__

#include "CommandExecutor.hpp"
#include "Headers.hpp"
#include "SessionRpc.hpp"
#include "TransferTypes.hpp"
#include "Transport.hpp"

namespace rt {
/**
 * @brief Copies a remote file to local storage, either in sequential chunks
 * over the session's request/response channel or, past the size threshold,
 * by splitting it on the remote host and fetching every part over its own
 * freshly authenticated connection.
 *
 * The relay caps the bytes one connection may carry, which is why the split
 * path never reuses a connection between parts.
 */
class FileTransfer {
 public:
  FileTransfer(shared_ptr<SessionRpc> _rpc,
               shared_ptr<CommandExecutor> _executor,
               TransportFactory _transportFactory, const string& _credential,
               const TransferOptions& _options = TransferOptions());

  /** @brief Picks direct or split transfer from `totalSize`. */
  TransferStats transfer(const string& remotePath, const string& localPath,
                         int64_t totalSize, ProgressCallback progress,
                         TransferStrategy* strategyUsed = NULL);

  /**
   * @throws TransferError when one offset fails more than maxRetries times.
   */
  TransferStats directChunked(const string& remotePath,
                              const string& localPath, int64_t totalSize,
                              ProgressCallback progress);

  /**
   * @throws ConfigurationError without touching the network when no
   * reconnect credential is configured.
   * @throws TransferError when splitting fails or a part exhausts its
   * attempts.  The partial local file is removed.
   */
  TransferStats splitParts(const string& remotePath, const string& localPath,
                           int64_t totalSize, ProgressCallback progress);

  const TransferOptions& getOptions() const { return options; }

 protected:
  vector<TransferPart> splitRemote(const string& remotePath,
                                   const string& splitDir);
  void downloadPart(TransferPart* part);
  void removeRemoteDirectory(const string& dir);

  shared_ptr<SessionRpc> rpc;
  shared_ptr<CommandExecutor> executor;
  TransportFactory transportFactory;
  string credential;
  TransferOptions options;
};
}  // namespace rt

#endif  // __RT_FILE_TRANSFER__
