#ifndef __RT_DOWNLOAD_SERVICE__
#define __RT_DOWNLOAD_SERVICE__

#include "FileTransfer.hpp"
#include "Headers.hpp"

namespace rt {
/**
 * @brief Downloads remote files, or URLs fetched by the remote host, and
 * reports the outcome as a DownloadResult instead of throwing.
 */
class DownloadService {
 public:
  DownloadService(shared_ptr<SessionRpc> _rpc,
                  shared_ptr<CommandExecutor> _executor,
                  TransportFactory _transportFactory,
                  const string& _credential,
                  const TransferOptions& _options = TransferOptions());

  DownloadResult downloadFile(const string& remotePath,
                              const string& localPath,
                              ProgressCallback progress = nullptr);

  /**
   * @brief Has the remote host fetch `url` with curl, waits for the file
   * to stop growing, then transfers it and deletes the remote copy.
   */
  DownloadResult downloadUrl(const string& url, const string& localPath,
                             ProgressCallback progress = nullptr);

  /**
   * @brief Polls the remote file until two consecutive polls report the
   * same non-zero size.  Returns 0 when the download timeout passes first.
   */
  int64_t waitForStableSize(const string& remotePath);

  static string remoteNameForUrl(const string& url);

 protected:
  void runTransfer(const string& remotePath, const string& localPath,
                   int64_t size, ProgressCallback progress,
                   DownloadResult* result);

  shared_ptr<SessionRpc> rpc;
  FileTransfer fileTransfer;
  TransferOptions options;
};
}  // namespace rt

#endif  // __RT_DOWNLOAD_SERVICE__
