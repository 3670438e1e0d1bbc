#ifndef __RT_TRANSFER_TYPES__
#define __RT_TRANSFER_TYPES__

#include "Headers.hpp"

namespace rt {
struct TransferOptions {
  int64_t chunkSize = 1024 * 1024;
  // Files above this size are split on the remote host
  int64_t largeFileThreshold = 10 * 1024 * 1024;
  int64_t splitPartSize = 5 * 1024 * 1024;
  int maxParallelParts = 4;
  int maxRetries = 3;
  std::chrono::milliseconds retryDelay = std::chrono::seconds(1);
  // Part attempt n waits partBackoffBase * 2^(n-1)
  std::chrono::milliseconds partBackoffBase = std::chrono::seconds(1);
  std::chrono::milliseconds readTimeout = std::chrono::seconds(120);
  std::chrono::milliseconds partReadTimeout = std::chrono::seconds(60);
  std::chrono::milliseconds splitTimeout = std::chrono::seconds(120);
  string remoteTempDir = "/tmp";
  std::chrono::milliseconds downloadTimeout = std::chrono::seconds(600);
  std::chrono::milliseconds filePollInterval = std::chrono::seconds(2);
};

struct TransferStats {
  int64_t bytesTransferred = 0;
  int64_t chunksCount = 0;
  int64_t retriesCount = 0;
  // Parts actually fetched; a direct transfer counts as one
  int64_t partsCount = 0;
};

/** @brief One piece of a split file, buffered in memory until the merge. */
struct TransferPart {
  int index = 0;
  string remotePath;
  int64_t declaredSize = 0;
  string data;
  int64_t chunks = 0;
  int64_t retries = 0;
};

enum class TransferStrategy { Direct, Split };

const char* strategyName(TransferStrategy strategy);

struct DownloadMetrics {
  TransferStrategy strategy = TransferStrategy::Direct;
  int64_t remoteSize = 0;
  int64_t transferredSize = 0;
  int64_t localSize = 0;
  double totalSeconds = 0;
  // Time the remote host spent fetching a URL
  double fetchSeconds = 0;
  double transferSeconds = 0;
  int64_t chunksCount = 0;
  int64_t partsCount = 0;
  int64_t retriesCount = 0;

  double transferMegabytesPerSecond() const;
  double totalMegabytesPerSecond() const;
  string summary() const;
};

struct DownloadResult {
  bool success = false;
  string localPath;
  int64_t size = 0;
  string error;
  DownloadMetrics metrics;
};

typedef std::function<void(int64_t transferred, int64_t total)>
    ProgressCallback;
}  // namespace rt

#endif  // __RT_TRANSFER_TYPES__
