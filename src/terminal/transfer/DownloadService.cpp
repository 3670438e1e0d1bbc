#include "DownloadService.hpp"

namespace rt {
namespace {
double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}
}  // namespace

DownloadService::DownloadService(shared_ptr<SessionRpc> _rpc,
                                 shared_ptr<CommandExecutor> _executor,
                                 TransportFactory _transportFactory,
                                 const string& _credential,
                                 const TransferOptions& _options)
    : rpc(_rpc),
      fileTransfer(_rpc, _executor, _transportFactory, _credential, _options),
      options(_options) {}

string DownloadService::remoteNameForUrl(const string& url) {
  string name = url.substr(0, url.find_first_of("?#"));
  auto slash = name.find_last_of('/');
  if (slash != string::npos) {
    name = name.substr(slash + 1);
  }
  string safe;
  for (char c : name) {
    if (isalnum((unsigned char)c) || c == '.' || c == '-' || c == '_') {
      safe.push_back(c);
    }
  }
  return safe.empty() ? "download" : safe;
}

void DownloadService::runTransfer(const string& remotePath,
                                  const string& localPath, int64_t size,
                                  ProgressCallback progress,
                                  DownloadResult* result) {
  auto transferStart = std::chrono::steady_clock::now();
  TransferStrategy strategy;
  TransferStats stats =
      fileTransfer.transfer(remotePath, localPath, size, progress, &strategy);
  DownloadMetrics& metrics = result->metrics;
  metrics.transferSeconds = secondsSince(transferStart);
  metrics.strategy = strategy;
  metrics.transferredSize = stats.bytesTransferred;
  metrics.chunksCount = stats.chunksCount;
  metrics.retriesCount = stats.retriesCount;
  metrics.partsCount = stats.partsCount;
  std::error_code ec;
  auto localSize = fs::file_size(localPath, ec);
  metrics.localSize = ec ? 0 : (int64_t)localSize;

  result->success = true;
  result->localPath = localPath;
  result->size = stats.bytesTransferred;
}

DownloadResult DownloadService::downloadFile(const string& remotePath,
                                             const string& localPath,
                                             ProgressCallback progress) {
  DownloadResult result;
  auto start = std::chrono::steady_clock::now();
  try {
    FileEntry info = rpc->fileInfo(remotePath);
    result.metrics.remoteSize = info.size();
    runTransfer(remotePath, localPath, info.size(), progress, &result);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Download of " << remotePath << " failed: " << re.what();
    result.success = false;
    result.error = re.what();
  }
  result.metrics.totalSeconds = secondsSince(start);
  VLOG(1) << "Download of " << remotePath << ": "
          << result.metrics.summary();
  return result;
}

int64_t DownloadService::waitForStableSize(const string& remotePath) {
  auto deadline = std::chrono::steady_clock::now() + options.downloadTimeout;
  int64_t lastSize = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(options.filePollInterval);
    try {
      int64_t size = rpc->fileInfo(remotePath).size();
      if (size > 0 && size == lastSize) {
        return size;
      }
      lastSize = size;
    } catch (const std::runtime_error& re) {
      // The file does not exist until curl starts writing
      VLOG(2) << "Waiting for " << remotePath << ": " << re.what();
    }
  }
  return 0;
}

DownloadResult DownloadService::downloadUrl(const string& url,
                                            const string& localPath,
                                            ProgressCallback progress) {
  DownloadResult result;
  auto start = std::chrono::steady_clock::now();
  string remotePath = options.remoteTempDir + "/rterm_dl_" +
                      genRandomAlphaNum(8) + "_" + remoteNameForUrl(url);
  bool remoteCreated = false;
  try {
    rpc->sendInput("curl -sS -o " + shellQuote(remotePath) + " " +
                   shellQuote(url) + "\n");
    remoteCreated = true;
    int64_t size = waitForStableSize(remotePath);
    result.metrics.fetchSeconds = secondsSince(start);
    result.metrics.remoteSize = size;
    if (size == 0) {
      result.error = "Download failed or timed out for " + url;
    } else {
      runTransfer(remotePath, localPath, size, progress, &result);
    }
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Download of " << url << " failed: " << re.what();
    result.success = false;
    result.error = re.what();
  }

  if (remoteCreated) {
    try {
      rpc->deleteFile(remotePath);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not delete remote file " << remotePath << ": "
                   << re.what();
    }
  }
  result.metrics.totalSeconds = secondsSince(start);
  return result;
}
}  // namespace rt
