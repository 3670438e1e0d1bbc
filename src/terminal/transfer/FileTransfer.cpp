#include "FileTransfer.hpp"

#include "Errors.hpp"

namespace rt {
namespace {
void prepareLocalFile(const string& localPath) {
  fs::path parent = fs::path(localPath).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }
}

void removePartialFile(const string& localPath) {
  std::error_code ec;
  fs::remove(localPath, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove partial file " << localPath << ": "
                 << ec.message();
  }
}
}  // namespace

FileTransfer::FileTransfer(shared_ptr<SessionRpc> _rpc,
                           shared_ptr<CommandExecutor> _executor,
                           TransportFactory _transportFactory,
                           const string& _credential,
                           const TransferOptions& _options)
    : rpc(_rpc),
      executor(_executor),
      transportFactory(_transportFactory),
      credential(_credential),
      options(_options) {}

TransferStats FileTransfer::transfer(const string& remotePath,
                                     const string& localPath,
                                     int64_t totalSize,
                                     ProgressCallback progress,
                                     TransferStrategy* strategyUsed) {
  TransferStrategy strategy = totalSize > options.largeFileThreshold
                                  ? TransferStrategy::Split
                                  : TransferStrategy::Direct;
  if (strategyUsed) {
    *strategyUsed = strategy;
  }
  VLOG(1) << "Transferring " << remotePath << " (" << totalSize
          << " bytes) using " << strategyName(strategy) << " strategy";
  if (strategy == TransferStrategy::Split) {
    return splitParts(remotePath, localPath, totalSize, progress);
  }
  return directChunked(remotePath, localPath, totalSize, progress);
}

TransferStats FileTransfer::directChunked(const string& remotePath,
                                          const string& localPath,
                                          int64_t totalSize,
                                          ProgressCallback progress) {
  prepareLocalFile(localPath);
  ofstream out(localPath, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw TransferError("Cannot open " + localPath + " for writing");
  }

  TransferStats stats;
  int64_t offset = 0;
  int failures = 0;
  try {
    while (offset < totalSize) {
      int64_t readSize = std::min(options.chunkSize, totalSize - offset);
      string content;
      string failure;
      try {
        content =
            rpc->readFile(remotePath, offset, readSize, options.readTimeout);
        if (content.empty()) {
          failure = "empty chunk";
        }
      } catch (const std::runtime_error& re) {
        failure = re.what();
      }

      if (!failure.empty()) {
        failures++;
        stats.retriesCount++;
        LOG(WARNING) << "Transfer error at offset " << offset << " of "
                     << remotePath << ": " << failure;
        if (failures > options.maxRetries) {
          throw TransferError("Transfer failed at offset " +
                              to_string(offset) + " after " +
                              to_string(options.maxRetries) +
                              " retries: " + failure);
        }
        std::this_thread::sleep_for(options.retryDelay);
        continue;
      }

      if ((int64_t)content.length() > totalSize - offset) {
        content.resize(totalSize - offset);
      }
      out.write(content.data(), content.length());
      if (!out) {
        throw TransferError("Write to " + localPath + " failed");
      }
      offset += content.length();
      stats.bytesTransferred += content.length();
      stats.chunksCount++;
      failures = 0;
      if (progress) {
        progress(stats.bytesTransferred, totalSize);
      }
    }
    out.close();
    if (!out) {
      throw TransferError("Write to " + localPath + " failed");
    }
    stats.partsCount = 1;
  } catch (const std::runtime_error&) {
    out.close();
    removePartialFile(localPath);
    throw;
  }
  return stats;
}

TransferStats FileTransfer::splitParts(const string& remotePath,
                                       const string& localPath,
                                       int64_t totalSize,
                                       ProgressCallback progress) {
  if (credential.empty()) {
    throw ConfigurationError(
        "A reconnect credential is required for split transfers of files "
        "larger than " +
        to_string(options.largeFileThreshold) + " bytes");
  }

  string splitDir =
      options.remoteTempDir + "/rterm_split_" + genRandomAlphaNum(12);
  TransferStats stats;
  try {
    vector<TransferPart> parts = splitRemote(remotePath, splitDir);
    VLOG(1) << "Split " << remotePath << " into " << parts.size()
            << " parts";

    vector<std::future<void>> results;
    string firstError;
    {
      ThreadPool pool(
          std::min<size_t>(std::max(options.maxParallelParts, 1), parts.size()));
      for (auto& part : parts) {
        TransferPart* partPtr = &part;
        results.push_back(pool.enqueue([this, partPtr] {
          el::Helpers::setThreadName("transfer-part");
          downloadPart(partPtr);
        }));
      }
      int64_t transferred = 0;
      for (size_t i = 0; i < results.size(); i++) {
        try {
          results[i].get();
          transferred += parts[i].data.length();
          if (progress && firstError.empty()) {
            progress(transferred, totalSize);
          }
        } catch (const std::runtime_error& re) {
          if (firstError.empty()) {
            firstError = re.what();
          }
        }
      }
    }
    if (!firstError.empty()) {
      throw TransferError(firstError);
    }

    prepareLocalFile(localPath);
    ofstream out(localPath,
                 std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw TransferError("Cannot open " + localPath + " for writing");
    }
    for (const auto& part : parts) {
      out.write(part.data.data(), part.data.length());
      stats.bytesTransferred += part.data.length();
      stats.chunksCount += part.chunks;
      stats.retriesCount += part.retries;
    }
    stats.partsCount = parts.size();
    out.close();
    if (!out) {
      throw TransferError("Write to " + localPath + " failed");
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Split transfer of " << remotePath
                 << " failed: " << re.what();
    removePartialFile(localPath);
    removeRemoteDirectory(splitDir);
    throw;
  }
  removeRemoteDirectory(splitDir);
  return stats;
}

vector<TransferPart> FileTransfer::splitRemote(const string& remotePath,
                                               const string& splitDir) {
  string command = "mkdir -p " + shellQuote(splitDir) + " && split -b " +
                   to_string(options.splitPartSize) + " " +
                   shellQuote(remotePath) + " " +
                   shellQuote(splitDir + "/part_");
  CommandResult result = executor->execute(command, options.splitTimeout);
  if (result.exitCode != 0) {
    throw TransferError("Failed to split file on remote: " + result.output);
  }

  vector<TransferPart> parts;
  for (const auto& entry : rpc->listDirectory(splitDir)) {
    if (entry.is_directory() || entry.name().rfind("part_", 0) != 0) {
      continue;
    }
    TransferPart part;
    part.remotePath = splitDir + "/" + entry.name();
    part.declaredSize = entry.size();
    parts.push_back(part);
  }
  if (parts.empty()) {
    throw TransferError("Failed to split file on remote: no parts in " +
                        splitDir);
  }
  // split(1) names parts so that lexical order is file order
  sort(parts.begin(), parts.end(),
       [](const TransferPart& a, const TransferPart& b) {
         return a.remotePath < b.remotePath;
       });
  for (size_t i = 0; i < parts.size(); i++) {
    parts[i].index = i;
  }
  return parts;
}

void FileTransfer::downloadPart(TransferPart* part) {
  string lastError = "incomplete";
  for (int attempt = 0; attempt <= options.maxRetries; attempt++) {
    if (attempt > 0) {
      auto delay = options.partBackoffBase * (1 << (attempt - 1));
      LOG(WARNING) << "Retrying part " << part->index << " in "
                   << delay.count() << "ms";
      std::this_thread::sleep_for(delay);
    }
    try {
      SessionRpc partRpc(transportFactory(credential), rpc->getSessionId());
      while ((int64_t)part->data.length() < part->declaredSize) {
        int64_t offset = part->data.length();
        string content = partRpc.readFile(
            part->remotePath, offset,
            std::min(options.chunkSize, part->declaredSize - offset),
            options.partReadTimeout);
        if (content.empty()) {
          break;
        }
        part->data.append(content);
        part->chunks++;
      }
      if ((int64_t)part->data.length() >= part->declaredSize) {
        part->data.resize(part->declaredSize);
        VLOG(2) << "Part " << part->index << " complete with "
                << part->chunks << " chunks";
        return;
      }
      lastError = "incomplete after " + to_string(part->data.length()) +
                  " of " + to_string(part->declaredSize) + " bytes";
    } catch (const std::runtime_error& re) {
      lastError = re.what();
    }
    part->retries++;
    LOG(WARNING) << "Part " << part->index << " attempt " << (attempt + 1)
                 << " failed: " << lastError;
  }
  throw TransferError("Part " + to_string(part->index) + " (" +
                      part->remotePath + ") failed after " +
                      to_string(options.maxRetries + 1) +
                      " attempts: " + lastError);
}

void FileTransfer::removeRemoteDirectory(const string& dir) {
  try {
    rpc->sendInput("rm -rf " + shellQuote(dir) + "\n");
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not remove remote directory " << dir << ": "
                 << re.what();
  }
}
}  // namespace rt
