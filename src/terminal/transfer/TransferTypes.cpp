#include "TransferTypes.hpp"

namespace rt {
namespace {
double toMegabytes(int64_t bytes) { return bytes / 1024.0 / 1024.0; }
}  // namespace

const char* strategyName(TransferStrategy strategy) {
  switch (strategy) {
    case TransferStrategy::Direct:
      return "direct";
    case TransferStrategy::Split:
      return "split";
  }
  return "unknown";
}

double DownloadMetrics::transferMegabytesPerSecond() const {
  if (transferSeconds <= 0) {
    return 0;
  }
  return toMegabytes(transferredSize) / transferSeconds;
}

double DownloadMetrics::totalMegabytesPerSecond() const {
  if (totalSeconds <= 0) {
    return 0;
  }
  return toMegabytes(transferredSize) / totalSeconds;
}

string DownloadMetrics::summary() const {
  ostringstream ss;
  ss << std::fixed << std::setprecision(1);
  ss << "Size: " << toMegabytes(transferredSize) << " MB ("
     << transferredSize << " bytes), total " << totalSeconds << "s @ "
     << totalMegabytesPerSecond() << " MB/s";
  if (fetchSeconds > 0) {
    ss << ", fetch " << fetchSeconds << "s";
  }
  if (transferSeconds > 0) {
    ss << ", transfer " << transferSeconds << "s @ "
       << transferMegabytesPerSecond() << " MB/s";
  }
  ss << ", strategy " << strategyName(strategy);
  if (partsCount > 1) {
    ss << ", parts " << partsCount;
  }
  if (chunksCount > 0) {
    ss << ", chunks " << chunksCount;
  }
  if (retriesCount > 0) {
    ss << ", retries " << retriesCount;
  }
  return ss.str();
}
}  // namespace rt
