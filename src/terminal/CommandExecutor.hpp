#ifndef __RT_COMMAND_EXECUTOR__
#define __RT_COMMAND_EXECUTOR__

#include "CommandMarkers.hpp"
#include "Headers.hpp"
#include "SessionRpc.hpp"

namespace rt {
struct ExecOptions {
  std::chrono::milliseconds pollInterval = std::chrono::milliseconds(200);
  // Bytes of output tail fetched per poll
  int64_t readWindow = 20 * 1024;
  size_t partialOutputCap = 2000;
  int idLength = 12;
};

struct CommandResult {
  string output;
  int exitCode = -1;
  bool timedOut = false;
};

/**
 * @brief Runs one command inside a remote shell by wrapping it in sentinels
 * and polling the session's output buffer.
 *
 * Polling reads a sliding window of the most recent output.  Output longer
 * than the window that arrives between two polls can push the start sentinel
 * out of view; raise the window for chatty commands.
 */
class CommandExecutor {
 public:
  explicit CommandExecutor(shared_ptr<SessionRpc> _rpc,
                           const ExecOptions& _options = ExecOptions());

  /**
   * @brief Never throws for remote failures: transport errors and timeouts
   * come back as a result with exit code -1 and a readable explanation.
   */
  CommandResult execute(const string& command,
                        std::chrono::milliseconds timeout);

  shared_ptr<SessionRpc> getRpc() const { return rpc; }
  const ExecOptions& getOptions() const { return options; }

 protected:
  string buildTimeoutReport(const string& buffer, const MarkerCommand& marker,
                            const CommandMarkers::Scan& scan,
                            std::chrono::milliseconds timeout) const;

  shared_ptr<SessionRpc> rpc;
  ExecOptions options;
};
}  // namespace rt

#endif  // __RT_COMMAND_EXECUTOR__
