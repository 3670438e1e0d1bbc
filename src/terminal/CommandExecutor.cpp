#include "CommandExecutor.hpp"

namespace rt {
CommandExecutor::CommandExecutor(shared_ptr<SessionRpc> _rpc,
                                 const ExecOptions& _options)
    : rpc(_rpc), options(_options) {}

CommandResult CommandExecutor::execute(const string& command,
                                       std::chrono::milliseconds timeout) {
  MarkerCommand marker =
      CommandMarkers::wrap(command, genRandomAlphaNum(options.idLength));
  auto deadline = std::chrono::steady_clock::now() + timeout;
  VLOG(1) << "Executing command " << marker.id << " in session "
          << rpc->getSessionId();

  CommandResult result;
  try {
    rpc->sendInput(marker.wrapped);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Failed to send command " << marker.id << ": "
                 << re.what();
    result.output = string("Failed to send command: ") + re.what();
    return result;
  }

  string buffer;
  CommandMarkers::Scan scan;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() > 0) {
      std::this_thread::sleep_for(std::min(options.pollInterval, remaining));
    }

    try {
      buffer = rpc->getOutput(options.readWindow);
      scan = CommandMarkers::scan(buffer, marker);
    } catch (const std::runtime_error& re) {
      // A failed poll is retried until the deadline
      LOG(WARNING) << "Failed to read output for command " << marker.id
                   << ": " << re.what();
    }

    if (scan.sawEnd && scan.sawStart) {
      result.output = CommandMarkers::extractOutput(buffer, marker, scan);
      result.exitCode = scan.exitCode;
      VLOG(1) << "Command " << marker.id << " finished with "
              << result.exitCode;
      return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }

  LOG(WARNING) << "Command " << marker.id << " timed out";
  result.timedOut = true;
  result.output = buildTimeoutReport(buffer, marker, scan, timeout);
  return result;
}

string CommandExecutor::buildTimeoutReport(
    const string& buffer, const MarkerCommand& marker,
    const CommandMarkers::Scan& scan,
    std::chrono::milliseconds timeout) const {
  ostringstream report;
  report << "[rterm] Command timed out after " << (timeout.count() / 1000.0)
         << "s.\n";
  string partial;
  if (scan.sawStart) {
    report << "Start marker found but missing end marker: the command is "
              "still running or was interrupted.\n";
    report << "Try: increase the timeout or check for an interactive "
              "prompt.\n";
    size_t contentStart = scan.startPos + marker.startMarker.length();
    partial = buffer.substr(std::min(contentStart, buffer.length()));
  } else if (scan.sawEnd) {
    report << "End marker found but the start marker is no longer in the "
              "read window: the output was too large to capture.\n";
    report << "Try: redirect the output to a file and download it.\n";
    partial = buffer.substr(0, scan.endPos);
  } else {
    report << "No markers found: the command may not have been sent.\n";
    report << "Try: check that the terminal session is active.\n";
    partial = buffer;
  }
  partial = CommandMarkers::stripTerminalEscapes(partial);
  replaceAll(partial, "\r", "");
  partial = trimWhitespace(partial);
  if (!partial.empty()) {
    if (partial.length() > options.partialOutputCap) {
      partial = "..." + partial.substr(partial.length() -
                                       options.partialOutputCap);
    }
    report << "Partial output:\n" << partial << "\n";
  }
  return report.str();
}
}  // namespace rt
