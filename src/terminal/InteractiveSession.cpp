#include "InteractiveSession.hpp"

#include "Errors.hpp"

namespace rt {
namespace {
const char CTRL_D = 0x04;
const int INPUT_POLL_MS = 10;
const size_t INPUT_BUF_SIZE = 16 * 1024;
}  // namespace

InteractiveSession::InteractiveSession(shared_ptr<TerminalStream> _stream,
                                       shared_ptr<Console> _console)
    : stream(_stream),
      console(_console),
      stopRequested(false),
      remoteEnded(false) {}

void InteractiveSession::markEnded(const string& reason) {
  lock_guard<mutex> guard(reasonMutex);
  if (endReason.empty()) {
    endReason = reason;
  }
  remoteEnded = true;
}

string InteractiveSession::run(const string& sessionId,
                               std::chrono::milliseconds timeout) {
  stream->setOutputHandler([this](const string& data) { console->write(data); });
  stream->setDisconnectHandler(
      [this](const string& reason) { markEnded(reason); });
  stream->setErrorHandler(
      [this](const string& code, const string& message, bool fatal) {
        LOG(ERROR) << "Stream error " << code << ": " << message;
        if (fatal) {
          markEnded(code);
        }
      });

  if (sessionId.empty()) {
    string newId = stream->connect(timeout);
    LOG(INFO) << "Started session " << newId;
  } else {
    stream->attach(sessionId, timeout);
    LOG(INFO) << "Attached to session " << sessionId;
  }

  {
    RawModeGuard rawMode(console.get());
    pumpInput();
  }

  if (stream->isConnected()) {
    stream->detach();
  }
  lock_guard<mutex> guard(reasonMutex);
  return endReason.empty() ? "detached" : endReason;
}

void InteractiveSession::pumpInput() {
  TerminalSize lastSize = console->getTerminalSize();
  try {
    stream->sendResize(lastSize.cols(), lastSize.rows());
    while (!stopRequested && !remoteEnded && stream->isConnected()) {
      optional<string> input = RawSocketUtils::readAvailable(
          console->getInputFd(), INPUT_BUF_SIZE, INPUT_POLL_MS);
      if (!input) {
        VLOG(1) << "End of local input";
        markEnded("detached");
        break;
      }
      if (!input->empty()) {
        auto ctrlD = input->find(CTRL_D);
        if (ctrlD != string::npos) {
          if (ctrlD > 0) {
            stream->sendInput(input->substr(0, ctrlD));
          }
          markEnded("detached");
          break;
        }
        stream->sendInput(*input);
      }

      TerminalSize size = console->getTerminalSize();
      if (size != lastSize) {
        LOG(INFO) << "Window size changed: " << size.cols() << "x"
                  << size.rows();
        lastSize = size;
        stream->sendResize(size.cols(), size.rows());
      }
    }
  } catch (const NotConnectedError& nce) {
    VLOG(1) << "Stream went away while forwarding input: " << nce.what();
  }
}
}  // namespace rt
