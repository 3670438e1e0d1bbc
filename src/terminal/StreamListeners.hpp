#ifndef __RT_STREAM_LISTENERS__
#define __RT_STREAM_LISTENERS__

#include "Headers.hpp"
#include "StreamState.hpp"

namespace rt {
typedef std::function<void(const string& data)> OutputHandler;
typedef std::function<void(StreamState oldState, StreamState newState,
                           const string& reason)>
    StatusHandler;
typedef std::function<void(const string& code, const string& message,
                           bool fatal)>
    ErrorHandler;
typedef std::function<void(const string& reason)> DisconnectHandler;
typedef std::function<void(const vector<string>& commands, int total)>
    HistoryHandler;

/**
 * @brief Caller supplied event handlers of a TerminalStream.
 *
 * Handlers for inbound events run on the stream's receiver thread, one at a
 * time and in receipt order; a handler that blocks stalls inbound dispatch
 * for that stream, so heavy work belongs on the caller's own thread.  Status
 * and disconnect handlers for transitions the caller starts (close, detach,
 * connect) run on the caller's thread.  A handler that throws is logged and
 * otherwise ignored.
 */
class StreamListeners {
 public:
  void setOutputHandler(OutputHandler handler);
  void setStatusHandler(StatusHandler handler);
  void setErrorHandler(ErrorHandler handler);
  void setDisconnectHandler(DisconnectHandler handler);
  void setHistoryHandler(HistoryHandler handler);

  void emitOutput(const string& data);
  void emitStatus(StreamState oldState, StreamState newState,
                  const string& reason);
  void emitError(const string& code, const string& message, bool fatal);
  void emitDisconnect(const string& reason);
  void emitHistory(const vector<string>& commands, int total);

 protected:
  /**
   * @brief Runs `invoke` and logs instead of propagating handler failures.
   */
  void guarded(const char* name, const std::function<void()>& invoke);

  mutex handlerMutex;
  OutputHandler outputHandler;
  StatusHandler statusHandler;
  ErrorHandler errorHandler;
  DisconnectHandler disconnectHandler;
  HistoryHandler historyHandler;
};
}  // namespace rt

#endif  // __RT_STREAM_LISTENERS__
