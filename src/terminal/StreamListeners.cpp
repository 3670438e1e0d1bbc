#include "StreamListeners.hpp"

namespace rt {
void StreamListeners::setOutputHandler(OutputHandler handler) {
  lock_guard<mutex> guard(handlerMutex);
  outputHandler = handler;
}

void StreamListeners::setStatusHandler(StatusHandler handler) {
  lock_guard<mutex> guard(handlerMutex);
  statusHandler = handler;
}

void StreamListeners::setErrorHandler(ErrorHandler handler) {
  lock_guard<mutex> guard(handlerMutex);
  errorHandler = handler;
}

void StreamListeners::setDisconnectHandler(DisconnectHandler handler) {
  lock_guard<mutex> guard(handlerMutex);
  disconnectHandler = handler;
}

void StreamListeners::setHistoryHandler(HistoryHandler handler) {
  lock_guard<mutex> guard(handlerMutex);
  historyHandler = handler;
}

void StreamListeners::guarded(const char* name,
                              const std::function<void()>& invoke) {
  try {
    invoke();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Callback error in " << name << " handler: " << e.what();
  }
}

void StreamListeners::emitOutput(const string& data) {
  OutputHandler handler;
  {
    lock_guard<mutex> guard(handlerMutex);
    handler = outputHandler;
  }
  if (handler) {
    guarded("output", [&] { handler(data); });
  }
}

void StreamListeners::emitStatus(StreamState oldState, StreamState newState,
                                 const string& reason) {
  VLOG(1) << "Stream state " << oldState << " -> " << newState << " ("
          << reason << ")";
  StatusHandler handler;
  {
    lock_guard<mutex> guard(handlerMutex);
    handler = statusHandler;
  }
  if (handler) {
    guarded("status", [&] { handler(oldState, newState, reason); });
  }
}

void StreamListeners::emitError(const string& code, const string& message,
                                bool fatal) {
  ErrorHandler handler;
  {
    lock_guard<mutex> guard(handlerMutex);
    handler = errorHandler;
  }
  if (handler) {
    guarded("error", [&] { handler(code, message, fatal); });
  }
}

void StreamListeners::emitDisconnect(const string& reason) {
  DisconnectHandler handler;
  {
    lock_guard<mutex> guard(handlerMutex);
    handler = disconnectHandler;
  }
  if (handler) {
    guarded("disconnect", [&] { handler(reason); });
  }
}

void StreamListeners::emitHistory(const vector<string>& commands, int total) {
  HistoryHandler handler;
  {
    lock_guard<mutex> guard(handlerMutex);
    handler = historyHandler;
  }
  if (handler) {
    guarded("history", [&] { handler(commands, total); });
  }
}
}  // namespace rt
