#ifndef __RT_TERMINAL_STREAM__
#define __RT_TERMINAL_STREAM__

#include "Headers.hpp"
#include "HeartbeatTimer.hpp"
#include "InboundDispatcher.hpp"
#include "MessageChannel.hpp"
#include "OutboundEncoder.hpp"
#include "StreamListeners.hpp"
#include "StreamState.hpp"
#include "Transport.hpp"

namespace rt {
struct StreamOptions {
  std::chrono::milliseconds keepaliveInterval =
      std::chrono::seconds(CLIENT_KEEP_ALIVE_DURATION);
  size_t queueMaxSize = 1000;
  std::chrono::milliseconds queuePutTimeout = std::chrono::seconds(5);
  string clientVersion = string("rterm-") + RT_VERSION;
  int initialCols = 80;
  int initialRows = 24;
  // Send resize/signal/history/detach as StatusUpdate reasons
  bool legacyStatusEncoding = true;
};

/**
 * @brief A live bidirectional terminal session carried over the relay.
 *
 * Two worker threads run while the stream is up: the pump drains the
 * outbound MessageChannel into the StreamChannel and sends a heartbeat
 * whenever nothing was written for a keepalive interval; the receiver reads
 * inbound messages one at a time and hands them to the InboundDispatcher.
 * Handler threading is described on StreamListeners.
 *
 * close() and detach() are idempotent and may be called from a handler.
 * Destroying the stream from one of its own handlers is not supported.
 */
class TerminalStream : public DispatchTarget {
 public:
  TerminalStream(shared_ptr<Transport> _transport,
                 const StreamOptions& _options = StreamOptions());
  virtual ~TerminalStream();

  void setOutputHandler(OutputHandler handler) {
    listeners.setOutputHandler(handler);
  }
  void setStatusHandler(StatusHandler handler) {
    listeners.setStatusHandler(handler);
  }
  void setErrorHandler(ErrorHandler handler) {
    listeners.setErrorHandler(handler);
  }
  void setDisconnectHandler(DisconnectHandler handler) {
    listeners.setDisconnectHandler(handler);
  }
  void setHistoryHandler(HistoryHandler handler) {
    listeners.setHistoryHandler(handler);
  }

  /**
   * @brief Starts a new session with a locally generated id.
   * @return The session id once the agent acknowledged it.
   * @throws ConfigurationError for a transport that can't stream.
   * @throws TimeoutError when no acknowledgment arrives within `timeout`.
   */
  string connect(std::chrono::milliseconds timeout);
  /**
   * @brief Joins an existing agent owned session.
   *
   * An id the relay doesn't know is never rejected explicitly; it surfaces
   * as a TimeoutError.
   */
  string attach(const string& sessionId, std::chrono::milliseconds timeout);
  void waitReady(std::chrono::milliseconds timeout);

  void sendInput(const string& data);
  void sendResize(int cols, int rows);
  void sendSignal(int signalNumber);
  void requestHistory(int limit = 100, int offset = 0);

  /** @brief Tears the stream down and ends the remote session. */
  void close(const string& reason = "client_close");
  /**
   * @brief Leaves the remote session running and tears the stream down.
   * @return The session id, or nullopt when there was nothing to detach.
   */
  optional<string> detach();

  StreamState getState() const;
  string getSessionId() const;
  bool isConnected() const { return getState() == StreamState::Connected; }
  StreamMetrics::Snapshot getMetrics() const { return metrics.snapshot(); }

  virtual void markSessionReady(const string& remoteSessionId);
  virtual void closeFromRemote(const string& reason);
  virtual void answerPing();
  virtual StreamState currentState() const { return getState(); }

 protected:
  string start(bool attachMode, std::chrono::milliseconds timeout);
  void pumpLoop();
  void receiveLoop();
  /**
   * @brief Stops both workers.  Joins them unless called from the receiver
   * thread, which then just winds down on its own.
   */
  void stopWorkers();
  void joinWorkers();
  void setState(StreamState newState, const string& reason);
  /**
   * @brief Moves to `to` only if the current state is one of `from`.
   * @return the previous state when the move happened.
   */
  optional<StreamState> transition(std::initializer_list<StreamState> from,
                                   StreamState to, const string& reason);
  void handleChannelFailure(const string& code, const string& message);
  void requireConnected() const;
  OutboundMessage newMessage();
  void enqueue(OutboundMessage message);
  RegisterRequest buildRegistration(bool attachMode) const;

  shared_ptr<Transport> transport;
  StreamOptions options;
  OutboundEncoder encoder;
  StreamListeners listeners;
  InboundDispatcher dispatcher;
  StreamMetrics metrics;
  MessageChannel<OutboundMessage> outbound;

  mutable mutex stateMutex;
  condition_variable stateChanged;
  StreamState state;
  string sessionId;

  atomic<bool> shuttingDown;
  atomic<int64_t> messageCounter;
  shared_ptr<StreamChannel> channel;
  mutex workerMutex;
  std::unique_ptr<std::thread> pumpThread;
  std::unique_ptr<std::thread> receiverThread;
  atomic<std::thread::id> receiverThreadId;
};
}  // namespace rt

#endif  // __RT_TERMINAL_STREAM__
