#include "TerminalStream.hpp"

#include "Errors.hpp"

namespace rt {
TerminalStream::TerminalStream(shared_ptr<Transport> _transport,
                               const StreamOptions& _options)
    : transport(_transport),
      options(_options),
      encoder(_options.legacyStatusEncoding),
      dispatcher(this, &listeners),
      outbound(_options.queueMaxSize),
      state(StreamState::Idle),
      shuttingDown(false),
      messageCounter(0),
      receiverThreadId(std::thread::id()) {
  if (options.keepaliveInterval.count() <= 0) {
    throw ConfigurationError("Keepalive interval must be positive");
  }
}

TerminalStream::~TerminalStream() {
  shuttingDown = true;
  outbound.close();
  if (channel) {
    channel->cancel();
  }
  joinWorkers();
}

StreamState TerminalStream::getState() const {
  lock_guard<mutex> guard(stateMutex);
  return state;
}

string TerminalStream::getSessionId() const {
  lock_guard<mutex> guard(stateMutex);
  return sessionId;
}

void TerminalStream::setState(StreamState newState, const string& reason) {
  StreamState oldState;
  {
    lock_guard<mutex> guard(stateMutex);
    oldState = state;
    state = newState;
    stateChanged.notify_all();
  }
  if (oldState != newState) {
    listeners.emitStatus(oldState, newState, reason);
  }
}

optional<StreamState> TerminalStream::transition(
    std::initializer_list<StreamState> from, StreamState to,
    const string& reason) {
  StreamState oldState;
  {
    lock_guard<mutex> guard(stateMutex);
    if (std::find(from.begin(), from.end(), state) == from.end()) {
      return nullopt;
    }
    oldState = state;
    state = to;
    stateChanged.notify_all();
  }
  listeners.emitStatus(oldState, to, reason);
  return oldState;
}

string TerminalStream::connect(std::chrono::milliseconds timeout) {
  if (!transport->isStreamingCapable()) {
    throw ConfigurationError(
        "Bidirectional streaming requires a relay connection; the local "
        "agent transport only supports request/response calls");
  }
  {
    lock_guard<mutex> guard(stateMutex);
    if (state != StreamState::Idle) {
      throw InvalidStateError("connect() needs an idle stream, state is " +
                              stateName(state));
    }
    sessionId = sole::uuid4().str();
  }
  LOG(INFO) << "Starting new session " << getSessionId();
  return start(false, timeout);
}

string TerminalStream::attach(const string& _sessionId,
                              std::chrono::milliseconds timeout) {
  if (!transport->isStreamingCapable()) {
    throw ConfigurationError(
        "Bidirectional streaming requires a relay connection; the local "
        "agent transport only supports request/response calls");
  }
  if (_sessionId.empty()) {
    throw ConfigurationError("attach() needs a session id");
  }
  {
    lock_guard<mutex> guard(stateMutex);
    if (state == StreamState::Connected || state == StreamState::Connecting ||
        state == StreamState::Registering || state == StreamState::Closing) {
      throw InvalidStateError("Cannot attach while " + stateName(state));
    }
    sessionId = _sessionId;
  }
  LOG(INFO) << "Attaching to session " << _sessionId;
  return start(true, timeout);
}

string TerminalStream::start(bool attachMode,
                             std::chrono::milliseconds timeout) {
  // A previous run may have been closed from its own receiver thread
  joinWorkers();
  outbound.reset();
  shuttingDown = false;

  setState(StreamState::Connecting, attachMode ? "attach" : "connect");
  try {
    channel = transport->openStream();
  } catch (const std::runtime_error& re) {
    metrics.recordError();
    setState(StreamState::Error, "connect_failed");
    throw ConnectionError(string("Failed to open stream: ") + re.what());
  }
  setState(StreamState::Registering, "registering");

  {
    lock_guard<mutex> guard(workerMutex);
    receiverThread.reset(
        new std::thread(&TerminalStream::receiveLoop, this));
    pumpThread.reset(new std::thread(&TerminalStream::pumpLoop, this));
  }

  OutboundMessage registration = newMessage();
  *registration.mutable_registration() = buildRegistration(attachMode);
  enqueue(registration);

  StreamState observed;
  bool settled;
  {
    unique_lock<mutex> guard(stateMutex);
    settled = stateChanged.wait_for(guard, timeout, [this] {
      return state != StreamState::Registering;
    });
    observed = state;
  }
  if (settled && observed == StreamState::Connected) {
    return getSessionId();
  }
  if (!settled) {
    metrics.recordError();
    string id = getSessionId();
    STERROR << "No session acknowledgment for " << id << " after "
            << timeout.count() << "ms";
    transition({StreamState::Registering}, StreamState::Error, "timeout");
    stopWorkers();
    if (attachMode) {
      throw TimeoutError("Attach timed out for session " + id +
                         " (the agent may have disconnected)");
    }
    throw TimeoutError("Connection timed out waiting for session");
  }
  stopWorkers();
  throw ConnectionError("Stream became " + stateName(observed) +
                        " before the session started");
}

void TerminalStream::waitReady(std::chrono::milliseconds timeout) {
  unique_lock<mutex> guard(stateMutex);
  if (state == StreamState::Connected) {
    return;
  }
  if (state == StreamState::Idle) {
    throw InvalidStateError("Stream not started, call connect() or attach()");
  }
  if (isTerminalState(state) || state == StreamState::Closing) {
    throw InvalidStateError("Stream is " + stateName(state));
  }
  bool settled = stateChanged.wait_for(guard, timeout, [this] {
    return state != StreamState::Connecting &&
           state != StreamState::Registering;
  });
  if (!settled) {
    throw TimeoutError("Timed out waiting for session " + sessionId +
                       " to become ready");
  }
  if (state != StreamState::Connected) {
    throw ConnectionError("Stream became " + stateName(state) +
                          " before the session started");
  }
}

void TerminalStream::requireConnected() const {
  if (getState() != StreamState::Connected) {
    throw NotConnectedError();
  }
}

OutboundMessage TerminalStream::newMessage() {
  OutboundMessage message;
  int64_t counter = ++messageCounter;
  string id = getSessionId();
  message.set_session_id(id);
  message.set_message_id(id + "-" + to_string(counter));
  message.set_sequence(counter);
  return message;
}

void TerminalStream::enqueue(OutboundMessage message) {
  if (!outbound.push(std::move(message), options.queuePutTimeout)) {
    throw NotConnectedError("Stream is shutting down");
  }
}

RegisterRequest TerminalStream::buildRegistration(bool attachMode) const {
  RegisterRequest registration;
  registration.set_version(options.clientVersion +
                           (attachMode ? "-attach" : ""));
  registration.set_hostname(GetLocalHostName());
  registration.set_platform(GetPlatformName());
  registration.mutable_initial_size()->set_cols(options.initialCols);
  registration.mutable_initial_size()->set_rows(options.initialRows);
  registration.set_username(GetOsUserName());
  registration.set_home_dir(GetHomeDirectory());
  return registration;
}

void TerminalStream::sendInput(const string& data) {
  requireConnected();
  OutboundMessage message = newMessage();
  auto* input = message.mutable_input();
  input->set_data(data);
  input->set_sequence(message.sequence());
  enqueue(std::move(message));
  metrics.recordSent(data.size());
}

void TerminalStream::sendResize(int cols, int rows) {
  requireConnected();
  OutboundMessage message = newMessage();
  encoder.encodeResize(&message, cols, rows);
  enqueue(std::move(message));
}

void TerminalStream::sendSignal(int signalNumber) {
  requireConnected();
  OutboundMessage message = newMessage();
  encoder.encodeSignal(&message, signalNumber);
  enqueue(std::move(message));
}

void TerminalStream::requestHistory(int limit, int offset) {
  requireConnected();
  OutboundMessage message = newMessage();
  encoder.encodeHistoryRequest(&message, limit, offset);
  enqueue(std::move(message));
}

void TerminalStream::close(const string& reason) {
  auto previous = transition(
      {StreamState::Idle, StreamState::Connecting, StreamState::Registering,
       StreamState::Connected, StreamState::Reconnecting, StreamState::Error},
      StreamState::Closing, reason);
  if (!previous) {
    VLOG(1) << "close(" << reason << ") ignored, stream already closing";
    return;
  }
  LOG(INFO) << "Closing stream for session " << getSessionId() << ": "
            << reason;
  stopWorkers();
  setState(StreamState::Closed, reason);
  listeners.emitDisconnect(reason);
}

optional<string> TerminalStream::detach() {
  string id;
  bool wasConnected;
  {
    lock_guard<mutex> guard(stateMutex);
    if (state != StreamState::Connected && state != StreamState::Connecting &&
        state != StreamState::Registering) {
      return nullopt;
    }
    id = sessionId;
    wasConnected = (state == StreamState::Connected);
  }
  if (wasConnected) {
    OutboundMessage notice = newMessage();
    encoder.encodeDetach(&notice);
    try {
      enqueue(std::move(notice));
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not queue detach notice: " << re.what();
    }
  }
  auto previous = transition({StreamState::Connecting, StreamState::Registering,
                              StreamState::Connected},
                             StreamState::Closing, "detached");
  if (!previous) {
    // Someone else closed the stream meanwhile
    return id;
  }
  LOG(INFO) << "Detaching from session " << id;
  // The pump drains the queue, detach notice included, before it exits
  stopWorkers();
  setState(StreamState::Closed, "detached");
  listeners.emitDisconnect("detached");
  return id;
}

void TerminalStream::markSessionReady(const string& remoteSessionId) {
  if (!remoteSessionId.empty() && remoteSessionId != getSessionId()) {
    LOG(WARNING) << "Agent acknowledged session " << remoteSessionId
                 << " while registering " << getSessionId();
  }
  if (transition({StreamState::Registering}, StreamState::Connected,
                 "session_started")) {
    LOG(INFO) << "Session " << getSessionId() << " started";
  } else {
    VLOG(1) << "Ignoring session_started in state " << getState();
  }
}

void TerminalStream::closeFromRemote(const string& reason) { close(reason); }

void TerminalStream::answerPing() {
  OutboundMessage heartbeat = newMessage();
  heartbeat.mutable_heartbeat();
  try {
    enqueue(std::move(heartbeat));
    metrics.recordKeepalive();
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not answer ping: " << re.what();
  }
}

void TerminalStream::handleChannelFailure(const string& code,
                                          const string& message) {
  metrics.recordError();
  LOG(WARNING) << "Stream failure (" << code << "): " << message;
  auto previous =
      transition({StreamState::Connecting, StreamState::Registering,
                  StreamState::Connected},
                 StreamState::Error, code);
  if (previous && *previous == StreamState::Connected) {
    listeners.emitError(code, message, true);
  }
}

void TerminalStream::pumpLoop() {
  el::Helpers::setThreadName("stream-pump");
  HeartbeatTimer heartbeat(options.keepaliveInterval);
  try {
    while (true) {
      OutboundMessage message;
      auto result = outbound.pop(&message, heartbeat.remaining());
      if (result == MessageChannel<OutboundMessage>::PopResult::CLOSED) {
        break;
      }
      if (result == MessageChannel<OutboundMessage>::PopResult::TIMEOUT) {
        if (shuttingDown) {
          break;
        }
        if (!heartbeat.expired()) {
          continue;
        }
        message = newMessage();
        message.mutable_heartbeat();
        metrics.recordKeepalive();
      }
      VLOG(3) << "Sending " << OutboundEncoder::describe(message);
      channel->write(message);
      heartbeat.touch();
    }
  } catch (const std::runtime_error& re) {
    if (!shuttingDown) {
      handleChannelFailure("STREAM_ERROR", re.what());
    }
  }
  try {
    channel->doneWriting();
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Could not finish the send side: " << re.what();
  }
}

void TerminalStream::receiveLoop() {
  receiverThreadId = std::this_thread::get_id();
  el::Helpers::setThreadName("stream-receiver");
  try {
    InboundMessage message;
    while (!shuttingDown) {
      if (!channel->read(&message)) {
        if (!shuttingDown) {
          handleChannelFailure("STREAM_CLOSED", "Relay closed the stream");
        }
        break;
      }
      metrics.recordReceived(message.ByteSizeLong());
      dispatcher.dispatch(message);
      message.Clear();
    }
  } catch (const std::runtime_error& re) {
    if (!shuttingDown) {
      handleChannelFailure("STREAM_ERROR", re.what());
    }
  }
  VLOG(1) << "Receiver finished";
}

void TerminalStream::stopWorkers() {
  shuttingDown = true;
  outbound.close();
  if (channel) {
    channel->cancel();
  }
  if (receiverThreadId.load() == std::this_thread::get_id()) {
    // The receiver exits on its own once the current dispatch returns and
    // the next start() or the destructor joins it.
    return;
  }
  joinWorkers();
}

void TerminalStream::joinWorkers() {
  lock_guard<mutex> guard(workerMutex);
  if (pumpThread) {
    if (pumpThread->joinable()) {
      pumpThread->join();
    }
    pumpThread.reset();
  }
  if (receiverThread) {
    if (receiverThread->get_id() == std::this_thread::get_id()) {
      receiverThread->detach();
    } else if (receiverThread->joinable()) {
      receiverThread->join();
    }
    receiverThread.reset();
  }
  receiverThreadId = std::thread::id();
}
}  // namespace rt
