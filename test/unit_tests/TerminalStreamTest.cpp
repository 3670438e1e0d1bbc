#include "Errors.hpp"
#include "FakeTransport.hpp"
#include "TerminalStream.hpp"
#include "TestHeaders.hpp"

using namespace rt;

namespace {
const std::chrono::milliseconds CONNECT_TIMEOUT(2000);

bool eventually(std::function<bool()> predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

bool isHeartbeat(const OutboundMessage& message) {
  return message.has_heartbeat();
}
}  // namespace

TEST_CASE("Connect registers and becomes connected", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  StreamOptions options;
  options.clientVersion = "rterm-test";
  TerminalStream stream(transport, options);

  string id = stream.connect(CONNECT_TIMEOUT);
  REQUIRE_FALSE(id.empty());
  REQUIRE(stream.getState() == StreamState::Connected);
  REQUIRE(stream.getSessionId() == id);

  auto written = transport->lastChannel()->getWritten();
  REQUIRE(written.size() >= 1);
  REQUIRE(written[0].has_registration());
  REQUIRE(written[0].registration().version() == "rterm-test");
  REQUIRE(written[0].session_id() == id);
  REQUIRE(written[0].message_id() == id + "-1");
  stream.close();
}

TEST_CASE("A non-streaming transport cannot carry a stream",
          "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>(false);
  TerminalStream stream(transport);

  REQUIRE_THROWS_AS(stream.connect(CONNECT_TIMEOUT), ConfigurationError);
  REQUIRE_THROWS_AS(stream.attach("abc", CONNECT_TIMEOUT), ConfigurationError);
  REQUIRE(transport->openCount == 0);
  REQUIRE(stream.getState() == StreamState::Idle);
}

TEST_CASE("Control requests need a connected stream", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);

  REQUIRE_THROWS_AS(stream.sendResize(120, 40), NotConnectedError);
  REQUIRE_THROWS_AS(stream.sendInput("ls\n"), NotConnectedError);
  REQUIRE_THROWS_AS(stream.sendSignal(2), NotConnectedError);
  REQUIRE_THROWS_AS(stream.requestHistory(), NotConnectedError);
}

TEST_CASE("Resize is sent in the legacy status form", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  stream.connect(CONNECT_TIMEOUT);

  stream.sendResize(120, 40);
  auto channel = transport->lastChannel();
  REQUIRE(channel->waitForWritten(
      [](const OutboundMessage& message) {
        return message.has_status() &&
               message.status().reason() == "resize:120x40";
      },
      CONNECT_TIMEOUT));
  stream.close();
}

TEST_CASE("Input keeps its order on the wire", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  stream.connect(CONNECT_TIMEOUT);

  for (int i = 0; i < 20; i++) {
    stream.sendInput(to_string(i));
  }
  auto channel = transport->lastChannel();
  REQUIRE(channel->waitForWritten(
      [](const OutboundMessage& message) {
        return message.has_input() && message.input().data() == "19";
      },
      CONNECT_TIMEOUT));

  vector<string> inputs;
  for (const auto& message : channel->getWritten()) {
    if (message.has_input()) {
      inputs.push_back(message.input().data());
    }
  }
  REQUIRE(inputs.size() == 20);
  for (int i = 0; i < 20; i++) {
    REQUIRE(inputs[i] == to_string(i));
  }
  REQUIRE(stream.getMetrics().bytesSent == 30);
  stream.close();
}

TEST_CASE("Close is idempotent", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  int disconnects = 0;
  string reason;
  stream.setDisconnectHandler([&](const string& r) {
    disconnects++;
    reason = r;
  });
  stream.connect(CONNECT_TIMEOUT);

  stream.close();
  stream.close();
  stream.close("again");

  REQUIRE(stream.getState() == StreamState::Closed);
  REQUIRE(disconnects == 1);
  REQUIRE(reason == "client_close");
  REQUIRE(transport->lastChannel()->isWritesDone());
}

TEST_CASE("Close from an idle stream", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  int disconnects = 0;
  stream.setDisconnectHandler([&disconnects](const string&) { disconnects++; });

  stream.close();
  stream.close();

  REQUIRE(stream.getState() == StreamState::Closed);
  REQUIRE(disconnects == 1);
  REQUIRE(transport->openCount == 0);
}

TEST_CASE("Close from a failed stream", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  transport->acknowledgeRegistration = false;
  TerminalStream stream(transport);
  int disconnects = 0;
  stream.setDisconnectHandler([&disconnects](const string&) { disconnects++; });
  REQUIRE_THROWS_AS(stream.attach("missing", std::chrono::milliseconds(50)),
                    TimeoutError);
  REQUIRE(stream.getState() == StreamState::Error);

  stream.close();
  stream.close("again");

  REQUIRE(stream.getState() == StreamState::Closed);
  REQUIRE(disconnects == 1);
}

TEST_CASE("Detach leaves the session to be attached again",
          "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  StreamOptions options;
  options.clientVersion = "rterm-test";
  string id;
  {
    TerminalStream first(transport, options);
    id = first.connect(CONNECT_TIMEOUT);
    auto detached = first.detach();
    REQUIRE(detached);
    REQUIRE(*detached == id);
    REQUIRE(first.getState() == StreamState::Closed);
    REQUIRE_FALSE(first.detach());

    auto written = transport->lastChannel()->getWritten();
    REQUIRE(written.back().has_status());
    REQUIRE(written.back().status().reason() == "detach");
  }

  TerminalStream second(transport, options);
  REQUIRE(second.attach(id, CONNECT_TIMEOUT) == id);
  REQUIRE(second.isConnected());
  auto written = transport->lastChannel()->getWritten();
  REQUIRE(written[0].registration().version() == "rterm-test-attach");
  REQUIRE(written[0].session_id() == id);
  REQUIRE(transport->openCount == 2);
  second.close();
}

TEST_CASE("Attach to an unknown session times out", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  transport->acknowledgeRegistration = false;
  TerminalStream stream(transport);

  REQUIRE_THROWS_WITH(stream.attach("missing", std::chrono::milliseconds(200)),
                      Catch::Contains("agent may have disconnected"));
  REQUIRE(stream.getState() == StreamState::Error);
  REQUIRE_THROWS_AS(stream.sendInput("x"), NotConnectedError);
}

TEST_CASE("Heartbeats fill idle gaps", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  StreamOptions options;
  options.keepaliveInterval = std::chrono::milliseconds(100);
  TerminalStream stream(transport, options);
  stream.connect(CONNECT_TIMEOUT);
  auto channel = transport->lastChannel();

  stream.sendInput("x");
  REQUIRE(channel->waitForWritten(
      [](const OutboundMessage& message) { return message.has_input(); },
      CONNECT_TIMEOUT));
  // A heartbeat must follow the input before twice the interval is up
  REQUIRE(eventually(
      [&channel] {
        bool sawInput = false;
        for (const auto& message : channel->getWritten()) {
          if (message.has_input()) {
            sawInput = true;
          } else if (sawInput && message.has_heartbeat()) {
            return true;
          }
        }
        return false;
      },
      std::chrono::milliseconds(200)));
  REQUIRE(stream.getMetrics().keepalivesSent >= 1);
  stream.close();
}

TEST_CASE("A ping is answered with a heartbeat", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  stream.connect(CONNECT_TIMEOUT);

  InboundMessage ping;
  ping.mutable_ping()->set_timestamp(1);
  transport->lastChannel()->inject(ping);
  REQUIRE(transport->lastChannel()->waitForWritten(isHeartbeat,
                                                   CONNECT_TIMEOUT));
  stream.close();
}

TEST_CASE("Output reaches the handler in order", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  mutex outputMutex;
  string received;
  stream.setOutputHandler([&](const string& data) {
    lock_guard<mutex> guard(outputMutex);
    received += data;
  });
  stream.connect(CONNECT_TIMEOUT);

  for (const char* chunk : {"one ", "two ", "three"}) {
    InboundMessage message;
    message.mutable_output()->set_data(chunk);
    transport->lastChannel()->inject(message);
  }
  REQUIRE(eventually([&] {
    lock_guard<mutex> guard(outputMutex);
    return received == "one two three";
  }));
  REQUIRE(stream.getMetrics().messagesReceived >= 4);
  stream.close();
}

TEST_CASE("A throwing handler does not stop the stream", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  atomic<int> calls(0);
  stream.setOutputHandler([&calls](const string&) {
    calls++;
    throw std::runtime_error("handler bug");
  });
  stream.connect(CONNECT_TIMEOUT);

  InboundMessage message;
  message.mutable_output()->set_data("x");
  transport->lastChannel()->inject(message);
  transport->lastChannel()->inject(message);

  REQUIRE(eventually([&calls] { return calls == 2; }));
  REQUIRE(stream.isConnected());
  stream.close();
}

TEST_CASE("The agent can end the session", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  atomic<int> disconnects(0);
  string reason;
  mutex reasonMutex;
  stream.setDisconnectHandler([&](const string& r) {
    lock_guard<mutex> guard(reasonMutex);
    reason = r;
    disconnects++;
  });
  stream.connect(CONNECT_TIMEOUT);

  InboundMessage closed;
  closed.mutable_session_closed()->set_reason("shell_exited");
  transport->lastChannel()->inject(closed);

  REQUIRE(eventually([&] { return stream.getState() == StreamState::Closed; }));
  REQUIRE(eventually([&disconnects] { return disconnects == 1; }));
  {
    lock_guard<mutex> guard(reasonMutex);
    REQUIRE(reason == "shell_exited");
  }
  stream.close();
  REQUIRE(disconnects == 1);
}

TEST_CASE("A relay hangup is a fatal error", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  mutex errorMutex;
  string errorCode;
  bool errorFatal = false;
  stream.setErrorHandler(
      [&](const string& code, const string&, bool fatal) {
        lock_guard<mutex> guard(errorMutex);
        errorCode = code;
        errorFatal = fatal;
      });
  stream.connect(CONNECT_TIMEOUT);

  transport->lastChannel()->finish();

  REQUIRE(eventually([&] { return stream.getState() == StreamState::Error; }));
  REQUIRE(eventually([&] {
    lock_guard<mutex> guard(errorMutex);
    return errorCode == "STREAM_CLOSED";
  }));
  {
    lock_guard<mutex> guard(errorMutex);
    REQUIRE(errorFatal);
  }
  REQUIRE(stream.getMetrics().errors >= 1);
  REQUIRE_THROWS_AS(stream.sendInput("x"), NotConnectedError);
}

TEST_CASE("Status transitions are reported", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  mutex statesMutex;
  vector<StreamState> states;
  stream.setStatusHandler(
      [&](StreamState, StreamState newState, const string&) {
        lock_guard<mutex> guard(statesMutex);
        states.push_back(newState);
      });

  stream.connect(CONNECT_TIMEOUT);
  // Connected is reported from the receiver thread
  REQUIRE(eventually([&] {
    lock_guard<mutex> guard(statesMutex);
    return states.size() == 3;
  }));
  stream.close();

  lock_guard<mutex> guard(statesMutex);
  REQUIRE(states == vector<StreamState>{StreamState::Connecting,
                                        StreamState::Registering,
                                        StreamState::Connected,
                                        StreamState::Closing,
                                        StreamState::Closed});
}

TEST_CASE("waitReady needs a started stream", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);

  REQUIRE_THROWS_AS(stream.waitReady(std::chrono::milliseconds(10)),
                    InvalidStateError);
}

TEST_CASE("waitReady rejects finished streams", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();

  TerminalStream closed(transport);
  closed.connect(CONNECT_TIMEOUT);
  closed.close();
  REQUIRE_THROWS_AS(closed.waitReady(std::chrono::milliseconds(10)),
                    InvalidStateError);

  transport->acknowledgeRegistration = false;
  TerminalStream failed(transport);
  REQUIRE_THROWS_AS(failed.attach("missing", std::chrono::milliseconds(50)),
                    TimeoutError);
  REQUIRE_THROWS_AS(failed.waitReady(std::chrono::milliseconds(10)),
                    InvalidStateError);
}

TEST_CASE("waitReady returns at once when connected", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  TerminalStream stream(transport);
  stream.connect(CONNECT_TIMEOUT);

  auto began = std::chrono::steady_clock::now();
  REQUIRE_NOTHROW(stream.waitReady(std::chrono::seconds(5)));
  REQUIRE(std::chrono::steady_clock::now() - began <
          std::chrono::milliseconds(500));
  stream.close();
}

TEST_CASE("waitReady blocks until the session starts", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  transport->acknowledgeRegistration = false;
  TerminalStream stream(transport);

  string attached;
  string attachError;
  std::thread attaching([&] {
    try {
      attached = stream.attach("agent-session", CONNECT_TIMEOUT);
    } catch (const std::runtime_error& re) {
      attachError = re.what();
    }
  });
  REQUIRE(eventually(
      [&] { return stream.getState() == StreamState::Registering; }));

  std::thread acknowledging([&transport] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    InboundMessage started;
    started.mutable_session_started()->set_session_id("agent-session");
    transport->lastChannel()->inject(started);
  });
  auto began = std::chrono::steady_clock::now();
  REQUIRE_NOTHROW(stream.waitReady(CONNECT_TIMEOUT));
  REQUIRE(std::chrono::steady_clock::now() - began >=
          std::chrono::milliseconds(50));
  REQUIRE(stream.isConnected());

  acknowledging.join();
  attaching.join();
  REQUIRE(attachError.empty());
  REQUIRE(attached == "agent-session");
  stream.close();
}

TEST_CASE("waitReady times out while registering", "[TerminalStream]") {
  auto transport = make_shared<FakeTransport>();
  transport->acknowledgeRegistration = false;
  TerminalStream stream(transport);

  string attachError;
  std::thread attaching([&] {
    try {
      stream.attach("agent-session", std::chrono::milliseconds(1000));
    } catch (const std::runtime_error& re) {
      attachError = re.what();
    }
  });
  REQUIRE(eventually(
      [&] { return stream.getState() == StreamState::Registering; }));

  REQUIRE_THROWS_AS(stream.waitReady(std::chrono::milliseconds(100)),
                    TimeoutError);
  attaching.join();
  REQUIRE(attachError.find("agent may have disconnected") != string::npos);
  REQUIRE(stream.getState() == StreamState::Error);
}
