#include "Errors.hpp"
#include "PipeSocketHandler.hpp"
#include "SocketTransport.hpp"
#include "TestHeaders.hpp"

using namespace rt;

namespace {
// Server side handler: takes ownership of accepted descriptors
class AcceptedSocketHandler : public PipeSocketHandler {
 public:
  void adopt(int fd) {
    initSocket(fd);
    addToActiveSockets(fd);
  }
};

/**
 * Minimal agent on a UNIX socket.  Accepts `connections` connections in
 * order and hands each one, handshake done, to `serve`.
 */
class FakeAgentServer {
 public:
  typedef std::function<void(AcceptedSocketHandler* handler, int fd,
                             const ConnectRequest& request)>
      Serve;

  FakeAgentServer(int connections, Serve _serve,
                  ConnectStatus _status = ACCEPTED)
      : scratch(makeScratchDirectory()), serve(_serve), status(_status) {
    path = scratch + "/agent.sock";
    listenFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    FATAL_FAIL(listenFd);
    sockaddr_un local;
    memset(&local, 0, sizeof(sockaddr_un));
    local.sun_family = AF_UNIX;
    strncpy(local.sun_path, path.c_str(), sizeof(local.sun_path) - 1);
    FATAL_FAIL(::bind(listenFd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
    FATAL_FAIL(::listen(listenFd, 8));
    acceptThread.reset(new std::thread([this, connections] {
      for (int i = 0; i < connections; i++) {
        int fd = ::accept(listenFd, NULL, NULL);
        if (fd < 0) {
          return;
        }
        handle(fd);
      }
    }));
  }

  ~FakeAgentServer() {
    join();
    ::close(listenFd);
    fs::remove_all(scratch);
  }

  // Waits until every expected connection was served
  void join() {
    if (acceptThread->joinable()) {
      acceptThread->join();
    }
  }

  vector<ConnectRequest> getHandshakes() {
    lock_guard<mutex> guard(serverMutex);
    return handshakes;
  }

  string path;

 protected:
  void handle(int fd) {
    handler.adopt(fd);
    try {
      auto request = handler.readProto<ConnectRequest>(fd, true);
      {
        lock_guard<mutex> guard(serverMutex);
        handshakes.push_back(request);
      }
      ConnectResponse response;
      response.set_status(status);
      if (status != ACCEPTED) {
        response.set_error("bad key");
      }
      handler.writeProto(fd, response, true);
      if (status == ACCEPTED) {
        serve(&handler, fd, request);
      }
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Fake agent connection ended: " << re.what();
    }
    handler.close(fd);
  }

  string scratch;
  Serve serve;
  ConnectStatus status;
  int listenFd;
  AcceptedSocketHandler handler;
  std::unique_ptr<std::thread> acceptThread;
  mutex serverMutex;
  vector<ConnectRequest> handshakes;
};

CallMetadata testMetadata() {
  CallMetadata metadata;
  metadata.credential = "secret";
  metadata.clientVersion = "rterm-test";
  return metadata;
}

void answerFileInfo(AcceptedSocketHandler* handler, int fd,
                    const ConnectRequest&) {
  Packet packet;
  if (!handler->readPacket(fd, &packet) ||
      packet.getHeader() != RtPacketType::RPC_REQUEST) {
    throw std::runtime_error("Expected a call");
  }
  auto request = stringToProto<RpcRequest>(packet.getPayload());
  RpcResponse response;
  auto* info = response.mutable_file_info();
  info->set_path(request.file_info().path());
  info->set_size(42);
  handler->writePacket(fd, Packet(uint8_t(RtPacketType::RPC_RESPONSE),
                                  protoToString(response)));
}
}  // namespace

TEST_CASE("A call handshakes and returns the response", "[SocketTransport]") {
  FakeAgentServer server(1, answerFileInfo);
  auto transport = SocketTransport::local(server.path, testMetadata());

  RpcRequest request;
  request.set_session_id("s-1");
  request.mutable_file_info()->set_path("/etc/hosts");
  RpcResponse response = transport->call(request, std::chrono::seconds(5));

  REQUIRE(response.file_info().path() == "/etc/hosts");
  REQUIRE(response.file_info().size() == 42);
  auto handshakes = server.getHandshakes();
  REQUIRE(handshakes.size() == 1);
  REQUIRE(handshakes[0].credential() == "secret");
  REQUIRE(handshakes[0].client_version() == "rterm-test");
  REQUIRE(handshakes[0].protocol_version() == PROTOCOL_VERSION);
  REQUIRE(handshakes[0].channel() == CALL_CHANNEL);
}

TEST_CASE("Every call uses its own connection", "[SocketTransport]") {
  FakeAgentServer server(2, answerFileInfo);
  auto transport = SocketTransport::local(server.path, testMetadata());

  RpcRequest request;
  request.mutable_file_info()->set_path("/a");
  transport->call(request, std::chrono::seconds(5));
  request.mutable_file_info()->set_path("/b");
  REQUIRE(transport->call(request, std::chrono::seconds(5))
              .file_info()
              .path() == "/b");
  REQUIRE(server.getHandshakes().size() == 2);
}

TEST_CASE("A rejected handshake is a connection error", "[SocketTransport]") {
  FakeAgentServer server(
      1, [](AcceptedSocketHandler*, int, const ConnectRequest&) {},
      UNAUTHORIZED);
  auto transport = SocketTransport::local(server.path, testMetadata());

  RpcRequest request;
  request.mutable_file_info()->set_path("/a");
  REQUIRE_THROWS_WITH(transport->call(request, std::chrono::seconds(5)),
                      Catch::Contains("unauthorized") &&
                          Catch::Contains("bad key"));
}

TEST_CASE("A silent agent times the call out", "[SocketTransport]") {
  FakeAgentServer server(1, [](AcceptedSocketHandler* handler, int fd,
                               const ConnectRequest&) {
    Packet packet;
    handler->readPacket(fd, &packet);
    // Wait for the client to hang up without answering
    handler->readPacket(fd, &packet);
  });
  auto transport = SocketTransport::local(server.path, testMetadata());

  RpcRequest request;
  request.mutable_get_output()->set_limit(10);
  REQUIRE_THROWS_AS(
      transport->call(request, std::chrono::milliseconds(300)), TimeoutError);
}

TEST_CASE("Nothing listening is a connection error", "[SocketTransport]") {
  string scratch = makeScratchDirectory();
  auto transport =
      SocketTransport::local(scratch + "/nobody.sock", testMetadata());

  RpcRequest request;
  request.mutable_file_info()->set_path("/a");
  REQUIRE_THROWS_AS(transport->call(request, std::chrono::seconds(1)),
                    ConnectionError);
  fs::remove_all(scratch);
}

TEST_CASE("The local agent transport cannot stream", "[SocketTransport]") {
  auto transport = SocketTransport::local("/tmp/unused.sock", testMetadata());
  REQUIRE_FALSE(transport->isStreamingCapable());
  REQUIRE_THROWS_AS(transport->openStream(), ConfigurationError);

  auto relay = SocketTransport::relay(SocketEndpoint("localhost", 7443),
                                      testMetadata());
  REQUIRE(relay->isStreamingCapable());
}

TEST_CASE("A stream carries messages both ways", "[SocketTransport]") {
  mutex receivedMutex;
  OutboundMessage received;
  bool sawEndOfStream = false;
  FakeAgentServer server(1, [&](AcceptedSocketHandler* handler, int fd,
                                const ConnectRequest& request) {
    if (request.channel() != STREAM_CHANNEL) {
      return;
    }
    Packet packet;
    handler->readPacket(fd, &packet);
    {
      lock_guard<mutex> guard(receivedMutex);
      received = stringToProto<OutboundMessage>(packet.getPayload());
    }
    InboundMessage output;
    output.mutable_output()->set_data("hello");
    handler->writePacket(fd, Packet(uint8_t(RtPacketType::INBOUND_MESSAGE),
                                    protoToString(output)));
    handler->writePacket(fd, Packet(uint8_t(RtPacketType::END_OF_STREAM), ""));
    handler->readPacket(fd, &packet);
    lock_guard<mutex> guard(receivedMutex);
    sawEndOfStream = packet.getHeader() == RtPacketType::END_OF_STREAM;
  });
  // A relay-kind transport over the UNIX socket handler
  SocketTransport transport(
      shared_ptr<SocketHandler>(new PipeSocketHandler()),
      SocketEndpoint(server.path), TransportKind::RELAY, testMetadata());

  auto channel = transport.openStream();
  OutboundMessage input;
  input.set_session_id("s-1");
  input.mutable_input()->set_data("ls\n");
  channel->write(input);

  InboundMessage message;
  REQUIRE(channel->read(&message));
  REQUIRE(message.output().data() == "hello");
  REQUIRE_FALSE(channel->read(&message));
  channel->doneWriting();
  REQUIRE_THROWS_AS(channel->write(input), ConnectionError);
  channel.reset();

  server.join();
  lock_guard<mutex> guard(receivedMutex);
  REQUIRE(received.input().data() == "ls\n");
  REQUIRE(sawEndOfStream);
  REQUIRE(server.getHandshakes()[0].channel() == STREAM_CHANNEL);
}
