#include "SocketTransport.hpp"

#include "Errors.hpp"
#include "PipeSocketHandler.hpp"
#include "TcpSocketHandler.hpp"

namespace rt {
namespace {
// Polling granularity for reads that must notice cancel() or a deadline
const int64_t READ_POLL_USEC = 100 * 1000;

string describeStatus(ConnectStatus status) {
  switch (status) {
    case ACCEPTED:
      return "accepted";
    case UNAUTHORIZED:
      return "unauthorized (check the api key)";
    case MISMATCHED_PROTOCOL:
      return "mismatched protocol (upgrade rterm)";
    case NO_ROUTE:
      return "no route to session";
  }
  return string("unknown status ") + to_string(int(status));
}

class SocketCloser {
 public:
  SocketCloser(shared_ptr<SocketHandler> _socketHandler, int _fd)
      : socketHandler(_socketHandler), fd(_fd) {}
  ~SocketCloser() { socketHandler->close(fd); }

 private:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
};
}  // namespace

SocketStreamChannel::SocketStreamChannel(
    shared_ptr<SocketHandler> _socketHandler, int _socketFd)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      cancelled(false),
      writesDone(false) {}

SocketStreamChannel::~SocketStreamChannel() { socketHandler->close(socketFd); }

void SocketStreamChannel::write(const OutboundMessage& message) {
  lock_guard<mutex> guard(writeMutex);
  if (writesDone) {
    throw ConnectionError("Write after end of stream");
  }
  VLOG(3) << "Writing outbound message " << message.message_id();
  try {
    socketHandler->writePacket(
        socketFd, Packet(uint8_t(RtPacketType::OUTBOUND_MESSAGE),
                         protoToString(message)));
  } catch (const ConnectionError&) {
    throw;
  } catch (const std::runtime_error& re) {
    throw ConnectionError(string("Stream write failed: ") + re.what());
  }
}

bool SocketStreamChannel::read(InboundMessage* message) {
  while (!cancelled) {
    if (!socketHandler->waitForData(socketFd, 0, READ_POLL_USEC)) {
      continue;
    }
    Packet packet;
    try {
      if (!socketHandler->readPacket(socketFd, &packet)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      if (cancelled) {
        return false;
      }
      throw ConnectionError(string("Stream read failed: ") + re.what());
    }
    switch (packet.getHeader()) {
      case RtPacketType::INBOUND_MESSAGE:
        *message = stringToProto<InboundMessage>(packet.getPayload());
        return true;
      case RtPacketType::END_OF_STREAM:
        VLOG(1) << "Relay finished the stream";
        return false;
      default:
        throw ConnectionError(string("Unexpected packet type on stream: ") +
                              to_string(int(packet.getHeader())));
    }
  }
  return false;
}

void SocketStreamChannel::doneWriting() {
  lock_guard<mutex> guard(writeMutex);
  if (writesDone) {
    return;
  }
  writesDone = true;
  try {
    socketHandler->writePacket(
        socketFd, Packet(uint8_t(RtPacketType::END_OF_STREAM), ""));
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Could not send end of stream: " << re.what();
  }
}

void SocketStreamChannel::cancel() { cancelled = true; }

SocketTransport::SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                                 const SocketEndpoint& _endpoint,
                                 TransportKind _kind,
                                 const CallMetadata& _metadata)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      kind(_kind),
      metadata(_metadata) {}

shared_ptr<SocketTransport> SocketTransport::relay(
    const SocketEndpoint& endpoint, const CallMetadata& metadata) {
  return shared_ptr<SocketTransport>(
      new SocketTransport(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                          endpoint, TransportKind::RELAY, metadata));
}

shared_ptr<SocketTransport> SocketTransport::local(
    const string& socketPath, const CallMetadata& metadata) {
  return shared_ptr<SocketTransport>(new SocketTransport(
      shared_ptr<SocketHandler>(new PipeSocketHandler()),
      SocketEndpoint(socketPath), TransportKind::LOCAL, metadata));
}

int SocketTransport::connectAndHandshake(ChannelKind channel) {
  VLOG(1) << "Connecting to " << endpoint;
  int socketFd = socketHandler->connect(endpoint);
  if (socketFd == -1) {
    throw ConnectionError("Could not connect to " + endpoint.getName());
  }
  try {
    ConnectRequest request;
    request.set_protocol_version(PROTOCOL_VERSION);
    request.set_credential(metadata.credential);
    request.set_client_version(metadata.clientVersion);
    request.set_channel(channel);
    socketHandler->writeProto(socketFd, request, true);
    ConnectResponse response =
        socketHandler->readProto<ConnectResponse>(socketFd, true);
    if (response.status() != ACCEPTED) {
      string s = "Connection refused: " + describeStatus(response.status());
      if (!response.error().empty()) {
        s += ": " + response.error();
      }
      STERROR << s;
      throw ConnectionError(s);
    }
  } catch (const ConnectionError&) {
    socketHandler->close(socketFd);
    throw;
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Got failure during handshake: " << re.what();
    socketHandler->close(socketFd);
    throw ConnectionError(string("Handshake failed: ") + re.what());
  }
  VLOG(1) << "Connection established with " << endpoint;
  return socketFd;
}

shared_ptr<StreamChannel> SocketTransport::openStream() {
  if (!isStreamingCapable()) {
    throw ConfigurationError("Transport to " + endpoint.getName() +
                             " does not support streaming");
  }
  int socketFd = connectAndHandshake(STREAM_CHANNEL);
  return shared_ptr<StreamChannel>(
      new SocketStreamChannel(socketHandler, socketFd));
}

RpcResponse SocketTransport::call(const RpcRequest& request,
                                  std::chrono::milliseconds timeout) {
  int socketFd = connectAndHandshake(CALL_CHANNEL);
  SocketCloser closer(socketHandler, socketFd);
  auto deadline = std::chrono::steady_clock::now() + timeout;
  Packet packet;
  try {
    socketHandler->writePacket(
        socketFd,
        Packet(uint8_t(RtPacketType::RPC_REQUEST), protoToString(request)));
    while (!socketHandler->waitForData(socketFd, 0, READ_POLL_USEC)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        throw TimeoutError("Call timed out after " +
                           to_string(timeout.count()) + "ms");
      }
    }
    if (!socketHandler->readPacket(socketFd, &packet)) {
      throw ConnectionError("Empty reply from " + endpoint.getName());
    }
  } catch (const TimeoutError&) {
    throw;
  } catch (const ConnectionError&) {
    throw;
  } catch (const std::runtime_error& re) {
    throw ConnectionError(string("Call failed: ") + re.what());
  }
  if (packet.getHeader() != RtPacketType::RPC_RESPONSE) {
    throw ConnectionError("Unexpected packet type in reply: " +
                          to_string(int(packet.getHeader())));
  }
  return stringToProto<RpcResponse>(packet.getPayload());
}
}  // namespace rt
