#ifndef __RT_SOCKET_TRANSPORT__
#define __RT_SOCKET_TRANSPORT__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"
#include "Transport.hpp"

namespace rt {
enum class TransportKind { RELAY, LOCAL };

/**
 * @brief StreamChannel over one handshaken socket, framed as Packets.
 */
class SocketStreamChannel : public StreamChannel {
 public:
  SocketStreamChannel(shared_ptr<SocketHandler> _socketHandler, int _socketFd);
  virtual ~SocketStreamChannel();

  virtual void write(const OutboundMessage& message);
  virtual bool read(InboundMessage* message);
  virtual void doneWriting();
  virtual void cancel();

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  atomic<bool> cancelled;
  bool writesDone;
  mutex writeMutex;
};

/**
 * @brief Transport speaking the framed relay protocol over a SocketHandler.
 *
 * Every stream and every call uses its own connection with its own
 * handshake, so a per-connection byte cap on the relay applies to each one
 * separately.
 */
class SocketTransport : public Transport {
 public:
  SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                  const SocketEndpoint& _endpoint, TransportKind _kind,
                  const CallMetadata& _metadata);
  virtual ~SocketTransport() {}

  /** @brief Transport to the relay over TCP. */
  static shared_ptr<SocketTransport> relay(const SocketEndpoint& endpoint,
                                           const CallMetadata& metadata);
  /** @brief Transport to a co-located agent over a UNIX socket. */
  static shared_ptr<SocketTransport> local(const string& socketPath,
                                           const CallMetadata& metadata);

  virtual bool isStreamingCapable() const { return kind == TransportKind::RELAY; }
  virtual shared_ptr<StreamChannel> openStream();
  virtual RpcResponse call(const RpcRequest& request,
                           std::chrono::milliseconds timeout);
  virtual const CallMetadata& getMetadata() const { return metadata; }

  const SocketEndpoint& getEndpoint() const { return endpoint; }

 protected:
  /**
   * @brief Connects and runs the ConnectRequest/ConnectResponse exchange.
   * @return The connected socket, owned by the caller.
   */
  int connectAndHandshake(ChannelKind channel);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  TransportKind kind;
  CallMetadata metadata;
};
}  // namespace rt

#endif  // __RT_SOCKET_TRANSPORT__
